#include "pawpal/data/Pet.hpp"

#include <utility>

#include "pawpal/core/Logging.hpp"

namespace pawpal {
namespace data {

Pet::Pet(QString name, QString species, int age, QString specialNeeds)
    : m_name(std::move(name))
    , m_species(std::move(species))
    , m_age(age)
    , m_specialNeeds(std::move(specialNeeds))
{
}

Pet::~Pet() = default;

const QUuid &Pet::id() const
{
    return m_id;
}

const QString &Pet::name() const
{
    return m_name;
}

const QString &Pet::species() const
{
    return m_species;
}

int Pet::age() const
{
    return m_age;
}

const QString &Pet::specialNeeds() const
{
    return m_specialNeeds;
}

bool Pet::addTask(CareTask task)
{
    const QString error = task.validationError();
    if (!error.isEmpty()) {
        qCWarning(lcData) << "Rejected task" << task.name << "for" << m_name << ":" << error;
        return false;
    }
    if (findTask(task.id)) {
        qCWarning(lcData) << "Rejected duplicate task id" << task.id << "for" << m_name;
        return false;
    }
    task.petId = m_id;
    m_tasks.push_back(std::make_unique<CareTask>(std::move(task)));
    return true;
}

std::vector<const CareTask *> Pet::tasks() const
{
    std::vector<const CareTask *> result;
    result.reserve(m_tasks.size());
    for (const auto &task : m_tasks) {
        result.push_back(task.get());
    }
    return result;
}

std::vector<const CareTask *> Pet::incompleteTasks() const
{
    std::vector<const CareTask *> result;
    for (const auto &task : m_tasks) {
        if (!task->completed) {
            result.push_back(task.get());
        }
    }
    return result;
}

const CareTask *Pet::findTask(const QUuid &taskId) const
{
    for (const auto &task : m_tasks) {
        if (task->id == taskId) {
            return task.get();
        }
    }
    return nullptr;
}

std::size_t Pet::taskCount() const
{
    return m_tasks.size();
}

std::optional<CareTask> Pet::completeTask(const QUuid &taskId)
{
    CareTask *task = findMutableTask(taskId);
    if (!task) {
        qCDebug(lcData) << "No task" << taskId << "owned by" << m_name;
        return std::nullopt;
    }
    if (task->completed) {
        qCDebug(lcData) << "Task" << task->name << "is already completed";
        return std::nullopt;
    }

    auto successor = task->complete();
    if (!successor) {
        return std::nullopt;
    }
    m_tasks.push_back(std::make_unique<CareTask>(*successor));
    qCInfo(lcData) << "Scheduled next" << task->name << "for" << m_name << "on"
                   << successor->dueDate.toString(Qt::ISODate);
    return successor;
}

QString Pet::description() const
{
    QString text = QStringLiteral("%1 - %2, %3 years old").arg(m_name, m_species).arg(m_age);
    if (!m_specialNeeds.isEmpty()) {
        text += QStringLiteral(" (Special needs: %1)").arg(m_specialNeeds);
    }
    return text;
}

CareTask *Pet::findMutableTask(const QUuid &taskId)
{
    for (auto &task : m_tasks) {
        if (task->id == taskId) {
            return task.get();
        }
    }
    return nullptr;
}

} // namespace data
} // namespace pawpal
