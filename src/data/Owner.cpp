#include "pawpal/data/Owner.hpp"

#include <utility>

#include "pawpal/core/Logging.hpp"
#include "pawpal/data/Pet.hpp"

namespace pawpal {
namespace data {

Owner::Owner(QString name, int availableMinutes)
    : m_name(std::move(name))
{
    setAvailableMinutes(availableMinutes);
}

Owner::~Owner() = default;

const QUuid &Owner::id() const
{
    return m_id;
}

const QString &Owner::name() const
{
    return m_name;
}

int Owner::availableMinutes() const
{
    return m_availableMinutes;
}

void Owner::setAvailableMinutes(int minutes)
{
    if (minutes < 0) {
        qCWarning(lcData) << "Negative time budget" << minutes << "for" << m_name << "clamped to 0";
        minutes = 0;
    }
    m_availableMinutes = minutes;
}

const QVariantMap &Owner::preferences() const
{
    return m_preferences;
}

void Owner::setPreference(const QString &key, const QVariant &value)
{
    m_preferences.insert(key, value);
}

Pet &Owner::addPet(QString name, QString species, int age, QString specialNeeds)
{
    m_pets.push_back(std::make_unique<Pet>(std::move(name), std::move(species), age, std::move(specialNeeds)));
    return *m_pets.back();
}

std::vector<const Pet *> Owner::pets() const
{
    std::vector<const Pet *> result;
    result.reserve(m_pets.size());
    for (const auto &pet : m_pets) {
        result.push_back(pet.get());
    }
    return result;
}

Pet *Owner::findPet(const QUuid &petId)
{
    for (auto &pet : m_pets) {
        if (pet->id() == petId) {
            return pet.get();
        }
    }
    return nullptr;
}

const Pet *Owner::findPet(const QUuid &petId) const
{
    for (const auto &pet : m_pets) {
        if (pet->id() == petId) {
            return pet.get();
        }
    }
    return nullptr;
}

QString Owner::petName(const QUuid &petId) const
{
    const Pet *pet = findPet(petId);
    return pet ? pet->name() : QString();
}

std::vector<const CareTask *> Owner::allTasks() const
{
    std::vector<const CareTask *> result;
    for (const auto &pet : m_pets) {
        const auto tasks = pet->tasks();
        result.insert(result.end(), tasks.begin(), tasks.end());
    }
    return result;
}

std::vector<const CareTask *> Owner::incompleteTasks() const
{
    std::vector<const CareTask *> result;
    for (const auto &pet : m_pets) {
        const auto tasks = pet->incompleteTasks();
        result.insert(result.end(), tasks.begin(), tasks.end());
    }
    return result;
}

const CareTask *Owner::findTask(const QUuid &taskId) const
{
    for (const auto &pet : m_pets) {
        if (const CareTask *task = pet->findTask(taskId)) {
            return task;
        }
    }
    return nullptr;
}

bool Owner::appendTask(const QUuid &petId, CareTask task)
{
    Pet *pet = findPet(petId);
    if (!pet) {
        qCWarning(lcData) << "Cannot add" << task.name << "- unknown pet" << petId;
        return false;
    }
    if (const CareTask *existing = findTask(task.id)) {
        qCWarning(lcData) << "Rejected duplicate task id" << task.id << "already held by" << petName(existing->petId);
        return false;
    }
    return pet->addTask(std::move(task));
}

std::optional<CareTask> Owner::completeTask(const QUuid &taskId)
{
    const CareTask *task = findTask(taskId);
    if (!task) {
        qCDebug(lcData) << "No task" << taskId << "owned by" << m_name;
        return std::nullopt;
    }
    Pet *pet = findPet(task->petId);
    if (!pet) {
        return std::nullopt;
    }
    return pet->completeTask(taskId);
}

QString Owner::description() const
{
    const auto petCount = static_cast<int>(m_pets.size());
    return QStringLiteral("%1 - %2 min available, %3 %4")
        .arg(m_name)
        .arg(m_availableMinutes)
        .arg(petCount)
        .arg(petCount == 1 ? QStringLiteral("pet") : QStringLiteral("pets"));
}

} // namespace data
} // namespace pawpal
