#include "pawpal/core/PlanningContext.hpp"

#include <QMutexLocker>
#include <utility>

#include "pawpal/core/Logging.hpp"
#include "pawpal/data/Owner.hpp"
#include "pawpal/data/Pet.hpp"

namespace pawpal {
namespace core {

PlanningContext::PlanningContext(std::unique_ptr<data::Owner> owner, SchedulerSettings settings)
    : m_owner(std::move(owner))
    , m_scheduler(settings)
{
    if (!m_owner) {
        m_owner = std::make_unique<data::Owner>(QString(), settings.defaultAvailableMinutes);
    }
}

PlanningContext::~PlanningContext() = default;

const Scheduler &PlanningContext::scheduler() const
{
    return m_scheduler;
}

QUuid PlanningContext::addPet(QString name, QString species, int age, QString specialNeeds)
{
    QMutexLocker locker(&m_mutex);
    const auto &pet = m_owner->addPet(std::move(name), std::move(species), age, std::move(specialNeeds));
    return pet.id();
}

bool PlanningContext::addTask(const QUuid &petId, data::CareTask task)
{
    QMutexLocker locker(&m_mutex);
    return m_owner->appendTask(petId, std::move(task));
}

std::optional<data::CareTask> PlanningContext::completeTask(const QUuid &taskId)
{
    QMutexLocker locker(&m_mutex);
    auto successor = m_owner->completeTask(taskId);
    if (successor) {
        qCDebug(lcContext) << "Completed" << taskId << "next occurrence" << successor->id;
    }
    return successor;
}

void PlanningContext::setAvailableMinutes(int minutes)
{
    QMutexLocker locker(&m_mutex);
    m_owner->setAvailableMinutes(minutes);
}

QString PlanningContext::planText(const QDate &date) const
{
    QMutexLocker locker(&m_mutex);
    return m_scheduler.generatePlan(*m_owner, date).toText();
}

ConflictReport PlanningContext::conflictReport() const
{
    QMutexLocker locker(&m_mutex);
    return m_scheduler.conflictReport(*m_owner);
}

void PlanningContext::withOwner(const std::function<void(const data::Owner &)> &fn) const
{
    if (!fn) {
        return;
    }
    QMutexLocker locker(&m_mutex);
    fn(*m_owner);
}

} // namespace core
} // namespace pawpal
