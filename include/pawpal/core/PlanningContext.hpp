#pragma once

#include <QDate>
#include <QMutex>
#include <QString>
#include <QUuid>
#include <functional>
#include <memory>
#include <optional>

#include "pawpal/core/Scheduler.hpp"
#include "pawpal/data/CareTask.hpp"

namespace pawpal {
namespace data {
class Owner;
}

namespace core {

// Owns one household and serialises every access to it, so completion's
// read-modify-write of a pet's task list never interleaves with a query.
class PlanningContext
{
public:
    PlanningContext(std::unique_ptr<data::Owner> owner, SchedulerSettings settings = SchedulerSettings());
    ~PlanningContext();

    const Scheduler &scheduler() const;

    QUuid addPet(QString name, QString species, int age = 0, QString specialNeeds = QString());
    bool addTask(const QUuid &petId, data::CareTask task);
    std::optional<data::CareTask> completeTask(const QUuid &taskId);
    void setAvailableMinutes(int minutes);

    QString planText(const QDate &date) const;
    ConflictReport conflictReport() const;

    // Runs fn with the owner while holding the lock. Pointers obtained inside
    // must not be used after fn returns.
    void withOwner(const std::function<void(const data::Owner &)> &fn) const;

private:
    mutable QMutex m_mutex;
    std::unique_ptr<data::Owner> m_owner;
    Scheduler m_scheduler;
};

} // namespace core
} // namespace pawpal
