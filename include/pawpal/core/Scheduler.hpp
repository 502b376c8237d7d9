#pragma once

#include <QDate>
#include <QString>
#include <QStringList>
#include <QUuid>
#include <vector>

#include "pawpal/core/Schedule.hpp"
#include "pawpal/core/SchedulerSettings.hpp"
#include "pawpal/data/CareTask.hpp"

namespace pawpal {
namespace data {
class Owner;
}

namespace core {

using TaskList = std::vector<const data::CareTask *>;

// Overlapping pair of scheduled tasks, in start-time order. End minutes are
// clamped to the configured end of day; the truncated flags record a clamp.
struct Conflict
{
    const data::CareTask *first = nullptr;
    const data::CareTask *second = nullptr;
    int firstEnd = 0;
    int secondEnd = 0;
    bool firstTruncated = false;
    bool secondTruncated = false;
};

struct ConflictReport
{
    QStringList descriptions;

    bool hasConflicts() const;
    QString toText() const;
};

class Scheduler
{
public:
    explicit Scheduler(SchedulerSettings settings = SchedulerSettings());

    const SchedulerSettings &settings() const;

    // Ascending scheduled time; unscheduled tasks last. Stable.
    static TaskList orderByTime(const TaskList &tasks);
    // Priority descending, then duration ascending. Stable.
    static TaskList orderByPriority(const TaskList &tasks);

    static TaskList filterByCompletion(const TaskList &tasks, bool completed);
    static TaskList filterByPet(const TaskList &tasks, const QUuid &petId);
    static TaskList filterByCategory(const TaskList &tasks, data::TaskCategory category);

    // Greedy selection of the owner's incomplete tasks under the owner's budget.
    Schedule generatePlan(const data::Owner &owner, const QDate &date) const;
    bool validateConstraints(const Schedule &schedule) const;

    std::vector<Conflict> detectConflicts(const TaskList &tasks) const;
    QString describeConflict(const Conflict &conflict, const data::Owner &owner) const;
    QStringList conflictDescriptions(const data::Owner &owner) const;
    ConflictReport conflictReport(const data::Owner &owner) const;

private:
    SchedulerSettings m_settings;
};

} // namespace core
} // namespace pawpal
