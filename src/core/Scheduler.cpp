#include "pawpal/core/Scheduler.hpp"

#include <QSet>
#include <algorithm>
#include <iterator>

#include "pawpal/core/Logging.hpp"
#include "pawpal/data/Owner.hpp"

namespace pawpal {
namespace core {

namespace {

struct Interval
{
    const data::CareTask *task = nullptr;
    int start = 0;
    int end = 0;
    bool truncated = false;
};

Interval intervalFor(const data::CareTask &task, int dayEndMinute)
{
    Interval interval;
    interval.task = &task;
    interval.start = task.scheduledMinute.value_or(0);
    // Compare against the room left so start + duration is only formed when it fits.
    interval.truncated = task.durationMinutes > dayEndMinute - interval.start;
    interval.end = interval.truncated ? qMax(interval.start, dayEndMinute) : interval.start + task.durationMinutes;
    return interval;
}

TaskList withoutNulls(const TaskList &tasks)
{
    TaskList result;
    result.reserve(tasks.size());
    std::copy_if(tasks.begin(), tasks.end(), std::back_inserter(result),
                 [](const data::CareTask *task) { return task != nullptr; });
    return result;
}

} // namespace

bool ConflictReport::hasConflicts() const
{
    return !descriptions.isEmpty();
}

QString ConflictReport::toText() const
{
    if (descriptions.isEmpty()) {
        return QStringLiteral("✅ No scheduling conflicts detected.");
    }
    QStringList lines;
    lines << QStringLiteral("⚠️ SCHEDULING CONFLICTS DETECTED (%1)").arg(descriptions.size());
    for (const auto &description : descriptions) {
        lines << QStringLiteral("⚠️ %1").arg(description);
    }
    return lines.join(QLatin1Char('\n'));
}

Scheduler::Scheduler(SchedulerSettings settings)
    : m_settings(settings)
{
}

const SchedulerSettings &Scheduler::settings() const
{
    return m_settings;
}

TaskList Scheduler::orderByTime(const TaskList &tasks)
{
    TaskList ordered = withoutNulls(tasks);
    std::stable_sort(ordered.begin(), ordered.end(), [](const data::CareTask *lhs, const data::CareTask *rhs) {
        if (lhs->isScheduled() != rhs->isScheduled()) {
            return lhs->isScheduled();
        }
        if (!lhs->isScheduled()) {
            return false;
        }
        return *lhs->scheduledMinute < *rhs->scheduledMinute;
    });
    return ordered;
}

TaskList Scheduler::orderByPriority(const TaskList &tasks)
{
    TaskList ordered = withoutNulls(tasks);
    std::stable_sort(ordered.begin(), ordered.end(), [](const data::CareTask *lhs, const data::CareTask *rhs) {
        if (lhs->priority == rhs->priority) {
            return lhs->durationMinutes < rhs->durationMinutes;
        }
        return lhs->priority > rhs->priority;
    });
    return ordered;
}

TaskList Scheduler::filterByCompletion(const TaskList &tasks, bool completed)
{
    TaskList result;
    for (const auto *task : tasks) {
        if (task && task->completed == completed) {
            result.push_back(task);
        }
    }
    return result;
}

TaskList Scheduler::filterByPet(const TaskList &tasks, const QUuid &petId)
{
    TaskList result;
    for (const auto *task : tasks) {
        if (task && task->petId == petId) {
            result.push_back(task);
        }
    }
    return result;
}

TaskList Scheduler::filterByCategory(const TaskList &tasks, data::TaskCategory category)
{
    TaskList result;
    for (const auto *task : tasks) {
        if (task && task->category == category) {
            result.push_back(task);
        }
    }
    return result;
}

Schedule Scheduler::generatePlan(const data::Owner &owner, const QDate &date) const
{
    Schedule schedule(date, owner.availableMinutes());
    const TaskList candidates = orderByPriority(filterByCompletion(owner.allTasks(), false));

    int remaining = owner.availableMinutes();
    for (const auto *task : candidates) {
        const QString error = task->validationError();
        if (!error.isEmpty()) {
            qCWarning(lcScheduler) << "Skipping invalid task" << task->name << ":" << error;
            schedule.skip(*task, QStringLiteral("rejected %1: invalid task (%2)").arg(task->name, error));
            continue;
        }
        if (task->fits(remaining)) {
            remaining -= task->durationMinutes;
            schedule.accept(*task, QStringLiteral("accepted %1: priority=%2, duration=%3, remaining=%4")
                                       .arg(task->name,
                                            QString::number(task->priority),
                                            QString::number(task->durationMinutes),
                                            QString::number(remaining)));
        } else {
            schedule.skip(*task, QStringLiteral("rejected %1: duration=%2 exceeds remaining=%3")
                                     .arg(task->name,
                                          QString::number(task->durationMinutes),
                                          QString::number(remaining)));
        }
    }

    qCDebug(lcScheduler) << "Plan for" << date.toString(Qt::ISODate) << "selected" << schedule.tasks().size()
                         << "of" << candidates.size() << "tasks," << schedule.totalMinutes() << "/"
                         << schedule.budgetMinutes() << "minutes";
    return schedule;
}

bool Scheduler::validateConstraints(const Schedule &schedule) const
{
    return schedule.totalMinutes() <= schedule.budgetMinutes();
}

std::vector<Conflict> Scheduler::detectConflicts(const TaskList &tasks) const
{
    TaskList eligible;
    QSet<QUuid> seen;
    for (const auto *task : tasks) {
        if (!task || task->completed || !task->isScheduled()) {
            continue;
        }
        if (seen.contains(task->id)) {
            continue;
        }
        const QString error = task->validationError();
        if (!error.isEmpty()) {
            qCWarning(lcScheduler) << "Ignoring invalid task" << task->name << "in conflict check:" << error;
            continue;
        }
        seen.insert(task->id);
        eligible.push_back(task);
    }

    std::vector<Interval> intervals;
    intervals.reserve(eligible.size());
    for (const auto *task : orderByTime(eligible)) {
        intervals.push_back(intervalFor(*task, m_settings.dayEndMinute));
    }

    // Pairwise scan; households have tens of tasks, not thousands.
    std::vector<Conflict> conflicts;
    for (std::size_t i = 0; i < intervals.size(); ++i) {
        for (std::size_t j = i + 1; j < intervals.size(); ++j) {
            const Interval &a = intervals[i];
            const Interval &b = intervals[j];
            if (a.start < b.end && b.start < a.end) {
                Conflict conflict;
                conflict.first = a.task;
                conflict.second = b.task;
                conflict.firstEnd = a.end;
                conflict.secondEnd = b.end;
                conflict.firstTruncated = a.truncated;
                conflict.secondTruncated = b.truncated;
                conflicts.push_back(conflict);
            }
        }
    }
    return conflicts;
}

QString Scheduler::describeConflict(const Conflict &conflict, const data::Owner &owner) const
{
    const auto describe = [&owner](const data::CareTask &task, int end, bool truncated) {
        QString petName = owner.petName(task.petId);
        if (petName.isEmpty()) {
            petName = QStringLiteral("unassigned");
        }
        QString text = QStringLiteral("%1 (%2) %3-%4")
                           .arg(task.name,
                                petName,
                                data::formatMinuteOfDay(task.scheduledMinute.value_or(0)),
                                data::formatMinuteOfDay(end));
        if (truncated) {
            text += QStringLiteral(" [end truncated at %1]").arg(data::formatMinuteOfDay(end));
        }
        return text;
    };

    if (!conflict.first || !conflict.second) {
        return QString();
    }
    return QStringLiteral("CONFLICT: %1 overlaps %2")
        .arg(describe(*conflict.first, conflict.firstEnd, conflict.firstTruncated),
             describe(*conflict.second, conflict.secondEnd, conflict.secondTruncated));
}

QStringList Scheduler::conflictDescriptions(const data::Owner &owner) const
{
    QStringList descriptions;
    for (const auto &conflict : detectConflicts(owner.allTasks())) {
        descriptions << describeConflict(conflict, owner);
    }
    return descriptions;
}

ConflictReport Scheduler::conflictReport(const data::Owner &owner) const
{
    ConflictReport report;
    report.descriptions = conflictDescriptions(owner);
    if (report.hasConflicts()) {
        qCInfo(lcScheduler) << report.descriptions.size() << "scheduling conflict(s) for" << owner.name();
    }
    return report;
}

} // namespace core
} // namespace pawpal
