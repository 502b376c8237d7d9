#include "pawpal/core/Schedule.hpp"

#include "pawpal/data/CareTask.hpp"

namespace pawpal {
namespace core {

namespace {
const QString SEPARATOR = QString(50, QLatin1Char('-'));
} // namespace

Schedule::Schedule(const QDate &date, int budgetMinutes)
    : m_date(date)
    , m_budgetMinutes(budgetMinutes)
{
}

const QDate &Schedule::date() const
{
    return m_date;
}

const std::vector<const data::CareTask *> &Schedule::tasks() const
{
    return m_tasks;
}

int Schedule::totalMinutes() const
{
    return m_totalMinutes;
}

int Schedule::budgetMinutes() const
{
    return m_budgetMinutes;
}

int Schedule::remainingMinutes() const
{
    return m_budgetMinutes - m_totalMinutes;
}

bool Schedule::isEmpty() const
{
    return m_tasks.empty();
}

bool Schedule::contains(const QUuid &taskId) const
{
    for (const auto *task : m_tasks) {
        if (task->id == taskId) {
            return true;
        }
    }
    return false;
}

const QStringList &Schedule::rationale() const
{
    return m_rationale;
}

const QStringList &Schedule::skippedTaskNames() const
{
    return m_skipped;
}

QString Schedule::summary() const
{
    if (m_tasks.empty() && m_skipped.isEmpty()) {
        return QStringLiteral("No incomplete tasks to schedule.");
    }

    QStringList parts;
    parts << QStringLiteral("Scheduled %1 task(s) using %2/%3 minutes available.")
                 .arg(static_cast<int>(m_tasks.size()))
                 .arg(m_totalMinutes)
                 .arg(m_budgetMinutes);
    if (!m_tasks.empty()) {
        parts << QStringLiteral("Tasks were prioritized by importance (higher priority first), "
                                "then by duration (shorter tasks first).");
    }
    if (!m_skipped.isEmpty()) {
        parts << QStringLiteral("%1 task(s) could not fit in the available time: %2.")
                     .arg(QString::number(m_skipped.size()), m_skipped.join(QStringLiteral(", ")));
    }
    return parts.join(QLatin1Char(' '));
}

QString Schedule::toText() const
{
    const QString dateText = m_date.toString(Qt::ISODate);
    if (m_tasks.empty()) {
        return QStringLiteral("Schedule for %1: No tasks scheduled").arg(dateText);
    }

    QStringList lines;
    lines << QStringLiteral("Schedule for %1:").arg(dateText);
    lines << QStringLiteral("Total Duration: %1 minutes").arg(m_totalMinutes);
    lines << SEPARATOR;
    int index = 1;
    for (const auto *task : m_tasks) {
        lines << QStringLiteral("%1. %2").arg(QString::number(index++), task->toString());
    }
    lines << SEPARATOR;
    lines << QStringLiteral("Reasoning: %1").arg(summary());
    return lines.join(QLatin1Char('\n'));
}

void Schedule::accept(const data::CareTask &task, const QString &reason)
{
    m_tasks.push_back(&task);
    m_totalMinutes += task.durationMinutes;
    m_rationale << reason;
}

void Schedule::skip(const data::CareTask &task, const QString &reason)
{
    m_skipped << task.name;
    m_rationale << reason;
}

} // namespace core
} // namespace pawpal
