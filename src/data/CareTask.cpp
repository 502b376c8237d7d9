#include "pawpal/data/CareTask.hpp"

#include <initializer_list>

namespace pawpal {
namespace data {

namespace {
constexpr int DAILY_STEP_DAYS = 1;
constexpr int WEEKLY_STEP_DAYS = 7;

bool isAsciiDigit(QChar ch)
{
    return ch >= QLatin1Char('0') && ch <= QLatin1Char('9');
}
} // namespace

bool CareTask::isScheduled() const
{
    return scheduledMinute.has_value();
}

bool CareTask::fits(int remainingMinutes) const
{
    return durationMinutes <= remainingMinutes;
}

std::optional<CareTask> CareTask::complete()
{
    if (completed) {
        return std::nullopt;
    }
    completed = true;
    if (petId.isNull()) {
        return std::nullopt;
    }
    return nextOccurrence();
}

std::optional<CareTask> CareTask::nextOccurrence() const
{
    int stepDays = 0;
    switch (recurrence) {
    case Recurrence::None:
        return std::nullopt;
    case Recurrence::Daily:
        stepDays = DAILY_STEP_DAYS;
        break;
    case Recurrence::Weekly:
        stepDays = WEEKLY_STEP_DAYS;
        break;
    }

    CareTask next = *this;
    next.id = QUuid::createUuid();
    next.dueDate = dueDate.addDays(stepDays);
    next.completed = false;
    return next;
}

QString CareTask::validationError() const
{
    if (id.isNull()) {
        return QStringLiteral("task id is null");
    }
    if (name.trimmed().isEmpty()) {
        return QStringLiteral("task name is empty");
    }
    if (durationMinutes <= 0) {
        return QStringLiteral("duration must be positive, got %1").arg(durationMinutes);
    }
    if (priority < kMinPriority || priority > kMaxPriority) {
        return QStringLiteral("priority must be within %1-%2, got %3")
            .arg(kMinPriority)
            .arg(kMaxPriority)
            .arg(priority);
    }
    if (scheduledMinute.has_value() && (*scheduledMinute < 0 || *scheduledMinute > kLastMinuteOfDay)) {
        return QStringLiteral("scheduled minute must be within 0-%1, got %2")
            .arg(kLastMinuteOfDay)
            .arg(*scheduledMinute);
    }
    if (!dueDate.isValid()) {
        return QStringLiteral("due date is invalid");
    }
    return QString();
}

bool CareTask::isValid() const
{
    return validationError().isEmpty();
}

QString CareTask::toString() const
{
    const QString status = completed ? QStringLiteral("✓") : QStringLiteral("○");
    QString text = QStringLiteral("%1 %2 (%3) - %4min [Priority: %5]")
                       .arg(status, name, categoryToString(category))
                       .arg(durationMinutes)
                       .arg(priority);
    if (scheduledMinute.has_value()) {
        text += QStringLiteral(" @ %1").arg(formatMinuteOfDay(*scheduledMinute));
    }
    if (recurrence != Recurrence::None) {
        text += QStringLiteral(" (%1)").arg(recurrenceToString(recurrence));
    }
    return text;
}

QString categoryToString(TaskCategory category)
{
    switch (category) {
    case TaskCategory::Walk:
        return QStringLiteral("walk");
    case TaskCategory::Feeding:
        return QStringLiteral("feeding");
    case TaskCategory::Medication:
        return QStringLiteral("medication");
    case TaskCategory::Grooming:
        return QStringLiteral("grooming");
    case TaskCategory::Enrichment:
        return QStringLiteral("enrichment");
    case TaskCategory::VetVisit:
        return QStringLiteral("vet_visit");
    }
    return QStringLiteral("walk");
}

std::optional<TaskCategory> categoryFromString(const QString &value)
{
    const QString normalized = value.trimmed().toLower();
    if (normalized == QLatin1String("walk")) {
        return TaskCategory::Walk;
    }
    if (normalized == QLatin1String("feeding")) {
        return TaskCategory::Feeding;
    }
    if (normalized == QLatin1String("medication")) {
        return TaskCategory::Medication;
    }
    if (normalized == QLatin1String("grooming")) {
        return TaskCategory::Grooming;
    }
    if (normalized == QLatin1String("enrichment")) {
        return TaskCategory::Enrichment;
    }
    if (normalized == QLatin1String("vet_visit") || normalized == QLatin1String("vetvisit")) {
        return TaskCategory::VetVisit;
    }
    return std::nullopt;
}

QString recurrenceToString(Recurrence recurrence)
{
    switch (recurrence) {
    case Recurrence::None:
        return QStringLiteral("once");
    case Recurrence::Daily:
        return QStringLiteral("daily");
    case Recurrence::Weekly:
        return QStringLiteral("weekly");
    }
    return QStringLiteral("once");
}

std::optional<Recurrence> recurrenceFromString(const QString &value)
{
    const QString normalized = value.trimmed().toLower();
    if (normalized == QLatin1String("once") || normalized == QLatin1String("none")) {
        return Recurrence::None;
    }
    if (normalized == QLatin1String("daily")) {
        return Recurrence::Daily;
    }
    if (normalized == QLatin1String("weekly")) {
        return Recurrence::Weekly;
    }
    return std::nullopt;
}

QString formatMinuteOfDay(int minute)
{
    return QStringLiteral("%1:%2")
        .arg(minute / 60, 2, 10, QLatin1Char('0'))
        .arg(minute % 60, 2, 10, QLatin1Char('0'));
}

std::optional<int> parseMinuteOfDay(const QString &value)
{
    if (value.size() != 5 || value.at(2) != QLatin1Char(':')) {
        return std::nullopt;
    }
    for (int i : { 0, 1, 3, 4 }) {
        if (!isAsciiDigit(value.at(i))) {
            return std::nullopt;
        }
    }
    const int hours = value.left(2).toInt();
    const int minutes = value.mid(3, 2).toInt();
    if (hours > 23 || minutes > 59) {
        return std::nullopt;
    }
    return hours * 60 + minutes;
}

} // namespace data
} // namespace pawpal
