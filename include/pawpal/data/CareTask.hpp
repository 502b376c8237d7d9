#pragma once

#include <QDate>
#include <QString>
#include <QUuid>
#include <optional>

namespace pawpal {
namespace data {

enum class TaskCategory
{
    Walk,
    Feeding,
    Medication,
    Grooming,
    Enrichment,
    VetVisit,
};

enum class Recurrence
{
    None,
    Daily,
    Weekly,
};

constexpr int kMinutesPerDay = 24 * 60;
constexpr int kLastMinuteOfDay = kMinutesPerDay - 1;
constexpr int kMinPriority = 1;
constexpr int kMaxPriority = 5;

struct CareTask
{
    QUuid id = QUuid::createUuid();
    QString name;
    TaskCategory category = TaskCategory::Walk;
    int durationMinutes = 0;
    int priority = kMinPriority;
    Recurrence recurrence = Recurrence::None;
    std::optional<int> scheduledMinute; // minute of day, empty = unscheduled
    QDate dueDate;
    bool completed = false;
    QUuid petId; // owning pet, null while unowned

    bool isScheduled() const;
    bool fits(int remainingMinutes) const;

    // Marks the task completed. Returns the next occurrence for a recurring
    // task that belongs to a pet; the caller appends it to that pet.
    // Completing an already completed task does nothing.
    std::optional<CareTask> complete();

    // Copy of this task due one day (Daily) or seven days (Weekly) later,
    // with a fresh id and the completion flag cleared.
    std::optional<CareTask> nextOccurrence() const;

    // Empty when the task satisfies all field constraints.
    QString validationError() const;
    bool isValid() const;

    QString toString() const;
};

QString categoryToString(TaskCategory category);
std::optional<TaskCategory> categoryFromString(const QString &value);

QString recurrenceToString(Recurrence recurrence);
std::optional<Recurrence> recurrenceFromString(const QString &value);

// "HH:MM", zero padded.
QString formatMinuteOfDay(int minute);
std::optional<int> parseMinuteOfDay(const QString &value);

} // namespace data
} // namespace pawpal
