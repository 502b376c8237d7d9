#include "pawpal/data/DemoHousehold.hpp"

#include <QObject>
#include <utility>

#include "pawpal/core/Logging.hpp"
#include "pawpal/data/CareTask.hpp"
#include "pawpal/data/Owner.hpp"
#include "pawpal/data/Pet.hpp"

namespace pawpal {
namespace data {

namespace {
void addSeedTask(Pet &pet,
                 const QString &name,
                 TaskCategory category,
                 int durationMinutes,
                 int priority,
                 Recurrence recurrence,
                 const QString &time,
                 const QDate &dueDate)
{
    CareTask task;
    task.name = name;
    task.category = category;
    task.durationMinutes = durationMinutes;
    task.priority = priority;
    task.recurrence = recurrence;
    task.scheduledMinute = parseMinuteOfDay(time);
    task.dueDate = dueDate;
    if (!pet.addTask(std::move(task))) {
        qCWarning(lcData) << "Demo task" << name << "was rejected for" << pet.name();
    }
}
} // namespace

void seedDemoHousehold(Owner &owner, const QDate &today)
{
    if (!owner.pets().empty()) {
        return;
    }

    Pet &max = owner.addPet(QObject::tr("Max"), QObject::tr("Dog"), 5);
    addSeedTask(max, QObject::tr("Morning walk"), TaskCategory::Walk, 30, 5, Recurrence::Daily,
                QStringLiteral("07:00"), today);
    addSeedTask(max, QObject::tr("Breakfast"), TaskCategory::Feeding, 10, 5, Recurrence::Daily,
                QStringLiteral("07:45"), today);
    addSeedTask(max, QObject::tr("Afternoon walk"), TaskCategory::Walk, 25, 4, Recurrence::Daily,
                QStringLiteral("14:00"), today);
    addSeedTask(max, QObject::tr("Brushing"), TaskCategory::Grooming, 20, 2, Recurrence::Weekly,
                QString(), today);

    Pet &luna = owner.addPet(QObject::tr("Luna"), QObject::tr("Cat"), 3, QObject::tr("Thyroid medication"));
    addSeedTask(luna, QObject::tr("Thyroid pill"), TaskCategory::Medication, 5, 5, Recurrence::Daily,
                QStringLiteral("08:00"), today);
    addSeedTask(luna, QObject::tr("Play session"), TaskCategory::Enrichment, 20, 3, Recurrence::None,
                QStringLiteral("14:10"), today);
    addSeedTask(luna, QObject::tr("Vet check-up"), TaskCategory::VetVisit, 60, 4, Recurrence::None,
                QStringLiteral("16:30"), today.addDays(2));
}

} // namespace data
} // namespace pawpal
