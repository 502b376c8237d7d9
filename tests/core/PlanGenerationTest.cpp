#include <QtTest/QtTest>

#include "pawpal/core/Scheduler.hpp"
#include "pawpal/data/Owner.hpp"
#include "pawpal/data/Pet.hpp"

using namespace pawpal;

namespace {

const QDate PLAN_DATE(2026, 2, 15);

data::CareTask makeTask(const QString &name, int priority, int duration)
{
    data::CareTask task;
    task.name = name;
    task.priority = priority;
    task.durationMinutes = duration;
    task.dueDate = PLAN_DATE;
    return task;
}

QStringList namesOf(const std::vector<const data::CareTask *> &tasks)
{
    QStringList names;
    for (const auto *task : tasks) {
        names << task->name;
    }
    return names;
}

} // namespace

class PlanGenerationTest : public QObject
{
    Q_OBJECT

private slots:
    void higherPriorityTaskThatDoesNotFitIsRejected();
    void greedySelectionFollowsPriorityThenDuration();
    void zeroBudgetRejectsEverything();
    void emptyOwnerYieldsEmptySchedule();
    void completedTasksAreExcluded();
    void repeatedPlanningIsDeterministic();
    void textRendering();
};

void PlanGenerationTest::higherPriorityTaskThatDoesNotFitIsRejected()
{
    data::Owner owner(QStringLiteral("Alex"), 20);
    data::Pet &pet = owner.addPet(QStringLiteral("Buddy"), QStringLiteral("Dog"));
    QVERIFY(pet.addTask(makeTask(QStringLiteral("A"), 5, 30)));
    QVERIFY(pet.addTask(makeTask(QStringLiteral("B"), 3, 10)));

    core::Scheduler scheduler;
    const auto schedule = scheduler.generatePlan(owner, PLAN_DATE);

    QCOMPARE(namesOf(schedule.tasks()), QStringList({ QStringLiteral("B") }));
    QCOMPARE(schedule.totalMinutes(), 10);
    QCOMPARE(schedule.budgetMinutes(), 20);
    QCOMPARE(schedule.remainingMinutes(), 10);
    QCOMPARE(schedule.rationale().size(), 2);
    QCOMPARE(schedule.rationale().at(0), QStringLiteral("rejected A: duration=30 exceeds remaining=20"));
    QCOMPARE(schedule.rationale().at(1), QStringLiteral("accepted B: priority=3, duration=10, remaining=10"));
    QCOMPARE(schedule.skippedTaskNames(), QStringList({ QStringLiteral("A") }));
    QVERIFY(scheduler.validateConstraints(schedule));
}

void PlanGenerationTest::greedySelectionFollowsPriorityThenDuration()
{
    data::Owner owner(QStringLiteral("Alex"), 60);
    data::Pet &dog = owner.addPet(QStringLiteral("Max"), QStringLiteral("Dog"));
    data::Pet &cat = owner.addPet(QStringLiteral("Luna"), QStringLiteral("Cat"));
    QVERIFY(dog.addTask(makeTask(QStringLiteral("Long walk"), 5, 30)));
    QVERIFY(dog.addTask(makeTask(QStringLiteral("Training"), 4, 15)));
    QVERIFY(cat.addTask(makeTask(QStringLiteral("Pill"), 5, 20)));
    QVERIFY(cat.addTask(makeTask(QStringLiteral("Brushing"), 3, 10)));

    core::Scheduler scheduler;
    const auto schedule = scheduler.generatePlan(owner, PLAN_DATE);

    QCOMPARE(namesOf(schedule.tasks()),
             QStringList({ QStringLiteral("Pill"), QStringLiteral("Long walk"), QStringLiteral("Brushing") }));
    QCOMPARE(schedule.totalMinutes(), 60);
    QCOMPARE(schedule.rationale(),
             QStringList({ QStringLiteral("accepted Pill: priority=5, duration=20, remaining=40"),
                           QStringLiteral("accepted Long walk: priority=5, duration=30, remaining=10"),
                           QStringLiteral("rejected Training: duration=15 exceeds remaining=10"),
                           QStringLiteral("accepted Brushing: priority=3, duration=10, remaining=0") }));
    QVERIFY(schedule.totalMinutes() <= owner.availableMinutes());
}

void PlanGenerationTest::zeroBudgetRejectsEverything()
{
    data::Owner owner(QStringLiteral("Alex"), 0);
    data::Pet &pet = owner.addPet(QStringLiteral("Buddy"), QStringLiteral("Dog"));
    QVERIFY(pet.addTask(makeTask(QStringLiteral("Walk"), 5, 30)));
    QVERIFY(pet.addTask(makeTask(QStringLiteral("Feed"), 4, 5)));

    core::Scheduler scheduler;
    const auto schedule = scheduler.generatePlan(owner, PLAN_DATE);

    QVERIFY(schedule.isEmpty());
    QCOMPARE(schedule.totalMinutes(), 0);
    QCOMPARE(schedule.rationale().size(), 2);
    for (const auto &entry : schedule.rationale()) {
        QVERIFY(entry.startsWith(QStringLiteral("rejected ")));
        QVERIFY(entry.endsWith(QStringLiteral("remaining=0")));
    }
}

void PlanGenerationTest::emptyOwnerYieldsEmptySchedule()
{
    data::Owner owner(QStringLiteral("Alex"), 120);
    owner.addPet(QStringLiteral("Buddy"), QStringLiteral("Dog"));

    core::Scheduler scheduler;
    const auto schedule = scheduler.generatePlan(owner, PLAN_DATE);

    QVERIFY(schedule.isEmpty());
    QVERIFY(schedule.rationale().isEmpty());
    QCOMPARE(schedule.date(), PLAN_DATE);
    QCOMPARE(schedule.summary(), QStringLiteral("No incomplete tasks to schedule."));
}

void PlanGenerationTest::completedTasksAreExcluded()
{
    data::Owner owner(QStringLiteral("Alex"), 120);
    data::Pet &pet = owner.addPet(QStringLiteral("Buddy"), QStringLiteral("Dog"));
    const auto done = makeTask(QStringLiteral("Done"), 5, 10);
    QVERIFY(pet.addTask(done));
    QVERIFY(pet.addTask(makeTask(QStringLiteral("Open"), 2, 10)));
    QVERIFY(!owner.completeTask(done.id).has_value());

    core::Scheduler scheduler;
    const auto schedule = scheduler.generatePlan(owner, PLAN_DATE);

    QCOMPARE(namesOf(schedule.tasks()), QStringList({ QStringLiteral("Open") }));
    QVERIFY(!schedule.contains(done.id));
    QCOMPARE(schedule.rationale().size(), 1);
}

void PlanGenerationTest::repeatedPlanningIsDeterministic()
{
    data::Owner owner(QStringLiteral("Alex"), 45);
    data::Pet &pet = owner.addPet(QStringLiteral("Buddy"), QStringLiteral("Dog"));
    QVERIFY(pet.addTask(makeTask(QStringLiteral("One"), 2, 20)));
    QVERIFY(pet.addTask(makeTask(QStringLiteral("Two"), 2, 20)));
    QVERIFY(pet.addTask(makeTask(QStringLiteral("Three"), 2, 20)));

    core::Scheduler scheduler;
    const auto first = scheduler.generatePlan(owner, PLAN_DATE);
    const auto second = scheduler.generatePlan(owner, PLAN_DATE);

    QCOMPARE(namesOf(first.tasks()), QStringList({ QStringLiteral("One"), QStringLiteral("Two") }));
    QCOMPARE(namesOf(second.tasks()), namesOf(first.tasks()));
    QCOMPARE(second.rationale(), first.rationale());
}

void PlanGenerationTest::textRendering()
{
    data::Owner owner(QStringLiteral("Alex"), 40);
    data::Pet &pet = owner.addPet(QStringLiteral("Buddy"), QStringLiteral("Dog"));
    auto walk = makeTask(QStringLiteral("Morning walk"), 5, 30);
    walk.scheduledMinute = 7 * 60;
    QVERIFY(pet.addTask(walk));
    QVERIFY(pet.addTask(makeTask(QStringLiteral("Bath"), 1, 45)));

    core::Scheduler scheduler;
    const auto schedule = scheduler.generatePlan(owner, PLAN_DATE);
    const QString text = schedule.toText();

    QVERIFY(text.startsWith(QStringLiteral("Schedule for 2026-02-15:")));
    QVERIFY(text.contains(QStringLiteral("Total Duration: 30 minutes")));
    QVERIFY(text.contains(QStringLiteral("1. ○ Morning walk (walk) - 30min [Priority: 5] @ 07:00")));
    QVERIFY(schedule.summary().startsWith(QStringLiteral("Scheduled 1 task(s) using 30/40 minutes available.")));
    QVERIFY(schedule.summary().contains(QStringLiteral("1 task(s) could not fit in the available time: Bath.")));

    data::Owner idle(QStringLiteral("Sam"), 30);
    const auto empty = scheduler.generatePlan(idle, PLAN_DATE);
    QCOMPARE(empty.toText(), QStringLiteral("Schedule for 2026-02-15: No tasks scheduled"));
}

QTEST_GUILESS_MAIN(PlanGenerationTest)
#include "PlanGenerationTest.moc"
