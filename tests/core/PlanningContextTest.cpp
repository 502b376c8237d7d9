#include <QtTest/QtTest>

#include <QAtomicInt>
#include <QThread>
#include <memory>
#include <vector>

#include "pawpal/core/PlanningContext.hpp"
#include "pawpal/data/Owner.hpp"

using namespace pawpal;

namespace {

data::CareTask dailyWalk()
{
    data::CareTask task;
    task.name = QStringLiteral("Morning walk");
    task.category = data::TaskCategory::Walk;
    task.durationMinutes = 30;
    task.priority = 5;
    task.recurrence = data::Recurrence::Daily;
    task.scheduledMinute = 7 * 60;
    task.dueDate = QDate(2026, 2, 15);
    return task;
}

} // namespace

class PlanningContextTest : public QObject
{
    Q_OBJECT

private slots:
    void plansAndReports();
    void completionGoesThroughOwner();
    void concurrentCompletionCreatesOneSuccessor();
    void nullOwnerUsesDefaultBudget();
};

void PlanningContextTest::plansAndReports()
{
    core::PlanningContext context(std::make_unique<data::Owner>(QStringLiteral("Alex"), 45));
    const QUuid petId = context.addPet(QStringLiteral("Buddy"), QStringLiteral("Dog"));
    QVERIFY(context.addTask(petId, dailyWalk()));

    data::CareTask feed = dailyWalk();
    feed.name = QStringLiteral("Feed breakfast");
    feed.category = data::TaskCategory::Feeding;
    feed.durationMinutes = 15;
    feed.scheduledMinute = 7 * 60 + 15;
    QVERIFY(context.addTask(petId, feed));
    QVERIFY(!context.addTask(QUuid::createUuid(), dailyWalk()));

    const QString plan = context.planText(QDate(2026, 2, 15));
    QVERIFY(plan.contains(QStringLiteral("Total Duration: 45 minutes")));

    const auto report = context.conflictReport();
    QVERIFY(report.hasConflicts());
    QCOMPARE(report.descriptions.size(), 1);

    context.setAvailableMinutes(20);
    QVERIFY(context.planText(QDate(2026, 2, 15)).contains(QStringLiteral("Total Duration: 15 minutes")));
}

void PlanningContextTest::completionGoesThroughOwner()
{
    core::PlanningContext context(std::make_unique<data::Owner>(QStringLiteral("Alex"), 60));
    const QUuid petId = context.addPet(QStringLiteral("Buddy"), QStringLiteral("Dog"));
    const auto walk = dailyWalk();
    QVERIFY(context.addTask(petId, walk));

    const auto next = context.completeTask(walk.id);
    QVERIFY(next.has_value());
    QCOMPARE(next->dueDate, QDate(2026, 2, 16));
    QCOMPARE(next->petId, petId);
    QVERIFY(!context.completeTask(walk.id).has_value());

    std::size_t taskCount = 0;
    std::size_t openCount = 0;
    context.withOwner([&](const data::Owner &owner) {
        taskCount = owner.allTasks().size();
        openCount = owner.incompleteTasks().size();
    });
    QCOMPARE(taskCount, static_cast<std::size_t>(2));
    QCOMPARE(openCount, static_cast<std::size_t>(1));
}

void PlanningContextTest::concurrentCompletionCreatesOneSuccessor()
{
    core::PlanningContext context(std::make_unique<data::Owner>(QStringLiteral("Alex"), 60));
    const QUuid petId = context.addPet(QStringLiteral("Buddy"), QStringLiteral("Dog"));
    const auto walk = dailyWalk();
    QVERIFY(context.addTask(petId, walk));

    QAtomicInt successors;
    std::vector<std::unique_ptr<QThread>> threads;
    for (int i = 0; i < 8; ++i) {
        threads.emplace_back(QThread::create([&context, &successors, &walk]() {
            if (context.completeTask(walk.id)) {
                successors.fetchAndAddOrdered(1);
            }
        }));
        threads.back()->start();
    }
    for (auto &thread : threads) {
        QVERIFY(thread->wait(5000));
    }

    QCOMPARE(successors.loadAcquire(), 1);
    std::size_t taskCount = 0;
    context.withOwner([&taskCount](const data::Owner &owner) { taskCount = owner.allTasks().size(); });
    QCOMPARE(taskCount, static_cast<std::size_t>(2));
}

void PlanningContextTest::nullOwnerUsesDefaultBudget()
{
    core::SchedulerSettings settings;
    settings.defaultAvailableMinutes = 90;
    core::PlanningContext context(nullptr, settings);

    int budget = -1;
    context.withOwner([&budget](const data::Owner &owner) { budget = owner.availableMinutes(); });
    QCOMPARE(budget, 90);
    QCOMPARE(context.scheduler().settings().defaultAvailableMinutes, 90);
}

QTEST_GUILESS_MAIN(PlanningContextTest)
#include "PlanningContextTest.moc"
