#include <QCoreApplication>
#include <QDate>
#include <QSettings>
#include <QString>
#include <QTextStream>
#include <memory>
#include <utility>

#include "version.h"

#include "pawpal/core/PlanningContext.hpp"
#include "pawpal/core/SchedulerSettings.hpp"
#include "pawpal/data/DemoHousehold.hpp"
#include "pawpal/data/Owner.hpp"
#include "pawpal/data/Pet.hpp"

int main(int argc, char *argv[])
{
    QCoreApplication::setOrganizationName(QStringLiteral("PawPal"));
    QCoreApplication::setOrganizationDomain(QStringLiteral("pawpal.example"));
    QCoreApplication::setApplicationName(QStringLiteral("PawPal Planner"));

    QCoreApplication app(argc, argv);

    QSettings settings;
    const auto schedulerSettings = pawpal::core::SchedulerSettings::load(settings);
    const QDate today = QDate::currentDate();

    auto owner = std::make_unique<pawpal::data::Owner>(QObject::tr("Jordan"),
                                                       schedulerSettings.defaultAvailableMinutes);
    pawpal::data::seedDemoHousehold(*owner, today);
    pawpal::core::PlanningContext context(std::move(owner), schedulerSettings);

    QTextStream out(stdout);
    out << QObject::tr("PawPal Planner %1").arg(QString::fromLatin1(kPawPalVersion)) << '\n';
    context.withOwner([&out](const pawpal::data::Owner &household) {
        out << household.description() << '\n';
        for (const auto *pet : household.pets()) {
            out << "  " << pet->description() << '\n';
        }
    });
    out << '\n' << context.planText(today) << "\n\n";
    out << context.conflictReport().toText() << '\n';

    QUuid firstTask;
    context.withOwner([&firstTask](const pawpal::data::Owner &household) {
        const auto tasks = household.incompleteTasks();
        if (!tasks.empty()) {
            firstTask = tasks.front()->id;
        }
    });
    if (!firstTask.isNull()) {
        if (const auto next = context.completeTask(firstTask)) {
            out << '\n' << QObject::tr("Completed %1, next occurrence due %2")
                               .arg(next->name, next->dueDate.toString(Qt::ISODate))
                << '\n';
        }
    }
    out.flush();
    return 0;
}
