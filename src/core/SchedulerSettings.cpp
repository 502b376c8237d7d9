#include "pawpal/core/SchedulerSettings.hpp"

#include <QSettings>
#include <QtGlobal>

namespace pawpal {
namespace core {

namespace {
const QString KEY_AVAILABLE_MINUTES = QStringLiteral("scheduler/defaultAvailableMinutes");
const QString KEY_DAY_END_MINUTE = QStringLiteral("scheduler/dayEndMinute");
} // namespace

SchedulerSettings SchedulerSettings::load(QSettings &settings)
{
    SchedulerSettings result;
    const int storedMinutes = settings.value(KEY_AVAILABLE_MINUTES, result.defaultAvailableMinutes).toInt();
    result.defaultAvailableMinutes = qMax(0, storedMinutes);
    const int storedDayEnd = settings.value(KEY_DAY_END_MINUTE, result.dayEndMinute).toInt();
    result.dayEndMinute = qBound(0, storedDayEnd, data::kLastMinuteOfDay);
    return result;
}

void SchedulerSettings::save(QSettings &settings) const
{
    settings.setValue(KEY_AVAILABLE_MINUTES, defaultAvailableMinutes);
    settings.setValue(KEY_DAY_END_MINUTE, dayEndMinute);
}

} // namespace core
} // namespace pawpal
