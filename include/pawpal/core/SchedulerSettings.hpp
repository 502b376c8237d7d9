#pragma once

#include "pawpal/data/CareTask.hpp"

class QSettings;

namespace pawpal {
namespace core {

struct SchedulerSettings
{
    int defaultAvailableMinutes = 120;
    // Conflict detection clamps computed end times to this minute of day.
    int dayEndMinute = data::kLastMinuteOfDay;

    static SchedulerSettings load(QSettings &settings);
    void save(QSettings &settings) const;
};

} // namespace core
} // namespace pawpal
