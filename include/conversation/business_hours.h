// =============================================================================
// FILE: include/conversation/business_hours.h
// =============================================================================
#ifndef CONVERSATION_BUSINESS_HOURS_H
#define CONVERSATION_BUSINESS_HOURS_H

#include "common/config.h"
#include <ctime>
#include <string>

namespace support_router {

struct BusinessSchedule {
    std::string weekday_start = "08:00";
    std::string weekday_end   = "18:00";
    bool        saturday_open = true;
    std::string saturday_end  = "12:00";
    bool        sunday_open   = false;

    static BusinessSchedule from_config(const Config& config);
};

// Minute-resolution check, bounds inclusive.
//   Mon-Fri  weekday_start <= HH:MM <= weekday_end
//   Sat      saturday_open && weekday_start <= HH:MM <= saturday_end
//   Sun      sunday_open (all day)
bool is_business_hours(const BusinessSchedule& schedule, const std::tm& local_time);

// Same check against the current local time
bool is_business_hours_now(const BusinessSchedule& schedule);

} // namespace support_router
#endif // CONVERSATION_BUSINESS_HOURS_H
