// =============================================================================
// FILE: src/conversation/business_hours.cpp
// =============================================================================
#include "conversation/business_hours.h"
#include <cstdio>

namespace support_router {

namespace {

// "8:05" and "08:05" both normalise to "08:05" so that plain string
// comparison orders them correctly.
std::string normalise_hhmm(const std::string& s) {
    int h = 0, m = 0;
    if (std::sscanf(s.c_str(), "%d:%d", &h, &m) != 2) return s;
    char buf[8];
    std::snprintf(buf, sizeof(buf), "%02d:%02d", h, m);
    return buf;
}

} // namespace

BusinessSchedule BusinessSchedule::from_config(const Config& config) {
    BusinessSchedule s;
    s.weekday_start = config.hours_weekday_start;
    s.weekday_end   = config.hours_weekday_end;
    s.saturday_open = config.hours_saturday_open;
    s.saturday_end  = config.hours_saturday_end;
    s.sunday_open   = config.hours_sunday_open;
    return s;
}

bool is_business_hours(const BusinessSchedule& schedule, const std::tm& local_time) {
    char now_buf[8];
    std::snprintf(now_buf, sizeof(now_buf), "%02d:%02d", local_time.tm_hour, local_time.tm_min);
    std::string now(now_buf);

    std::string start = normalise_hhmm(schedule.weekday_start);

    switch (local_time.tm_wday) {
        case 0:  // Sunday
            return schedule.sunday_open;
        case 6:  // Saturday
            if (!schedule.saturday_open) return false;
            return start <= now && now <= normalise_hhmm(schedule.saturday_end);
        default:
            return start <= now && now <= normalise_hhmm(schedule.weekday_end);
    }
}

bool is_business_hours_now(const BusinessSchedule& schedule) {
    std::time_t t = std::time(nullptr);
    std::tm local_tm;
    localtime_r(&t, &local_tm);
    return is_business_hours(schedule, local_tm);
}

} // namespace support_router
