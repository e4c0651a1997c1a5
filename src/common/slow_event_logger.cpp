// =============================================================================
// FILE: src/common/slow_event_logger.cpp
// =============================================================================
#include "common/slow_event_logger.h"

namespace support_router {

SlowEventLogger::SlowEventLogger(const Config& config)
    : warn_ms_(config.slow_event_warn_threshold.count())
    , error_ms_(config.slow_event_error_threshold.count())
    , critical_ms_(config.slow_event_critical_threshold.count())
{}

void SlowEventLogger::set_thresholds(Millisecs warn, Millisecs error, Millisecs critical) {
    warn_ms_.store(warn.count(), std::memory_order_relaxed);
    error_ms_.store(error.count(), std::memory_order_relaxed);
    critical_ms_.store(critical.count(), std::memory_order_relaxed);
}

SlowEventLogger::Thresholds SlowEventLogger::thresholds() const {
    return {
        Millisecs(warn_ms_.load(std::memory_order_relaxed)),
        Millisecs(error_ms_.load(std::memory_order_relaxed)),
        Millisecs(critical_ms_.load(std::memory_order_relaxed))
    };
}

void SlowEventLogger::record(const char* operation,
                             const std::string& subject,
                             const std::string& extra_context,
                             Millisecs elapsed) {
    int64_t ms = elapsed.count();
    stats_.timed_count.fetch_add(1, std::memory_order_relaxed);

    uint64_t prev_max = stats_.max_duration_ms.load(std::memory_order_relaxed);
    while (static_cast<uint64_t>(ms) > prev_max) {
        if (stats_.max_duration_ms.compare_exchange_weak(prev_max, static_cast<uint64_t>(ms),
                std::memory_order_relaxed)) break;
    }

    int64_t crit = critical_ms_.load(std::memory_order_relaxed);
    int64_t err  = error_ms_.load(std::memory_order_relaxed);
    int64_t warn = warn_ms_.load(std::memory_order_relaxed);

    if (ms < warn) return;

    const char* grade = "SLOW";
    if (ms >= crit) {
        stats_.critical_count.fetch_add(1, std::memory_order_relaxed);
        grade = "CRITICAL";
    } else if (ms >= err) {
        stats_.error_count.fetch_add(1, std::memory_order_relaxed);
        grade = "VERY_SLOW";
    } else {
        stats_.warn_count.fetch_add(1, std::memory_order_relaxed);
    }

    LOG_SLOW("%s: %s took %ldms subject=%s %s",
             grade, operation, static_cast<long>(ms), subject.c_str(), extra_context.c_str());
    if (ms >= err) {
        LOG_ERROR("%s: %s took %ldms subject=%s",
                  grade, operation, static_cast<long>(ms), subject.c_str());
    }
}

SlowEventLogger::Timer::Timer(SlowEventLogger& logger, const char* operation,
                              const std::string& subject, const std::string& extra)
    : logger_(logger), operation_(operation), subject_(subject)
    , extra_context_(extra), start_(Clock::now())
{}

SlowEventLogger::Timer::~Timer() {
    if (!finished_) finish();
}

void SlowEventLogger::Timer::finish() {
    if (finished_) return;
    finished_ = true;
    logger_.record(operation_, subject_, extra_context_, elapsed());
}

} // namespace support_router
