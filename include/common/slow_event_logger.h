// =============================================================================
// FILE: include/common/slow_event_logger.h
// =============================================================================
#ifndef SLOW_EVENT_LOGGER_H
#define SLOW_EVENT_LOGGER_H

#include "common/types.h"
#include "common/config.h"
#include "common/logger.h"
#include <atomic>
#include <string>

namespace support_router {

// Reports external calls and reply cycles that exceed configured thresholds.
// Usage:
//   SlowEventLogger::Timer timer(slow_logger, "classifier", address);
//   ... call the collaborator ...
//   timer.finish(); // or let destructor call it
//
//   >= warn_threshold:     slow log, WARN
//   >= error_threshold:    slow log, ERROR
//   >= critical_threshold: slow log, ERROR + critical counter
class SlowEventLogger {
public:
    explicit SlowEventLogger(const Config& config);

    void set_thresholds(Millisecs warn, Millisecs error, Millisecs critical);

    struct Thresholds {
        Millisecs warn;
        Millisecs error;
        Millisecs critical;
    };
    Thresholds thresholds() const;

    // RAII timer for automatic reporting
    class Timer {
    public:
        Timer(SlowEventLogger& logger,
              const char* operation,
              const std::string& subject,
              const std::string& extra_context = "");
        ~Timer();

        // Explicit finish (prevents double report in destructor)
        void finish();

        void set_extra_context(const std::string& extra) { extra_context_ = extra; }

        Millisecs elapsed() const {
            return std::chrono::duration_cast<Millisecs>(Clock::now() - start_);
        }

    private:
        SlowEventLogger& logger_;
        const char* operation_;
        std::string subject_;
        std::string extra_context_;
        TimePoint start_;
        bool finished_ = false;
    };

    struct Stats {
        std::atomic<uint64_t> timed_count{0};
        std::atomic<uint64_t> warn_count{0};
        std::atomic<uint64_t> error_count{0};
        std::atomic<uint64_t> critical_count{0};
        std::atomic<uint64_t> max_duration_ms{0};
    };
    const Stats& stats() const { return stats_; }

private:
    friend class Timer;
    void record(const char* operation,
                const std::string& subject,
                const std::string& extra_context,
                Millisecs elapsed);

    std::atomic<int64_t> warn_ms_;
    std::atomic<int64_t> error_ms_;
    std::atomic<int64_t> critical_ms_;
    Stats stats_;
};

} // namespace support_router
#endif // SLOW_EVENT_LOGGER_H
