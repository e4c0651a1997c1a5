// =============================================================================
// FILE: include/dispatch/delay_scheduler.h
// =============================================================================
#ifndef DISPATCH_DELAY_SCHEDULER_H
#define DISPATCH_DELAY_SCHEDULER_H

#include "common/types.h"
#include <atomic>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>

namespace support_router {

// Single timer thread running callbacks at or after their deadline.
// Callbacks must be short (they hand work back to a worker queue).
// Timers still pending at stop() are discarded.
class DelayScheduler {
public:
    using Callback = std::function<void()>;

    DelayScheduler();
    ~DelayScheduler();

    Result start();
    void stop();

    Result schedule_after(Millisecs delay, Callback cb);

    size_t pending() const;

    struct SchedulerStats {
        std::atomic<uint64_t> scheduled{0};
        std::atomic<uint64_t> fired{0};
        std::atomic<uint64_t> discarded{0};
        std::atomic<uint64_t> callback_errors{0};
    };
    const SchedulerStats& stats() const { return stats_; }

    DelayScheduler(const DelayScheduler&) = delete;
    DelayScheduler& operator=(const DelayScheduler&) = delete;

private:
    struct Timer {
        TimePoint deadline;
        uint64_t  seq;
        Callback  cb;
    };
    // Earliest deadline on top, FIFO among equal deadlines
    struct Later {
        bool operator()(const Timer& a, const Timer& b) const {
            if (a.deadline != b.deadline) return a.deadline > b.deadline;
            return a.seq > b.seq;
        }
    };

    void run();

    std::thread thread_;
    std::atomic<bool> running_{false};
    std::atomic<bool> stop_requested_{false};
    mutable std::mutex mu_;
    std::condition_variable cv_;
    std::priority_queue<Timer, std::vector<Timer>, Later> timers_;
    uint64_t next_seq_ = 0;
    SchedulerStats stats_;
};

} // namespace support_router
#endif // DISPATCH_DELAY_SCHEDULER_H
