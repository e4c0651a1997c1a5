// =============================================================================
// FILE: src/dispatch/delay_scheduler.cpp
// =============================================================================
#include "dispatch/delay_scheduler.h"
#include "common/logger.h"

namespace support_router {

DelayScheduler::DelayScheduler() = default;

DelayScheduler::~DelayScheduler() { stop(); }

Result DelayScheduler::start() {
    if (running_.load()) return Result::kAlreadyExists;
    stop_requested_.store(false); running_.store(true);
    thread_ = std::thread(&DelayScheduler::run, this);
    return Result::kOk;
}

void DelayScheduler::stop() {
    if (!running_.load()) return;
    { std::lock_guard<std::mutex> lk(mu_); stop_requested_.store(true); }
    cv_.notify_one();
    if (thread_.joinable()) thread_.join();
    running_.store(false);

    std::lock_guard<std::mutex> lk(mu_);
    if (!timers_.empty()) {
        LOG_WARN("DelayScheduler: %zu pending timers discarded at shutdown", timers_.size());
        stats_.discarded.fetch_add(timers_.size());
        while (!timers_.empty()) timers_.pop();
    }
}

Result DelayScheduler::schedule_after(Millisecs delay, Callback cb) {
    if (!cb) return Result::kInvalidArgument;
    {
        std::lock_guard<std::mutex> lk(mu_);
        if (stop_requested_.load() || !running_.load()) return Result::kShuttingDown;
        timers_.push(Timer{Clock::now() + delay, next_seq_++, std::move(cb)});
        stats_.scheduled.fetch_add(1);
    }
    cv_.notify_one();
    return Result::kOk;
}

size_t DelayScheduler::pending() const {
    std::lock_guard<std::mutex> lk(mu_);
    return timers_.size();
}

void DelayScheduler::run() {
    std::vector<Callback> due;

    while (true) {
        {
            std::unique_lock<std::mutex> lk(mu_);
            if (timers_.empty()) {
                cv_.wait(lk, [this] { return !timers_.empty() || stop_requested_.load(); });
            } else {
                TimePoint next = timers_.top().deadline;
                cv_.wait_until(lk, next, [this, next] {
                    return stop_requested_.load() ||
                           (!timers_.empty() && timers_.top().deadline < next);
                });
            }
            if (stop_requested_.load()) break;

            auto now = Clock::now();
            while (!timers_.empty() && timers_.top().deadline <= now) {
                // priority_queue::top is const; the callback is copied out
                due.push_back(timers_.top().cb);
                timers_.pop();
            }
        }

        for (auto& cb : due) {
            try {
                cb();
                stats_.fired.fetch_add(1);
            } catch (const std::exception& e) {
                stats_.callback_errors.fetch_add(1);
                LOG_ERROR("DelayScheduler: callback threw: %s", e.what());
            }
        }
        due.clear();
    }
}

} // namespace support_router
