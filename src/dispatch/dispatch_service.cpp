// =============================================================================
// FILE: src/dispatch/dispatch_service.cpp
// =============================================================================
#include "dispatch/dispatch_service.h"
#include "common/logger.h"
#include <functional>

namespace support_router {

DispatchService::DispatchService(const Config& config, InboundDispatcher& dispatcher)
    : dispatcher_(dispatcher) {
    size_t n = config.num_workers > 0 ? config.num_workers : 4;
    workers_.reserve(n);
    for (size_t i = 0; i < n; ++i) {
        workers_.push_back(std::make_unique<DispatchWorker>(
            i, config.max_pending_per_worker, dispatcher_, scheduler_));
    }
}

DispatchService::~DispatchService() { stop(); }

Result DispatchService::start() {
    if (started_) return Result::kAlreadyExists;
    auto r = scheduler_.start();
    if (r != Result::kOk) return r;
    for (auto& w : workers_) {
        r = w->start();
        if (r != Result::kOk) { stop(); return r; }
    }
    started_ = true;
    LOG_INFO("DispatchService: %zu workers, debounce window %ldms",
             workers_.size(), static_cast<long>(dispatcher_.debounce_window().count()));
    return Result::kOk;
}

// Timers go first so no continuation lands on a stopped worker
void DispatchService::stop() {
    scheduler_.stop();
    for (auto& w : workers_) w->stop();
    started_ = false;
}

size_t DispatchService::worker_index_for(const std::string& address) const {
    return std::hash<std::string>{}(address) % workers_.size();
}

Result DispatchService::submit(InboundMessage msg) {
    if (!started_) return Result::kShuttingDown;
    if (msg.address.empty()) return Result::kInvalidArgument;
    size_t idx = worker_index_for(msg.address);
    return workers_[idx]->enqueue(std::move(msg));
}

DispatchService::AggregateStats DispatchService::aggregate_stats() const {
    AggregateStats a{};
    for (const auto& w : workers_) {
        const auto& s = w->stats();
        a.total_messages_received += s.messages_received.load();
        a.total_messages_dropped += s.messages_dropped.load();
        a.total_cycles_started += s.cycles_started.load();
        a.total_cycles_completed += s.cycles_completed.load();
        a.total_store_failures += s.store_failures.load();
        uint64_t qd = s.queue_depth.load();
        if (qd > a.max_queue_depth) a.max_queue_depth = qd;
    }
    a.pending_timers = scheduler_.pending();
    return a;
}

} // namespace support_router
