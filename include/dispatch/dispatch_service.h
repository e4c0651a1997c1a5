// =============================================================================
// FILE: include/dispatch/dispatch_service.h
// =============================================================================
#ifndef DISPATCH_SERVICE_H
#define DISPATCH_SERVICE_H

#include "common/types.h"
#include "common/config.h"
#include "dispatch/delay_scheduler.h"
#include "dispatch/dispatch_worker.h"
#include <memory>
#include <vector>

namespace support_router {

// Front door for inbound messages: shards them onto workers by customer
// address and owns the timer thread that parks debounce continuations.
class DispatchService {
public:
    DispatchService(const Config& config, InboundDispatcher& dispatcher);
    ~DispatchService();

    Result start();
    void stop();

    // kShuttingDown when stopped, kInvalidArgument for an empty address,
    // kCapacityExceeded when the worker queue is full.
    Result submit(InboundMessage msg);

    size_t worker_index_for(const std::string& address) const;
    size_t num_workers() const { return workers_.size(); }
    const DispatchWorker& worker(size_t idx) const { return *workers_[idx]; }
    bool running() const { return started_; }

    struct AggregateStats {
        uint64_t total_messages_received = 0, total_messages_dropped = 0;
        uint64_t total_cycles_started = 0, total_cycles_completed = 0;
        uint64_t total_store_failures = 0, max_queue_depth = 0;
        uint64_t pending_timers = 0;
    };
    AggregateStats aggregate_stats() const;

    const InboundDispatcher& dispatcher() const { return dispatcher_; }

    DispatchService(const DispatchService&) = delete;
    DispatchService& operator=(const DispatchService&) = delete;

private:
    InboundDispatcher& dispatcher_;
    DelayScheduler scheduler_;
    std::vector<std::unique_ptr<DispatchWorker>> workers_;
    bool started_ = false;
};

} // namespace support_router
#endif // DISPATCH_SERVICE_H
