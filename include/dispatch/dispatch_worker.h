// =============================================================================
// FILE: include/dispatch/dispatch_worker.h
// =============================================================================
#ifndef DISPATCH_WORKER_H
#define DISPATCH_WORKER_H

#include "common/types.h"
#include "dispatch/inbound_dispatcher.h"
#include <atomic>
#include <condition_variable>
#include <mutex>
#include <queue>
#include <thread>

namespace support_router {

class DelayScheduler;

struct WorkerStats {
    std::atomic<uint64_t> messages_received{0};
    std::atomic<uint64_t> messages_dropped{0};
    std::atomic<uint64_t> cycles_started{0};
    std::atomic<uint64_t> cycles_completed{0};
    std::atomic<uint64_t> store_failures{0};
    std::atomic<uint64_t> queue_depth{0};
};

// One thread draining a queue of work for the addresses hashed to it.
// Arriving messages run the arm phase here; the continuation is parked on
// the DelayScheduler and comes back through this same queue when the
// debounce window ends, so no thread sleeps on a customer.
class DispatchWorker {
public:
    DispatchWorker(size_t worker_index, size_t max_pending,
                   InboundDispatcher& dispatcher, DelayScheduler& scheduler);
    ~DispatchWorker();

    Result start();
    void stop();

    Result enqueue(InboundMessage msg);

    const WorkerStats& stats() const { return stats_; }
    size_t worker_index() const { return worker_index_; }

    DispatchWorker(const DispatchWorker&) = delete;
    DispatchWorker& operator=(const DispatchWorker&) = delete;

private:
    struct WorkItem {
        bool           is_continuation = false;
        InboundMessage message;
        PendingCycle   pending;
    };

    void run();
    void process(WorkItem& item);
    void push_continuation(PendingCycle pending);

    size_t worker_index_;
    size_t max_pending_;
    InboundDispatcher& dispatcher_;
    DelayScheduler& scheduler_;

    std::thread thread_;
    std::atomic<bool> running_{false};
    std::atomic<bool> stop_requested_{false};
    std::mutex incoming_mu_;
    std::condition_variable incoming_cv_;
    std::queue<WorkItem> incoming_queue_;
    WorkerStats stats_;
};

} // namespace support_router
#endif // DISPATCH_WORKER_H
