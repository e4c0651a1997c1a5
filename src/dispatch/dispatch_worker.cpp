// =============================================================================
// FILE: src/dispatch/dispatch_worker.cpp
// =============================================================================
#include "dispatch/dispatch_worker.h"
#include "dispatch/delay_scheduler.h"
#include "common/logger.h"

namespace support_router {

DispatchWorker::DispatchWorker(size_t idx, size_t max_pending,
                               InboundDispatcher& dispatcher, DelayScheduler& scheduler)
    : worker_index_(idx), max_pending_(max_pending)
    , dispatcher_(dispatcher), scheduler_(scheduler)
{}

DispatchWorker::~DispatchWorker() { stop(); }

Result DispatchWorker::start() {
    if (running_.load()) return Result::kAlreadyExists;
    stop_requested_.store(false); running_.store(true);
    thread_ = std::thread(&DispatchWorker::run, this);
    return Result::kOk;
}

void DispatchWorker::stop() {
    if (!running_.load()) return;
    { std::lock_guard<std::mutex> lk(incoming_mu_); stop_requested_.store(true); }
    incoming_cv_.notify_one();
    if (thread_.joinable()) thread_.join();
    running_.store(false);
}

Result DispatchWorker::enqueue(InboundMessage msg) {
    if (stop_requested_.load()) return Result::kShuttingDown;
    {
        std::lock_guard<std::mutex> lk(incoming_mu_);
        if (incoming_queue_.size() >= max_pending_) {
            stats_.messages_dropped.fetch_add(1);
            return Result::kCapacityExceeded;
        }
        WorkItem item;
        item.message = std::move(msg);
        incoming_queue_.push(std::move(item));
        stats_.messages_received.fetch_add(1);
        stats_.queue_depth.store(incoming_queue_.size());
    }
    incoming_cv_.notify_one();
    return Result::kOk;
}

// Continuations bypass the capacity limit: their message is already stored
void DispatchWorker::push_continuation(PendingCycle pending) {
    {
        std::lock_guard<std::mutex> lk(incoming_mu_);
        if (stop_requested_.load()) {
            LOG_WARN("Worker %zu: stopping, reply cycle for %s dropped",
                     worker_index_, pending.inbound.address.c_str());
            return;
        }
        WorkItem item;
        item.is_continuation = true;
        item.pending = std::move(pending);
        incoming_queue_.push(std::move(item));
        stats_.queue_depth.store(incoming_queue_.size());
    }
    incoming_cv_.notify_one();
}

void DispatchWorker::run() {
    std::queue<WorkItem> local_batch;

    while (true) {
        {
            std::unique_lock<std::mutex> lk(incoming_mu_);
            incoming_cv_.wait_for(lk, Millisecs(100), [this] {
                return !incoming_queue_.empty() || stop_requested_.load();
            });
            if (stop_requested_.load() && incoming_queue_.empty()) break;
            std::swap(local_batch, incoming_queue_);
            stats_.queue_depth.store(0);
        }

        while (!local_batch.empty()) {
            process(local_batch.front());
            local_batch.pop();
        }
    }
    LOG_DEBUG("Worker %zu: exiting", worker_index_);
}

void DispatchWorker::process(WorkItem& item) {
    if (item.is_continuation) {
        CycleOutcome outcome = dispatcher_.complete_cycle(item.pending);
        stats_.cycles_completed.fetch_add(1);
        LOG_TRACE("Worker %zu: cycle for %s -> %s", worker_index_,
                  item.pending.inbound.address.c_str(), cycle_outcome_to_string(outcome));
        return;
    }

    PendingCycle pending;
    Result r = dispatcher_.begin_cycle(item.message, pending);
    if (r != Result::kOk) {
        stats_.store_failures.fetch_add(1);
        LOG_ERROR("Worker %zu: message from %s not accepted: %s", worker_index_,
                  item.message.address.c_str(), result_to_string(r));
        return;
    }
    stats_.cycles_started.fetch_add(1);

    auto shared = std::make_shared<PendingCycle>(std::move(pending));
    r = scheduler_.schedule_after(dispatcher_.debounce_window(), [this, shared] {
        push_continuation(std::move(*shared));
    });
    if (r != Result::kOk) {
        LOG_WARN("Worker %zu: debounce timer for %s not scheduled (%s)", worker_index_,
                 shared->inbound.address.c_str(), result_to_string(r));
    }
}

} // namespace support_router
