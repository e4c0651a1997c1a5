// =============================================================================
// FILE: include/dispatch/inbound_dispatcher.h
// =============================================================================
#ifndef DISPATCH_INBOUND_DISPATCHER_H
#define DISPATCH_INBOUND_DISPATCHER_H

#include "common/config.h"
#include "common/slow_event_logger.h"
#include "conversation/business_hours.h"
#include "conversation/sector_catalog.h"
#include "dispatch/classifier.h"
#include "dispatch/inbound_message.h"
#include "dispatch/notifier.h"
#include "dispatch/sender.h"
#include "persistence/conversation_repository.h"
#include "state/context_store.h"
#include "state/debounce_gate.h"
#include "state/dedup_guard.h"
#include "state/sector_queue_router.h"
#include <atomic>
#include <functional>

namespace support_router {

// State carried from the arm phase to the continuation after the debounce
// window.
struct PendingCycle {
    InboundMessage  inbound;
    CustomerId      customer_id = 0;
    std::string     customer_name;
    ConversationId  conversation_id = 0;
    Message         inbound_record;
    int64_t         armed_at = 0;
    TimePoint       received_at{};
};

enum class CycleOutcome {
    kReplied,          // reply sent (or attempted) and stored
    kHandedOff,        // reply stored and the conversation queued / migrated
    kSuperseded,       // a newer message for the customer took over
    kOperatorHandling, // conversation is in_progress, bot stays silent
    kDuplicate,        // same reply sent recently, nothing sent
    kFailed            // error after the inbound message was stored
};

const char* cycle_outcome_to_string(CycleOutcome o);

struct DispatcherStats {
    std::atomic<uint64_t> messages_received{0};
    std::atomic<uint64_t> messages_rejected{0};
    std::atomic<uint64_t> customers_created{0};
    std::atomic<uint64_t> conversations_created{0};
    std::atomic<uint64_t> conversations_reactivated{0};
    std::atomic<uint64_t> cycles_superseded{0};
    std::atomic<uint64_t> cycles_operator_handling{0};
    std::atomic<uint64_t> replies_deduplicated{0};
    std::atomic<uint64_t> replies_sent{0};
    std::atomic<uint64_t> send_failures{0};
    std::atomic<uint64_t> handoffs{0};
    std::atomic<uint64_t> sector_migrations{0};
    std::atomic<uint64_t> routing_conflicts{0};
    std::atomic<uint64_t> cycle_failures{0};
};

// Per-message orchestration, split at the debounce suspension:
//
//   begin_cycle     resolve customer, resolve/reactivate/create conversation,
//                   store the inbound message, append it to the context, arm
//                   the debounce gate
//   (caller waits debounce_window without holding a worker)
//   complete_cycle  superseded / operator checks, classify, dedup, send,
//                   store the reply, handoff, notify
//
// Nothing after the inbound message is stored can prevent it from staying
// stored; later failures are logged and reported as kFailed.
class InboundDispatcher {
public:
    using WallClockFn = std::function<WallTime()>;

    InboundDispatcher(const Config& config,
                      const SectorCatalog& catalog,
                      ConversationRepository& repository,
                      ContextStore& context,
                      DebounceGate& debounce,
                      DedupGuard& dedup,
                      SectorQueueRouter& queues,
                      Classifier& classifier,
                      Sender& sender,
                      Notifier& notifier,
                      SlowEventLogger& slow_logger);

    // kInvalidArgument for an empty address or text, kPersistenceError /
    // kConnectionLost when the inbound message could not be stored.
    Result begin_cycle(const InboundMessage& msg, PendingCycle& out);

    CycleOutcome complete_cycle(const PendingCycle& pending);

    Millisecs debounce_window() const { return debounce_window_; }

    // Wall clock used for timestamps, debounce stamps and reactivation
    void set_clock(WallClockFn clock) { clock_ = std::move(clock); }
    void set_business_hours_check(std::function<bool()> check) { business_hours_ = std::move(check); }

    const DispatcherStats& stats() const { return stats_; }

private:
    Result resolve_customer(const InboundMessage& msg, WallTime now, Customer& out);
    Result resolve_conversation(Customer& customer, WallTime now, Conversation& out);

    // Writes intent, sector and status back unless an operator action changed
    // the conversation during the reply; then runs the queue side of a
    // handoff. Returns the outcome of the cycle.
    CycleOutcome route(Conversation& conv, bool needs_human, const std::string& sector);

    // Queue side of a handoff whose status is already stored.
    // false when the conversation could not be queued.
    bool place_in_queue(const Conversation& conv, ConversationStatus previous);

    void notify_queue_sizes();
    void notify_messages(const Conversation& conv, const Message& inbound, const Message& reply);

    const SectorCatalog& catalog_;
    ConversationRepository& repo_;
    ContextStore& context_;
    DebounceGate& debounce_;
    DedupGuard& dedup_;
    SectorQueueRouter& queues_;
    Classifier& classifier_;
    Sender& sender_;
    Notifier& notifier_;
    SlowEventLogger& slow_logger_;

    ReplyDedupPolicy dedup_policy_;
    std::string fallback_sector_;
    std::string notify_fallback_sector_;
    Millisecs debounce_window_;
    Hours reactivation_window_;

    WallClockFn clock_;
    std::function<bool()> business_hours_;
    DispatcherStats stats_;
};

} // namespace support_router
#endif // DISPATCH_INBOUND_DISPATCHER_H
