// =============================================================================
// FILE: include/dispatch/handoff_service.h
// =============================================================================
#ifndef DISPATCH_HANDOFF_SERVICE_H
#define DISPATCH_HANDOFF_SERVICE_H

#include "dispatch/notifier.h"
#include "dispatch/sender.h"
#include "persistence/conversation_repository.h"
#include "state/context_store.h"
#include "state/sector_queue_router.h"
#include <functional>
#include <mutex>

namespace support_router {

// Operator-side lifecycle actions on conversations.
//
// Status changes go through ConversationStateMachine; a transition it
// rejects comes back as kInvalidArgument with nothing changed. Every action
// that alters queue contents publishes the new queue sizes.
class HandoffService {
public:
    using WallClockFn = std::function<WallTime()>;

    HandoffService(ConversationRepository& repository,
                   SectorQueueRouter& queues,
                   ContextStore& context,
                   Sender& sender,
                   Notifier& notifier,
                   std::string notify_fallback_sector);

    // waiting_queue | bot_handling -> in_progress, assigned to operator_id
    Result accept(ConversationId conversation_id, OperatorId operator_id, Conversation& out);

    // Takes the head of the sector queue. kNotFound when the queue is empty.
    Result accept_next(const std::string& sector, OperatorId operator_id, Conversation& out);

    Result resolve(ConversationId conversation_id, Conversation& out);
    Result close(ConversationId conversation_id, Conversation& out);

    // Delivers text to the customer, then stores it and appends it to the
    // context. kError when delivery fails (nothing stored).
    Result send_operator_message(ConversationId conversation_id, OperatorId operator_id,
                                 const std::string& text, Message& out);

    Result mark_read(MessageId message_id);

    void set_clock(WallClockFn clock) { clock_ = std::move(clock); }

private:
    // Removes any queue slot of a conversation leaving the waiting state
    void release_queue_slot(const Conversation& before);
    void publish_queue_sizes();

    ConversationRepository& repo_;
    SectorQueueRouter& queues_;
    ContextStore& context_;
    Sender& sender_;
    Notifier& notifier_;
    std::string notify_fallback_sector_;
    WallClockFn clock_;

    // Serialises read-modify-write of conversation records between operators
    std::mutex mu_;
};

} // namespace support_router
#endif // DISPATCH_HANDOFF_SERVICE_H
