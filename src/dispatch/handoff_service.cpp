// =============================================================================
// FILE: src/dispatch/handoff_service.cpp
// =============================================================================
#include "dispatch/handoff_service.h"
#include "conversation/conversation_state_machine.h"
#include "common/logger.h"

namespace support_router {

HandoffService::HandoffService(ConversationRepository& repository,
                               SectorQueueRouter& queues,
                               ContextStore& context,
                               Sender& sender,
                               Notifier& notifier,
                               std::string notify_fallback_sector)
    : repo_(repository), queues_(queues), context_(context)
    , sender_(sender), notifier_(notifier)
    , notify_fallback_sector_(std::move(notify_fallback_sector))
    , clock_([] { return WallClock::now(); })
{}

void HandoffService::publish_queue_sizes() {
    try {
        notifier_.notify_queue_sizes(queues_.sizes());
    } catch (const std::exception& e) {
        LOG_WARN("Handoff: queue notification failed: %s", e.what());
    }
}

void HandoffService::release_queue_slot(const Conversation& before) {
    // The queue holding the conversation may differ from its sector label
    if (before.status != ConversationStatus::kWaitingQueue && !queues_.is_queued(before.id)) {
        return;
    }

    Result r = queues_.remove_anywhere(before.id);
    if (r != Result::kOk) {
        LOG_WARN("Handoff: queue slot of %ld not released: %s",
                 static_cast<long>(before.id), result_to_string(r));
    }
    publish_queue_sizes();
}

Result HandoffService::accept(ConversationId conversation_id, OperatorId operator_id,
                              Conversation& out) {
    std::lock_guard<std::mutex> lk(mu_);
    Conversation conv;
    Result r = repo_.get_conversation(conversation_id, conv);
    if (r != Result::kOk) return r;

    Conversation before = conv;
    r = ConversationStateMachine::accept(conv, operator_id);
    if (r != Result::kOk) return r;

    release_queue_slot(before);

    r = repo_.update_conversation(conv);
    if (r != Result::kOk) return r;

    LOG_INFO("Handoff: conversation %ld accepted by operator %ld",
             static_cast<long>(conv.id), static_cast<long>(operator_id));
    out = conv;
    return Result::kOk;
}

Result HandoffService::accept_next(const std::string& sector, OperatorId operator_id,
                                   Conversation& out) {
    if (operator_id == 0) return Result::kInvalidArgument;

    // Queue entries whose conversation moved on are skipped
    while (true) {
        ConversationId id = 0;
        Result r = queues_.dequeue_next(sector, id);
        if (r != Result::kOk) return r;

        std::lock_guard<std::mutex> lk(mu_);
        Conversation conv;
        r = repo_.get_conversation(id, conv);
        if (r == Result::kNotFound) {
            LOG_WARN("Handoff: queued conversation %ld no longer exists", static_cast<long>(id));
            continue;
        }
        if (r != Result::kOk) return r;

        if (ConversationStateMachine::accept(conv, operator_id) != Result::kOk) {
            LOG_WARN("Handoff: queued conversation %ld is %s, skipped",
                     static_cast<long>(id), status_to_string(conv.status));
            continue;
        }
        r = repo_.update_conversation(conv);
        if (r != Result::kOk) return r;

        publish_queue_sizes();
        LOG_INFO("Handoff: operator %ld took %ld from %s",
                 static_cast<long>(operator_id), static_cast<long>(id), sector.c_str());
        out = conv;
        return Result::kOk;
    }
}

Result HandoffService::resolve(ConversationId conversation_id, Conversation& out) {
    std::lock_guard<std::mutex> lk(mu_);
    Conversation conv;
    Result r = repo_.get_conversation(conversation_id, conv);
    if (r != Result::kOk) return r;

    Conversation before = conv;
    r = ConversationStateMachine::resolve(conv, clock_());
    if (r != Result::kOk) return r;

    release_queue_slot(before);

    r = repo_.update_conversation(conv);
    if (r != Result::kOk) return r;

    LOG_INFO("Handoff: conversation %ld resolved", static_cast<long>(conv.id));
    out = conv;
    return Result::kOk;
}

Result HandoffService::close(ConversationId conversation_id, Conversation& out) {
    std::lock_guard<std::mutex> lk(mu_);
    Conversation conv;
    Result r = repo_.get_conversation(conversation_id, conv);
    if (r != Result::kOk) return r;

    Conversation before = conv;
    r = ConversationStateMachine::close(conv, clock_());
    if (r != Result::kOk) return r;

    release_queue_slot(before);

    r = repo_.update_conversation(conv);
    if (r != Result::kOk) return r;

    LOG_INFO("Handoff: conversation %ld closed", static_cast<long>(conv.id));
    out = conv;
    return Result::kOk;
}

Result HandoffService::send_operator_message(ConversationId conversation_id,
                                             OperatorId operator_id,
                                             const std::string& text, Message& out) {
    if (text.empty() || operator_id == 0) return Result::kInvalidArgument;

    Conversation conv;
    Result r = repo_.get_conversation(conversation_id, conv);
    if (r != Result::kOk) return r;

    Customer customer;
    r = repo_.get_customer(conv.customer_id, customer);
    if (r != Result::kOk) return r;

    SendResult sent;
    try {
        sent = sender_.send(customer.address, text);
    } catch (const std::exception& e) {
        sent.success = false;
        sent.error = e.what();
    }
    if (!sent.success) {
        LOG_ERROR("Handoff: operator %ld message to %s failed: %s",
                  static_cast<long>(operator_id), customer.address.c_str(), sent.error.c_str());
        return Result::kError;
    }

    Message msg;
    msg.conversation_id = conv.id;
    msg.sender_role = SenderRole::kOperator;
    msg.sender_id = std::to_string(operator_id);
    msg.content = text;
    msg.kind = MessageKind::kText;
    msg.channel_message_id = sent.message_id;
    msg.created_at = clock_();
    r = repo_.insert_message(msg);
    if (r != Result::kOk) return r;

    context_.append(customer.address, "assistant", text);

    const std::string& sector = conv.sector.empty() ? notify_fallback_sector_ : conv.sector;
    try {
        notifier_.notify_message(conv.id, sector, msg);
    } catch (const std::exception& e) {
        LOG_WARN("Handoff: message notification for %ld failed: %s",
                 static_cast<long>(conv.id), e.what());
    }

    out = msg;
    return Result::kOk;
}

Result HandoffService::mark_read(MessageId message_id) {
    return repo_.mark_message_read(message_id);
}

} // namespace support_router
