// =============================================================================
// FILE: src/conversation/conversation_state_machine.cpp
// =============================================================================
#include "conversation/conversation_state_machine.h"
#include "common/logger.h"

namespace support_router {

bool ConversationStateMachine::can_transition(ConversationStatus from, ConversationStatus to) {
    using S = ConversationStatus;
    switch (to) {
        case S::kWaitingQueue:
            return from == S::kBotHandling;
        case S::kInProgress:
            return from == S::kBotHandling || from == S::kWaitingQueue;
        case S::kResolved:
            return from == S::kBotHandling || from == S::kWaitingQueue ||
                   from == S::kInProgress;
        case S::kClosed:
            return from == S::kInProgress || from == S::kResolved;
        case S::kBotHandling:
            return from == S::kResolved;
        default:
            return false;
    }
}

namespace {

Result reject(const Conversation& conv, ConversationStatus to) {
    LOG_WARN("Conversation %ld: %s -> %s not allowed",
             static_cast<long>(conv.id), status_to_string(conv.status), status_to_string(to));
    return Result::kInvalidArgument;
}

} // namespace

Result ConversationStateMachine::begin_waiting(Conversation& conv, const std::string& sector) {
    if (!can_transition(conv.status, ConversationStatus::kWaitingQueue)) {
        return reject(conv, ConversationStatus::kWaitingQueue);
    }
    conv.status = ConversationStatus::kWaitingQueue;
    conv.sector = sector;
    return Result::kOk;
}

Result ConversationStateMachine::accept(Conversation& conv, OperatorId operator_id) {
    if (operator_id == 0) return Result::kInvalidArgument;
    if (!can_transition(conv.status, ConversationStatus::kInProgress)) {
        return reject(conv, ConversationStatus::kInProgress);
    }
    conv.status = ConversationStatus::kInProgress;
    conv.operator_id = operator_id;
    return Result::kOk;
}

Result ConversationStateMachine::resolve(Conversation& conv, WallTime now) {
    if (!can_transition(conv.status, ConversationStatus::kResolved)) {
        return reject(conv, ConversationStatus::kResolved);
    }
    conv.status = ConversationStatus::kResolved;
    conv.resolved_at = now;
    return Result::kOk;
}

Result ConversationStateMachine::close(Conversation& conv, WallTime now) {
    if (!can_transition(conv.status, ConversationStatus::kClosed)) {
        return reject(conv, ConversationStatus::kClosed);
    }
    conv.status = ConversationStatus::kClosed;
    if (!conv.has_resolved_at()) conv.resolved_at = now;
    return Result::kOk;
}

bool ConversationStateMachine::should_reactivate(const Conversation& conv, WallTime now,
                                                 Hours window) {
    if (conv.status != ConversationStatus::kResolved) return false;
    WallTime cutoff = now - window;
    // Either timestamp inside the window counts
    return (conv.has_resolved_at() && conv.resolved_at > cutoff) ||
           conv.started_at > cutoff;
}

Result ConversationStateMachine::reactivate(Conversation& conv) {
    if (!can_transition(conv.status, ConversationStatus::kBotHandling)) {
        return reject(conv, ConversationStatus::kBotHandling);
    }
    conv.status = ConversationStatus::kBotHandling;
    conv.resolved_at = WallTime();
    conv.operator_id = 0;
    conv.sector.clear();
    conv.intent.clear();
    return Result::kOk;
}

} // namespace support_router
