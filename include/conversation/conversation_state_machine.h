// =============================================================================
// FILE: include/conversation/conversation_state_machine.h
// =============================================================================
#ifndef CONVERSATION_STATE_MACHINE_H
#define CONVERSATION_STATE_MACHINE_H

#include "conversation/conversation_types.h"

namespace support_router {

// Lifecycle rules for a Conversation.
//
//   bot_handling  -> waiting_queue              handoff
//   bot_handling | waiting_queue -> in_progress operator accepts
//   bot_handling | waiting_queue | in_progress -> resolved
//   in_progress | resolved -> closed            (terminal)
//   resolved -> bot_handling                    reactivation only
//
// The transition helpers mutate the record in place and return
// kInvalidArgument, leaving it untouched, when the move is not allowed.
// Queue membership is the caller's concern.
class ConversationStateMachine {
public:
    static bool is_active(ConversationStatus s) {
        return s != ConversationStatus::kResolved && s != ConversationStatus::kClosed;
    }
    static bool is_terminal(ConversationStatus s) { return s == ConversationStatus::kClosed; }

    static bool can_transition(ConversationStatus from, ConversationStatus to);

    static Result begin_waiting(Conversation& conv, const std::string& sector);
    static Result accept(Conversation& conv, OperatorId operator_id);
    static Result resolve(Conversation& conv, WallTime now);
    static Result close(Conversation& conv, WallTime now);

    // True when conv is resolved and its resolution time or its start time
    // is newer than now - window.
    static bool should_reactivate(const Conversation& conv, WallTime now, Hours window);

    // Back to bot_handling with resolution, operator, sector and intent cleared.
    static Result reactivate(Conversation& conv);

    // Automated replies are only produced outside in_progress.
    static bool bot_may_reply(const Conversation& conv) {
        return conv.status != ConversationStatus::kInProgress;
    }
};

} // namespace support_router
#endif // CONVERSATION_STATE_MACHINE_H
