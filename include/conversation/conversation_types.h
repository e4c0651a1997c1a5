// =============================================================================
// FILE: include/conversation/conversation_types.h
// =============================================================================
#ifndef CONVERSATION_TYPES_H
#define CONVERSATION_TYPES_H

#include "common/types.h"
#include <string>

namespace support_router {

enum class ConversationStatus {
    kBotHandling,
    kWaitingQueue,
    kInProgress,
    kResolved,
    kClosed
};

inline const char* status_to_string(ConversationStatus s) {
    switch (s) {
        case ConversationStatus::kBotHandling:  return "bot_handling";
        case ConversationStatus::kWaitingQueue: return "waiting_queue";
        case ConversationStatus::kInProgress:   return "in_progress";
        case ConversationStatus::kResolved:     return "resolved";
        case ConversationStatus::kClosed:       return "closed";
        default:                                return "unknown";
    }
}

inline bool parse_status(const std::string& s, ConversationStatus& out) {
    if (s == "bot_handling")  { out = ConversationStatus::kBotHandling;  return true; }
    if (s == "waiting_queue") { out = ConversationStatus::kWaitingQueue; return true; }
    if (s == "in_progress")   { out = ConversationStatus::kInProgress;   return true; }
    if (s == "resolved")      { out = ConversationStatus::kResolved;     return true; }
    if (s == "closed")        { out = ConversationStatus::kClosed;       return true; }
    return false;
}

enum class SenderRole { kCustomer, kBot, kOperator };

inline const char* sender_role_to_string(SenderRole r) {
    switch (r) {
        case SenderRole::kCustomer: return "customer";
        case SenderRole::kBot:      return "bot";
        case SenderRole::kOperator: return "operator";
        default:                    return "unknown";
    }
}

inline bool parse_sender_role(const std::string& s, SenderRole& out) {
    if (s == "customer") { out = SenderRole::kCustomer; return true; }
    if (s == "bot")      { out = SenderRole::kBot;      return true; }
    if (s == "operator") { out = SenderRole::kOperator; return true; }
    return false;
}

enum class MessageKind { kText, kImage, kAudio, kDocument, kOther };

inline const char* message_kind_to_string(MessageKind k) {
    switch (k) {
        case MessageKind::kText:     return "text";
        case MessageKind::kImage:    return "image";
        case MessageKind::kAudio:    return "audio";
        case MessageKind::kDocument: return "document";
        default:                     return "other";
    }
}

inline MessageKind parse_message_kind(const std::string& s) {
    if (s == "text")     return MessageKind::kText;
    if (s == "image")    return MessageKind::kImage;
    if (s == "audio")    return MessageKind::kAudio;
    if (s == "document") return MessageKind::kDocument;
    return MessageKind::kOther;
}

// A customer reachable on the channel. address is the canonical digit form.
struct Customer {
    CustomerId  id = 0;
    std::string address;
    std::string name;                 // empty = unknown
    WallTime    first_contact{};
    WallTime    last_contact{};
    int         total_conversations = 0;
};

struct Conversation {
    ConversationId     id = 0;
    CustomerId         customer_id = 0;
    ConversationStatus status = ConversationStatus::kBotHandling;
    std::string        sector;        // empty = none
    std::string        intent;        // empty = none
    OperatorId         operator_id = 0;  // 0 = unassigned
    int                priority = 0;
    WallTime           started_at{};
    WallTime           resolved_at{};    // epoch = unset

    bool has_operator() const { return operator_id != 0; }
    bool has_resolved_at() const { return resolved_at != WallTime(); }
};

// Immutable once stored, except for is_read.
struct Message {
    MessageId      id = 0;
    ConversationId conversation_id = 0;
    SenderRole     sender_role = SenderRole::kCustomer;
    std::string    sender_id;
    std::string    content;
    MessageKind    kind = MessageKind::kText;
    std::string    media_url;
    std::string    channel_message_id;
    std::string    intent;
    bool           is_read = false;
    WallTime       created_at{};
};

} // namespace support_router
#endif // CONVERSATION_TYPES_H
