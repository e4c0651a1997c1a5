// =============================================================================
// FILE: include/dispatch/inbound_message.h
// =============================================================================
#ifndef DISPATCH_INBOUND_MESSAGE_H
#define DISPATCH_INBOUND_MESSAGE_H

#include "conversation/conversation_types.h"
#include <string>

namespace support_router {

// One customer message as delivered by a channel webhook, address already
// in canonical digit form.
struct InboundMessage {
    std::string address;
    std::string text;
    std::string channel_message_id;
    std::string sender_name;
    MessageKind kind = MessageKind::kText;
    std::string media_url;
};

} // namespace support_router
#endif // DISPATCH_INBOUND_MESSAGE_H
