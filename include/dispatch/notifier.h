// =============================================================================
// FILE: include/dispatch/notifier.h
// =============================================================================
#ifndef DISPATCH_NOTIFIER_H
#define DISPATCH_NOTIFIER_H

#include "conversation/conversation_types.h"
#include <map>
#include <string>

namespace support_router {

// Fire-and-forget events towards connected operator clients.
class Notifier {
public:
    virtual ~Notifier() = default;

    virtual void notify_message(ConversationId conversation_id, const std::string& sector,
                                const Message& message) = 0;
    virtual void notify_queue_sizes(const std::map<std::string, size_t>& sizes) = 0;
    virtual void notify_new_conversation(const std::string& sector,
                                         const Conversation& conversation) = 0;
};

} // namespace support_router
#endif // DISPATCH_NOTIFIER_H
