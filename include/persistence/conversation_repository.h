// =============================================================================
// FILE: include/persistence/conversation_repository.h
// =============================================================================
#ifndef PERSISTENCE_CONVERSATION_REPOSITORY_H
#define PERSISTENCE_CONVERSATION_REPOSITORY_H

#include "common/types.h"
#include "conversation/conversation_types.h"
#include <string>
#include <vector>

namespace support_router {

// Durable store for customers, conversations and messages.
//
// Every call commits on its own; there is no transaction spanning calls.
// Inserts assign the record id. Lookups that find nothing return kNotFound.
// Implementations never throw: driver failures come back as
// kPersistenceError (or kConnectionLost when the store is unreachable).
class ConversationRepository {
public:
    virtual ~ConversationRepository() = default;

    // ---------------------------------------------------------------------
    // Customers
    // ---------------------------------------------------------------------

    virtual Result find_customer_by_address(const std::string& address, Customer& out) = 0;
    virtual Result get_customer(CustomerId id, Customer& out) = 0;

    // kAlreadyExists when another customer holds the same address
    virtual Result insert_customer(Customer& customer) = 0;
    virtual Result update_customer(const Customer& customer) = 0;

    // ---------------------------------------------------------------------
    // Conversations
    // ---------------------------------------------------------------------

    virtual Result insert_conversation(Conversation& conversation) = 0;
    virtual Result get_conversation(ConversationId id, Conversation& out) = 0;
    virtual Result update_conversation(const Conversation& conversation) = 0;

    // Writes status, sector and intent only while the stored status still
    // equals expected; other fields are left alone. kConflict when the
    // status moved on in the meantime.
    virtual Result update_routing(ConversationId id, ConversationStatus expected,
                                  ConversationStatus status, const std::string& sector,
                                  const std::string& intent) = 0;

    // Latest (by start time) conversation that is neither resolved nor closed
    virtual Result find_active_conversation(CustomerId customer_id, Conversation& out) = 0;

    // Latest (by start time) resolved conversation
    virtual Result find_latest_resolved(CustomerId customer_id, Conversation& out) = 0;

    virtual Result count_conversations(ConversationStatus status, size_t& out) = 0;

    // ---------------------------------------------------------------------
    // Messages
    // ---------------------------------------------------------------------

    virtual Result insert_message(Message& message) = 0;
    virtual Result get_message(MessageId id, Message& out) = 0;

    // Oldest first
    virtual Result list_messages(ConversationId conversation_id, std::vector<Message>& out) = 0;

    virtual Result tag_message_intent(MessageId id, const std::string& intent) = 0;
    virtual Result mark_message_read(MessageId id) = 0;
};

} // namespace support_router
#endif // PERSISTENCE_CONVERSATION_REPOSITORY_H
