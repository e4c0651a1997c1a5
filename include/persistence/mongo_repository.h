// =============================================================================
// FILE: include/persistence/mongo_repository.h
// =============================================================================
#ifndef PERSISTENCE_MONGO_REPOSITORY_H
#define PERSISTENCE_MONGO_REPOSITORY_H

#include "persistence/conversation_repository.h"
#include "persistence/mongo_client.h"
#include <memory>
#include <string>

namespace support_router {

// MongoDB-backed repository.
//
// Collections (names from the [mongodb] config section):
//   customers      {_id, address (unique), name, first_contact, last_contact,
//                   total_conversations}
//   conversations  {_id, customer_id, status, sector, intent, operator_id,
//                   priority, started_at, resolved_at}
//   messages       {_id, conversation_id, sender_role, sender_id, content,
//                   kind, media_url, channel_message_id, intent, is_read,
//                   created_at}
//   counters       {_id: <sequence>, seq}    integer id allocation via $inc
class MongoRepository final : public ConversationRepository {
public:
    explicit MongoRepository(std::shared_ptr<MongoClient> client);

    // Unique address index plus the lookup indexes; idempotent.
    Result ensure_indexes();

    Result find_customer_by_address(const std::string& address, Customer& out) override;
    Result get_customer(CustomerId id, Customer& out) override;
    Result insert_customer(Customer& customer) override;
    Result update_customer(const Customer& customer) override;

    Result insert_conversation(Conversation& conversation) override;
    Result get_conversation(ConversationId id, Conversation& out) override;
    Result update_conversation(const Conversation& conversation) override;
    Result update_routing(ConversationId id, ConversationStatus expected,
                          ConversationStatus status, const std::string& sector,
                          const std::string& intent) override;
    Result find_active_conversation(CustomerId customer_id, Conversation& out) override;
    Result find_latest_resolved(CustomerId customer_id, Conversation& out) override;
    Result count_conversations(ConversationStatus status, size_t& out) override;

    Result insert_message(Message& message) override;
    Result get_message(MessageId id, Message& out) override;
    Result list_messages(ConversationId conversation_id, std::vector<Message>& out) override;
    Result tag_message_intent(MessageId id, const std::string& intent) override;
    Result mark_message_read(MessageId id) override;

private:
    // Runs fn(scoped_client) with timing, stats and exception translation.
    template <typename Fn>
    Result run(const char* operation, Fn&& fn);

    std::shared_ptr<MongoClient> client_;
    const Config& config_;
};

} // namespace support_router
#endif // PERSISTENCE_MONGO_REPOSITORY_H
