// =============================================================================
// FILE: include/persistence/memory_repository.h
// =============================================================================
#ifndef PERSISTENCE_MEMORY_REPOSITORY_H
#define PERSISTENCE_MEMORY_REPOSITORY_H

#include "persistence/conversation_repository.h"
#include <map>
#include <mutex>
#include <unordered_map>

namespace support_router {

// Process-local repository used by tests and when MongoDB persistence is
// disabled. Contents are lost on exit.
class MemoryRepository final : public ConversationRepository {
public:
    MemoryRepository() = default;

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

    // Every conversation of a customer, oldest first
    std::vector<Conversation> conversations_of(CustomerId customer_id);

private:
    // Latest by start time among conversations of customer_id matching pred.
    // Caller holds mu_.
    template <typename Pred>
    const Conversation* latest_locked(CustomerId customer_id, Pred pred) const;

    std::mutex mu_;
    std::map<CustomerId, Customer> customers_;
    std::unordered_map<std::string, CustomerId> customer_by_address_;
    std::map<ConversationId, Conversation> conversations_;
    std::map<MessageId, Message> messages_;
    CustomerId next_customer_id_ = 1;
    ConversationId next_conversation_id_ = 1;
    MessageId next_message_id_ = 1;
};

} // namespace support_router
#endif // PERSISTENCE_MEMORY_REPOSITORY_H
