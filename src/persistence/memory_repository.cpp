// =============================================================================
// FILE: src/persistence/memory_repository.cpp
// =============================================================================
#include "persistence/memory_repository.h"
#include "conversation/conversation_state_machine.h"

namespace support_router {

// -----------------------------------------------------------------------------
// Customers
// -----------------------------------------------------------------------------

Result MemoryRepository::find_customer_by_address(const std::string& address, Customer& out) {
    std::lock_guard<std::mutex> lk(mu_);
    auto it = customer_by_address_.find(address);
    if (it == customer_by_address_.end()) return Result::kNotFound;
    out = customers_.at(it->second);
    return Result::kOk;
}

Result MemoryRepository::get_customer(CustomerId id, Customer& out) {
    std::lock_guard<std::mutex> lk(mu_);
    auto it = customers_.find(id);
    if (it == customers_.end()) return Result::kNotFound;
    out = it->second;
    return Result::kOk;
}

Result MemoryRepository::insert_customer(Customer& customer) {
    if (customer.address.empty()) return Result::kInvalidArgument;
    std::lock_guard<std::mutex> lk(mu_);
    if (customer_by_address_.count(customer.address)) return Result::kAlreadyExists;
    customer.id = next_customer_id_++;
    customers_[customer.id] = customer;
    customer_by_address_[customer.address] = customer.id;
    return Result::kOk;
}

Result MemoryRepository::update_customer(const Customer& customer) {
    std::lock_guard<std::mutex> lk(mu_);
    auto it = customers_.find(customer.id);
    if (it == customers_.end()) return Result::kNotFound;
    if (it->second.address != customer.address) return Result::kInvalidArgument;
    it->second = customer;
    return Result::kOk;
}

// -----------------------------------------------------------------------------
// Conversations
// -----------------------------------------------------------------------------

Result MemoryRepository::insert_conversation(Conversation& conversation) {
    std::lock_guard<std::mutex> lk(mu_);
    if (!customers_.count(conversation.customer_id)) return Result::kNotFound;
    conversation.id = next_conversation_id_++;
    conversations_[conversation.id] = conversation;
    return Result::kOk;
}

Result MemoryRepository::get_conversation(ConversationId id, Conversation& out) {
    std::lock_guard<std::mutex> lk(mu_);
    auto it = conversations_.find(id);
    if (it == conversations_.end()) return Result::kNotFound;
    out = it->second;
    return Result::kOk;
}

Result MemoryRepository::update_conversation(const Conversation& conversation) {
    std::lock_guard<std::mutex> lk(mu_);
    auto it = conversations_.find(conversation.id);
    if (it == conversations_.end()) return Result::kNotFound;
    it->second = conversation;
    return Result::kOk;
}

Result MemoryRepository::update_routing(ConversationId id, ConversationStatus expected,
                                        ConversationStatus status, const std::string& sector,
                                        const std::string& intent) {
    std::lock_guard<std::mutex> lk(mu_);
    auto it = conversations_.find(id);
    if (it == conversations_.end()) return Result::kNotFound;
    if (it->second.status != expected) return Result::kConflict;
    it->second.status = status;
    it->second.sector = sector;
    it->second.intent = intent;
    return Result::kOk;
}

template <typename Pred>
const Conversation* MemoryRepository::latest_locked(CustomerId customer_id, Pred pred) const {
    const Conversation* best = nullptr;
    for (const auto& kv : conversations_) {
        const Conversation& c = kv.second;
        if (c.customer_id != customer_id || !pred(c)) continue;
        // Ties on start time go to the higher id
        if (!best || c.started_at >= best->started_at) best = &c;
    }
    return best;
}

Result MemoryRepository::find_active_conversation(CustomerId customer_id, Conversation& out) {
    std::lock_guard<std::mutex> lk(mu_);
    const Conversation* c = latest_locked(customer_id, [](const Conversation& conv) {
        return ConversationStateMachine::is_active(conv.status);
    });
    if (!c) return Result::kNotFound;
    out = *c;
    return Result::kOk;
}

Result MemoryRepository::find_latest_resolved(CustomerId customer_id, Conversation& out) {
    std::lock_guard<std::mutex> lk(mu_);
    const Conversation* c = latest_locked(customer_id, [](const Conversation& conv) {
        return conv.status == ConversationStatus::kResolved;
    });
    if (!c) return Result::kNotFound;
    out = *c;
    return Result::kOk;
}

Result MemoryRepository::count_conversations(ConversationStatus status, size_t& out) {
    std::lock_guard<std::mutex> lk(mu_);
    out = 0;
    for (const auto& kv : conversations_) {
        if (kv.second.status == status) ++out;
    }
    return Result::kOk;
}

std::vector<Conversation> MemoryRepository::conversations_of(CustomerId customer_id) {
    std::lock_guard<std::mutex> lk(mu_);
    std::vector<Conversation> out;
    for (const auto& kv : conversations_) {
        if (kv.second.customer_id == customer_id) out.push_back(kv.second);
    }
    return out;
}

// -----------------------------------------------------------------------------
// Messages
// -----------------------------------------------------------------------------

Result MemoryRepository::insert_message(Message& message) {
    std::lock_guard<std::mutex> lk(mu_);
    if (!conversations_.count(message.conversation_id)) return Result::kNotFound;
    message.id = next_message_id_++;
    messages_[message.id] = message;
    return Result::kOk;
}

Result MemoryRepository::get_message(MessageId id, Message& out) {
    std::lock_guard<std::mutex> lk(mu_);
    auto it = messages_.find(id);
    if (it == messages_.end()) return Result::kNotFound;
    out = it->second;
    return Result::kOk;
}

Result MemoryRepository::list_messages(ConversationId conversation_id, std::vector<Message>& out) {
    std::lock_guard<std::mutex> lk(mu_);
    out.clear();
    for (const auto& kv : messages_) {
        if (kv.second.conversation_id == conversation_id) out.push_back(kv.second);
    }
    return Result::kOk;
}

Result MemoryRepository::tag_message_intent(MessageId id, const std::string& intent) {
    std::lock_guard<std::mutex> lk(mu_);
    auto it = messages_.find(id);
    if (it == messages_.end()) return Result::kNotFound;
    it->second.intent = intent;
    return Result::kOk;
}

Result MemoryRepository::mark_message_read(MessageId id) {
    std::lock_guard<std::mutex> lk(mu_);
    auto it = messages_.find(id);
    if (it == messages_.end()) return Result::kNotFound;
    it->second.is_read = true;
    return Result::kOk;
}

} // namespace support_router
