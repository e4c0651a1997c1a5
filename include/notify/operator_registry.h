// =============================================================================
// FILE: include/notify/operator_registry.h
// =============================================================================
#ifndef NOTIFY_OPERATOR_REGISTRY_H
#define NOTIFY_OPERATOR_REGISTRY_H

#include "dispatch/notifier.h"
#include <json/json.h>
#include <atomic>
#include <functional>
#include <mutex>
#include <unordered_map>
#include <utility>
#include <vector>

namespace support_router {

// Event payload documents, shared with the operator HTTP endpoints
Json::Value message_to_json(const Message& message);
Json::Value conversation_to_json(const Conversation& conversation);
std::string write_compact_json(const Json::Value& value);

// Connected operator clients and the JSON events pushed to them.
//
// A client is an operator id, the sector it works on and a sink that
// delivers one serialized event. A sink that throws is logged and skipped;
// delivery to the other clients continues.
//
// Events:
//   {"type":"new_message","conversation_id":N,"message":{...}}      all
//   {"type":"queue_update","queue_sizes":{"<sector>":N,...}}         all
//   {"type":"new_conversation","conversation":{...}}                 sector
class OperatorRegistry : public Notifier {
public:
    using EventSink = std::function<void(const std::string& event)>;

    OperatorRegistry() = default;

    // A second connect for the same operator replaces the earlier one
    void connect(OperatorId operator_id, const std::string& sector, EventSink sink);
    void disconnect(OperatorId operator_id);
    size_t connected() const;

    bool send_to(OperatorId operator_id, const std::string& event);
    size_t broadcast_sector(const std::string& sector, const std::string& event);
    size_t broadcast_all(const std::string& event);

    void notify_message(ConversationId conversation_id, const std::string& sector,
                        const Message& message) override;
    void notify_queue_sizes(const std::map<std::string, size_t>& sizes) override;
    void notify_new_conversation(const std::string& sector,
                                 const Conversation& conversation) override;

    struct RegistryStats {
        std::atomic<uint64_t> events_sent{0};
        std::atomic<uint64_t> sink_failures{0};
    };
    const RegistryStats& stats() const { return stats_; }

    OperatorRegistry(const OperatorRegistry&) = delete;
    OperatorRegistry& operator=(const OperatorRegistry&) = delete;

private:
    struct Client {
        std::string sector;
        EventSink   sink;
    };

    // Sinks run outside the lock; this returns the matching copies
    std::vector<std::pair<OperatorId, EventSink>> select(const std::string* sector) const;
    bool deliver(OperatorId operator_id, const EventSink& sink, const std::string& event);

    mutable std::mutex mu_;
    std::unordered_map<OperatorId, Client> clients_;
    RegistryStats stats_;
};

} // namespace support_router
#endif // NOTIFY_OPERATOR_REGISTRY_H
