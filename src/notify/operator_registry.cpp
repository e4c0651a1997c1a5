// =============================================================================
// FILE: src/notify/operator_registry.cpp
// =============================================================================
#include "notify/operator_registry.h"
#include "common/logger.h"

namespace support_router {

std::string write_compact_json(const Json::Value& v) {
    Json::StreamWriterBuilder w;
    w["indentation"] = "";
    return Json::writeString(w, v);
}

Json::Value message_to_json(const Message& m) {
    Json::Value v(Json::objectValue);
    v["id"]                 = Json::Int64(m.id);
    v["conversation_id"]    = Json::Int64(m.conversation_id);
    v["sender_type"]        = sender_role_to_string(m.sender_role);
    v["sender_id"]          = m.sender_id;
    v["content"]            = m.content;
    v["message_type"]       = message_kind_to_string(m.kind);
    v["media_url"]          = m.media_url;
    v["channel_message_id"] = m.channel_message_id;
    v["intent"]             = m.intent;
    v["is_read"]            = m.is_read;
    v["created_at_us"]      = Json::Int64(to_epoch_us(m.created_at));
    return v;
}

Json::Value conversation_to_json(const Conversation& c) {
    Json::Value v(Json::objectValue);
    v["id"]          = Json::Int64(c.id);
    v["customer_id"] = Json::Int64(c.customer_id);
    v["status"]      = status_to_string(c.status);
    v["sector"]      = c.sector;
    v["intent"]      = c.intent;
    if (c.has_operator()) {
        v["operator_id"] = Json::Int64(c.operator_id);
    } else {
        v["operator_id"] = Json::Value(Json::nullValue);
    }
    v["priority"]      = c.priority;
    v["started_at_us"] = Json::Int64(to_epoch_us(c.started_at));
    return v;
}

void OperatorRegistry::connect(OperatorId operator_id, const std::string& sector,
                               EventSink sink) {
    std::lock_guard<std::mutex> lk(mu_);
    clients_[operator_id] = Client{sector, std::move(sink)};
    LOG_INFO("Operator %ld connected (sector=%s, %zu online)",
             static_cast<long>(operator_id), sector.c_str(), clients_.size());
}

void OperatorRegistry::disconnect(OperatorId operator_id) {
    std::lock_guard<std::mutex> lk(mu_);
    if (clients_.erase(operator_id) > 0) {
        LOG_INFO("Operator %ld disconnected (%zu online)",
                 static_cast<long>(operator_id), clients_.size());
    }
}

size_t OperatorRegistry::connected() const {
    std::lock_guard<std::mutex> lk(mu_);
    return clients_.size();
}

std::vector<std::pair<OperatorId, OperatorRegistry::EventSink>>
OperatorRegistry::select(const std::string* sector) const {
    std::vector<std::pair<OperatorId, EventSink>> out;
    std::lock_guard<std::mutex> lk(mu_);
    out.reserve(clients_.size());
    for (const auto& kv : clients_) {
        if (sector && kv.second.sector != *sector) continue;
        out.emplace_back(kv.first, kv.second.sink);
    }
    return out;
}

bool OperatorRegistry::deliver(OperatorId operator_id, const EventSink& sink,
                               const std::string& event) {
    if (!sink) return false;
    try {
        sink(event);
        stats_.events_sent.fetch_add(1, std::memory_order_relaxed);
        return true;
    } catch (const std::exception& e) {
        stats_.sink_failures.fetch_add(1, std::memory_order_relaxed);
        LOG_WARN("Operator %ld: event delivery failed: %s",
                 static_cast<long>(operator_id), e.what());
        return false;
    }
}

bool OperatorRegistry::send_to(OperatorId operator_id, const std::string& event) {
    EventSink sink;
    {
        std::lock_guard<std::mutex> lk(mu_);
        auto it = clients_.find(operator_id);
        if (it == clients_.end()) return false;
        sink = it->second.sink;
    }
    return deliver(operator_id, sink, event);
}

size_t OperatorRegistry::broadcast_sector(const std::string& sector, const std::string& event) {
    size_t delivered = 0;
    for (const auto& target : select(&sector)) {
        if (deliver(target.first, target.second, event)) ++delivered;
    }
    return delivered;
}

size_t OperatorRegistry::broadcast_all(const std::string& event) {
    size_t delivered = 0;
    for (const auto& target : select(nullptr)) {
        if (deliver(target.first, target.second, event)) ++delivered;
    }
    return delivered;
}

void OperatorRegistry::notify_message(ConversationId conversation_id, const std::string& sector,
                                      const Message& message) {
    Json::Value ev(Json::objectValue);
    ev["type"]            = "new_message";
    ev["conversation_id"] = Json::Int64(conversation_id);
    ev["message"]         = message_to_json(message);
    size_t n = broadcast_all(write_compact_json(ev));
    LOG_DEBUG("new_message for %ld (sector=%s) sent to %zu operators",
              static_cast<long>(conversation_id), sector.c_str(), n);
}

void OperatorRegistry::notify_queue_sizes(const std::map<std::string, size_t>& sizes) {
    Json::Value ev(Json::objectValue);
    ev["type"] = "queue_update";
    Json::Value q(Json::objectValue);
    for (const auto& kv : sizes) {
        q[kv.first] = Json::UInt64(kv.second);
    }
    ev["queue_sizes"] = q;
    broadcast_all(write_compact_json(ev));
}

void OperatorRegistry::notify_new_conversation(const std::string& sector,
                                               const Conversation& conversation) {
    Json::Value ev(Json::objectValue);
    ev["type"]         = "new_conversation";
    ev["conversation"] = conversation_to_json(conversation);
    size_t n = broadcast_sector(sector, write_compact_json(ev));
    LOG_INFO("new_conversation %ld announced to %zu operators of %s",
             static_cast<long>(conversation.id), n, sector.c_str());
}

} // namespace support_router
