// =============================================================================
// FILE: src/state/context_store.cpp
// =============================================================================
#include "state/context_store.h"
#include "common/logger.h"
#include <json/json.h>
#include <memory>
#include <sstream>

namespace support_router {

namespace {

std::string encode_entry(const std::string& role, const std::string& content) {
    Json::Value v(Json::objectValue);
    v["role"] = role;
    v["content"] = content;
    Json::StreamWriterBuilder builder;
    builder["indentation"] = "";
    return Json::writeString(builder, v);
}

bool decode_entry(const std::string& raw, ContextEntry& out) {
    Json::CharReaderBuilder builder;
    std::unique_ptr<Json::CharReader> reader(builder.newCharReader());
    Json::Value v;
    std::string errs;
    if (!reader->parse(raw.data(), raw.data() + raw.size(), &v, &errs)) return false;
    if (!v.isObject() || !v["role"].isString() || !v["content"].isString()) return false;
    out.role = v["role"].asString();
    out.content = v["content"].asString();
    return true;
}

} // namespace

ContextStore::ContextStore(KvBackend& kv, size_t max_entries, Seconds ttl)
    : kv_(kv), max_entries_(max_entries), ttl_(ttl)
{}

void ContextStore::append(const std::string& address, const std::string& role,
                          const std::string& content) {
    try {
        kv_.list_append_capped(key_for(address), encode_entry(role, content),
                               max_entries_, std::chrono::duration_cast<Millisecs>(ttl_));
    } catch (const std::exception& e) {
        LOG_WARN("ContextStore: append for %s dropped: %s", address.c_str(), e.what());
    }
}

std::vector<ContextEntry> ContextStore::read(const std::string& address) {
    std::vector<ContextEntry> out;
    std::vector<std::string> raw;
    try {
        raw = kv_.list_range(key_for(address));
    } catch (const std::exception& e) {
        LOG_WARN("ContextStore: read for %s failed, using empty context: %s",
                 address.c_str(), e.what());
        return out;
    }

    out.reserve(raw.size());
    for (const auto& item : raw) {
        ContextEntry entry;
        if (decode_entry(item, entry)) {
            out.push_back(std::move(entry));
        } else {
            LOG_DEBUG("ContextStore: skipping malformed entry for %s", address.c_str());
        }
    }
    return out;
}

void ContextStore::clear(const std::string& address) {
    try {
        kv_.del(key_for(address));
    } catch (const std::exception& e) {
        LOG_WARN("ContextStore: clear for %s failed: %s", address.c_str(), e.what());
    }
}

} // namespace support_router
