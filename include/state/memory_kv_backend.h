// =============================================================================
// FILE: include/state/memory_kv_backend.h
// =============================================================================
#ifndef STATE_MEMORY_KV_BACKEND_H
#define STATE_MEMORY_KV_BACKEND_H

#include "state/kv_backend.h"
#include <deque>
#include <mutex>
#include <set>
#include <unordered_map>

namespace support_router {

// In-process KvBackend. One mutex guards the whole keyspace; expired keys
// are dropped lazily on access and by purge_expired().
//
// Using a key with an operation of the wrong kind (list op on a plain value)
// throws std::logic_error.
class MemoryKvBackend : public KvBackend {
public:
    MemoryKvBackend() = default;

    bool get(const std::string& key, std::string& out) override;
    void set(const std::string& key, const std::string& value, Millisecs ttl) override;
    bool expire(const std::string& key, Millisecs ttl) override;
    bool del(const std::string& key) override;
    bool check_and_set(const std::string& key, const std::string& value,
                       Millisecs ttl) override;

    size_t list_push_back(const std::string& key, const std::string& value) override;
    bool   list_pop_front(const std::string& key, std::string& out) override;
    size_t list_remove(const std::string& key, const std::string& value) override;
    size_t list_length(const std::string& key) override;
    std::vector<std::string> list_range(const std::string& key) override;
    void list_append_capped(const std::string& key, const std::string& value,
                            size_t max_len, Millisecs ttl) override;

    bool set_add(const std::string& key, const std::string& member) override;
    bool set_remove(const std::string& key, const std::string& member) override;
    bool set_contains(const std::string& key, const std::string& member) override;
    std::vector<std::string> set_members(const std::string& key) override;

    // Drops every expired key, returns how many were removed
    size_t purge_expired();
    size_t key_count() override;

private:
    enum class Kind { kValue, kList, kSet };

    struct Entry {
        Kind kind = Kind::kValue;
        std::string value;
        std::deque<std::string> list;
        std::set<std::string> members;
        bool has_expiry = false;
        TimePoint expires_at;
    };

    // Live entry or nullptr; erases the key if it has expired. Caller holds mu_.
    Entry* find_live(const std::string& key);
    // Live entry of the given kind, created empty when absent. Caller holds mu_.
    Entry& find_or_create(const std::string& key, Kind kind);
    static void apply_ttl(Entry& e, Millisecs ttl);
    static void require_kind(const Entry& e, Kind kind, const std::string& key);

    std::mutex mu_;
    std::unordered_map<std::string, Entry> entries_;
};

} // namespace support_router
#endif // STATE_MEMORY_KV_BACKEND_H
