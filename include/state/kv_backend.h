// =============================================================================
// FILE: include/state/kv_backend.h
// =============================================================================
#ifndef STATE_KV_BACKEND_H
#define STATE_KV_BACKEND_H

#include "common/types.h"
#include <string>
#include <vector>

namespace support_router {

// Key-value store holding the ephemeral routing state (context windows,
// debounce stamps, reply fingerprints, sector queues).
//
// Every single call is atomic with respect to its key. Implementations report
// storage failures by throwing std::exception; the state components above
// this interface catch and degrade.
//
// A ttl of zero means "no expiry".
class KvBackend {
public:
    virtual ~KvBackend() = default;

    // Plain values
    virtual bool get(const std::string& key, std::string& out) = 0;
    virtual void set(const std::string& key, const std::string& value, Millisecs ttl) = 0;
    virtual bool expire(const std::string& key, Millisecs ttl) = 0;
    virtual bool del(const std::string& key) = 0;

    // Stores value unless the current value equals it. Returns true when the
    // stored value already matched (nothing written, expiry untouched).
    virtual bool check_and_set(const std::string& key, const std::string& value,
                               Millisecs ttl) = 0;

    // Lists
    virtual size_t list_push_back(const std::string& key, const std::string& value) = 0;
    virtual bool   list_pop_front(const std::string& key, std::string& out) = 0;
    virtual size_t list_remove(const std::string& key, const std::string& value) = 0;
    virtual size_t list_length(const std::string& key) = 0;
    virtual std::vector<std::string> list_range(const std::string& key) = 0;

    // Appends, keeps only the newest max_len elements and resets the expiry.
    virtual void list_append_capped(const std::string& key, const std::string& value,
                                    size_t max_len, Millisecs ttl) = 0;

    // Sets
    virtual bool set_add(const std::string& key, const std::string& member) = 0;
    virtual bool set_remove(const std::string& key, const std::string& member) = 0;
    virtual bool set_contains(const std::string& key, const std::string& member) = 0;
    virtual std::vector<std::string> set_members(const std::string& key) = 0;

    // Number of keys currently held, for /stats
    virtual size_t key_count() = 0;
};

} // namespace support_router
#endif // STATE_KV_BACKEND_H
