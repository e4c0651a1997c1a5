// =============================================================================
// FILE: include/state/context_store.h
// =============================================================================
#ifndef STATE_CONTEXT_STORE_H
#define STATE_CONTEXT_STORE_H

#include "state/kv_backend.h"
#include <string>
#include <vector>

namespace support_router {

// One dialogue turn as handed to the classifier. role is "user" or "assistant".
struct ContextEntry {
    std::string role;
    std::string content;

    bool operator==(const ContextEntry& o) const {
        return role == o.role && content == o.content;
    }
};

// Bounded, expiring dialogue history per customer address.
// Each append keeps only the newest max_entries turns and restarts the ttl.
// Backend failures are logged and turn every operation into a no-op /
// empty read.
class ContextStore {
public:
    ContextStore(KvBackend& kv, size_t max_entries, Seconds ttl);

    void append(const std::string& address, const std::string& role,
                const std::string& content);
    std::vector<ContextEntry> read(const std::string& address);
    void clear(const std::string& address);

    size_t max_entries() const { return max_entries_; }

    static std::string key_for(const std::string& address) { return "context:" + address; }

private:
    KvBackend& kv_;
    size_t max_entries_;
    Seconds ttl_;
};

} // namespace support_router
#endif // STATE_CONTEXT_STORE_H
