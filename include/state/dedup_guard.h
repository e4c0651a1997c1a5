// =============================================================================
// FILE: include/state/dedup_guard.h
// =============================================================================
#ifndef STATE_DEDUP_GUARD_H
#define STATE_DEDUP_GUARD_H

#include "state/kv_backend.h"
#include <string>
#include <vector>

namespace support_router {

// Suppresses sending the same reply twice to one address within a window.
// The store keeps one fingerprint (MD5 hex of the key) per address.
class DedupGuard {
public:
    explicit DedupGuard(KvBackend& kv);

    // True when the stored fingerprint equals fingerprint(key); the stored
    // entry is then left untouched. Otherwise the new fingerprint replaces
    // the old one with the given ttl and false is returned.
    // An empty key, or a backend failure, is never a duplicate.
    bool is_duplicate(const std::string& address, const std::string& key, Millisecs ttl);

    static std::string fingerprint(const std::string& key);
    static std::string key_for(const std::string& address) { return "dedup:" + address; }

private:
    KvBackend& kv_;
};

// Dedup key and window derived from an outgoing reply.
struct DedupKey {
    std::string key;
    Millisecs   ttl;
};

// Replies pointing at the app stores all collapse to one static key with a
// longer window, whatever their wording. Anything else dedups on its text.
class ReplyDedupPolicy {
public:
    ReplyDedupPolicy(std::vector<std::string> app_link_markers,
                     std::string app_link_key,
                     Seconds app_link_ttl,
                     Seconds text_ttl);

    DedupKey key_for(const std::string& reply) const;

private:
    std::vector<std::string> markers_;
    std::string app_link_key_;
    Millisecs app_link_ttl_;
    Millisecs text_ttl_;
};

} // namespace support_router
#endif // STATE_DEDUP_GUARD_H
