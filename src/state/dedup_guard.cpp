// =============================================================================
// FILE: src/state/dedup_guard.cpp
// =============================================================================
#include "state/dedup_guard.h"
#include "common/logger.h"
#include <openssl/md5.h>
#include <iomanip>
#include <sstream>

namespace support_router {

DedupGuard::DedupGuard(KvBackend& kv) : kv_(kv) {}

std::string DedupGuard::fingerprint(const std::string& key) {
    unsigned char digest[MD5_DIGEST_LENGTH];
    MD5(reinterpret_cast<const unsigned char*>(key.data()), key.size(), digest);

    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (int i = 0; i < MD5_DIGEST_LENGTH; ++i) {
        oss << std::setw(2) << static_cast<int>(digest[i]);
    }
    return oss.str();
}

bool DedupGuard::is_duplicate(const std::string& address, const std::string& key,
                              Millisecs ttl) {
    if (key.empty()) return false;

    try {
        bool dup = kv_.check_and_set(key_for(address), fingerprint(key), ttl);
        if (dup) {
            LOG_DEBUG("DedupGuard: repeated reply for %s suppressed", address.c_str());
        }
        return dup;
    } catch (const std::exception& e) {
        LOG_WARN("DedupGuard: check for %s failed, treating as new: %s",
                 address.c_str(), e.what());
        return false;
    }
}

// =============================================================================
// ReplyDedupPolicy
// =============================================================================

ReplyDedupPolicy::ReplyDedupPolicy(std::vector<std::string> app_link_markers,
                                   std::string app_link_key,
                                   Seconds app_link_ttl,
                                   Seconds text_ttl)
    : markers_(std::move(app_link_markers))
    , app_link_key_(std::move(app_link_key))
    , app_link_ttl_(std::chrono::duration_cast<Millisecs>(app_link_ttl))
    , text_ttl_(std::chrono::duration_cast<Millisecs>(text_ttl))
{}

DedupKey ReplyDedupPolicy::key_for(const std::string& reply) const {
    for (const auto& marker : markers_) {
        if (!marker.empty() && reply.find(marker) != std::string::npos) {
            return {app_link_key_, app_link_ttl_};
        }
    }
    return {reply, text_ttl_};
}

} // namespace support_router
