// =============================================================================
// FILE: src/state/debounce_gate.cpp
// =============================================================================
#include "state/debounce_gate.h"
#include "common/logger.h"

namespace support_router {

DebounceGate::DebounceGate(KvBackend& kv, Seconds key_ttl)
    : kv_(kv), key_ttl_(key_ttl)
{}

int64_t DebounceGate::arm(const std::string& address, WallTime now) {
    int64_t stamp = to_epoch_us(now);
    try {
        kv_.set(key_for(address), std::to_string(stamp),
                std::chrono::duration_cast<Millisecs>(key_ttl_));
    } catch (const std::exception& e) {
        LOG_WARN("DebounceGate: arm for %s not recorded: %s", address.c_str(), e.what());
    }
    return stamp;
}

bool DebounceGate::superseded_since(const std::string& address, int64_t armed_at) {
    std::string raw;
    try {
        if (!kv_.get(key_for(address), raw)) return false;
    } catch (const std::exception& e) {
        LOG_WARN("DebounceGate: stamp for %s unreadable, proceeding: %s",
                 address.c_str(), e.what());
        return false;
    }

    int64_t latest = 0;
    try {
        latest = std::stoll(raw);
    } catch (const std::exception&) {
        LOG_WARN("DebounceGate: malformed stamp '%s' for %s", raw.c_str(), address.c_str());
        return false;
    }
    return latest > armed_at;
}

} // namespace support_router
