// =============================================================================
// FILE: include/state/debounce_gate.h
// =============================================================================
#ifndef STATE_DEBOUNCE_GATE_H
#define STATE_DEBOUNCE_GATE_H

#include "state/kv_backend.h"
#include <string>

namespace support_router {

// Latest-arrival stamp per customer address. A run armed at T is superseded
// once a later arrival has stored a stamp strictly greater than T.
//
// Stamps are microseconds since the epoch. Two arms inside the same
// microsecond do not supersede each other.
class DebounceGate {
public:
    DebounceGate(KvBackend& kv, Seconds key_ttl);

    // Records now as the latest arrival and returns the stamp written.
    int64_t arm(const std::string& address, WallTime now);

    // True iff the stored stamp is strictly newer than armed_at.
    // A missing or unreadable stamp never supersedes.
    bool superseded_since(const std::string& address, int64_t armed_at);

    static std::string key_for(const std::string& address) { return "debounce:" + address; }

private:
    KvBackend& kv_;
    Seconds key_ttl_;
};

} // namespace support_router
#endif // STATE_DEBOUNCE_GATE_H
