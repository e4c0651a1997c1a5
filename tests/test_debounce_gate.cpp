// =============================================================================
// FILE: tests/test_debounce_gate.cpp
// =============================================================================
#include <gtest/gtest.h>
#include "state/debounce_gate.h"
#include "state/memory_kv_backend.h"
#include "test_doubles.h"

using namespace support_router;

namespace {
WallTime at_ms(int64_t ms) { return from_epoch_us(ms * 1000); }
}

TEST(DebounceGate, LaterArrivalSupersedesEarlierRun) {
    MemoryKvBackend kv;
    DebounceGate gate(kv, Seconds(60));

    int64_t t0 = gate.arm("addr", at_ms(1000));
    EXPECT_FALSE(gate.superseded_since("addr", t0));

    int64_t t1 = gate.arm("addr", at_ms(1500));
    EXPECT_TRUE(gate.superseded_since("addr", t0));
    EXPECT_FALSE(gate.superseded_since("addr", t1));
}

TEST(DebounceGate, StampIsEpochMicros) {
    MemoryKvBackend kv;
    DebounceGate gate(kv, Seconds(60));
    EXPECT_EQ(gate.arm("addr", at_ms(1234)), 1234000);

    std::string raw;
    ASSERT_TRUE(kv.get(DebounceGate::key_for("addr"), raw));
    EXPECT_EQ(raw, "1234000");
}

TEST(DebounceGate, SameInstantDoesNotSupersede) {
    MemoryKvBackend kv;
    DebounceGate gate(kv, Seconds(60));
    int64_t a = gate.arm("addr", at_ms(2000));
    int64_t b = gate.arm("addr", at_ms(2000));
    EXPECT_FALSE(gate.superseded_since("addr", a));
    EXPECT_FALSE(gate.superseded_since("addr", b));
}

TEST(DebounceGate, AddressesAreIndependent) {
    MemoryKvBackend kv;
    DebounceGate gate(kv, Seconds(60));
    int64_t a = gate.arm("a", at_ms(1000));
    gate.arm("b", at_ms(9000));
    EXPECT_FALSE(gate.superseded_since("a", a));
}

TEST(DebounceGate, MissingOrBadStampNeverSupersedes) {
    MemoryKvBackend kv;
    DebounceGate gate(kv, Seconds(60));
    EXPECT_FALSE(gate.superseded_since("nobody", 1));

    kv.set(DebounceGate::key_for("garbled"), "abc", Millisecs(0));
    EXPECT_FALSE(gate.superseded_since("garbled", 1));
}

TEST(DebounceGate, BackendFailureProceeds) {
    testing_support::ThrowingKvBackend kv;
    DebounceGate gate(kv, Seconds(60));
    int64_t t = gate.arm("addr", at_ms(1000));
    EXPECT_EQ(t, 1000000);
    EXPECT_FALSE(gate.superseded_since("addr", t));
}
