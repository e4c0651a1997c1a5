// =============================================================================
// FILE: tests/test_context_store.cpp
// =============================================================================
#include <gtest/gtest.h>
#include "state/context_store.h"
#include "state/memory_kv_backend.h"
#include "test_doubles.h"

using namespace support_router;

TEST(ContextStore, AppendAndReadInOrder) {
    MemoryKvBackend kv;
    ContextStore store(kv, 10, Seconds(3600));

    store.append("5511999990000", "user", "Oi");
    store.append("5511999990000", "assistant", "Olá! Como posso ajudar?");

    auto ctx = store.read("5511999990000");
    ASSERT_EQ(ctx.size(), 2u);
    EXPECT_EQ(ctx[0], (ContextEntry{"user", "Oi"}));
    EXPECT_EQ(ctx[1], (ContextEntry{"assistant", "Olá! Como posso ajudar?"}));
}

TEST(ContextStore, KeepsOnlyNewestEntries) {
    MemoryKvBackend kv;
    ContextStore store(kv, 10, Seconds(3600));

    for (int i = 0; i < 14; ++i) {
        store.append("addr", i % 2 == 0 ? "user" : "assistant", "turn " + std::to_string(i));
    }

    auto ctx = store.read("addr");
    ASSERT_EQ(ctx.size(), 10u);
    EXPECT_EQ(ctx.front().content, "turn 4");
    EXPECT_EQ(ctx.back().content, "turn 13");
}

TEST(ContextStore, AddressesAreIsolated) {
    MemoryKvBackend kv;
    ContextStore store(kv, 10, Seconds(3600));

    store.append("a", "user", "from a");
    store.append("b", "user", "from b");

    EXPECT_EQ(store.read("a").size(), 1u);
    EXPECT_EQ(store.read("b").front().content, "from b");
    EXPECT_TRUE(store.read("c").empty());
}

TEST(ContextStore, ClearDropsHistory) {
    MemoryKvBackend kv;
    ContextStore store(kv, 10, Seconds(3600));
    store.append("a", "user", "x");
    store.clear("a");
    EXPECT_TRUE(store.read("a").empty());
}

TEST(ContextStore, MalformedEntriesAreSkipped) {
    MemoryKvBackend kv;
    ContextStore store(kv, 10, Seconds(3600));
    kv.list_push_back(ContextStore::key_for("a"), "not json");
    store.append("a", "user", "ok");

    auto ctx = store.read("a");
    ASSERT_EQ(ctx.size(), 1u);
    EXPECT_EQ(ctx[0].content, "ok");
}

TEST(ContextStore, BackendFailureDegradesToEmpty) {
    testing_support::ThrowingKvBackend kv;
    ContextStore store(kv, 10, Seconds(3600));

    EXPECT_NO_THROW(store.append("a", "user", "x"));
    EXPECT_NO_THROW(store.clear("a"));
    EXPECT_TRUE(store.read("a").empty());
}
