// =============================================================================
// FILE: tests/test_dedup_guard.cpp
// =============================================================================
#include <gtest/gtest.h>
#include "state/dedup_guard.h"
#include "state/memory_kv_backend.h"
#include "test_doubles.h"
#include <thread>

using namespace support_router;

TEST(DedupGuard, SecondIdenticalReplyIsDuplicate) {
    MemoryKvBackend kv;
    DedupGuard guard(kv);

    EXPECT_FALSE(guard.is_duplicate("addr", "Olá!", Millisecs(15000)));
    EXPECT_TRUE(guard.is_duplicate("addr", "Olá!", Millisecs(15000)));
    EXPECT_FALSE(guard.is_duplicate("other", "Olá!", Millisecs(15000)));
}

TEST(DedupGuard, DifferentReplyReplacesFingerprint) {
    MemoryKvBackend kv;
    DedupGuard guard(kv);

    EXPECT_FALSE(guard.is_duplicate("addr", "A", Millisecs(15000)));
    EXPECT_FALSE(guard.is_duplicate("addr", "B", Millisecs(15000)));
    EXPECT_FALSE(guard.is_duplicate("addr", "A", Millisecs(15000)));
}

TEST(DedupGuard, WindowExpires) {
    MemoryKvBackend kv;
    DedupGuard guard(kv);

    EXPECT_FALSE(guard.is_duplicate("addr", "A", Millisecs(30)));
    std::this_thread::sleep_for(Millisecs(70));
    EXPECT_FALSE(guard.is_duplicate("addr", "A", Millisecs(30)));
}

TEST(DedupGuard, EmptyKeyNeverDuplicate) {
    MemoryKvBackend kv;
    DedupGuard guard(kv);
    EXPECT_FALSE(guard.is_duplicate("addr", "", Millisecs(15000)));
    EXPECT_FALSE(guard.is_duplicate("addr", "", Millisecs(15000)));
    EXPECT_EQ(kv.key_count(), 0u);
}

TEST(DedupGuard, BackendFailureTreatedAsNew) {
    testing_support::ThrowingKvBackend kv;
    DedupGuard guard(kv);
    EXPECT_FALSE(guard.is_duplicate("addr", "A", Millisecs(15000)));
    EXPECT_FALSE(guard.is_duplicate("addr", "A", Millisecs(15000)));
}

TEST(DedupGuard, FingerprintIsMd5Hex) {
    EXPECT_EQ(DedupGuard::fingerprint(""), "d41d8cd98f00b204e9800998ecf8427e");
    EXPECT_EQ(DedupGuard::fingerprint("abc"), "900150983cd24fb0d6963f7d28e17f72");
}

TEST(ReplyDedupPolicy, AppLinksShareOneKey) {
    ReplyDedupPolicy policy({"play.google.com", "apps.apple.com"},
                            "STATIC_KEY:APP_LINKS", Seconds(60), Seconds(15));

    DedupKey a = policy.key_for("Baixe: https://play.google.com/store/apps/x");
    DedupKey b = policy.key_for("Também no iPhone: https://apps.apple.com/app/y");
    EXPECT_EQ(a.key, "STATIC_KEY:APP_LINKS");
    EXPECT_EQ(b.key, "STATIC_KEY:APP_LINKS");
    EXPECT_EQ(a.ttl, Millisecs(60000));

    DedupKey plain = policy.key_for("Bom dia!");
    EXPECT_EQ(plain.key, "Bom dia!");
    EXPECT_EQ(plain.ttl, Millisecs(15000));
}

TEST(ReplyDedupPolicy, DifferentAppLinkWordingIsSuppressed) {
    MemoryKvBackend kv;
    DedupGuard guard(kv);
    ReplyDedupPolicy policy({"play.google.com", "apps.apple.com"},
                            "STATIC_KEY:APP_LINKS", Seconds(60), Seconds(15));

    DedupKey first = policy.key_for("Android: https://play.google.com/store/apps/x");
    DedupKey second = policy.key_for("iOS: https://apps.apple.com/app/y");
    EXPECT_FALSE(guard.is_duplicate("addr", first.key, first.ttl));
    EXPECT_TRUE(guard.is_duplicate("addr", second.key, second.ttl));
}
