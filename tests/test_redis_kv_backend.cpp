// =============================================================================
// FILE: tests/test_redis_kv_backend.cpp
//
// The live cases need a disposable Redis server:
//   SUPPORT_ROUTER_TEST_REDIS_URI=tcp://127.0.0.1:6379 ./support_router_tests
// =============================================================================
#include <gtest/gtest.h>
#include "state/redis_kv_backend.h"
#include "state/context_store.h"
#include "state/sector_queue_router.h"
#include <chrono>
#include <cstdlib>
#include <memory>
#include <stdexcept>
#include <thread>

using namespace support_router;

namespace {

Config unreachable_config() {
    Config c;
    c.redis_uri = "tcp://127.0.0.1:1";
    c.redis_connect_timeout = Millisecs(200);
    c.redis_socket_timeout = Millisecs(200);
    c.redis_pool_size = 1;
    return c;
}

} // namespace

TEST(RedisKvBackendOffline, UnreachableServerReported) {
    RedisKvBackend kv(unreachable_config());
    EXPECT_EQ(kv.connect(), Result::kConnectionLost);
    EXPECT_FALSE(kv.is_connected());
    EXPECT_FALSE(kv.ping());

    std::string out;
    EXPECT_THROW(kv.get("k", out), std::exception);
    EXPECT_THROW(kv.set("k", "v", Millisecs(0)), std::exception);
    EXPECT_THROW(kv.list_push_back("l", "v"), std::exception);
}

TEST(RedisKvBackendOffline, StateComponentsDegrade) {
    RedisKvBackend kv(unreachable_config());
    ASSERT_NE(kv.connect(), Result::kOk);

    ContextStore context(kv, 10, Seconds(60));
    context.append("5553999990000", "user", "Oi");
    EXPECT_TRUE(context.read("5553999990000").empty());

    SectorCatalog catalog({"comercial"}, {});
    SectorQueueRouter queues(kv, catalog);
    EXPECT_EQ(queues.enqueue("comercial", 1), Result::kPersistenceError);
    EXPECT_FALSE(queues.is_queued(1));
}

class RedisKvBackendLiveTest : public ::testing::Test {
protected:
    void SetUp() override {
        const char* uri = std::getenv("SUPPORT_ROUTER_TEST_REDIS_URI");
        if (!uri || !*uri) GTEST_SKIP() << "SUPPORT_ROUTER_TEST_REDIS_URI not set";

        config_.redis_uri = uri;
        config_.redis_key_prefix = "support_router_test:" + std::to_string(
            std::chrono::steady_clock::now().time_since_epoch().count()) + ":";
        kv_.reset(new RedisKvBackend(config_));
        ASSERT_EQ(kv_->connect(), Result::kOk);
    }

    Config config_;
    std::unique_ptr<RedisKvBackend> kv_;
};

TEST_F(RedisKvBackendLiveTest, ValuesAndExpiry) {
    std::string out;
    EXPECT_FALSE(kv_->get("a", out));
    kv_->set("a", "1", Millisecs(0));
    ASSERT_TRUE(kv_->get("a", out));
    EXPECT_EQ(out, "1");

    kv_->set("b", "2", Millisecs(50));
    std::this_thread::sleep_for(std::chrono::milliseconds(120));
    EXPECT_FALSE(kv_->get("b", out));

    EXPECT_TRUE(kv_->del("a"));
    EXPECT_FALSE(kv_->del("a"));
}

TEST_F(RedisKvBackendLiveTest, CheckAndSet) {
    EXPECT_FALSE(kv_->check_and_set("fp", "x", Millisecs(10000)));
    EXPECT_TRUE(kv_->check_and_set("fp", "x", Millisecs(10000)));
    EXPECT_FALSE(kv_->check_and_set("fp", "y", Millisecs(10000)));

    std::string out;
    ASSERT_TRUE(kv_->get("fp", out));
    EXPECT_EQ(out, "y");
}

TEST_F(RedisKvBackendLiveTest, CappedAppendKeepsNewest) {
    for (int i = 0; i < 5; ++i) {
        kv_->list_append_capped("ctx", std::to_string(i), 3, Millisecs(10000));
    }
    auto items = kv_->list_range("ctx");
    ASSERT_EQ(items.size(), 3u);
    EXPECT_EQ(items[0], "2");
    EXPECT_EQ(items[2], "4");
}

TEST_F(RedisKvBackendLiveTest, ListsAndSets) {
    kv_->list_push_back("q", "1");
    kv_->list_push_back("q", "2");
    kv_->list_push_back("q", "1");
    EXPECT_EQ(kv_->list_remove("q", "1"), 2u);
    EXPECT_EQ(kv_->list_length("q"), 1u);
    std::string head;
    ASSERT_TRUE(kv_->list_pop_front("q", head));
    EXPECT_EQ(head, "2");
    EXPECT_FALSE(kv_->list_pop_front("q", head));

    EXPECT_TRUE(kv_->set_add("s", "7"));
    EXPECT_FALSE(kv_->set_add("s", "7"));
    EXPECT_TRUE(kv_->set_contains("s", "7"));
    EXPECT_EQ(kv_->set_members("s").size(), 1u);
    EXPECT_TRUE(kv_->set_remove("s", "7"));
    EXPECT_FALSE(kv_->set_contains("s", "7"));
}
