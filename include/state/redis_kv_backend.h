// =============================================================================
// FILE: include/state/redis_kv_backend.h
// =============================================================================
#ifndef STATE_REDIS_KV_BACKEND_H
#define STATE_REDIS_KV_BACKEND_H

#include "state/kv_backend.h"
#include "common/config.h"
#include <atomic>
#include <memory>
#include <string>

namespace sw { namespace redis {
    class Redis;
}}

namespace support_router {

// KvBackend on a Redis server, shared by every router process pointed at it.
// All keys carry the configured prefix.
//
// check_and_set and list_append_capped run as Lua scripts so each stays a
// single atomic step on the server. Driver errors (sw::redis::Error) reach
// the caller as std::exception, like any other backend failure.
class RedisKvBackend : public KvBackend {
public:
    explicit RedisKvBackend(const Config& config);
    ~RedisKvBackend() override;

    // Builds the connection pool and pings the server.
    // kConnectionLost when the server does not answer.
    Result connect();
    bool is_connected() const { return connected_.load(std::memory_order_acquire); }
    bool ping();

    bool get(const std::string& key, std::string& out) override;
    void set(const std::string& key, const std::string& value, Millisecs ttl) override;
    bool expire(const std::string& key, Millisecs ttl) override;
    bool del(const std::string& key) override;
    bool check_and_set(const std::string& key, const std::string& value,
                       Millisecs ttl) override;

    size_t list_push_back(const std::string& key, const std::string& value) override;
    bool   list_pop_front(const std::string& key, std::string& out) override;
    size_t list_remove(const std::string& key, const std::string& value) override;
    size_t list_length(const std::string& key) override;
    std::vector<std::string> list_range(const std::string& key) override;
    void list_append_capped(const std::string& key, const std::string& value,
                            size_t max_len, Millisecs ttl) override;

    bool set_add(const std::string& key, const std::string& member) override;
    bool set_remove(const std::string& key, const std::string& member) override;
    bool set_contains(const std::string& key, const std::string& member) override;
    std::vector<std::string> set_members(const std::string& key) override;

    // Keys of the whole selected database
    size_t key_count() override;

    RedisKvBackend(const RedisKvBackend&) = delete;
    RedisKvBackend& operator=(const RedisKvBackend&) = delete;

private:
    std::string prefixed(const std::string& key) const { return prefix_ + key; }
    // Throws when connect() has not succeeded
    sw::redis::Redis& redis();

    Config config_;
    std::string prefix_;
    std::unique_ptr<sw::redis::Redis> redis_;
    std::atomic<bool> connected_{false};
};

} // namespace support_router
#endif // STATE_REDIS_KV_BACKEND_H
