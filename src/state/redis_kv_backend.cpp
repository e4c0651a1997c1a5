// =============================================================================
// FILE: src/state/redis_kv_backend.cpp
// =============================================================================
#include "state/redis_kv_backend.h"
#include "common/logger.h"
#include <sw/redis++/redis++.h>
#include <iterator>
#include <stdexcept>

namespace support_router {

namespace {

// KEYS[1] key, ARGV[1] value, ARGV[2] ttl ms (0 = none). 1 when it already held value.
const char* const kCheckAndSetScript =
    "local cur = redis.call('GET', KEYS[1])\n"
    "if cur == ARGV[1] then return 1 end\n"
    "if tonumber(ARGV[2]) > 0 then\n"
    "  redis.call('SET', KEYS[1], ARGV[1], 'PX', ARGV[2])\n"
    "else\n"
    "  redis.call('SET', KEYS[1], ARGV[1])\n"
    "end\n"
    "return 0\n";

// KEYS[1] list, ARGV[1] value, ARGV[2] max length (0 = uncapped), ARGV[3] ttl ms (0 = none)
const char* const kAppendCappedScript =
    "redis.call('RPUSH', KEYS[1], ARGV[1])\n"
    "if tonumber(ARGV[2]) > 0 then\n"
    "  redis.call('LTRIM', KEYS[1], -tonumber(ARGV[2]), -1)\n"
    "end\n"
    "if tonumber(ARGV[3]) > 0 then\n"
    "  redis.call('PEXPIRE', KEYS[1], ARGV[3])\n"
    "else\n"
    "  redis.call('PERSIST', KEYS[1])\n"
    "end\n"
    "return redis.call('LLEN', KEYS[1])\n";

std::chrono::milliseconds to_ms(Millisecs d) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(d);
}

} // namespace

RedisKvBackend::RedisKvBackend(const Config& config)
    : config_(config), prefix_(config.redis_key_prefix)
{}

RedisKvBackend::~RedisKvBackend() = default;

Result RedisKvBackend::connect() {
    try {
        sw::redis::ConnectionOptions opts(config_.redis_uri);
        if (!config_.redis_password.empty()) opts.password = config_.redis_password;
        opts.db = config_.redis_db;
        opts.connect_timeout = to_ms(config_.redis_connect_timeout);
        opts.socket_timeout = to_ms(config_.redis_socket_timeout);

        sw::redis::ConnectionPoolOptions pool_opts;
        pool_opts.size = config_.redis_pool_size > 0 ? config_.redis_pool_size : 1;
        pool_opts.wait_timeout = to_ms(config_.redis_socket_timeout);

        redis_ = std::make_unique<sw::redis::Redis>(opts, pool_opts);
        connected_.store(true, std::memory_order_release);
    } catch (const std::exception& e) {
        LOG_ERROR("Redis: bad connection settings '%s': %s", config_.redis_uri.c_str(), e.what());
        redis_.reset();
        return Result::kInvalidArgument;
    }

    if (!ping()) {
        connected_.store(false, std::memory_order_release);
        redis_.reset();
        return Result::kConnectionLost;
    }

    LOG_INFO("Redis connected: %s db=%d pool=%zu prefix=%s",
             config_.redis_uri.c_str(), config_.redis_db, config_.redis_pool_size,
             prefix_.c_str());
    return Result::kOk;
}

bool RedisKvBackend::ping() {
    if (!redis_) return false;
    try {
        redis_->ping();
        return true;
    } catch (const sw::redis::Error& e) {
        LOG_WARN("Redis ping failed: %s", e.what());
        return false;
    }
}

sw::redis::Redis& RedisKvBackend::redis() {
    if (!redis_ || !is_connected()) throw std::runtime_error("redis backend not connected");
    return *redis_;
}

bool RedisKvBackend::get(const std::string& key, std::string& out) {
    auto val = redis().get(prefixed(key));
    if (!val) return false;
    out = *val;
    return true;
}

void RedisKvBackend::set(const std::string& key, const std::string& value, Millisecs ttl) {
    redis().set(prefixed(key), value, to_ms(ttl));
}

bool RedisKvBackend::expire(const std::string& key, Millisecs ttl) {
    if (ttl.count() <= 0) {
        std::string k = prefixed(key);
        if (redis().exists(k) == 0) return false;
        redis().persist(k);
        return true;
    }
    return redis().pexpire(prefixed(key), to_ms(ttl));
}

bool RedisKvBackend::del(const std::string& key) {
    return redis().del(prefixed(key)) > 0;
}

bool RedisKvBackend::check_and_set(const std::string& key, const std::string& value,
                                   Millisecs ttl) {
    std::string k = prefixed(key);
    std::string ttl_ms = std::to_string(to_ms(ttl).count());
    return redis().eval<long long>(kCheckAndSetScript, {k}, {value, ttl_ms}) == 1;
}

size_t RedisKvBackend::list_push_back(const std::string& key, const std::string& value) {
    return static_cast<size_t>(redis().rpush(prefixed(key), value));
}

bool RedisKvBackend::list_pop_front(const std::string& key, std::string& out) {
    auto val = redis().lpop(prefixed(key));
    if (!val) return false;
    out = *val;
    return true;
}

size_t RedisKvBackend::list_remove(const std::string& key, const std::string& value) {
    return static_cast<size_t>(redis().lrem(prefixed(key), 0, value));
}

size_t RedisKvBackend::list_length(const std::string& key) {
    return static_cast<size_t>(redis().llen(prefixed(key)));
}

std::vector<std::string> RedisKvBackend::list_range(const std::string& key) {
    std::vector<std::string> out;
    redis().lrange(prefixed(key), 0, -1, std::back_inserter(out));
    return out;
}

void RedisKvBackend::list_append_capped(const std::string& key, const std::string& value,
                                        size_t max_len, Millisecs ttl) {
    std::string k = prefixed(key);
    std::string cap = std::to_string(max_len);
    std::string ttl_ms = std::to_string(to_ms(ttl).count());
    redis().eval<long long>(kAppendCappedScript, {k}, {value, cap, ttl_ms});
}

bool RedisKvBackend::set_add(const std::string& key, const std::string& member) {
    return redis().sadd(prefixed(key), member) > 0;
}

bool RedisKvBackend::set_remove(const std::string& key, const std::string& member) {
    return redis().srem(prefixed(key), member) > 0;
}

bool RedisKvBackend::set_contains(const std::string& key, const std::string& member) {
    return redis().sismember(prefixed(key), member);
}

std::vector<std::string> RedisKvBackend::set_members(const std::string& key) {
    std::vector<std::string> out;
    redis().smembers(prefixed(key), std::back_inserter(out));
    return out;
}

size_t RedisKvBackend::key_count() {
    return static_cast<size_t>(redis().dbsize());
}

} // namespace support_router
