// =============================================================================
// FILE: include/persistence/mongo_client.h
// =============================================================================
#ifndef MONGO_CLIENT_H
#define MONGO_CLIENT_H

#include "common/types.h"
#include "common/config.h"
#include <memory>
#include <atomic>
#include <cstdint>
#include <string>

// Forward declarations, mongo headers stay in the .cpp files
namespace mongocxx { inline namespace v_noabi {
    class instance;
    class pool;
    class database;
    class collection;
}}

namespace support_router {

// Connection pool for the conversation store.
// A ScopedClient is checked out per repository call and returned on scope exit;
// it exposes the router's collections by role, named through Config.
class MongoClient {
public:
    explicit MongoClient(const Config& config);
    ~MongoClient();

    Result connect();
    void disconnect();
    bool is_connected() const { return connected_.load(std::memory_order_acquire); }

    // Round trip to the server; used by /ready
    bool ping();

    // RAII handle around pool::entry (defined in .cpp)
    class ScopedClient {
    public:
        explicit ScopedClient(MongoClient& parent);
        ~ScopedClient();

        ScopedClient(ScopedClient&&) noexcept;
        ScopedClient& operator=(ScopedClient&&) = delete;
        ScopedClient(const ScopedClient&) = delete;
        ScopedClient& operator=(const ScopedClient&) = delete;

        bool valid() const { return valid_; }
        mongocxx::database database();

        mongocxx::collection customers();
        mongocxx::collection conversations();
        mongocxx::collection messages();

        // Allocates the next integer id of a sequence ("customers",
        // "conversations", "messages") from the counters collection.
        // Throws when the server returns no counter document.
        int64_t next_sequence(const std::string& sequence);

    private:
        struct Impl;
        MongoClient& parent_;
        std::unique_ptr<Impl> impl_;
        bool valid_ = false;
    };

    ScopedClient acquire();

    struct MongoStats {
        std::atomic<uint64_t> operations{0};
        std::atomic<uint64_t> errors{0};
        std::atomic<uint64_t> latency_total_ms{0};
    };
    const MongoStats& stats() const { return stats_; }

    // Repository bookkeeping for every driver round trip
    void record_operation(Millisecs latency, bool failed);

    const Config& config() const { return config_; }

    MongoClient(const MongoClient&) = delete;
    MongoClient& operator=(const MongoClient&) = delete;

private:
    std::string build_uri() const;

    Config config_;
    std::unique_ptr<mongocxx::instance> instance_;
    std::unique_ptr<mongocxx::pool> pool_;
    std::atomic<bool> connected_{false};
    MongoStats stats_;
};

} // namespace support_router
#endif // MONGO_CLIENT_H
