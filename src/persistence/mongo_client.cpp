// =============================================================================
// FILE: src/persistence/mongo_client.cpp
// =============================================================================
#include "persistence/mongo_client.h"
#include "common/logger.h"

#include <mongocxx/instance.hpp>
#include <mongocxx/pool.hpp>
#include <mongocxx/client.hpp>
#include <mongocxx/uri.hpp>
#include <mongocxx/exception/exception.hpp>
#include <mongocxx/options/find_one_and_update.hpp>
#include <bsoncxx/builder/basic/document.hpp>
#include <bsoncxx/builder/basic/kvp.hpp>
#include <bsoncxx/types.hpp>
#include <stdexcept>

namespace support_router {

using bsoncxx::builder::basic::kvp;
using bsoncxx::builder::basic::make_document;

MongoClient::MongoClient(const Config& config) : config_(config) {}

MongoClient::~MongoClient() { disconnect(); }

// Pool bounds and timeouts travel as URI options
std::string MongoClient::build_uri() const {
    std::string uri = config_.mongo_uri;
    uri += (uri.find('?') == std::string::npos) ? "?" : "&";
    uri += "minPoolSize=" + std::to_string(config_.mongo_pool_min_size);
    uri += "&maxPoolSize=" + std::to_string(config_.mongo_pool_max_size);
    uri += "&connectTimeoutMS=" + std::to_string(config_.mongo_connect_timeout.count());
    uri += "&socketTimeoutMS=" + std::to_string(config_.mongo_socket_timeout.count());
    uri += "&w=" + config_.mongo_write_concern;
    uri += "&readPreference=" + config_.mongo_read_preference;
    return uri;
}

Result MongoClient::connect() {
    try {
        instance_ = std::make_unique<mongocxx::instance>();

        mongocxx::uri uri{build_uri()};
        pool_ = std::make_unique<mongocxx::pool>(uri);
        connected_.store(true, std::memory_order_release);

        if (!ping()) {
            connected_.store(false, std::memory_order_release);
            return Result::kConnectionLost;
        }

        LOG_INFO("MongoDB connected: %s/%s (pool %d..%d)",
                 config_.mongo_uri.c_str(), config_.mongo_database.c_str(),
                 config_.mongo_pool_min_size, config_.mongo_pool_max_size);
        return Result::kOk;

    } catch (const mongocxx::exception& e) {
        LOG_ERROR("MongoDB connect failed: %s", e.what());
        connected_.store(false, std::memory_order_release);
        return Result::kPersistenceError;
    }
}

void MongoClient::disconnect() {
    connected_.store(false, std::memory_order_release);
    pool_.reset();
    instance_.reset();
}

bool MongoClient::ping() {
    if (!pool_) return false;
    try {
        auto client = pool_->acquire();
        auto db = (*client)[config_.mongo_database];
        db.run_command(make_document(kvp("ping", 1)));
        return true;
    } catch (const mongocxx::exception& e) {
        LOG_WARN("MongoDB ping failed: %s", e.what());
        return false;
    }
}

void MongoClient::record_operation(Millisecs latency, bool failed) {
    stats_.operations.fetch_add(1, std::memory_order_relaxed);
    stats_.latency_total_ms.fetch_add(static_cast<uint64_t>(latency.count()),
                                      std::memory_order_relaxed);
    if (failed) stats_.errors.fetch_add(1, std::memory_order_relaxed);
}

struct MongoClient::ScopedClient::Impl {
    mongocxx::pool::entry entry;
    explicit Impl(mongocxx::pool::entry e) : entry(std::move(e)) {}
};

MongoClient::ScopedClient::ScopedClient(MongoClient& parent) : parent_(parent) {
    if (!parent_.pool_ || !parent_.is_connected()) return;
    try {
        auto entry = parent_.pool_->acquire();
        impl_ = std::make_unique<Impl>(std::move(entry));
        valid_ = true;
    } catch (const mongocxx::exception& e) {
        LOG_ERROR("MongoDB acquire client failed: %s", e.what());
        impl_.reset();
        valid_ = false;
    }
}

MongoClient::ScopedClient::~ScopedClient() = default;
MongoClient::ScopedClient::ScopedClient(ScopedClient&&) noexcept = default;

mongocxx::database MongoClient::ScopedClient::database() {
    return (*impl_->entry)[parent_.config_.mongo_database];
}

mongocxx::collection MongoClient::ScopedClient::customers() {
    return database()[parent_.config_.mongo_collection_customers];
}

mongocxx::collection MongoClient::ScopedClient::conversations() {
    return database()[parent_.config_.mongo_collection_conversations];
}

mongocxx::collection MongoClient::ScopedClient::messages() {
    return database()[parent_.config_.mongo_collection_messages];
}

int64_t MongoClient::ScopedClient::next_sequence(const std::string& sequence) {
    mongocxx::options::find_one_and_update opts;
    opts.upsert(true);
    opts.return_document(mongocxx::options::return_document::k_after);

    auto doc = database()[parent_.config_.mongo_collection_counters].find_one_and_update(
        make_document(kvp("_id", sequence)),
        make_document(kvp("$inc", make_document(kvp("seq", int64_t{1})))),
        opts);
    if (!doc) throw std::runtime_error("id allocation returned no counter for " + sequence);

    auto el = doc->view()["seq"];
    if (el.type() == bsoncxx::type::k_int64) return el.get_int64().value;
    if (el.type() == bsoncxx::type::k_int32) return el.get_int32().value;
    throw std::runtime_error("counter " + sequence + " has a non-integer seq");
}

MongoClient::ScopedClient MongoClient::acquire() {
    return ScopedClient(*this);
}

} // namespace support_router
