// =============================================================================
// FILE: src/persistence/mongo_repository.cpp
// =============================================================================
#include "persistence/mongo_repository.h"
#include "common/logger.h"

#include <mongocxx/client.hpp>
#include <mongocxx/collection.hpp>
#include <mongocxx/database.hpp>
#include <mongocxx/exception/exception.hpp>
#include <mongocxx/exception/operation_exception.hpp>
#include <mongocxx/options/find.hpp>
#include <bsoncxx/builder/basic/array.hpp>
#include <bsoncxx/builder/basic/document.hpp>
#include <bsoncxx/builder/basic/kvp.hpp>
#include <bsoncxx/types.hpp>

namespace support_router {

using bsoncxx::builder::basic::kvp;
using bsoncxx::builder::basic::make_array;
using bsoncxx::builder::basic::make_document;

namespace {

constexpr int kDuplicateKeyError = 11000;

bsoncxx::types::b_date to_bson_date(WallTime t) {
    return bsoncxx::types::b_date{t};
}

std::string str_field(const bsoncxx::document::view& v, const char* key) {
    auto el = v[key];
    if (!el || el.type() != bsoncxx::type::k_string) return "";
    return std::string(el.get_string().value);
}

int64_t int_field(const bsoncxx::document::view& v, const char* key) {
    auto el = v[key];
    if (!el) return 0;
    switch (el.type()) {
        case bsoncxx::type::k_int64: return el.get_int64().value;
        case bsoncxx::type::k_int32: return el.get_int32().value;
        default:                     return 0;
    }
}

bool bool_field(const bsoncxx::document::view& v, const char* key) {
    auto el = v[key];
    return el && el.type() == bsoncxx::type::k_bool && el.get_bool().value;
}

WallTime date_field(const bsoncxx::document::view& v, const char* key) {
    auto el = v[key];
    if (!el || el.type() != bsoncxx::type::k_date) return WallTime();
    return WallTime(std::chrono::duration_cast<WallClock::duration>(el.get_date().value));
}

bsoncxx::document::value customer_doc(const Customer& c) {
    return make_document(
        kvp("_id", c.id),
        kvp("address", c.address),
        kvp("name", c.name),
        kvp("first_contact", to_bson_date(c.first_contact)),
        kvp("last_contact", to_bson_date(c.last_contact)),
        kvp("total_conversations", c.total_conversations));
}

Customer customer_from(const bsoncxx::document::view& v) {
    Customer c;
    c.id = int_field(v, "_id");
    c.address = str_field(v, "address");
    c.name = str_field(v, "name");
    c.first_contact = date_field(v, "first_contact");
    c.last_contact = date_field(v, "last_contact");
    c.total_conversations = static_cast<int>(int_field(v, "total_conversations"));
    return c;
}

bsoncxx::document::value conversation_doc(const Conversation& c) {
    bsoncxx::builder::basic::document doc;
    doc.append(kvp("_id", c.id),
               kvp("customer_id", c.customer_id),
               kvp("status", status_to_string(c.status)),
               kvp("sector", c.sector),
               kvp("intent", c.intent),
               kvp("operator_id", c.operator_id),
               kvp("priority", c.priority),
               kvp("started_at", to_bson_date(c.started_at)));
    if (c.has_resolved_at()) {
        doc.append(kvp("resolved_at", to_bson_date(c.resolved_at)));
    } else {
        doc.append(kvp("resolved_at", bsoncxx::types::b_null{}));
    }
    return doc.extract();
}

Conversation conversation_from(const bsoncxx::document::view& v) {
    Conversation c;
    c.id = int_field(v, "_id");
    c.customer_id = int_field(v, "customer_id");
    std::string status = str_field(v, "status");
    if (!parse_status(status, c.status)) {
        LOG_WARN("MongoRepository: conversation %ld has unknown status '%s'",
                 static_cast<long>(c.id), status.c_str());
    }
    c.sector = str_field(v, "sector");
    c.intent = str_field(v, "intent");
    c.operator_id = int_field(v, "operator_id");
    c.priority = static_cast<int>(int_field(v, "priority"));
    c.started_at = date_field(v, "started_at");
    c.resolved_at = date_field(v, "resolved_at");
    return c;
}

bsoncxx::document::value message_doc(const Message& m) {
    return make_document(
        kvp("_id", m.id),
        kvp("conversation_id", m.conversation_id),
        kvp("sender_role", sender_role_to_string(m.sender_role)),
        kvp("sender_id", m.sender_id),
        kvp("content", m.content),
        kvp("kind", message_kind_to_string(m.kind)),
        kvp("media_url", m.media_url),
        kvp("channel_message_id", m.channel_message_id),
        kvp("intent", m.intent),
        kvp("is_read", m.is_read),
        kvp("created_at", to_bson_date(m.created_at)));
}

Message message_from(const bsoncxx::document::view& v) {
    Message m;
    m.id = int_field(v, "_id");
    m.conversation_id = int_field(v, "conversation_id");
    parse_sender_role(str_field(v, "sender_role"), m.sender_role);
    m.sender_id = str_field(v, "sender_id");
    m.content = str_field(v, "content");
    m.kind = parse_message_kind(str_field(v, "kind"));
    m.media_url = str_field(v, "media_url");
    m.channel_message_id = str_field(v, "channel_message_id");
    m.intent = str_field(v, "intent");
    m.is_read = bool_field(v, "is_read");
    m.created_at = date_field(v, "created_at");
    return m;
}

} // namespace

MongoRepository::MongoRepository(std::shared_ptr<MongoClient> client)
    : client_(std::move(client)), config_(client_->config())
{}

template <typename Fn>
Result MongoRepository::run(const char* operation, Fn&& fn) {
    if (!client_->is_connected()) return Result::kConnectionLost;
    auto sc = client_->acquire();
    if (!sc.valid()) return Result::kConnectionLost;

    ScopedTimer timer;
    try {
        Result r = fn(sc);
        client_->record_operation(timer.elapsed_ms(), false);
        return r;
    } catch (const mongocxx::operation_exception& e) {
        client_->record_operation(timer.elapsed_ms(), true);
        if (e.code().value() == kDuplicateKeyError) return Result::kAlreadyExists;
        LOG_ERROR("MongoRepository: %s failed: %s", operation, e.what());
        return Result::kPersistenceError;
    } catch (const std::exception& e) {
        client_->record_operation(timer.elapsed_ms(), true);
        LOG_ERROR("MongoRepository: %s failed: %s", operation, e.what());
        return Result::kPersistenceError;
    }
}

Result MongoRepository::ensure_indexes() {
    return run("ensure_indexes", [&](MongoClient::ScopedClient& sc) {
        sc.customers().create_index(
            make_document(kvp("address", 1)), make_document(kvp("unique", true)));
        sc.conversations().create_index(
            make_document(kvp("customer_id", 1), kvp("status", 1), kvp("started_at", -1)));
        sc.messages().create_index(
            make_document(kvp("conversation_id", 1), kvp("_id", 1)));
        LOG_INFO("MongoRepository: indexes ensured on %s", config_.mongo_database.c_str());
        return Result::kOk;
    });
}

// -----------------------------------------------------------------------------
// Customers
// -----------------------------------------------------------------------------

Result MongoRepository::find_customer_by_address(const std::string& address, Customer& out) {
    return run("find_customer_by_address", [&](MongoClient::ScopedClient& sc) {
        auto doc = sc.customers()
                       .find_one(make_document(kvp("address", address)));
        if (!doc) return Result::kNotFound;
        out = customer_from(doc->view());
        return Result::kOk;
    });
}

Result MongoRepository::get_customer(CustomerId id, Customer& out) {
    return run("get_customer", [&](MongoClient::ScopedClient& sc) {
        auto doc = sc.customers()
                       .find_one(make_document(kvp("_id", id)));
        if (!doc) return Result::kNotFound;
        out = customer_from(doc->view());
        return Result::kOk;
    });
}

Result MongoRepository::insert_customer(Customer& customer) {
    if (customer.address.empty()) return Result::kInvalidArgument;
    return run("insert_customer", [&](MongoClient::ScopedClient& sc) {
        customer.id = sc.next_sequence("customers");
        sc.customers().insert_one(customer_doc(customer));
        return Result::kOk;
    });
}

Result MongoRepository::update_customer(const Customer& customer) {
    return run("update_customer", [&](MongoClient::ScopedClient& sc) {
        auto res = sc.customers().replace_one(
            make_document(kvp("_id", customer.id)), customer_doc(customer));
        if (res && res->matched_count() == 0) return Result::kNotFound;
        return Result::kOk;
    });
}

Result MongoRepository::update_routing(ConversationId id, ConversationStatus expected,
                                       ConversationStatus status, const std::string& sector,
                                       const std::string& intent) {
    return run("update_routing", [&](MongoClient::ScopedClient& sc) {
        auto res = sc.conversations().update_one(
            make_document(kvp("_id", id), kvp("status", status_to_string(expected))),
            make_document(kvp("$set", make_document(
                kvp("status", status_to_string(status)),
                kvp("sector", sector),
                kvp("intent", intent)))));
        if (res && res->matched_count() == 1) return Result::kOk;

        // Tell a missing conversation apart from one whose status moved on
        auto doc = sc.conversations().find_one(make_document(kvp("_id", id)));
        return doc ? Result::kConflict : Result::kNotFound;
    });
}

// -----------------------------------------------------------------------------
// Conversations
// -----------------------------------------------------------------------------

Result MongoRepository::insert_conversation(Conversation& conversation) {
    return run("insert_conversation", [&](MongoClient::ScopedClient& sc) {
        conversation.id = sc.next_sequence("conversations");
        sc.conversations()
            .insert_one(conversation_doc(conversation));
        return Result::kOk;
    });
}

Result MongoRepository::get_conversation(ConversationId id, Conversation& out) {
    return run("get_conversation", [&](MongoClient::ScopedClient& sc) {
        auto doc = sc.conversations()
                       .find_one(make_document(kvp("_id", id)));
        if (!doc) return Result::kNotFound;
        out = conversation_from(doc->view());
        return Result::kOk;
    });
}

Result MongoRepository::update_conversation(const Conversation& conversation) {
    return run("update_conversation", [&](MongoClient::ScopedClient& sc) {
        auto res = sc.conversations().replace_one(
            make_document(kvp("_id", conversation.id)), conversation_doc(conversation));
        if (res && res->matched_count() == 0) return Result::kNotFound;
        return Result::kOk;
    });
}

Result MongoRepository::find_active_conversation(CustomerId customer_id, Conversation& out) {
    return run("find_active_conversation", [&](MongoClient::ScopedClient& sc) {
        mongocxx::options::find opts;
        opts.sort(make_document(kvp("started_at", -1), kvp("_id", -1)));
        auto doc = sc.conversations().find_one(
            make_document(
                kvp("customer_id", customer_id),
                kvp("status", make_document(kvp("$nin", make_array("resolved", "closed"))))),
            opts);
        if (!doc) return Result::kNotFound;
        out = conversation_from(doc->view());
        return Result::kOk;
    });
}

Result MongoRepository::find_latest_resolved(CustomerId customer_id, Conversation& out) {
    return run("find_latest_resolved", [&](MongoClient::ScopedClient& sc) {
        mongocxx::options::find opts;
        opts.sort(make_document(kvp("started_at", -1), kvp("_id", -1)));
        auto doc = sc.conversations().find_one(
            make_document(kvp("customer_id", customer_id), kvp("status", "resolved")), opts);
        if (!doc) return Result::kNotFound;
        out = conversation_from(doc->view());
        return Result::kOk;
    });
}

Result MongoRepository::count_conversations(ConversationStatus status, size_t& out) {
    return run("count_conversations", [&](MongoClient::ScopedClient& sc) {
        auto n = sc.conversations().count_documents(
            make_document(kvp("status", status_to_string(status))));
        out = static_cast<size_t>(n);
        return Result::kOk;
    });
}

// -----------------------------------------------------------------------------
// Messages
// -----------------------------------------------------------------------------

Result MongoRepository::insert_message(Message& message) {
    return run("insert_message", [&](MongoClient::ScopedClient& sc) {
        message.id = sc.next_sequence("messages");
        sc.messages().insert_one(message_doc(message));
        return Result::kOk;
    });
}

Result MongoRepository::get_message(MessageId id, Message& out) {
    return run("get_message", [&](MongoClient::ScopedClient& sc) {
        auto doc = sc.messages()
                       .find_one(make_document(kvp("_id", id)));
        if (!doc) return Result::kNotFound;
        out = message_from(doc->view());
        return Result::kOk;
    });
}

Result MongoRepository::list_messages(ConversationId conversation_id, std::vector<Message>& out) {
    return run("list_messages", [&](MongoClient::ScopedClient& sc) {
        mongocxx::options::find opts;
        opts.sort(make_document(kvp("_id", 1)));
        auto cursor = sc.messages().find(
            make_document(kvp("conversation_id", conversation_id)), opts);
        out.clear();
        for (auto&& doc : cursor) {
            out.push_back(message_from(doc));
        }
        return Result::kOk;
    });
}

Result MongoRepository::tag_message_intent(MessageId id, const std::string& intent) {
    return run("tag_message_intent", [&](MongoClient::ScopedClient& sc) {
        auto res = sc.messages().update_one(
            make_document(kvp("_id", id)),
            make_document(kvp("$set", make_document(kvp("intent", intent)))));
        if (res && res->matched_count() == 0) return Result::kNotFound;
        return Result::kOk;
    });
}

Result MongoRepository::mark_message_read(MessageId id) {
    return run("mark_message_read", [&](MongoClient::ScopedClient& sc) {
        auto res = sc.messages().update_one(
            make_document(kvp("_id", id)),
            make_document(kvp("$set", make_document(kvp("is_read", true)))));
        if (res && res->matched_count() == 0) return Result::kNotFound;
        return Result::kOk;
    });
}

} // namespace support_router
