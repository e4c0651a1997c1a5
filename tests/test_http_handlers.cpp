// =============================================================================
// FILE: tests/test_http_handlers.cpp
// =============================================================================
#include <gtest/gtest.h>
#include "channel/webhook_parser.h"
#include "http/health_handler.h"
#include "http/operator_handler.h"
#include "http/stats_handler.h"
#include "http/webhook_handler.h"
#include "dispatch/dispatch_service.h"
#include "dispatch/handoff_service.h"
#include "notify/operator_registry.h"
#include "persistence/memory_repository.h"
#include "state/memory_kv_backend.h"
#include "test_doubles.h"
#include <sstream>
#include <thread>

using namespace support_router;
using namespace support_router::testing_support;

namespace {

Config http_config() {
    Config c;
    c.num_workers = 2;
    c.debounce_window = Millisecs(50);
    c.webhook_verify_token = "verify-me";
    c.classifier_api_key = "sk-secret-value";
    c.mongo_enable_persistence = false;
    return c;
}

HttpServer::Request make_request(const std::string& method, const std::string& path,
                                 const std::string& body = "") {
    HttpServer::Request req;
    req.method = method;
    req.target = path;
    req.remote_addr = "127.0.0.1";
    req.body = body;
    auto q = path.find('?');
    req.path = path.substr(0, q);
    if (q != std::string::npos) {
        req.query_string = path.substr(q + 1);
        for (const auto& kv : parse_query_string(path)) req.query_params[kv.first] = kv.second;
    }
    return req;
}

Json::Value parse(const std::string& body) {
    Json::CharReaderBuilder builder;
    Json::Value root;
    std::string errs;
    std::istringstream in(body);
    EXPECT_TRUE(Json::parseFromStream(builder, in, &root, &errs)) << errs << " in " << body;
    return root;
}

} // namespace

class HttpHandlersTest : public ::testing::Test {
protected:
    HttpHandlersTest()
        : config_(http_config())
        , catalog_(SectorCatalog::from_config(config_))
        , context_(kv_, config_.context_max_entries, config_.context_ttl)
        , debounce_(kv_, config_.debounce_key_ttl)
        , dedup_(kv_)
        , queues_(kv_, catalog_)
        , slow_(config_)
        , dispatcher_(config_, catalog_, repo_, context_, debounce_, dedup_, queues_,
                      classifier_, sender_, registry_, slow_)
        , service_(config_, dispatcher_)
        , handoff_(repo_, queues_, context_, sender_, registry_, config_.notify_fallback_sector)
        , server_(config_)
    {
        classifier_.fallback.intent = "geral";
        classifier_.fallback.response = "Olá!";
        dispatcher_.set_business_hours_check([] { return true; });

        WebhookHandler::Dependencies wh;
        wh.dispatch = &service_;
        wh.verify_token = config_.webhook_verify_token;
        WebhookHandler::register_routes(server_, wh);

        HealthHandler::Dependencies hh;
        hh.dispatch = &service_;
        HealthHandler::register_routes(server_, hh);

        StatsHandler::Dependencies sh;
        sh.config = &config_;
        sh.dispatch = &service_;
        sh.queues = &queues_;
        sh.operators = &registry_;
        sh.slow_logger = &slow_;
        sh.kv = &kv_;
        StatsHandler::register_routes(server_, sh);

        OperatorHandler::Dependencies oh;
        oh.handoff = &handoff_;
        oh.registry = &registry_;
        oh.mailboxes = &mailboxes_;
        OperatorHandler::register_routes(server_, oh);
    }

    ~HttpHandlersTest() override { service_.stop(); }

    HttpServer::Response call(const std::string& method, const std::string& path,
                              const std::string& body = "") {
        return server_.dispatch(make_request(method, path, body));
    }

    ConversationId waiting_conversation(const std::string& sector) {
        Customer c;
        c.address = "5553999990000";
        repo_.insert_customer(c);
        Conversation conv;
        conv.customer_id = c.id;
        conv.status = ConversationStatus::kWaitingQueue;
        conv.sector = sector;
        conv.started_at = WallClock::now();
        repo_.insert_conversation(conv);
        queues_.enqueue(sector, conv.id);
        return conv.id;
    }

    Config config_;
    SectorCatalog catalog_;
    MemoryRepository repo_;
    MemoryKvBackend kv_;
    ContextStore context_;
    DebounceGate debounce_;
    DedupGuard dedup_;
    SectorQueueRouter queues_;
    SlowEventLogger slow_;
    ScriptedClassifier classifier_;
    RecordingSender sender_;
    OperatorRegistry registry_;
    OperatorMailboxes mailboxes_;
    InboundDispatcher dispatcher_;
    DispatchService service_;
    HandoffService handoff_;
    HttpServer server_;
};

TEST_F(HttpHandlersTest, SubscriptionVerification) {
    auto ok = call("GET", "/webhook?hub.mode=subscribe&hub.verify_token=verify-me&hub.challenge=1158201444");
    EXPECT_EQ(ok.status_code, 200);
    EXPECT_EQ(ok.content_type, "text/plain");
    EXPECT_EQ(ok.body, "1158201444");

    auto bad = call("GET", "/webhook?hub.mode=subscribe&hub.verify_token=wrong&hub.challenge=1");
    EXPECT_EQ(bad.status_code, 403);
    EXPECT_EQ(parse(bad.body)["detail"].asString(), "Verification failed");
}

TEST_F(HttpHandlersTest, TwilioDeliveryQueuedAndAnswered) {
    ASSERT_EQ(service_.start(), Result::kOk);
    auto resp = call("POST", "/webhook/twilio",
                     "From=whatsapp%3A%2B5553999990000&Body=Oi&MessageSid=SM9&NumMedia=0");
    EXPECT_EQ(resp.status_code, 200);
    EXPECT_EQ(resp.content_type, "text/xml");
    EXPECT_TRUE(resp.body.empty());

    auto deadline = Clock::now() + Millisecs(5000);
    while (sender_.count() == 0 && Clock::now() < deadline) {
        std::this_thread::sleep_for(Millisecs(10));
    }
    ASSERT_EQ(sender_.count(), 1u);
    EXPECT_EQ(sender_.sent[0].first, "5553999990000");
}

TEST_F(HttpHandlersTest, MetaDeliveryAcknowledged) {
    ASSERT_EQ(service_.start(), Result::kOk);
    auto bad = call("POST", "/webhook", "{not json");
    EXPECT_EQ(bad.status_code, 200);
    EXPECT_EQ(parse(bad.body)["status"].asString(), "error");

    const std::string body = R"({"object":"whatsapp_business_account","entry":[{"changes":[{
        "field":"messages","value":{"messages":[
        {"from":"5553999990001","id":"wamid.1","type":"text","text":{"body":"Oi"}}]}}]}]})";
    auto ok = call("POST", "/webhook", body);
    EXPECT_EQ(parse(ok.body)["status"].asString(), "ok");
    EXPECT_EQ(service_.aggregate_stats().total_messages_received, 1u);
}

TEST_F(HttpHandlersTest, UnknownRouteIs404) {
    auto resp = call("GET", "/nope");
    EXPECT_EQ(resp.status_code, 404);
    EXPECT_EQ(parse(resp.body)["error"].asString(), "not_found");
}

TEST_F(HttpHandlersTest, HealthFollowsDispatcher) {
    auto down = call("GET", "/health");
    EXPECT_EQ(down.status_code, 503);
    EXPECT_FALSE(parse(down.body)["healthy"].asBool());

    ASSERT_EQ(service_.start(), Result::kOk);
    auto up = call("GET", "/health");
    EXPECT_EQ(up.status_code, 200);
    Json::Value j = parse(up.body);
    EXPECT_TRUE(j["healthy"].asBool());
    EXPECT_EQ(j["workers"].asInt(), 2);
    EXPECT_EQ(call("GET", "/ready").status_code, 200);
}

TEST_F(HttpHandlersTest, QueuesAndConfig) {
    waiting_conversation("rh");
    Json::Value q = parse(call("GET", "/queues").body);
    EXPECT_EQ(q["queue_sizes"]["rh"].asUInt64(), 1u);
    EXPECT_EQ(q["queue_sizes"]["comercial"].asUInt64(), 0u);
    EXPECT_EQ(q["total"].asUInt64(), 1u);

    auto cfg = call("GET", "/config");
    EXPECT_EQ(cfg.status_code, 200);
    EXPECT_EQ(cfg.body.find("sk-secret-value"), std::string::npos);
    EXPECT_EQ(parse(cfg.body)["classifier_api_key"].asString(), "***redacted***");

    EXPECT_EQ(call("GET", "/stats").status_code, 200);
}

TEST_F(HttpHandlersTest, OperatorTakesConversationFromQueue) {
    auto conn = call("POST", "/operators/1/connect?sector=rh");
    EXPECT_EQ(conn.status_code, 200);
    EXPECT_EQ(registry_.connected(), 1u);

    ConversationId id = waiting_conversation("rh");
    auto next = call("POST", "/queues/rh/next?operator_id=1");
    ASSERT_EQ(next.status_code, 200);
    Json::Value conv = parse(next.body);
    EXPECT_EQ(conv["id"].asInt64(), id);
    EXPECT_EQ(conv["status"].asString(), "in_progress");
    EXPECT_EQ(conv["operator_id"].asInt64(), 1);

    auto empty = call("POST", "/queues/rh/next?operator_id=1");
    EXPECT_EQ(empty.status_code, 404);

    std::string base = "/conversations/" + std::to_string(id);
    auto sent = call("POST", base + "/messages?operator_id=1", R"({"content":"Olá, sou do RH."})");
    ASSERT_EQ(sent.status_code, 200);
    Json::Value msg = parse(sent.body);
    EXPECT_EQ(msg["sender_type"].asString(), "operator");
    ASSERT_EQ(sender_.count(), 1u);

    Json::Value events = parse(call("GET", "/operators/1/events").body)["events"];
    ASSERT_GE(events.size(), 2u);
    EXPECT_EQ(events[0u]["type"].asString(), "queue_update");
    EXPECT_EQ(events[events.size() - 1]["type"].asString(), "new_message");
    EXPECT_EQ(parse(call("GET", "/operators/1/events").body)["events"].size(), 0u);

    std::string read_path = "/messages/" + std::to_string(msg["id"].asInt64()) + "/read";
    EXPECT_EQ(call("POST", read_path).status_code, 200);
    EXPECT_EQ(call("POST", "/messages/999/read").status_code, 404);

    EXPECT_EQ(call("POST", base + "/resolve").status_code, 200);
    EXPECT_EQ(call("POST", base + "/close").status_code, 200);
    EXPECT_EQ(call("POST", base + "/close").status_code, 409);

    EXPECT_EQ(call("POST", "/operators/1/disconnect").status_code, 200);
    EXPECT_EQ(registry_.connected(), 0u);
}

TEST_F(HttpHandlersTest, OperatorRequestValidation) {
    ConversationId id = waiting_conversation("comercial");
    std::string base = "/conversations/" + std::to_string(id);

    EXPECT_EQ(call("POST", base + "/accept").status_code, 400);
    EXPECT_EQ(call("POST", base + "/messages?operator_id=1", "{}").status_code, 400);
    EXPECT_EQ(call("POST", "/conversations/abc/accept?operator_id=1").status_code, 404);
    EXPECT_EQ(call("POST", "/conversations/999/accept?operator_id=1").status_code, 404);
    EXPECT_EQ(call("POST", base + "/accept?operator_id=2").status_code, 200);
    EXPECT_EQ(call("POST", "/queues/financeiro/next?operator_id=2").status_code, 409);
}

TEST(OperatorHandlerStatus, ResultMapping) {
    EXPECT_EQ(OperatorHandler::status_for(Result::kOk), 200);
    EXPECT_EQ(OperatorHandler::status_for(Result::kNotFound), 404);
    EXPECT_EQ(OperatorHandler::status_for(Result::kInvalidArgument), 409);
    EXPECT_EQ(OperatorHandler::status_for(Result::kConflict), 409);
    EXPECT_EQ(OperatorHandler::status_for(Result::kError), 502);
    EXPECT_EQ(OperatorHandler::status_for(Result::kPersistenceError), 500);
}

TEST(OperatorMailboxesTest, DrainAndCap) {
    OperatorMailboxes boxes(2);
    boxes.push(1, "a");
    boxes.push(1, "b");
    boxes.push(1, "c");
    auto got = boxes.drain(1);
    ASSERT_EQ(got.size(), 2u);
    EXPECT_EQ(got.front(), "b");
    EXPECT_TRUE(boxes.drain(1).empty());
}
