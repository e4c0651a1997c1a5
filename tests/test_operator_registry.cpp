// =============================================================================
// FILE: tests/test_operator_registry.cpp
// =============================================================================
#include <gtest/gtest.h>
#include "notify/operator_registry.h"
#include <sstream>
#include <stdexcept>

using namespace support_router;

namespace {

struct Inbox {
    std::vector<std::string> events;
    OperatorRegistry::EventSink sink() {
        return [this](const std::string& e) { events.push_back(e); };
    }
};

Json::Value parse(const std::string& body) {
    Json::CharReaderBuilder builder;
    Json::Value root;
    std::string errs;
    std::istringstream in(body);
    EXPECT_TRUE(Json::parseFromStream(builder, in, &root, &errs)) << errs;
    return root;
}

} // namespace

TEST(OperatorRegistry, ConnectReplacesAndDisconnect) {
    OperatorRegistry reg;
    Inbox first, second;
    reg.connect(1, "comercial", first.sink());
    reg.connect(1, "rh", second.sink());
    EXPECT_EQ(reg.connected(), 1u);

    EXPECT_TRUE(reg.send_to(1, "ping"));
    EXPECT_TRUE(first.events.empty());
    ASSERT_EQ(second.events.size(), 1u);

    reg.disconnect(1);
    EXPECT_EQ(reg.connected(), 0u);
    EXPECT_FALSE(reg.send_to(1, "ping"));
}

TEST(OperatorRegistry, SectorBroadcastOnlyReachesSector) {
    OperatorRegistry reg;
    Inbox com, rh;
    reg.connect(1, "comercial", com.sink());
    reg.connect(2, "rh", rh.sink());

    EXPECT_EQ(reg.broadcast_sector("rh", "x"), 1u);
    EXPECT_TRUE(com.events.empty());
    EXPECT_EQ(rh.events.size(), 1u);

    EXPECT_EQ(reg.broadcast_all("y"), 2u);
}

TEST(OperatorRegistry, ThrowingSinkDoesNotStopOthers) {
    OperatorRegistry reg;
    Inbox ok;
    reg.connect(1, "rh", [](const std::string&) { throw std::runtime_error("socket closed"); });
    reg.connect(2, "rh", ok.sink());

    EXPECT_EQ(reg.broadcast_all("x"), 1u);
    EXPECT_EQ(ok.events.size(), 1u);
    EXPECT_EQ(reg.stats().sink_failures.load(), 1u);
    EXPECT_EQ(reg.stats().events_sent.load(), 1u);
}

TEST(OperatorRegistry, NewMessageEvent) {
    OperatorRegistry reg;
    Inbox inbox;
    reg.connect(1, "comercial", inbox.sink());

    Message m;
    m.id = 9;
    m.conversation_id = 4;
    m.sender_role = SenderRole::kBot;
    m.content = "Olá!";
    reg.notify_message(4, "rh", m);

    ASSERT_EQ(inbox.events.size(), 1u);
    Json::Value ev = parse(inbox.events[0]);
    EXPECT_EQ(ev["type"].asString(), "new_message");
    EXPECT_EQ(ev["conversation_id"].asInt64(), 4);
    EXPECT_EQ(ev["message"]["sender_type"].asString(), "bot");
    EXPECT_EQ(ev["message"]["content"].asString(), "Olá!");
    EXPECT_EQ(ev["message"]["message_type"].asString(), "text");
}

TEST(OperatorRegistry, QueueUpdateEvent) {
    OperatorRegistry reg;
    Inbox inbox;
    reg.connect(1, "rh", inbox.sink());
    reg.notify_queue_sizes({{"comercial", 2}, {"rh", 0}});

    ASSERT_EQ(inbox.events.size(), 1u);
    Json::Value ev = parse(inbox.events[0]);
    EXPECT_EQ(ev["type"].asString(), "queue_update");
    EXPECT_EQ(ev["queue_sizes"]["comercial"].asUInt64(), 2u);
    EXPECT_EQ(ev["queue_sizes"]["rh"].asUInt64(), 0u);
}

TEST(OperatorRegistry, NewConversationGoesToSector) {
    OperatorRegistry reg;
    Inbox com, rh;
    reg.connect(1, "comercial", com.sink());
    reg.connect(2, "rh", rh.sink());

    Conversation c;
    c.id = 12;
    c.customer_id = 3;
    c.status = ConversationStatus::kWaitingQueue;
    c.sector = "rh";
    reg.notify_new_conversation("rh", c);

    EXPECT_TRUE(com.events.empty());
    ASSERT_EQ(rh.events.size(), 1u);
    Json::Value ev = parse(rh.events[0]);
    EXPECT_EQ(ev["type"].asString(), "new_conversation");
    EXPECT_EQ(ev["conversation"]["id"].asInt64(), 12);
    EXPECT_EQ(ev["conversation"]["status"].asString(), "waiting_queue");
    EXPECT_TRUE(ev["conversation"]["operator_id"].isNull());
}
