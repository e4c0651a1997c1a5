// =============================================================================
// FILE: tests/test_conversation_state_machine.cpp
// =============================================================================
#include <gtest/gtest.h>
#include "conversation/conversation_state_machine.h"
#include "conversation/sector_catalog.h"

using namespace support_router;
using S = ConversationStatus;

TEST(ConversationStateMachine, AllowedTransitions) {
    EXPECT_TRUE(ConversationStateMachine::can_transition(S::kBotHandling, S::kWaitingQueue));
    EXPECT_TRUE(ConversationStateMachine::can_transition(S::kWaitingQueue, S::kInProgress));
    EXPECT_TRUE(ConversationStateMachine::can_transition(S::kBotHandling, S::kInProgress));
    EXPECT_TRUE(ConversationStateMachine::can_transition(S::kInProgress, S::kResolved));
    EXPECT_TRUE(ConversationStateMachine::can_transition(S::kResolved, S::kClosed));
    EXPECT_TRUE(ConversationStateMachine::can_transition(S::kResolved, S::kBotHandling));
}

TEST(ConversationStateMachine, ClosedIsTerminal) {
    for (S to : {S::kBotHandling, S::kWaitingQueue, S::kInProgress, S::kResolved, S::kClosed}) {
        EXPECT_FALSE(ConversationStateMachine::can_transition(S::kClosed, to));
    }
    EXPECT_TRUE(ConversationStateMachine::is_terminal(S::kClosed));
    EXPECT_FALSE(ConversationStateMachine::is_active(S::kResolved));
    EXPECT_TRUE(ConversationStateMachine::is_active(S::kWaitingQueue));
}

TEST(ConversationStateMachine, BeginWaitingOnlyFromBot) {
    Conversation c;
    ASSERT_EQ(ConversationStateMachine::begin_waiting(c, "rh"), Result::kOk);
    EXPECT_EQ(c.status, S::kWaitingQueue);
    EXPECT_EQ(c.sector, "rh");

    EXPECT_EQ(ConversationStateMachine::begin_waiting(c, "comercial"), Result::kInvalidArgument);
    EXPECT_EQ(c.sector, "rh");
}

TEST(ConversationStateMachine, AcceptAssignsOperator) {
    Conversation c;
    c.status = S::kWaitingQueue;
    EXPECT_EQ(ConversationStateMachine::accept(c, 0), Result::kInvalidArgument);
    ASSERT_EQ(ConversationStateMachine::accept(c, 42), Result::kOk);
    EXPECT_EQ(c.status, S::kInProgress);
    EXPECT_EQ(c.operator_id, 42);
    EXPECT_EQ(ConversationStateMachine::accept(c, 43), Result::kInvalidArgument);
    EXPECT_EQ(c.operator_id, 42);
}

TEST(ConversationStateMachine, ResolveAndClose) {
    WallTime now = WallClock::now();
    Conversation c;
    c.status = S::kInProgress;
    ASSERT_EQ(ConversationStateMachine::resolve(c, now), Result::kOk);
    EXPECT_EQ(c.resolved_at, now);

    ASSERT_EQ(ConversationStateMachine::close(c, now + Hours(1)), Result::kOk);
    EXPECT_EQ(c.status, S::kClosed);
    EXPECT_EQ(c.resolved_at, now);

    Conversation bot;
    EXPECT_EQ(ConversationStateMachine::close(bot, now), Result::kInvalidArgument);
    EXPECT_EQ(bot.status, S::kBotHandling);
}

TEST(ConversationStateMachine, CloseFromInProgressStampsResolution) {
    WallTime now = WallClock::now();
    Conversation c;
    c.status = S::kInProgress;
    ASSERT_EQ(ConversationStateMachine::close(c, now), Result::kOk);
    EXPECT_EQ(c.resolved_at, now);
}

TEST(ConversationStateMachine, ReactivationWindow) {
    WallTime now = WallClock::now();
    Conversation c;
    c.status = S::kResolved;
    c.started_at = now - Hours(48);

    c.resolved_at = now - Hours(23);
    EXPECT_TRUE(ConversationStateMachine::should_reactivate(c, now, Hours(24)));

    c.resolved_at = now - Hours(25);
    EXPECT_FALSE(ConversationStateMachine::should_reactivate(c, now, Hours(24)));

    // A recent start also counts
    c.started_at = now - Hours(2);
    EXPECT_TRUE(ConversationStateMachine::should_reactivate(c, now, Hours(24)));

    c.status = S::kClosed;
    EXPECT_FALSE(ConversationStateMachine::should_reactivate(c, now, Hours(24)));
}

TEST(ConversationStateMachine, ReactivateClearsAssignment) {
    Conversation c;
    c.status = S::kResolved;
    c.resolved_at = WallClock::now();
    c.operator_id = 9;
    c.sector = "rh";
    c.intent = "rh";

    ASSERT_EQ(ConversationStateMachine::reactivate(c), Result::kOk);
    EXPECT_EQ(c.status, S::kBotHandling);
    EXPECT_FALSE(c.has_resolved_at());
    EXPECT_FALSE(c.has_operator());
    EXPECT_TRUE(c.sector.empty());
    EXPECT_TRUE(c.intent.empty());

    EXPECT_EQ(ConversationStateMachine::reactivate(c), Result::kInvalidArgument);
}

TEST(ConversationStateMachine, BotSilentWhileOperatorHandles) {
    Conversation c;
    EXPECT_TRUE(ConversationStateMachine::bot_may_reply(c));
    c.status = S::kWaitingQueue;
    EXPECT_TRUE(ConversationStateMachine::bot_may_reply(c));
    c.status = S::kInProgress;
    EXPECT_FALSE(ConversationStateMachine::bot_may_reply(c));
}

TEST(SectorCatalog, ResolvesIntentsCaseInsensitive) {
    SectorCatalog catalog({"comercial", "RH", "atendimento_humano"},
                          {{"atendente", "atendimento_humano"}, {"ferias", "financeiro"}});

    EXPECT_EQ(catalog.sectors().size(), 3u);
    EXPECT_EQ(catalog.resolve_sector("Comercial"), "comercial");
    EXPECT_EQ(catalog.resolve_sector("rh"), "rh");
    EXPECT_EQ(catalog.resolve_sector("ATENDENTE"), "atendimento_humano");
    EXPECT_EQ(catalog.resolve_sector("ferias"), "");
    EXPECT_EQ(catalog.resolve_sector("duvida"), "");
    EXPECT_TRUE(catalog.is_valid("Rh"));
    EXPECT_FALSE(catalog.is_valid("financeiro"));
}
