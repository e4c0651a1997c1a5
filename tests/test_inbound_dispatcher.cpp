// =============================================================================
// FILE: tests/test_inbound_dispatcher.cpp
// =============================================================================
#include <gtest/gtest.h>
#include "dispatch/inbound_dispatcher.h"
#include "dispatch/handoff_service.h"
#include "persistence/memory_repository.h"
#include "state/memory_kv_backend.h"
#include "test_doubles.h"
#include <memory>

using namespace support_router;
using namespace support_router::testing_support;

namespace {

const char* const kCustomer = "5553999990000";

InboundMessage text_from(const std::string& address, const std::string& text) {
    InboundMessage m;
    m.address = address;
    m.text = text;
    m.channel_message_id = "SMin";
    return m;
}

} // namespace

class InboundDispatcherTest : public ::testing::Test {
protected:
    InboundDispatcherTest()
        : catalog_(SectorCatalog::from_config(config_))
        , slow_(config_)
        , now_(from_epoch_us(1700000000LL * 1000000))
    {
        rebuild(kv_);
    }

    // Wires a dispatcher whose ephemeral state lives in kv
    void rebuild(KvBackend& kv) {
        context_.reset(new ContextStore(kv, config_.context_max_entries, config_.context_ttl));
        debounce_.reset(new DebounceGate(kv, config_.debounce_key_ttl));
        dedup_.reset(new DedupGuard(kv));
        queues_.reset(new SectorQueueRouter(kv, catalog_));
        dispatcher_.reset(new InboundDispatcher(config_, catalog_, repo_, *context_, *debounce_,
                                                *dedup_, *queues_, classifier_, sender_,
                                                notifier_, slow_));
        dispatcher_->set_clock([this] { return now_; });
        dispatcher_->set_business_hours_check([this] { return in_hours_; });
        handoff_.reset(new HandoffService(repo_, *queues_, *context_, sender_, notifier_,
                                          config_.notify_fallback_sector));
    }

    // An operator takes the customer's conversation while the classifier runs
    void accept_during_reply(OperatorId operator_id) {
        classifier_.during_analyze = [this, operator_id] {
            Conversation accepted;
            EXPECT_EQ(handoff_->accept(conversation_of(kCustomer).id, operator_id, accepted),
                      Result::kOk);
        };
    }

    size_t queued_total() {
        size_t total = 0;
        for (const auto& kv : queues_->sizes()) total += kv.second;
        return total;
    }

    // Arm and immediately continue, as if the debounce window had passed
    CycleOutcome run(const std::string& text, const std::string& address = kCustomer) {
        PendingCycle pending;
        EXPECT_EQ(dispatcher_->begin_cycle(text_from(address, text), pending), Result::kOk);
        now_ += Millisecs(2500);
        return dispatcher_->complete_cycle(pending);
    }

    Conversation conversation_of(const std::string& address) {
        Customer c;
        EXPECT_EQ(repo_.find_customer_by_address(address, c), Result::kOk);
        auto all = repo_.conversations_of(c.id);
        EXPECT_FALSE(all.empty());
        return all.empty() ? Conversation() : all.back();
    }

    Config config_;
    SectorCatalog catalog_;
    MemoryRepository repo_;
    MemoryKvBackend kv_;
    ThrowingKvBackend broken_kv_;
    SlowEventLogger slow_;
    ScriptedClassifier classifier_;
    RecordingSender sender_;
    RecordingNotifier notifier_;

    std::unique_ptr<ContextStore> context_;
    std::unique_ptr<DebounceGate> debounce_;
    std::unique_ptr<DedupGuard> dedup_;
    std::unique_ptr<SectorQueueRouter> queues_;
    std::unique_ptr<InboundDispatcher> dispatcher_;
    std::unique_ptr<HandoffService> handoff_;

    WallTime now_;
    bool in_hours_ = true;
};

TEST_F(InboundDispatcherTest, GeneralQuestionAnsweredByBot) {
    classifier_.push("geral", false, "O preço da gasolina hoje é R$ 5,89.");

    EXPECT_EQ(run("Qual o preço da gasolina?"), CycleOutcome::kReplied);

    ASSERT_EQ(sender_.count(), 1u);
    EXPECT_EQ(sender_.sent[0].first, kCustomer);
    EXPECT_EQ(sender_.sent[0].second, "O preço da gasolina hoje é R$ 5,89.");

    Conversation conv = conversation_of(kCustomer);
    EXPECT_EQ(conv.status, ConversationStatus::kBotHandling);
    EXPECT_EQ(conv.sector, "geral");
    EXPECT_EQ(conv.intent, "geral");

    std::vector<Message> msgs;
    repo_.list_messages(conv.id, msgs);
    ASSERT_EQ(msgs.size(), 2u);
    EXPECT_EQ(msgs[0].sender_role, SenderRole::kCustomer);
    EXPECT_EQ(msgs[0].intent, "geral");
    EXPECT_EQ(msgs[1].sender_role, SenderRole::kBot);

    auto ctx = context_->read(kCustomer);
    ASSERT_EQ(ctx.size(), 2u);
    EXPECT_EQ(ctx[0].role, "user");
    EXPECT_EQ(ctx[1].role, "assistant");

    EXPECT_EQ(notifier_.messages.size(), 2u);
    EXPECT_TRUE(notifier_.new_conversations.empty());
    EXPECT_EQ(dispatcher_->stats().conversations_created.load(), 1u);
}

TEST_F(InboundDispatcherTest, HumanRequestQueuesConversation) {
    classifier_.push("atendente", true, "Vou transferir você para um atendente.");

    EXPECT_EQ(run("quero falar com atendente"), CycleOutcome::kHandedOff);

    Conversation conv = conversation_of(kCustomer);
    EXPECT_EQ(conv.status, ConversationStatus::kWaitingQueue);
    EXPECT_EQ(conv.sector, "atendimento_humano");
    EXPECT_EQ(queues_->sizes()["atendimento_humano"], 1u);
    EXPECT_EQ(queues_->sector_of(conv.id), "atendimento_humano");

    ASSERT_EQ(notifier_.new_conversations.size(), 1u);
    EXPECT_EQ(notifier_.new_conversations[0].first, "atendimento_humano");
    ASSERT_FALSE(notifier_.queue_updates.empty());
    EXPECT_EQ(notifier_.queue_updates.back().at("atendimento_humano"), 1u);
    EXPECT_EQ(sender_.count(), 1u);
}

TEST_F(InboundDispatcherTest, BurstIsAnsweredOnce) {
    classifier_.push("geral", false, "Resposta única.");

    PendingCycle first, second;
    ASSERT_EQ(dispatcher_->begin_cycle(text_from(kCustomer, "Oi"), first), Result::kOk);
    now_ += Millisecs(500);
    ASSERT_EQ(dispatcher_->begin_cycle(text_from(kCustomer, "tudo bem?"), second), Result::kOk);
    now_ += Millisecs(2500);

    EXPECT_EQ(dispatcher_->complete_cycle(first), CycleOutcome::kSuperseded);
    EXPECT_EQ(dispatcher_->complete_cycle(second), CycleOutcome::kReplied);

    ASSERT_EQ(classifier_.call_count(), 1u);
    EXPECT_EQ(classifier_.calls[0].message, "tudo bem?");
    ASSERT_EQ(classifier_.calls[0].context.size(), 1u);
    EXPECT_EQ(classifier_.calls[0].context[0].content, "Oi");
    EXPECT_EQ(sender_.count(), 1u);

    // Both inbound messages stay stored
    Conversation conv = conversation_of(kCustomer);
    std::vector<Message> msgs;
    repo_.list_messages(conv.id, msgs);
    EXPECT_EQ(msgs.size(), 3u);
}

TEST_F(InboundDispatcherTest, BotSilentWhileOperatorHandles) {
    classifier_.push("geral", false, "Olá!");
    run("Oi");

    Conversation conv = conversation_of(kCustomer);
    conv.status = ConversationStatus::kInProgress;
    conv.operator_id = 7;
    repo_.update_conversation(conv);

    EXPECT_EQ(run("ainda está aí?"), CycleOutcome::kOperatorHandling);
    EXPECT_EQ(classifier_.call_count(), 1u);
    EXPECT_EQ(sender_.count(), 1u);

    std::vector<Message> msgs;
    repo_.list_messages(conv.id, msgs);
    EXPECT_EQ(msgs.size(), 3u);
    EXPECT_EQ(msgs.back().content, "ainda está aí?");
}

TEST_F(InboundDispatcherTest, AppLinkRepliesDeduplicated) {
    classifier_.push("geral", false, "Baixe nosso app: https://play.google.com/store/apps/x");
    classifier_.push("geral", false, "Também temos para iPhone: https://apps.apple.com/app/y");

    EXPECT_EQ(run("tem app?"), CycleOutcome::kReplied);
    EXPECT_EQ(run("e para iphone?"), CycleOutcome::kDuplicate);
    EXPECT_EQ(sender_.count(), 1u);
    EXPECT_EQ(dispatcher_->stats().replies_deduplicated.load(), 1u);
}

TEST_F(InboundDispatcherTest, RecentlyResolvedConversationReactivated) {
    classifier_.push("rh", true, "Vou chamar o RH.");
    run("preciso falar com o RH");

    Conversation conv = conversation_of(kCustomer);
    conv.status = ConversationStatus::kResolved;
    conv.resolved_at = now_;
    repo_.update_conversation(conv);

    now_ += Hours(23);
    classifier_.push("geral", false, "Bom dia de novo!");
    run("bom dia");

    Conversation again = conversation_of(kCustomer);
    EXPECT_EQ(again.id, conv.id);
    EXPECT_EQ(again.status, ConversationStatus::kBotHandling);
    EXPECT_FALSE(again.has_operator());
    EXPECT_EQ(dispatcher_->stats().conversations_reactivated.load(), 1u);
}

TEST_F(InboundDispatcherTest, OldResolvedConversationStartsNewOne) {
    classifier_.push("geral", false, "Olá!");
    run("Oi");

    Conversation conv = conversation_of(kCustomer);
    conv.status = ConversationStatus::kResolved;
    conv.resolved_at = now_;
    repo_.update_conversation(conv);

    now_ += Hours(25);
    classifier_.push("geral", false, "Olá de novo!");
    run("Oi de novo");

    Conversation fresh = conversation_of(kCustomer);
    EXPECT_NE(fresh.id, conv.id);
    EXPECT_EQ(fresh.status, ConversationStatus::kBotHandling);

    Customer customer;
    repo_.find_customer_by_address(kCustomer, customer);
    EXPECT_EQ(customer.total_conversations, 2);
}

TEST_F(InboundDispatcherTest, WaitingConversationMovesToNewSector) {
    classifier_.push("comercial", true, "Vou chamar o comercial.");
    run("quero comprar");
    classifier_.push("rh", true, "Na verdade é com o RH.");
    EXPECT_EQ(run("é sobre meu salário"), CycleOutcome::kHandedOff);

    Conversation conv = conversation_of(kCustomer);
    EXPECT_EQ(conv.status, ConversationStatus::kWaitingQueue);
    EXPECT_EQ(conv.sector, "rh");
    auto sizes = queues_->sizes();
    EXPECT_EQ(sizes["comercial"], 0u);
    EXPECT_EQ(sizes["rh"], 1u);
    EXPECT_EQ(notifier_.new_conversations.size(), 1u);
    EXPECT_EQ(dispatcher_->stats().sector_migrations.load(), 1u);
}

TEST_F(InboundDispatcherTest, WaitingConversationTakesNewSectorLabel) {
    classifier_.push("comercial", true, "Vou chamar o comercial.");
    run("quero comprar");
    classifier_.push("geral", false, "Aguarde um momento.");
    EXPECT_EQ(run("obrigado"), CycleOutcome::kReplied);

    Conversation conv = conversation_of(kCustomer);
    EXPECT_EQ(conv.status, ConversationStatus::kWaitingQueue);
    EXPECT_EQ(conv.sector, "geral");
    EXPECT_EQ(conv.intent, "geral");
    EXPECT_EQ(queues_->sector_of(conv.id), "comercial");
    EXPECT_EQ(queues_->sizes()["comercial"], 1u);
    EXPECT_EQ(queues_->sizes()["geral"], 0u);
}

TEST_F(InboundDispatcherTest, HandoffBackToHoldingQueueDoesNotMigrate) {
    classifier_.push("comercial", true, "Vou chamar o comercial.");
    run("quero comprar");
    classifier_.push("geral", false, "Aguarde um momento.");
    run("obrigado");
    classifier_.push("comercial", true, "Já está na fila do comercial.");
    EXPECT_EQ(run("ainda esperando"), CycleOutcome::kHandedOff);

    Conversation conv = conversation_of(kCustomer);
    EXPECT_EQ(conv.sector, "comercial");
    EXPECT_EQ(queues_->sizes()["comercial"], 1u);
    EXPECT_EQ(dispatcher_->stats().sector_migrations.load(), 0u);
}

TEST_F(InboundDispatcherTest, AcceptReleasesSlotOfRelabelledConversation) {
    classifier_.push("comercial", true, "Vou chamar o comercial.");
    run("quero comprar");
    classifier_.push("geral", false, "Aguarde um momento.");
    run("obrigado");

    Conversation accepted;
    ASSERT_EQ(handoff_->accept(conversation_of(kCustomer).id, 3, accepted), Result::kOk);
    EXPECT_EQ(queued_total(), 0u);
    EXPECT_FALSE(queues_->is_queued(accepted.id));
}

TEST_F(InboundDispatcherTest, AcceptDuringReplyIsKept) {
    accept_during_reply(7);
    classifier_.push("geral", false, "Olá!");
    EXPECT_EQ(run("Oi"), CycleOutcome::kReplied);

    Conversation conv = conversation_of(kCustomer);
    EXPECT_EQ(conv.status, ConversationStatus::kInProgress);
    EXPECT_EQ(conv.operator_id, 7);
    EXPECT_EQ(dispatcher_->stats().routing_conflicts.load(), 1u);
}

TEST_F(InboundDispatcherTest, AcceptDuringHandoffReplyIsKept) {
    accept_during_reply(7);
    classifier_.push("atendente", true, "Vou transferir você.");
    EXPECT_EQ(run("quero falar com atendente"), CycleOutcome::kReplied);

    Conversation conv = conversation_of(kCustomer);
    EXPECT_EQ(conv.status, ConversationStatus::kInProgress);
    EXPECT_EQ(conv.operator_id, 7);
    EXPECT_EQ(queued_total(), 0u);
    EXPECT_TRUE(notifier_.new_conversations.empty());
    EXPECT_EQ(dispatcher_->stats().handoffs.load(), 0u);
}

TEST_F(InboundDispatcherTest, AcceptDuringMigrationReplyIsKept) {
    classifier_.push("comercial", true, "Vou chamar o comercial.");
    run("quero comprar");

    accept_during_reply(9);
    classifier_.push("rh", true, "Na verdade é com o RH.");
    EXPECT_EQ(run("é sobre meu salário"), CycleOutcome::kReplied);

    Conversation conv = conversation_of(kCustomer);
    EXPECT_EQ(conv.status, ConversationStatus::kInProgress);
    EXPECT_EQ(conv.operator_id, 9);
    EXPECT_EQ(conv.sector, "comercial");
    EXPECT_EQ(queued_total(), 0u);
    EXPECT_EQ(dispatcher_->stats().sector_migrations.load(), 0u);
}

TEST_F(InboundDispatcherTest, UnqueueableHandoffRollsBackStatus) {
    rebuild(broken_kv_);
    classifier_.push("atendente", true, "Vou transferir você.");
    EXPECT_EQ(run("quero falar com atendente"), CycleOutcome::kReplied);

    Conversation conv = conversation_of(kCustomer);
    EXPECT_EQ(conv.status, ConversationStatus::kBotHandling);
    EXPECT_TRUE(conv.sector.empty());
    EXPECT_EQ(conv.intent, "atendente");
    EXPECT_TRUE(notifier_.new_conversations.empty());
    EXPECT_EQ(dispatcher_->stats().handoffs.load(), 0u);
}

TEST_F(InboundDispatcherTest, ClassifierFailureHandsOff) {
    classifier_.throw_next = true;
    EXPECT_EQ(run("Oi"), CycleOutcome::kHandedOff);

    ASSERT_EQ(sender_.count(), 1u);
    EXPECT_EQ(sender_.sent[0].second, kUnavailableResponseText);
    Conversation conv = conversation_of(kCustomer);
    EXPECT_EQ(conv.status, ConversationStatus::kWaitingQueue);
    EXPECT_EQ(conv.intent, "outros");
}

TEST_F(InboundDispatcherTest, UnroutedIntentUsesFallbackSector) {
    classifier_.push("reclamacao", true, "Vou encaminhar.");
    EXPECT_EQ(run("quero reclamar"), CycleOutcome::kHandedOff);

    Conversation conv = conversation_of(kCustomer);
    EXPECT_EQ(conv.sector, "atendimento_humano");
}

TEST_F(InboundDispatcherTest, FailedDeliveryStillStored) {
    sender_.succeed = false;
    classifier_.push("geral", false, "Olá!");
    EXPECT_EQ(run("Oi"), CycleOutcome::kReplied);

    Conversation conv = conversation_of(kCustomer);
    std::vector<Message> msgs;
    repo_.list_messages(conv.id, msgs);
    EXPECT_EQ(msgs.size(), 2u);
    EXPECT_EQ(dispatcher_->stats().send_failures.load(), 1u);
}

TEST_F(InboundDispatcherTest, BusinessHoursPassedToClassifier) {
    in_hours_ = false;
    classifier_.push("geral", false, "Estamos fora do horário.");
    run("Oi");
    ASSERT_EQ(classifier_.call_count(), 1u);
    EXPECT_FALSE(classifier_.calls[0].is_business_hours);
}

TEST_F(InboundDispatcherTest, EmptyMessageRejected) {
    PendingCycle pending;
    EXPECT_EQ(dispatcher_->begin_cycle(text_from(kCustomer, ""), pending),
              Result::kInvalidArgument);
    EXPECT_EQ(dispatcher_->begin_cycle(text_from("", "Oi"), pending),
              Result::kInvalidArgument);
    EXPECT_EQ(dispatcher_->stats().messages_rejected.load(), 2u);
}

TEST_F(InboundDispatcherTest, UnreachableStateStoreDegrades) {
    rebuild(broken_kv_);
    classifier_.push("geral", false, "Olá!");

    EXPECT_EQ(run("Oi"), CycleOutcome::kReplied);
    EXPECT_EQ(sender_.count(), 1u);
    ASSERT_EQ(classifier_.call_count(), 1u);
    EXPECT_TRUE(classifier_.calls[0].context.empty());

    Conversation conv = conversation_of(kCustomer);
    std::vector<Message> msgs;
    repo_.list_messages(conv.id, msgs);
    EXPECT_EQ(msgs.size(), 2u);
}
