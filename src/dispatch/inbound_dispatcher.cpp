// =============================================================================
// FILE: src/dispatch/inbound_dispatcher.cpp
// =============================================================================
#include "dispatch/inbound_dispatcher.h"
#include "conversation/conversation_state_machine.h"
#include "common/logger.h"

namespace support_router {

const char* cycle_outcome_to_string(CycleOutcome o) {
    switch (o) {
        case CycleOutcome::kReplied:          return "replied";
        case CycleOutcome::kHandedOff:        return "handed_off";
        case CycleOutcome::kSuperseded:       return "superseded";
        case CycleOutcome::kOperatorHandling: return "operator_handling";
        case CycleOutcome::kDuplicate:        return "duplicate";
        case CycleOutcome::kFailed:           return "failed";
        default:                              return "unknown";
    }
}

namespace {

std::string pick_sector(const SectorCatalog& catalog, const std::string& wanted,
                        const char* what) {
    if (catalog.is_valid(wanted)) return SectorCatalog::to_lower(wanted);
    std::string replacement = catalog.sectors().empty() ? "" : catalog.sectors().front();
    LOG_ERROR("Dispatcher: %s '%s' is not a configured sector, using '%s'",
              what, wanted.c_str(), replacement.c_str());
    return replacement;
}

} // namespace

InboundDispatcher::InboundDispatcher(const Config& config,
                                     const SectorCatalog& catalog,
                                     ConversationRepository& repository,
                                     ContextStore& context,
                                     DebounceGate& debounce,
                                     DedupGuard& dedup,
                                     SectorQueueRouter& queues,
                                     Classifier& classifier,
                                     Sender& sender,
                                     Notifier& notifier,
                                     SlowEventLogger& slow_logger)
    : catalog_(catalog)
    , repo_(repository)
    , context_(context)
    , debounce_(debounce)
    , dedup_(dedup)
    , queues_(queues)
    , classifier_(classifier)
    , sender_(sender)
    , notifier_(notifier)
    , slow_logger_(slow_logger)
    , dedup_policy_(config.dedup_app_link_markers, config.dedup_app_link_key,
                    config.dedup_app_link_ttl, config.dedup_text_ttl)
    , fallback_sector_(pick_sector(catalog, config.fallback_sector, "fallback_sector"))
    , notify_fallback_sector_(config.notify_fallback_sector)
    , debounce_window_(config.debounce_window)
    , reactivation_window_(config.reactivation_window)
    , clock_([] { return WallClock::now(); })
{
    BusinessSchedule schedule = BusinessSchedule::from_config(config);
    business_hours_ = [schedule] { return is_business_hours_now(schedule); };
}

// =============================================================================
// Arm phase
// =============================================================================

Result InboundDispatcher::resolve_customer(const InboundMessage& msg, WallTime now,
                                           Customer& out) {
    Result r = repo_.find_customer_by_address(msg.address, out);
    if (r == Result::kOk) {
        out.last_contact = now;
        if (out.name.empty() && !msg.sender_name.empty()) out.name = msg.sender_name;
        Result u = repo_.update_customer(out);
        if (u != Result::kOk) {
            LOG_WARN("Dispatcher: refresh of customer %ld failed: %s",
                     static_cast<long>(out.id), result_to_string(u));
        }
        return Result::kOk;
    }
    if (r != Result::kNotFound) return r;

    Customer fresh;
    fresh.address = msg.address;
    fresh.name = msg.sender_name;
    fresh.first_contact = now;
    fresh.last_contact = now;

    r = repo_.insert_customer(fresh);
    if (r == Result::kAlreadyExists) {
        // First contact raced with another message from the same address
        return repo_.find_customer_by_address(msg.address, out);
    }
    if (r != Result::kOk) return r;

    stats_.customers_created.fetch_add(1, std::memory_order_relaxed);
    LOG_INFO("Dispatcher: new customer %ld for %s", static_cast<long>(fresh.id), msg.address.c_str());
    out = fresh;
    return Result::kOk;
}

Result InboundDispatcher::resolve_conversation(Customer& customer, WallTime now,
                                               Conversation& out) {
    Result r = repo_.find_active_conversation(customer.id, out);
    if (r == Result::kOk) return Result::kOk;
    if (r != Result::kNotFound) return r;

    Conversation resolved;
    r = repo_.find_latest_resolved(customer.id, resolved);
    if (r != Result::kOk && r != Result::kNotFound) return r;

    if (r == Result::kOk &&
        ConversationStateMachine::should_reactivate(resolved, now, reactivation_window_) &&
        ConversationStateMachine::reactivate(resolved) == Result::kOk) {
        r = repo_.update_conversation(resolved);
        if (r != Result::kOk) return r;
        stats_.conversations_reactivated.fetch_add(1, std::memory_order_relaxed);
        LOG_INFO("Dispatcher: conversation %ld reactivated", static_cast<long>(resolved.id));
        out = resolved;
        return Result::kOk;
    }

    Conversation conv;
    conv.customer_id = customer.id;
    conv.status = ConversationStatus::kBotHandling;
    conv.started_at = now;
    r = repo_.insert_conversation(conv);
    if (r != Result::kOk) return r;

    customer.total_conversations += 1;
    Result u = repo_.update_customer(customer);
    if (u != Result::kOk) {
        LOG_WARN("Dispatcher: conversation count of customer %ld not updated: %s",
                 static_cast<long>(customer.id), result_to_string(u));
    }

    stats_.conversations_created.fetch_add(1, std::memory_order_relaxed);
    LOG_INFO("Dispatcher: conversation %ld opened for customer %ld",
             static_cast<long>(conv.id), static_cast<long>(customer.id));
    out = conv;
    return Result::kOk;
}

Result InboundDispatcher::begin_cycle(const InboundMessage& msg, PendingCycle& out) {
    if (msg.address.empty() || msg.text.empty()) {
        stats_.messages_rejected.fetch_add(1, std::memory_order_relaxed);
        return Result::kInvalidArgument;
    }
    stats_.messages_received.fetch_add(1, std::memory_order_relaxed);
    WallTime now = clock_();

    Customer customer;
    Result r = resolve_customer(msg, now, customer);
    if (r != Result::kOk) {
        LOG_ERROR("Dispatcher: customer lookup for %s failed: %s",
                  msg.address.c_str(), result_to_string(r));
        return r;
    }

    Conversation conv;
    r = resolve_conversation(customer, now, conv);
    if (r != Result::kOk) {
        LOG_ERROR("Dispatcher: conversation lookup for customer %ld failed: %s",
                  static_cast<long>(customer.id), result_to_string(r));
        return r;
    }

    Message inbound;
    inbound.conversation_id = conv.id;
    inbound.sender_role = SenderRole::kCustomer;
    inbound.sender_id = msg.address;
    inbound.content = msg.text;
    inbound.kind = msg.kind;
    inbound.media_url = msg.media_url;
    inbound.channel_message_id = msg.channel_message_id;
    inbound.created_at = now;

    r = repo_.insert_message(inbound);
    if (r != Result::kOk) {
        LOG_ERROR("Dispatcher: inbound message from %s not stored: %s",
                  msg.address.c_str(), result_to_string(r));
        return r;
    }

    context_.append(msg.address, "user", msg.text);

    out.inbound = msg;
    out.customer_id = customer.id;
    out.customer_name = customer.name;
    out.conversation_id = conv.id;
    out.inbound_record = inbound;
    out.armed_at = debounce_.arm(msg.address, now);
    out.received_at = Clock::now();

    LOG_DEBUG("Dispatcher: message %ld from %s stored, waiting %ldms for more",
              static_cast<long>(inbound.id), msg.address.c_str(),
              static_cast<long>(debounce_window_.count()));
    return Result::kOk;
}

// =============================================================================
// Continuation
// =============================================================================

CycleOutcome InboundDispatcher::complete_cycle(const PendingCycle& pending) {
    const std::string& address = pending.inbound.address;

    if (debounce_.superseded_since(address, pending.armed_at)) {
        stats_.cycles_superseded.fetch_add(1, std::memory_order_relaxed);
        LOG_DEBUG("Dispatcher: newer message from %s, dropping run armed at %ld",
                  address.c_str(), static_cast<long>(pending.armed_at));
        return CycleOutcome::kSuperseded;
    }

    SlowEventLogger::Timer cycle_timer(slow_logger_, "reply_cycle", address);

    try {
        Conversation conv;
        Result r = repo_.get_conversation(pending.conversation_id, conv);
        if (r != Result::kOk) {
            LOG_ERROR("Dispatcher: conversation %ld unreadable: %s",
                      static_cast<long>(pending.conversation_id), result_to_string(r));
            stats_.cycle_failures.fetch_add(1, std::memory_order_relaxed);
            return CycleOutcome::kFailed;
        }

        if (!ConversationStateMachine::bot_may_reply(conv)) {
            stats_.cycles_operator_handling.fetch_add(1, std::memory_order_relaxed);
            LOG_INFO("Dispatcher: conversation %ld is with operator %ld, bot stays silent",
                     static_cast<long>(conv.id), static_cast<long>(conv.operator_id));
            return CycleOutcome::kOperatorHandling;
        }

        // The newest turn is the inbound message itself
        std::vector<ContextEntry> history = context_.read(address);
        if (!history.empty()) history.pop_back();

        ClassifierResult verdict;
        {
            SlowEventLogger::Timer timer(slow_logger_, "classifier", address);
            try {
                verdict = classifier_.analyze(pending.inbound.text, history,
                                              pending.customer_name, business_hours_());
            } catch (const std::exception& e) {
                LOG_ERROR("Dispatcher: classifier failed for %s: %s", address.c_str(), e.what());
                verdict = classifier_unavailable_result();
            }
        }

        DedupKey dedup_key = dedup_policy_.key_for(verdict.response);
        if (dedup_.is_duplicate(address, dedup_key.key, dedup_key.ttl)) {
            stats_.replies_deduplicated.fetch_add(1, std::memory_order_relaxed);
            LOG_WARN("Dispatcher: duplicate reply for %s suppressed", address.c_str());
            return CycleOutcome::kDuplicate;
        }

        r = repo_.tag_message_intent(pending.inbound_record.id, verdict.intent);
        if (r != Result::kOk) {
            LOG_WARN("Dispatcher: intent tag on message %ld failed: %s",
                     static_cast<long>(pending.inbound_record.id), result_to_string(r));
        }
        Message inbound = pending.inbound_record;
        inbound.intent = verdict.intent;

        std::string sector = catalog_.resolve_sector(verdict.intent);

        {
            SlowEventLogger::Timer timer(slow_logger_, "sender", address);
            try {
                SendResult sent = sender_.send(address, verdict.response);
                if (sent.success) {
                    stats_.replies_sent.fetch_add(1, std::memory_order_relaxed);
                } else {
                    stats_.send_failures.fetch_add(1, std::memory_order_relaxed);
                    LOG_ERROR("Dispatcher: reply to %s not delivered: %s",
                              address.c_str(), sent.error.c_str());
                }
            } catch (const std::exception& e) {
                stats_.send_failures.fetch_add(1, std::memory_order_relaxed);
                LOG_ERROR("Dispatcher: sender failed for %s: %s", address.c_str(), e.what());
            }
        }

        Message reply;
        reply.conversation_id = conv.id;
        reply.sender_role = SenderRole::kBot;
        reply.sender_id = "bot";
        reply.content = verdict.response;
        reply.kind = MessageKind::kText;
        reply.intent = verdict.intent;
        reply.created_at = clock_();
        r = repo_.insert_message(reply);
        if (r != Result::kOk) {
            LOG_ERROR("Dispatcher: reply for conversation %ld not stored: %s",
                      static_cast<long>(conv.id), result_to_string(r));
        }

        context_.append(address, "assistant", verdict.response);

        conv.intent = verdict.intent;
        CycleOutcome outcome = route(conv, verdict.needs_human, sector);

        notify_messages(conv, inbound, reply);

        LOG_INFO("Dispatcher: %s for %s intent=%s sector=%s status=%s confidence=%.2f",
                 cycle_outcome_to_string(outcome), address.c_str(), verdict.intent.c_str(),
                 conv.sector.empty() ? "-" : conv.sector.c_str(),
                 status_to_string(conv.status), verdict.confidence);
        return outcome;

    } catch (const std::exception& e) {
        stats_.cycle_failures.fetch_add(1, std::memory_order_relaxed);
        LOG_ERROR("Dispatcher: reply cycle for %s aborted: %s", address.c_str(), e.what());
        return CycleOutcome::kFailed;
    }
}

CycleOutcome InboundDispatcher::route(Conversation& conv, bool needs_human,
                                      const std::string& sector) {
    const ConversationStatus previous = conv.status;
    const std::string previous_sector = conv.sector;

    Conversation next = conv;
    if (needs_human) {
        std::string target = sector.empty() ? fallback_sector_ : sector;
        if (next.status == ConversationStatus::kWaitingQueue) {
            next.sector = target;
        } else if (ConversationStateMachine::begin_waiting(next, target) != Result::kOk) {
            needs_human = false;
        }
    } else if (!sector.empty()) {
        next.sector = sector;
    }

    Result r = repo_.update_routing(conv.id, previous, next.status, next.sector, next.intent);
    if (r == Result::kConflict) {
        stats_.routing_conflicts.fetch_add(1, std::memory_order_relaxed);
        Conversation current;
        if (repo_.get_conversation(conv.id, current) == Result::kOk) conv = current;
        LOG_WARN("Dispatcher: conversation %ld became %s during the reply, routing left as is",
                 static_cast<long>(conv.id), status_to_string(conv.status));
        return CycleOutcome::kReplied;
    }
    if (r != Result::kOk) {
        LOG_ERROR("Dispatcher: conversation %ld not updated: %s",
                  static_cast<long>(conv.id), result_to_string(r));
        return CycleOutcome::kReplied;
    }
    conv = next;
    if (!needs_human) return CycleOutcome::kReplied;

    if (!place_in_queue(conv, previous)) {
        // Put the stored status back so the conversation does not wait in no queue
        r = repo_.update_routing(conv.id, conv.status, previous, previous_sector, conv.intent);
        if (r != Result::kOk) {
            LOG_ERROR("Dispatcher: conversation %ld left waiting without a queue slot: %s",
                      static_cast<long>(conv.id), result_to_string(r));
            return CycleOutcome::kFailed;
        }
        conv.status = previous;
        conv.sector = previous_sector;
        return CycleOutcome::kReplied;
    }
    return CycleOutcome::kHandedOff;
}

bool InboundDispatcher::place_in_queue(const Conversation& conv, ConversationStatus previous) {
    if (previous == ConversationStatus::kWaitingQueue) {
        std::string holder = queues_.sector_of(conv.id);
        if (holder.empty()) holder = conv.sector;
        if (holder == conv.sector) {
            LOG_DEBUG("Dispatcher: conversation %ld already waiting in %s",
                      static_cast<long>(conv.id), conv.sector.c_str());
            return true;
        }
        Result r = queues_.migrate(holder, conv.sector, conv.id);
        if (r != Result::kOk) {
            LOG_ERROR("Dispatcher: move of %ld %s -> %s failed: %s",
                      static_cast<long>(conv.id), holder.c_str(), conv.sector.c_str(),
                      result_to_string(r));
            return true;
        }
        stats_.sector_migrations.fetch_add(1, std::memory_order_relaxed);
        notify_queue_sizes();
        return true;
    }

    Result r = queues_.enqueue(conv.sector, conv.id);
    if (r != Result::kOk) {
        LOG_ERROR("Dispatcher: conversation %ld not queued in %s: %s",
                  static_cast<long>(conv.id), conv.sector.c_str(), result_to_string(r));
        return false;
    }
    stats_.handoffs.fetch_add(1, std::memory_order_relaxed);
    LOG_INFO("Dispatcher: conversation %ld waiting in %s",
             static_cast<long>(conv.id), conv.sector.c_str());

    notify_queue_sizes();
    try {
        notifier_.notify_new_conversation(conv.sector, conv);
    } catch (const std::exception& e) {
        LOG_WARN("Dispatcher: new-conversation notification failed: %s", e.what());
    }
    return true;
}

void InboundDispatcher::notify_queue_sizes() {
    try {
        notifier_.notify_queue_sizes(queues_.sizes());
    } catch (const std::exception& e) {
        LOG_WARN("Dispatcher: queue notification failed: %s", e.what());
    }
}

void InboundDispatcher::notify_messages(const Conversation& conv, const Message& inbound,
                                        const Message& reply) {
    const std::string& sector = conv.sector.empty() ? notify_fallback_sector_ : conv.sector;
    try {
        notifier_.notify_message(conv.id, sector, inbound);
        notifier_.notify_message(conv.id, sector, reply);
    } catch (const std::exception& e) {
        LOG_WARN("Dispatcher: message notification for %ld failed: %s",
                 static_cast<long>(conv.id), e.what());
    }
}

} // namespace support_router
