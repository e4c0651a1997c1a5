// =============================================================================
// FILE: src/http/stats_handler.cpp
// =============================================================================
#include "http/stats_handler.h"
#include "dispatch/dispatch_service.h"
#include "notify/operator_registry.h"
#include "persistence/mongo_client.h"
#include "state/kv_backend.h"
#include "state/sector_queue_router.h"
#include "common/slow_event_logger.h"
#include "common/config.h"
#include "common/logger.h"
#include <sstream>

namespace support_router {

void StatsHandler::register_routes(HttpServer& server, const Dependencies& deps) {
    auto d = deps;

    server.route("GET", "/stats", [d](const HttpServer::Request& r) { return handle_stats(r, d); });
    server.route("GET", "/stats/workers", [d](const HttpServer::Request& r) { return handle_stats_workers(r, d); });
    server.route("GET", "/queues", [d](const HttpServer::Request& r) { return handle_queues(r, d); });
    server.route("GET", "/config", [d](const HttpServer::Request& r) { return handle_config(r, d); });
}

HttpServer::Response StatsHandler::handle_stats(const HttpServer::Request&, const Dependencies& d) {
    HttpServer::Response resp;
    std::ostringstream j;
    j << "{";
    bool first = true;
    auto section = [&](const char* name) {
        if (!first) j << ",";
        first = false;
        j << "\"" << name << "\":{";
    };

    if (d.dispatch) {
        auto agg = d.dispatch->aggregate_stats();
        section("workers");
        j << "\"count\":" << d.dispatch->num_workers();
        j << ",\"messages_received\":" << agg.total_messages_received;
        j << ",\"messages_dropped\":" << agg.total_messages_dropped;
        j << ",\"cycles_started\":" << agg.total_cycles_started;
        j << ",\"cycles_completed\":" << agg.total_cycles_completed;
        j << ",\"store_failures\":" << agg.total_store_failures;
        j << ",\"max_queue_depth\":" << agg.max_queue_depth;
        j << ",\"pending_timers\":" << agg.pending_timers;
        j << "}";

        auto& ds = d.dispatch->dispatcher().stats();
        section("dispatcher");
        j << "\"messages_received\":" << ds.messages_received.load();
        j << ",\"messages_rejected\":" << ds.messages_rejected.load();
        j << ",\"customers_created\":" << ds.customers_created.load();
        j << ",\"conversations_created\":" << ds.conversations_created.load();
        j << ",\"conversations_reactivated\":" << ds.conversations_reactivated.load();
        j << ",\"cycles_superseded\":" << ds.cycles_superseded.load();
        j << ",\"cycles_operator_handling\":" << ds.cycles_operator_handling.load();
        j << ",\"replies_deduplicated\":" << ds.replies_deduplicated.load();
        j << ",\"replies_sent\":" << ds.replies_sent.load();
        j << ",\"send_failures\":" << ds.send_failures.load();
        j << ",\"handoffs\":" << ds.handoffs.load();
        j << ",\"sector_migrations\":" << ds.sector_migrations.load();
        j << ",\"routing_conflicts\":" << ds.routing_conflicts.load();
        j << ",\"cycle_failures\":" << ds.cycle_failures.load();
        j << "}";
    }

    if (d.operators) {
        auto& os = d.operators->stats();
        section("operators");
        j << "\"connected\":" << d.operators->connected();
        j << ",\"events_sent\":" << os.events_sent.load();
        j << ",\"sink_failures\":" << os.sink_failures.load();
        j << "}";
    }

    if (d.slow_logger) {
        auto& ss = d.slow_logger->stats();
        auto th = d.slow_logger->thresholds();
        section("slow_events");
        j << "\"timed\":" << ss.timed_count.load();
        j << ",\"warn_count\":" << ss.warn_count.load();
        j << ",\"error_count\":" << ss.error_count.load();
        j << ",\"critical_count\":" << ss.critical_count.load();
        j << ",\"max_duration_ms\":" << ss.max_duration_ms.load();
        j << ",\"warn_threshold_ms\":" << th.warn.count();
        j << ",\"error_threshold_ms\":" << th.error.count();
        j << ",\"critical_threshold_ms\":" << th.critical.count();
        j << "}";
    }

    if (d.kv) {
        section("state");
        j << "\"backend\":\"" << d.kv_backend << "\"";
        try {
            j << ",\"keys\":" << d.kv->key_count();
        } catch (const std::exception& e) {
            LOG_WARN("Stats: state key count unavailable: %s", e.what());
        }
        j << "}";
    }

    if (d.mongo) {
        auto& ms = d.mongo->stats();
        section("mongodb");
        j << "\"connected\":" << (d.mongo->is_connected() ? "true" : "false");
        j << ",\"operations\":" << ms.operations.load();
        j << ",\"errors\":" << ms.errors.load();
        j << ",\"latency_total_ms\":" << ms.latency_total_ms.load();
        j << "}";
    }

    j << "}";
    resp.body = j.str();
    return resp;
}

HttpServer::Response StatsHandler::handle_stats_workers(const HttpServer::Request&,
                                                        const Dependencies& d) {
    HttpServer::Response resp;
    std::ostringstream j;
    j << "{\"workers\":[";

    if (d.dispatch) {
        for (size_t i = 0; i < d.dispatch->num_workers(); ++i) {
            if (i > 0) j << ",";
            auto& s = d.dispatch->worker(i).stats();
            j << "{\"index\":" << i;
            j << ",\"messages_received\":" << s.messages_received.load();
            j << ",\"messages_dropped\":" << s.messages_dropped.load();
            j << ",\"cycles_started\":" << s.cycles_started.load();
            j << ",\"cycles_completed\":" << s.cycles_completed.load();
            j << ",\"store_failures\":" << s.store_failures.load();
            j << ",\"queue_depth\":" << s.queue_depth.load();
            j << "}";
        }
    }

    j << "]}";
    resp.body = j.str();
    return resp;
}

HttpServer::Response StatsHandler::handle_queues(const HttpServer::Request&,
                                                 const Dependencies& d) {
    HttpServer::Response resp;
    if (!d.queues) { resp.status_code = 503; resp.body = R"({"error":"queues unavailable"})"; return resp; }

    std::ostringstream j;
    j << "{\"queue_sizes\":{";
    bool first = true;
    size_t total = 0;
    for (const auto& kv : d.queues->sizes()) {
        if (!first) j << ",";
        first = false;
        j << "\"" << kv.first << "\":" << kv.second;
        total += kv.second;
    }
    j << "},\"total\":" << total << "}";
    resp.body = j.str();
    return resp;
}

HttpServer::Response StatsHandler::handle_config(const HttpServer::Request&,
                                                 const Dependencies& d) {
    HttpServer::Response resp;
    if (!d.config) { resp.status_code = 500; return resp; }
    auto& c = *d.config;

    std::ostringstream j;
    j << "{";
    j << "\"service_id\":\"" << c.service_id << "\"";
    j << ",\"num_workers\":" << c.num_workers;
    j << ",\"debounce_window_ms\":" << c.debounce_window.count();
    j << ",\"context_max_entries\":" << c.context_max_entries;
    j << ",\"context_ttl_sec\":" << c.context_ttl.count();
    j << ",\"dedup_text_ttl_sec\":" << c.dedup_text_ttl.count();
    j << ",\"dedup_app_link_ttl_sec\":" << c.dedup_app_link_ttl.count();
    j << ",\"sectors\":[";
    for (size_t i = 0; i < c.sectors.size(); ++i) {
        if (i > 0) j << ",";
        j << "\"" << c.sectors[i] << "\"";
    }
    j << "]";
    j << ",\"fallback_sector\":\"" << c.fallback_sector << "\"";
    j << ",\"reactivation_window_hours\":" << c.reactivation_window.count();
    j << ",\"classifier_model\":\"" << c.classifier_model << "\"";
    j << ",\"classifier_api_key\":\"" << "***redacted***" << "\"";
    j << ",\"sender_auth_token\":\"" << "***redacted***" << "\"";
    j << ",\"mongo_enabled\":" << (c.mongo_enable_persistence ? "true" : "false");
    j << ",\"mongo_uri\":\"" << "***redacted***" << "\"";
    j << ",\"redis_enabled\":" << (c.redis_enabled ? "true" : "false");
    j << ",\"redis_uri\":\"" << "***redacted***" << "\"";
    j << ",\"redis_key_prefix\":\"" << c.redis_key_prefix << "\"";
    j << ",\"mongo_database\":\"" << c.mongo_database << "\"";
    j << ",\"slow_event_warn_ms\":" << c.slow_event_warn_threshold.count();
    j << ",\"slow_event_error_ms\":" << c.slow_event_error_threshold.count();
    j << ",\"slow_event_critical_ms\":" << c.slow_event_critical_threshold.count();
    j << "}";

    resp.body = j.str();
    return resp;
}

} // namespace support_router
