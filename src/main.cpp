// =============================================================================
// FILE: src/main.cpp
// =============================================================================
#include "common/config.h"
#include "common/logger.h"
#include "common/slow_event_logger.h"
#include "conversation/sector_catalog.h"
#include "state/memory_kv_backend.h"
#include "state/redis_kv_backend.h"
#include "state/context_store.h"
#include "state/debounce_gate.h"
#include "state/dedup_guard.h"
#include "state/sector_queue_router.h"
#include "persistence/memory_repository.h"
#include "persistence/mongo_client.h"
#include "persistence/mongo_repository.h"
#include "channel/openai_classifier.h"
#include "channel/twilio_sender.h"
#include "notify/operator_registry.h"
#include "dispatch/inbound_dispatcher.h"
#include "dispatch/dispatch_service.h"
#include "dispatch/handoff_service.h"
#include "http/http_server.h"
#include "http/webhook_handler.h"
#include "http/health_handler.h"
#include "http/stats_handler.h"
#include "http/operator_handler.h"
#include <curl/curl.h>
#include <csignal>
#include <atomic>
#include <thread>

using namespace support_router;

static std::atomic<bool> g_shutdown{false};

static void signal_handler(int sig) {
    LOG_INFO("Signal %d received", sig);
    g_shutdown.store(true, std::memory_order_release);
}

int main(int argc, char* argv[]) {
    Logger::instance().set_level(LogLevel::kInfo);
    LOG_INFO("Support router starting...");

    // 1. Config and logging
    Config config = (argc > 1) ? Config::load_from_file(argv[1]) : Config::load_defaults();

    LoggingOptions log_opts;
    log_opts.directory           = config.log_directory;
    log_opts.base_name           = config.log_base_name;
    log_opts.console_level       = parse_log_level(config.log_console_level_str);
    log_opts.max_file_size_bytes = config.log_max_file_size_mb * 1024 * 1024;
    log_opts.max_rotated_files   = config.log_max_rotated_files;
    Logger::instance().configure(log_opts);
    Logger::instance().set_level(parse_log_level(config.log_level_str));

    struct sigaction sa{}; sa.sa_handler = signal_handler; sigemptyset(&sa.sa_mask);
    sigaction(SIGINT, &sa, nullptr); sigaction(SIGTERM, &sa, nullptr);
    signal(SIGPIPE, SIG_IGN);

    if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK) {
        LOG_FATAL("libcurl initialisation failed"); return 1;
    }

    SlowEventLogger slow_logger(config);

    // 2. Persistence
    std::shared_ptr<MongoClient> mongo;
    std::unique_ptr<ConversationRepository> repository;
    if (config.mongo_enable_persistence) {
        mongo = std::make_shared<MongoClient>(config);
        if (mongo->connect() != Result::kOk) {
            LOG_FATAL("MongoDB connection failed"); return 1;
        }
        auto mongo_repo = std::make_unique<MongoRepository>(mongo);
        if (mongo_repo->ensure_indexes() != Result::kOk) {
            LOG_FATAL("MongoDB index setup failed"); return 1;
        }
        repository = std::move(mongo_repo);
    } else {
        LOG_WARN("Persistence disabled, conversations are kept in memory only");
        repository = std::make_unique<MemoryRepository>();
    }

    // 3. Conversation state
    SectorCatalog catalog = SectorCatalog::from_config(config);
    MemoryKvBackend memory_kv;
    std::unique_ptr<RedisKvBackend> redis_kv;
    KvBackend* kv = &memory_kv;
    const char* kv_name = "memory";
    if (config.redis_enabled) {
        redis_kv = std::make_unique<RedisKvBackend>(config);
        if (redis_kv->connect() == Result::kOk) {
            kv = redis_kv.get();
            kv_name = "redis";
        } else {
            LOG_WARN("Redis unreachable at %s, routing state kept in process memory",
                     config.redis_uri.c_str());
            redis_kv.reset();
        }
    } else {
        LOG_WARN("Redis disabled, routing state kept in process memory");
    }
    ContextStore context(*kv, config.context_max_entries, config.context_ttl);
    DebounceGate debounce(*kv, config.debounce_key_ttl);
    DedupGuard dedup(*kv);
    SectorQueueRouter queues(*kv, catalog);

    // 4. Collaborators
    OpenAiClassifier classifier(config);
    TwilioSender sender(config);
    OperatorRegistry operators;
    OperatorMailboxes mailboxes;

    // 5. Dispatch
    InboundDispatcher dispatcher(config, catalog, *repository, context, debounce, dedup,
                                 queues, classifier, sender, operators, slow_logger);

    HandoffService handoff(*repository, queues, context, sender, operators,
                           config.notify_fallback_sector);

    DispatchService service(config, dispatcher);
    if (service.start() != Result::kOk) { LOG_FATAL("Dispatch service start failed"); return 1; }

    // 6. HTTP server
    HttpServer http(config);
    if (config.http_enabled) {
        WebhookHandler::register_routes(http, {&service, config.webhook_verify_token});
        HealthHandler::register_routes(http, {&service, mongo.get(), config.mongo_enable_persistence});
        StatsHandler::register_routes(http, {&config, &service, &queues, &operators,
                                             mongo.get(), &slow_logger, kv, kv_name});
        OperatorHandler::register_routes(http, {&handoff, &operators, &mailboxes});

        if (http.start() != Result::kOk) {
            LOG_FATAL("HTTP server start failed");
            service.stop();
            return 1;
        }
    }

    LOG_INFO("All components started. service_id=%s sectors=%zu workers=%zu",
             config.service_id.c_str(), catalog.sectors().size(), service.num_workers());

    // Main loop
    uint64_t tick = 0;
    while (!g_shutdown.load(std::memory_order_acquire)) {
        std::this_thread::sleep_for(Seconds(1));
        ++tick;
        if (tick % 60 == 0 && !redis_kv) {
            size_t purged = memory_kv.purge_expired();
            if (purged > 0) LOG_DEBUG("State: %zu expired keys purged", purged);
        }
        if (tick % 30 == 0) {
            auto agg = service.aggregate_stats();
            auto& ds = dispatcher.stats();
            LOG_INFO("Stats: messages=%lu cycles=%lu/%lu replies=%lu handoffs=%lu timers=%lu operators=%zu",
                     static_cast<unsigned long>(agg.total_messages_received),
                     static_cast<unsigned long>(agg.total_cycles_completed),
                     static_cast<unsigned long>(agg.total_cycles_started),
                     static_cast<unsigned long>(ds.replies_sent.load()),
                     static_cast<unsigned long>(ds.handoffs.load()),
                     static_cast<unsigned long>(agg.pending_timers),
                     operators.connected());
        }
    }

    // Shutdown (reverse order)
    LOG_INFO("Shutting down...");
    http.stop();
    service.stop();
    if (mongo) mongo->disconnect();
    curl_global_cleanup();

    LOG_INFO("Support router stopped cleanly.");
    Logger::instance().flush_all();
    return 0;
}
