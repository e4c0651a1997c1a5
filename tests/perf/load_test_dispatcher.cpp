// =============================================================================
// FILE: tests/perf/load_test_dispatcher.cpp
//
// Load test for the dispatch service: submits bursts of messages for many
// customers from several producer threads and measures enqueue latency,
// debounce coalescing and end-to-end drain time. Classifier and sender are
// in-process fakes, state and persistence are in memory.
//
// Run:
//   ./load_test_dispatcher [num_messages] [num_customers] [num_workers] [debounce_ms]
// =============================================================================
#include "common/config.h"
#include "common/logger.h"
#include "common/slow_event_logger.h"
#include "conversation/sector_catalog.h"
#include "dispatch/dispatch_service.h"
#include "persistence/memory_repository.h"
#include "state/memory_kv_backend.h"
#include "test_doubles.h"

#include <algorithm>
#include <cstdio>
#include <atomic>
#include <chrono>
#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <random>
#include <thread>
#include <vector>

using namespace support_router;
using namespace support_router::testing_support;
using namespace std::chrono;

static std::string make_address(int i) {
    char buf[32];
    snprintf(buf, sizeof(buf), "55539%08d", i);
    return buf;
}

int main(int argc, char* argv[]) {
    int total_messages = (argc > 1) ? atoi(argv[1]) : 20000;
    int num_customers  = (argc > 2) ? atoi(argv[2]) : 2000;
    int num_workers    = (argc > 3) ? atoi(argv[3]) : 0;
    int debounce_ms    = (argc > 4) ? atoi(argv[4]) : 200;
    int num_producers  = 4;

    Logger::instance().set_level(LogLevel::kWarn);

    Config config = Config::load_defaults();
    if (num_workers > 0) config.num_workers = static_cast<size_t>(num_workers);
    config.max_pending_per_worker = 1000000;
    config.debounce_window = Millisecs(debounce_ms);
    config.mongo_enable_persistence = false;

    SectorCatalog catalog = SectorCatalog::from_config(config);
    MemoryRepository repo;
    MemoryKvBackend kv;
    ContextStore context(kv, config.context_max_entries, config.context_ttl);
    DebounceGate debounce(kv, config.debounce_key_ttl);
    DedupGuard dedup(kv);
    SectorQueueRouter queues(kv, catalog);
    SlowEventLogger slow_logger(config);
    ScriptedClassifier classifier;
    classifier.fallback.intent = "geral";
    classifier.fallback.response = "Resposta automática";
    RecordingSender sender;
    RecordingNotifier notifier;

    InboundDispatcher dispatcher(config, catalog, repo, context, debounce, dedup, queues,
                                 classifier, sender, notifier, slow_logger);
    dispatcher.set_business_hours_check([] { return true; });
    DispatchService service(config, dispatcher);
    service.start();

    std::cout << "=== Support Router Dispatch Load Test ===" << std::endl;
    std::cout << "Messages:  " << total_messages << std::endl;
    std::cout << "Customers: " << num_customers << std::endl;
    std::cout << "Workers:   " << service.num_workers() << std::endl;
    std::cout << "Debounce:  " << debounce_ms << " ms" << std::endl;
    std::cout << "Producers: " << num_producers << std::endl;
    std::cout << std::endl;

    std::vector<std::string> addresses(num_customers);
    for (int i = 0; i < num_customers; ++i) addresses[i] = make_address(i);

    // ─── Phase 1: burst submission ───
    std::cout << "Phase 1: Submitting " << total_messages << " messages..." << std::endl;

    std::atomic<int64_t> submitted{0};
    std::atomic<int64_t> rejected{0};
    std::atomic<int64_t> total_enqueue_ns{0};
    std::atomic<int64_t> max_enqueue_ns{0};

    auto phase1_start = steady_clock::now();
    std::vector<std::thread> producers;
    int per_producer = total_messages / num_producers;

    for (int p = 0; p < num_producers; ++p) {
        producers.emplace_back([&, p, per_producer]() {
            std::mt19937 rng(42 + p);
            std::uniform_int_distribution<int> customer_dist(0, num_customers - 1);

            for (int i = 0; i < per_producer; ++i) {
                InboundMessage msg;
                msg.address = addresses[customer_dist(rng)];
                msg.text = "mensagem " + std::to_string(i);

                auto enq_start = steady_clock::now();
                Result r = service.submit(std::move(msg));
                int64_t enq_ns = duration_cast<nanoseconds>(steady_clock::now() - enq_start).count();

                total_enqueue_ns.fetch_add(enq_ns, std::memory_order_relaxed);
                int64_t prev_max = max_enqueue_ns.load(std::memory_order_relaxed);
                while (enq_ns > prev_max) {
                    if (max_enqueue_ns.compare_exchange_weak(prev_max, enq_ns)) break;
                }

                if (r == Result::kOk) submitted.fetch_add(1, std::memory_order_relaxed);
                else rejected.fetch_add(1, std::memory_order_relaxed);
            }
        });
    }
    for (auto& t : producers) t.join();
    auto phase1_dur = duration_cast<milliseconds>(steady_clock::now() - phase1_start);

    // ─── Phase 2: drain ───
    std::cout << "  Waiting for reply cycles to drain..." << std::endl;
    int64_t expected = submitted.load();
    auto drain_deadline = steady_clock::now() + seconds(120);
    while (steady_clock::now() < drain_deadline) {
        auto agg = service.aggregate_stats();
        if (static_cast<int64_t>(agg.total_cycles_completed + agg.total_store_failures) >= expected &&
            agg.pending_timers == 0) {
            break;
        }
        std::this_thread::sleep_for(milliseconds(50));
    }
    auto total_dur = duration_cast<milliseconds>(steady_clock::now() - phase1_start);
    auto agg = service.aggregate_stats();
    const auto& ds = dispatcher.stats();

    double avg_enqueue_us = (total_enqueue_ns.load() / 1000.0) /
                            static_cast<double>(std::max<int64_t>(expected, 1));

    std::cout << std::endl;
    std::cout << "=== Results ===" << std::endl;
    std::cout << "  Submit duration:    " << phase1_dur.count() << " ms" << std::endl;
    std::cout << "  Total duration:     " << total_dur.count() << " ms" << std::endl;
    std::cout << "  Submitted:          " << expected << std::endl;
    std::cout << "  Rejected:           " << rejected.load() << std::endl;
    std::cout << "  Cycles completed:   " << agg.total_cycles_completed << std::endl;
    std::cout << "  Superseded:         " << ds.cycles_superseded.load() << std::endl;
    std::cout << "  Replies sent:       " << ds.replies_sent.load() << std::endl;
    std::cout << "  Replies deduped:    " << ds.replies_deduplicated.load() << std::endl;
    std::cout << "  Store failures:     " << agg.total_store_failures << std::endl;
    std::cout << "  Submit throughput:  " << std::fixed << std::setprecision(0)
              << (expected * 1000.0 / std::max<int64_t>(phase1_dur.count(), 1)) << " msgs/sec"
              << std::endl;
    std::cout << "  Avg enqueue lat:    " << std::setprecision(2) << avg_enqueue_us << " us"
              << std::endl;
    std::cout << "  Max enqueue lat:    " << (max_enqueue_ns.load() / 1000.0) << " us"
              << std::endl;
    std::cout << "  Max queue depth:    " << agg.max_queue_depth << std::endl;
    std::cout << "  State keys:         " << kv.key_count() << std::endl;
    std::cout << std::endl;

    // ─── Phase 3: per-worker breakdown ───
    std::cout << "=== Per-Worker Stats ===" << std::endl;
    std::cout << std::setw(8) << "Worker" << std::setw(12) << "Received"
              << std::setw(12) << "Started" << std::setw(12) << "Completed"
              << std::setw(10) << "Dropped" << std::setw(10) << "QDepth" << std::endl;
    for (size_t i = 0; i < service.num_workers(); ++i) {
        const auto& s = service.worker(i).stats();
        std::cout << std::setw(8) << i
                  << std::setw(12) << s.messages_received.load()
                  << std::setw(12) << s.cycles_started.load()
                  << std::setw(12) << s.cycles_completed.load()
                  << std::setw(10) << s.messages_dropped.load()
                  << std::setw(10) << s.queue_depth.load()
                  << std::endl;
    }

    service.stop();
    std::cout << std::endl << "Done." << std::endl;
    return 0;
}
