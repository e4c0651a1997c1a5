// =============================================================================
// FILE: include/http/stats_handler.h
// =============================================================================
#ifndef STATS_HANDLER_H
#define STATS_HANDLER_H

#include "http/http_server.h"

namespace support_router {

class DispatchService;
class SectorQueueRouter;
class OperatorRegistry;
class MongoClient;
class SlowEventLogger;
class KvBackend;
struct Config;

// Registers stats, queue and config endpoints on the HTTP server.
class StatsHandler {
public:
    struct Dependencies {
        const Config*      config      = nullptr;
        DispatchService*   dispatch    = nullptr;
        SectorQueueRouter* queues      = nullptr;
        OperatorRegistry*  operators   = nullptr;
        MongoClient*       mongo       = nullptr;
        SlowEventLogger*   slow_logger = nullptr;
        KvBackend*         kv          = nullptr;
        const char*        kv_backend  = "memory";
    };

    static void register_routes(HttpServer& server, const Dependencies& deps);

    static HttpServer::Response handle_stats(const HttpServer::Request& req,
                                             const Dependencies& deps);
    static HttpServer::Response handle_stats_workers(const HttpServer::Request& req,
                                                     const Dependencies& deps);
    static HttpServer::Response handle_queues(const HttpServer::Request& req,
                                              const Dependencies& deps);
    static HttpServer::Response handle_config(const HttpServer::Request& req,
                                              const Dependencies& deps);
};

} // namespace support_router
#endif // STATS_HANDLER_H
