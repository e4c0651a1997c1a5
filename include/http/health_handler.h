// =============================================================================
// FILE: include/http/health_handler.h
// =============================================================================
#ifndef HEALTH_HANDLER_H
#define HEALTH_HANDLER_H

#include "http/http_server.h"

namespace support_router {

class DispatchService;
class MongoClient;

// Registers health and readiness endpoints on the HTTP server.
// Health is determined by:
//   - dispatch workers running
//   - MongoDB connected (if persistence enabled)
// Readiness additionally requires a successful MongoDB ping.
class HealthHandler {
public:
    struct Dependencies {
        DispatchService* dispatch      = nullptr;
        MongoClient*     mongo         = nullptr;
        bool             mongo_enabled = false;
    };

    static void register_routes(HttpServer& server, const Dependencies& deps);

private:
    static HttpServer::Response handle_health(const HttpServer::Request& req,
                                              const Dependencies& deps);
    static HttpServer::Response handle_ready(const HttpServer::Request& req,
                                             const Dependencies& deps);
};

} // namespace support_router
#endif // HEALTH_HANDLER_H
