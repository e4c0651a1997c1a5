// =============================================================================
// FILE: src/http/health_handler.cpp
// =============================================================================
#include "http/health_handler.h"
#include "dispatch/dispatch_service.h"
#include "persistence/mongo_client.h"
#include <sstream>

namespace support_router {

void HealthHandler::register_routes(HttpServer& server, const Dependencies& deps) {
    auto deps_copy = deps;

    server.route("GET", "/health", [deps_copy](const HttpServer::Request& req) {
        return handle_health(req, deps_copy);
    });

    server.route("GET", "/ready", [deps_copy](const HttpServer::Request& req) {
        return handle_ready(req, deps_copy);
    });
}

HttpServer::Response HealthHandler::handle_health(const HttpServer::Request&,
                                                  const Dependencies& deps) {
    HttpServer::Response resp;
    bool healthy = true;
    std::ostringstream json;
    json << "{";

    bool dispatch_ok = deps.dispatch && deps.dispatch->running();
    json << "\"dispatcher\":" << (dispatch_ok ? "true" : "false");
    if (deps.dispatch) {
        json << ",\"workers\":" << deps.dispatch->num_workers();
    }
    if (!dispatch_ok) healthy = false;

    if (deps.mongo_enabled) {
        bool mongo_ok = deps.mongo && deps.mongo->is_connected();
        json << ",\"mongodb\":" << (mongo_ok ? "true" : "false");
        if (!mongo_ok) healthy = false;
    }

    json << ",\"healthy\":" << (healthy ? "true" : "false");
    json << "}";

    resp.status_code = healthy ? 200 : 503;
    resp.body = json.str();
    return resp;
}

HttpServer::Response HealthHandler::handle_ready(const HttpServer::Request&,
                                                 const Dependencies& deps) {
    HttpServer::Response resp;
    bool ready = deps.dispatch && deps.dispatch->running();
    if (deps.mongo_enabled) ready = ready && deps.mongo && deps.mongo->ping();

    resp.status_code = ready ? 200 : 503;
    resp.body = ready ? R"({"ready":true})" : R"({"ready":false})";
    return resp;
}

} // namespace support_router
