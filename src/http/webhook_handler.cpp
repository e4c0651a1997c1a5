// =============================================================================
// FILE: src/http/webhook_handler.cpp
// =============================================================================
#include "http/webhook_handler.h"
#include "channel/webhook_parser.h"
#include "dispatch/dispatch_service.h"
#include "common/logger.h"
#include <map>

namespace support_router {

namespace {

Result submit(const WebhookHandler::Dependencies& deps, InboundMessage msg) {
    if (!deps.dispatch) return Result::kShuttingDown;
    std::string address = msg.address;
    std::string sid = msg.channel_message_id;
    Result r = deps.dispatch->submit(std::move(msg));
    if (r != Result::kOk) {
        LOG_WARN("Webhook: message %s from %s not queued: %s",
                 sid.c_str(), address.c_str(), result_to_string(r));
    }
    return r;
}

} // namespace

void WebhookHandler::register_routes(HttpServer& server, const Dependencies& deps) {
    auto d = deps;

    server.route("GET", "/webhook", [d](const HttpServer::Request& r) { return handle_verify(r, d); });
    server.route("POST", "/webhook", [d](const HttpServer::Request& r) { return handle_meta(r, d); });
    server.route("POST", "/webhook/twilio", [d](const HttpServer::Request& r) { return handle_twilio(r, d); });
}

HttpServer::Response WebhookHandler::handle_verify(const HttpServer::Request& req,
                                                   const Dependencies& deps) {
    HttpServer::Response resp;
    std::map<std::string, std::string> query(req.query_params.begin(), req.query_params.end());

    std::string challenge;
    if (verify_webhook_subscription(query, deps.verify_token, challenge)) {
        LOG_INFO("Webhook: subscription verified");
        resp.content_type = "text/plain";
        resp.body = challenge;
        return resp;
    }

    LOG_WARN("Webhook: verification failed from %s", req.remote_addr.c_str());
    resp.status_code = 403;
    resp.body = R"({"detail":"Verification failed"})";
    return resp;
}

HttpServer::Response WebhookHandler::handle_meta(const HttpServer::Request& req,
                                                 const Dependencies& deps) {
    HttpServer::Response resp;
    std::vector<InboundMessage> messages;

    if (parse_meta_webhook(req.body, messages) != Result::kOk) {
        LOG_ACCESS("%s POST /webhook status=error bytes=%zu",
                   req.remote_addr.c_str(), req.body.size());
        resp.body = R"({"status":"error"})";
        return resp;
    }

    size_t queued = 0;
    for (auto& msg : messages) {
        if (submit(deps, std::move(msg)) == Result::kOk) ++queued;
    }
    LOG_ACCESS("%s POST /webhook messages=%zu queued=%zu",
               req.remote_addr.c_str(), messages.size(), queued);
    resp.body = R"({"status":"ok"})";
    return resp;
}

HttpServer::Response WebhookHandler::handle_twilio(const HttpServer::Request& req,
                                                   const Dependencies& deps) {
    HttpServer::Response resp;
    resp.content_type = "text/xml";

    InboundMessage msg;
    if (parse_twilio_webhook(req.body, msg) != Result::kOk) {
        LOG_ACCESS("%s POST /webhook/twilio ignored", req.remote_addr.c_str());
        return resp;
    }

    std::string sid = msg.channel_message_id;
    std::string from = msg.address;
    Result r = submit(deps, std::move(msg));
    LOG_ACCESS("%s POST /webhook/twilio sid=%s from=%s %s",
               req.remote_addr.c_str(), sid.c_str(), from.c_str(), result_to_string(r));
    return resp;
}

} // namespace support_router
