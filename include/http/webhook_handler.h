// =============================================================================
// FILE: include/http/webhook_handler.h
// =============================================================================
#ifndef WEBHOOK_HANDLER_H
#define WEBHOOK_HANDLER_H

#include "http/http_server.h"
#include <string>

namespace support_router {

class DispatchService;

// Channel webhook endpoints.
//   GET  /webhook          Meta subscription verification (hub.* query)
//   POST /webhook          Meta Cloud API delivery (JSON)
//   POST /webhook/twilio   Twilio delivery (form), answered with empty text/xml
//
// Deliveries are acknowledged as soon as the messages are queued; the reply
// cycle runs on the dispatch workers.
class WebhookHandler {
public:
    struct Dependencies {
        DispatchService* dispatch     = nullptr;
        std::string      verify_token;
    };

    static void register_routes(HttpServer& server, const Dependencies& deps);

    static HttpServer::Response handle_verify(const HttpServer::Request& req,
                                              const Dependencies& deps);
    static HttpServer::Response handle_meta(const HttpServer::Request& req,
                                            const Dependencies& deps);
    static HttpServer::Response handle_twilio(const HttpServer::Request& req,
                                              const Dependencies& deps);
};

} // namespace support_router
#endif // WEBHOOK_HANDLER_H
