// =============================================================================
// FILE: include/http/operator_handler.h
// =============================================================================
#ifndef OPERATOR_HANDLER_H
#define OPERATOR_HANDLER_H

#include "http/http_server.h"
#include "common/types.h"
#include <deque>
#include <map>
#include <mutex>
#include <string>

namespace support_router {

class HandoffService;
class OperatorRegistry;

// Per-operator event buffers used as OperatorRegistry sinks for clients
// that poll over HTTP. Oldest events are dropped past max_events.
class OperatorMailboxes {
public:
    explicit OperatorMailboxes(size_t max_events = 500) : max_events_(max_events) {}

    void push(OperatorId operator_id, const std::string& event);
    std::deque<std::string> drain(OperatorId operator_id);
    void drop(OperatorId operator_id);

    OperatorMailboxes(const OperatorMailboxes&) = delete;
    OperatorMailboxes& operator=(const OperatorMailboxes&) = delete;

private:
    size_t max_events_;
    std::mutex mu_;
    std::map<OperatorId, std::deque<std::string>> boxes_;
};

// Operator console endpoints.
//   POST /operators/<id>/connect?sector=S     register for events
//   POST /operators/<id>/disconnect
//   GET  /operators/<id>/events               drain buffered events
//   POST /conversations/<id>/accept?operator_id=N
//   POST /conversations/<id>/resolve
//   POST /conversations/<id>/close
//   POST /conversations/<id>/messages?operator_id=N   body {"content":"..."}
//   POST /queues/<sector>/next?operator_id=N
//   POST /messages/<id>/read
class OperatorHandler {
public:
    struct Dependencies {
        HandoffService*    handoff   = nullptr;
        OperatorRegistry*  registry  = nullptr;
        OperatorMailboxes* mailboxes = nullptr;
    };

    static void register_routes(HttpServer& server, const Dependencies& deps);

    static HttpServer::Response handle_operator(const HttpServer::Request& req,
                                                const Dependencies& deps);
    static HttpServer::Response handle_conversation(const HttpServer::Request& req,
                                                    const Dependencies& deps);
    static HttpServer::Response handle_queue_next(const HttpServer::Request& req,
                                                  const Dependencies& deps);
    static HttpServer::Response handle_message_read(const HttpServer::Request& req,
                                                    const Dependencies& deps);

    // Result code -> HTTP status for operator actions
    static int status_for(Result r);
};

} // namespace support_router
#endif // OPERATOR_HANDLER_H
