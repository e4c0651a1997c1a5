// =============================================================================
// FILE: src/http/operator_handler.cpp
// =============================================================================
#include "http/operator_handler.h"
#include "dispatch/handoff_service.h"
#include "notify/operator_registry.h"
#include "common/logger.h"
#include <json/json.h>
#include <sstream>
#include <vector>

namespace support_router {

namespace {

// "/conversations/42/accept" with prefix "/conversations/" -> {"42","accept"}
std::vector<std::string> path_segments(const std::string& path, const std::string& prefix) {
    std::vector<std::string> out;
    std::istringstream stream(path.substr(prefix.size()));
    std::string seg;
    while (std::getline(stream, seg, '/')) {
        if (!seg.empty()) out.push_back(seg);
    }
    return out;
}

bool parse_id(const std::string& s, int64_t& out) {
    if (s.empty() || s.size() > 18) return false;
    for (char c : s) if (c < '0' || c > '9') return false;
    out = std::stoll(s);
    return out > 0;
}

bool query_id(const HttpServer::Request& req, const char* name, int64_t& out) {
    auto it = req.query_params.find(name);
    return it != req.query_params.end() && parse_id(it->second, out);
}

HttpServer::Response json_response(int status, const Json::Value& body) {
    HttpServer::Response resp;
    resp.status_code = status;
    resp.body = write_compact_json(body);
    return resp;
}

HttpServer::Response error_response(int status, const std::string& error) {
    Json::Value body(Json::objectValue);
    body["error"] = error;
    return json_response(status, body);
}

HttpServer::Response result_response(Result r, const Json::Value& on_ok) {
    if (r == Result::kOk) return json_response(200, on_ok);
    return error_response(OperatorHandler::status_for(r), result_to_string(r));
}

} // namespace

void OperatorMailboxes::push(OperatorId operator_id, const std::string& event) {
    std::lock_guard<std::mutex> lk(mu_);
    auto& box = boxes_[operator_id];
    box.push_back(event);
    while (box.size() > max_events_) box.pop_front();
}

std::deque<std::string> OperatorMailboxes::drain(OperatorId operator_id) {
    std::lock_guard<std::mutex> lk(mu_);
    std::deque<std::string> out;
    auto it = boxes_.find(operator_id);
    if (it != boxes_.end()) out.swap(it->second);
    return out;
}

void OperatorMailboxes::drop(OperatorId operator_id) {
    std::lock_guard<std::mutex> lk(mu_);
    boxes_.erase(operator_id);
}

int OperatorHandler::status_for(Result r) {
    switch (r) {
        case Result::kOk:                return 200;
        case Result::kNotFound:          return 404;
        case Result::kInvalidArgument:   return 409;
        case Result::kAlreadyExists:     return 409;
        case Result::kConflict:          return 409;
        case Result::kCapacityExceeded:  return 429;
        case Result::kShuttingDown:      return 503;
        case Result::kError:             return 502;
        default:                         return 500;
    }
}

void OperatorHandler::register_routes(HttpServer& server, const Dependencies& deps) {
    auto d = deps;

    server.route("POST", "/operators/", [d](const HttpServer::Request& r) { return handle_operator(r, d); });
    server.route("GET", "/operators/", [d](const HttpServer::Request& r) { return handle_operator(r, d); });
    server.route("POST", "/conversations/", [d](const HttpServer::Request& r) { return handle_conversation(r, d); });
    server.route("POST", "/queues/", [d](const HttpServer::Request& r) { return handle_queue_next(r, d); });
    server.route("POST", "/messages/", [d](const HttpServer::Request& r) { return handle_message_read(r, d); });
}

HttpServer::Response OperatorHandler::handle_operator(const HttpServer::Request& req,
                                                      const Dependencies& d) {
    if (!d.registry || !d.mailboxes) return error_response(503, "operators unavailable");

    auto seg = path_segments(req.path, "/operators/");
    int64_t op = 0;
    if (seg.size() != 2 || !parse_id(seg[0], op)) return error_response(404, "not_found");

    if (req.method == "POST" && seg[1] == "connect") {
        auto it = req.query_params.find("sector");
        std::string sector = (it != req.query_params.end()) ? it->second : std::string();
        OperatorMailboxes* boxes = d.mailboxes;
        d.registry->connect(op, sector, [boxes, op](const std::string& ev) { boxes->push(op, ev); });
        Json::Value body(Json::objectValue);
        body["connected"] = true;
        body["operator_id"] = Json::Int64(op);
        body["sector"] = sector;
        return json_response(200, body);
    }
    if (req.method == "POST" && seg[1] == "disconnect") {
        d.registry->disconnect(op);
        d.mailboxes->drop(op);
        Json::Value body(Json::objectValue);
        body["connected"] = false;
        return json_response(200, body);
    }
    if (req.method == "GET" && seg[1] == "events") {
        Json::Value events(Json::arrayValue);
        Json::CharReaderBuilder builder;
        for (const auto& raw : d.mailboxes->drain(op)) {
            Json::Value ev;
            std::string errs;
            std::istringstream in(raw);
            if (Json::parseFromStream(builder, in, &ev, &errs)) events.append(ev);
        }
        Json::Value body(Json::objectValue);
        body["events"] = events;
        return json_response(200, body);
    }
    return error_response(404, "not_found");
}

HttpServer::Response OperatorHandler::handle_conversation(const HttpServer::Request& req,
                                                          const Dependencies& d) {
    if (!d.handoff) return error_response(503, "handoff unavailable");

    auto seg = path_segments(req.path, "/conversations/");
    int64_t conv_id = 0;
    if (seg.size() != 2 || !parse_id(seg[0], conv_id)) return error_response(404, "not_found");
    const std::string& action = seg[1];

    Conversation conv;
    if (action == "accept") {
        int64_t op = 0;
        if (!query_id(req, "operator_id", op)) return error_response(400, "operator_id required");
        Result r = d.handoff->accept(conv_id, op, conv);
        return result_response(r, conversation_to_json(conv));
    }
    if (action == "resolve") {
        Result r = d.handoff->resolve(conv_id, conv);
        return result_response(r, conversation_to_json(conv));
    }
    if (action == "close") {
        Result r = d.handoff->close(conv_id, conv);
        return result_response(r, conversation_to_json(conv));
    }
    if (action == "messages") {
        int64_t op = 0;
        if (!query_id(req, "operator_id", op)) return error_response(400, "operator_id required");

        Json::CharReaderBuilder builder;
        Json::Value body;
        std::string errs;
        std::istringstream in(req.body);
        if (!Json::parseFromStream(builder, in, &body, &errs) || !body.isObject() ||
            !body["content"].isString() || body["content"].asString().empty()) {
            return error_response(400, "content required");
        }

        Message msg;
        Result r = d.handoff->send_operator_message(conv_id, op, body["content"].asString(), msg);
        return result_response(r, message_to_json(msg));
    }
    return error_response(404, "not_found");
}

HttpServer::Response OperatorHandler::handle_queue_next(const HttpServer::Request& req,
                                                        const Dependencies& d) {
    if (!d.handoff) return error_response(503, "handoff unavailable");

    auto seg = path_segments(req.path, "/queues/");
    if (seg.size() != 2 || seg[1] != "next") return error_response(404, "not_found");
    int64_t op = 0;
    if (!query_id(req, "operator_id", op)) return error_response(400, "operator_id required");

    Conversation conv;
    Result r = d.handoff->accept_next(seg[0], op, conv);
    return result_response(r, conversation_to_json(conv));
}

HttpServer::Response OperatorHandler::handle_message_read(const HttpServer::Request& req,
                                                          const Dependencies& d) {
    if (!d.handoff) return error_response(503, "handoff unavailable");

    auto seg = path_segments(req.path, "/messages/");
    int64_t msg_id = 0;
    if (seg.size() != 2 || seg[1] != "read" || !parse_id(seg[0], msg_id)) {
        return error_response(404, "not_found");
    }
    Result r = d.handoff->mark_read(msg_id);
    Json::Value body(Json::objectValue);
    body["is_read"] = true;
    return result_response(r, body);
}

} // namespace support_router
