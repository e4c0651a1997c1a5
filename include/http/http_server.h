// =============================================================================
// FILE: include/http/http_server.h
// =============================================================================
#ifndef HTTP_SERVER_H
#define HTTP_SERVER_H

#include "common/types.h"
#include "common/config.h"
#include <string>
#include <thread>
#include <atomic>
#include <functional>
#include <unordered_map>
#include <mutex>
#include <vector>

namespace support_router {

// Minimal embedded HTTP/1.1 server carrying the webhook, health, stats and
// operator endpoints. One request per connection, handled on the accept
// thread; handlers only parse and enqueue, so none of them block for long.
//
// Routing: exact "METHOD:path" match first, then the longest registered
// path that is a prefix of the request path ("/conversations/" serves
// "/conversations/42/accept").
class HttpServer {
public:
    explicit HttpServer(const Config& config);
    ~HttpServer();

    struct Request {
        std::string method;
        std::string path;
        std::string target;         // path plus "?query" as received
        std::string query_string;
        std::unordered_map<std::string, std::string> query_params;
        std::unordered_map<std::string, std::string> headers;  // lower-case names
        std::string body;
        std::string remote_addr;
    };

    struct Response {
        int status_code = 200;
        std::string content_type = "application/json";
        std::string body;
        std::unordered_map<std::string, std::string> headers;
    };

    using Handler = std::function<Response(const Request&)>;

    void route(const std::string& method, const std::string& path, Handler handler);

    Result start();
    void stop();
    bool is_running() const { return running_.load(std::memory_order_acquire); }

    // Routing and handler invocation without a socket
    Response dispatch(const Request& req);

    struct ServerStats {
        std::atomic<uint64_t> requests_total{0};
        std::atomic<uint64_t> requests_ok{0};
        std::atomic<uint64_t> requests_error{0};
        std::atomic<uint64_t> requests_rejected{0};
    };
    const ServerStats& stats() const { return stats_; }

    static const char* status_text(int status_code);

    HttpServer(const HttpServer&) = delete;
    HttpServer& operator=(const HttpServer&) = delete;

private:
    void server_thread_func();
    void handle_client(int client_fd, const std::string& remote_addr);
    // Reads head and Content-Length body. false on timeout or oversize.
    bool read_request(int client_fd, std::string& raw, size_t& header_len, int& error_status);
    Request parse_request(const std::string& raw, size_t header_len);
    std::string serialize_response(const Response& resp);

    Config config_;
    int server_fd_ = -1;
    std::thread server_thread_;
    std::atomic<bool> running_{false};
    std::atomic<bool> stop_requested_{false};

    // "METHOD:path" -> handler
    std::mutex routes_mu_;
    std::unordered_map<std::string, Handler> routes_;

    ServerStats stats_;
};

} // namespace support_router
#endif // HTTP_SERVER_H
