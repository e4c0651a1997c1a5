// =============================================================================
// FILE: src/http/http_server.cpp
// =============================================================================
#include "http/http_server.h"
#include "channel/webhook_parser.h"
#include "common/logger.h"

#include <sys/socket.h>
#include <netinet/in.h>
#include <arpa/inet.h>
#include <unistd.h>
#include <poll.h>
#include <cctype>
#include <cerrno>
#include <cstring>
#include <sstream>
#include <algorithm>

namespace support_router {

namespace {

constexpr size_t kMaxHeaderBytes = 16 * 1024;

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::string json_escape(const std::string& s) {
    std::string out;
    for (char c : s) {
        if (c == '"' || c == '\\') { out += '\\'; out += c; }
        else if (static_cast<unsigned char>(c) < 0x20) out += ' ';
        else out += c;
    }
    return out;
}

} // namespace

HttpServer::HttpServer(const Config& config) : config_(config) {}

HttpServer::~HttpServer() { stop(); }

void HttpServer::route(const std::string& method, const std::string& path, Handler handler) {
    std::lock_guard<std::mutex> lk(routes_mu_);
    routes_[method + ":" + path] = std::move(handler);
}

Result HttpServer::start() {
    if (!config_.http_enabled) { LOG_INFO("HTTP server disabled"); return Result::kOk; }
    if (running_.load()) return Result::kAlreadyExists;

    server_fd_ = socket(AF_INET, SOCK_STREAM, 0);
    if (server_fd_ < 0) { LOG_ERROR("HTTP: socket failed: %s", strerror(errno)); return Result::kError; }

    int opt = 1;
    setsockopt(server_fd_, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt));

    struct sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(config_.http_port);
    if (inet_pton(AF_INET, config_.http_bind_address.c_str(), &addr.sin_addr) != 1) {
        LOG_ERROR("HTTP: invalid bind address '%s'", config_.http_bind_address.c_str());
        close(server_fd_); server_fd_ = -1;
        return Result::kInvalidArgument;
    }

    if (bind(server_fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
        LOG_ERROR("HTTP: bind failed on %s:%d: %s",
                  config_.http_bind_address.c_str(), config_.http_port, strerror(errno));
        close(server_fd_); server_fd_ = -1;
        return Result::kError;
    }

    if (listen(server_fd_, static_cast<int>(config_.http_max_connections)) < 0) {
        LOG_ERROR("HTTP: listen failed: %s", strerror(errno));
        close(server_fd_); server_fd_ = -1;
        return Result::kError;
    }

    stop_requested_.store(false); running_.store(true);
    server_thread_ = std::thread(&HttpServer::server_thread_func, this);

    LOG_INFO("HTTP server started on %s:%d", config_.http_bind_address.c_str(), config_.http_port);
    return Result::kOk;
}

void HttpServer::stop() {
    if (!running_.load()) return;
    stop_requested_.store(true);
    if (server_fd_ >= 0) { shutdown(server_fd_, SHUT_RDWR); close(server_fd_); server_fd_ = -1; }
    if (server_thread_.joinable()) server_thread_.join();
    running_.store(false);
    LOG_INFO("HTTP server stopped");
}

void HttpServer::server_thread_func() {
    while (!stop_requested_.load(std::memory_order_acquire)) {
        struct pollfd pfd{server_fd_, POLLIN, 0};
        int pr = poll(&pfd, 1, 500);
        if (pr <= 0) continue;
        if (pfd.revents & (POLLERR | POLLHUP | POLLNVAL)) break;

        struct sockaddr_in client_addr{};
        socklen_t addr_len = sizeof(client_addr);
        int client_fd = accept(server_fd_, reinterpret_cast<sockaddr*>(&client_addr), &addr_len);
        if (client_fd < 0) { if (errno != EINTR) LOG_WARN("HTTP: accept failed: %s", strerror(errno)); continue; }

        char ip[INET_ADDRSTRLEN] = {0};
        inet_ntop(AF_INET, &client_addr.sin_addr, ip, sizeof(ip));

        stats_.requests_total.fetch_add(1);
        handle_client(client_fd, ip);
        close(client_fd);
    }
}

bool HttpServer::read_request(int client_fd, std::string& raw, size_t& header_len,
                              int& error_status) {
    char buf[8192];
    size_t head_end = std::string::npos;

    while (head_end == std::string::npos) {
        ssize_t n = recv(client_fd, buf, sizeof(buf), 0);
        if (n <= 0) { error_status = 0; return false; }
        raw.append(buf, static_cast<size_t>(n));
        head_end = raw.find("\r\n\r\n");
        if (head_end == std::string::npos && raw.size() > kMaxHeaderBytes) {
            error_status = 431;
            return false;
        }
    }
    header_len = head_end + 4;

    // Content-Length, case-insensitive
    size_t content_length = 0;
    std::string head = to_lower(raw.substr(0, head_end));
    auto pos = head.find("\r\ncontent-length:");
    if (pos != std::string::npos) {
        size_t value_start = pos + strlen("\r\ncontent-length:");
        size_t value_end = head.find("\r\n", value_start);
        std::string value = head.substr(value_start, value_end - value_start);
        try {
            content_length = std::stoull(value);
        } catch (const std::exception&) {
            error_status = 400;
            return false;
        }
    }
    if (content_length > config_.http_max_body_bytes) {
        error_status = 413;
        return false;
    }

    while (raw.size() < header_len + content_length) {
        ssize_t n = recv(client_fd, buf, sizeof(buf), 0);
        if (n <= 0) { error_status = 400; return false; }
        raw.append(buf, static_cast<size_t>(n));
    }
    raw.resize(header_len + content_length);
    return true;
}

void HttpServer::handle_client(int client_fd, const std::string& remote_addr) {
    struct timeval tv;
    tv.tv_sec = config_.http_read_timeout.count(); tv.tv_usec = 0;
    setsockopt(client_fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));

    std::string raw;
    size_t header_len = 0;
    int error_status = 0;
    Response resp;

    if (!read_request(client_fd, raw, header_len, error_status)) {
        if (error_status == 0) return;
        stats_.requests_rejected.fetch_add(1);
        resp.status_code = error_status;
        resp.body = R"({"error":")" + std::string(status_text(error_status)) + R"("})";
        LOG_WARN("HTTP: rejected request from %s: %d", remote_addr.c_str(), error_status);
    } else {
        Request req = parse_request(raw, header_len);
        req.remote_addr = remote_addr;
        resp = dispatch(req);
    }

    std::string raw_resp = serialize_response(resp);
    send(client_fd, raw_resp.c_str(), raw_resp.size(), MSG_NOSIGNAL);
}

HttpServer::Response HttpServer::dispatch(const Request& req) {
    Handler handler;
    {
        std::lock_guard<std::mutex> lk(routes_mu_);

        auto it = routes_.find(req.method + ":" + req.path);
        if (it != routes_.end()) {
            handler = it->second;
        } else {
            size_t best = 0;
            for (const auto& entry : routes_) {
                auto colon = entry.first.find(':');
                if (colon == std::string::npos) continue;
                std::string rp = entry.first.substr(colon + 1);
                if (entry.first.compare(0, colon, req.method) != 0) continue;
                if (rp.size() < 2 || rp.back() != '/') continue;
                if (req.path.compare(0, rp.size(), rp) == 0 && rp.size() > best) {
                    handler = entry.second;
                    best = rp.size();
                }
            }
        }
    }

    Response resp;
    if (handler) {
        try {
            resp = handler(req);
            if (resp.status_code < 400) stats_.requests_ok.fetch_add(1);
            else stats_.requests_error.fetch_add(1);
        } catch (const std::exception& e) {
            LOG_ERROR("HTTP: %s %s handler failed: %s",
                      req.method.c_str(), req.path.c_str(), e.what());
            resp = Response();
            resp.status_code = 500;
            resp.body = R"({"error":")" + json_escape(e.what()) + R"("})";
            stats_.requests_error.fetch_add(1);
        }
    } else {
        resp.status_code = 404;
        resp.body = R"({"error":"not_found","path":")" + json_escape(req.path) + R"("})";
    }
    return resp;
}

HttpServer::Request HttpServer::parse_request(const std::string& raw, size_t header_len) {
    Request req;
    std::istringstream stream(raw.substr(0, header_len));
    std::string line;

    // GET /path?query HTTP/1.1
    if (std::getline(stream, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        auto sp1 = line.find(' ');
        auto sp2 = line.find(' ', sp1 + 1);
        if (sp1 != std::string::npos && sp2 != std::string::npos) {
            req.method = line.substr(0, sp1);
            req.target = line.substr(sp1 + 1, sp2 - sp1 - 1);

            auto qm = req.target.find('?');
            if (qm != std::string::npos) {
                req.path = req.target.substr(0, qm);
                req.query_string = req.target.substr(qm + 1);
                for (auto& kv : parse_query_string(req.target)) {
                    req.query_params.emplace(kv.first, kv.second);
                }
            } else {
                req.path = req.target;
            }
        }
    }

    while (std::getline(stream, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (line.empty()) break;
        auto colon = line.find(':');
        if (colon != std::string::npos) {
            std::string key = to_lower(line.substr(0, colon));
            std::string val = line.substr(colon + 1);
            val.erase(0, val.find_first_not_of(" \t"));
            req.headers[key] = val;
        }
    }

    req.body = raw.substr(header_len);
    return req;
}

const char* HttpServer::status_text(int status_code) {
    switch (status_code) {
        case 200: return "OK";
        case 202: return "Accepted";
        case 400: return "Bad Request";
        case 403: return "Forbidden";
        case 404: return "Not Found";
        case 409: return "Conflict";
        case 413: return "Payload Too Large";
        case 429: return "Too Many Requests";
        case 431: return "Request Header Fields Too Large";
        case 500: return "Internal Server Error";
        case 502: return "Bad Gateway";
        case 503: return "Service Unavailable";
        default:  return "Unknown";
    }
}

std::string HttpServer::serialize_response(const Response& resp) {
    std::ostringstream ss;
    ss << "HTTP/1.1 " << resp.status_code << " " << status_text(resp.status_code) << "\r\n";
    ss << "Content-Type: " << resp.content_type << "\r\n";
    ss << "Content-Length: " << resp.body.size() << "\r\n";
    ss << "Connection: close\r\n";
    for (auto& [k, v] : resp.headers) ss << k << ": " << v << "\r\n";
    ss << "\r\n";
    ss << resp.body;
    return ss.str();
}

} // namespace support_router
