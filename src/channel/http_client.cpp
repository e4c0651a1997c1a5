// =============================================================================
// FILE: src/channel/http_client.cpp
// =============================================================================
#include "channel/http_client.h"
#include "common/logger.h"
#include <curl/curl.h>
#include <cstdio>
#include <memory>
#include <sstream>

namespace support_router {

namespace {

size_t write_callback(char* ptr, size_t size, size_t nmemb, void* userdata) {
    size_t total = size * nmemb;
    static_cast<std::string*>(userdata)->append(ptr, total);
    return total;
}

struct CurlDeleter {
    void operator()(CURL* c) const { if (c) curl_easy_cleanup(c); }
};
struct SlistDeleter {
    void operator()(curl_slist* l) const { if (l) curl_slist_free_all(l); }
};

} // namespace

HttpClient::HttpClient(Millisecs timeout) : timeout_(timeout) {}

void HttpClient::set_basic_auth(const std::string& user, const std::string& password) {
    userpwd_ = user.empty() ? std::string() : user + ":" + password;
}

std::string HttpClient::url_encode(const std::string& s) {
    std::string out;
    out.reserve(s.size() * 3);
    for (unsigned char c : s) {
        if ((c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') ||
            (c >= '0' && c <= '9') || c == '-' || c == '_' || c == '.' || c == '~') {
            out += static_cast<char>(c);
        } else {
            char buf[4];
            snprintf(buf, sizeof(buf), "%%%02X", c);
            out += buf;
        }
    }
    return out;
}

HttpResponse HttpClient::get(const std::string& url, const HeaderMap& headers) {
    return perform("GET", url, "", headers);
}

HttpResponse HttpClient::post_json(const std::string& url, const std::string& body,
                                   const HeaderMap& extra_headers) {
    HeaderMap headers = extra_headers;
    headers["Content-Type"] = "application/json";
    return perform("POST", url, body, headers);
}

HttpResponse HttpClient::post_form(const std::string& url,
                                   const std::map<std::string, std::string>& form,
                                   const HeaderMap& extra_headers) {
    HeaderMap headers = extra_headers;
    headers["Content-Type"] = "application/x-www-form-urlencoded";

    std::string body;
    for (const auto& kv : form) {
        if (!body.empty()) body += "&";
        body += url_encode(kv.first) + "=" + url_encode(kv.second);
    }
    return perform("POST", url, body, headers);
}

HttpResponse HttpClient::perform(const std::string& method, const std::string& url,
                                 const std::string& body, const HeaderMap& headers) {
    HttpResponse resp;

    std::unique_ptr<CURL, CurlDeleter> curl(curl_easy_init());
    if (!curl) {
        resp.error = "curl_easy_init failed";
        return resp;
    }
    CURL* h = curl.get();

    long timeout_ms = static_cast<long>(timeout_.count());
    curl_easy_setopt(h, CURLOPT_URL, url.c_str());
    curl_easy_setopt(h, CURLOPT_TIMEOUT_MS, timeout_ms);
    curl_easy_setopt(h, CURLOPT_CONNECTTIMEOUT_MS, timeout_ms / 2);
    curl_easy_setopt(h, CURLOPT_NOSIGNAL, 1L);

    if (method == "POST") {
        curl_easy_setopt(h, CURLOPT_POST, 1L);
        curl_easy_setopt(h, CURLOPT_POSTFIELDS, body.c_str());
        curl_easy_setopt(h, CURLOPT_POSTFIELDSIZE, static_cast<long>(body.size()));
    }

    std::unique_ptr<curl_slist, SlistDeleter> header_list;
    for (const auto& kv : headers) {
        std::string line = kv.first + ": " + kv.second;
        curl_slist* next = curl_slist_append(header_list.get(), line.c_str());
        if (!next) {
            resp.error = "curl_slist_append failed";
            return resp;
        }
        header_list.release();
        header_list.reset(next);
    }
    if (header_list) curl_easy_setopt(h, CURLOPT_HTTPHEADER, header_list.get());

    if (!userpwd_.empty()) {
        curl_easy_setopt(h, CURLOPT_HTTPAUTH, CURLAUTH_BASIC);
        curl_easy_setopt(h, CURLOPT_USERPWD, userpwd_.c_str());
    }

    std::string response_body;
    curl_easy_setopt(h, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(h, CURLOPT_WRITEDATA, &response_body);
    curl_easy_setopt(h, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(h, CURLOPT_MAXREDIRS, 5L);
    curl_easy_setopt(h, CURLOPT_SSL_VERIFYPEER, 1L);
    curl_easy_setopt(h, CURLOPT_SSL_VERIFYHOST, 2L);

    CURLcode rc = curl_easy_perform(h);
    if (rc != CURLE_OK) {
        resp.error = curl_easy_strerror(rc);
        LOG_WARN("HTTP %s %s failed: %s", method.c_str(), url.c_str(), resp.error.c_str());
        return resp;
    }

    curl_easy_getinfo(h, CURLINFO_RESPONSE_CODE, &resp.status_code);
    resp.body = std::move(response_body);

    if (!resp.ok()) {
        std::ostringstream oss;
        oss << "HTTP " << resp.status_code;
        if (!resp.body.empty()) {
            oss << ": " << (resp.body.size() > 512 ? resp.body.substr(0, 512) + "..." : resp.body);
        }
        resp.error = oss.str();
    }
    return resp;
}

} // namespace support_router
