// =============================================================================
// FILE: include/channel/http_client.h
// =============================================================================
#ifndef CHANNEL_HTTP_CLIENT_H
#define CHANNEL_HTTP_CLIENT_H

#include "common/types.h"
#include <map>
#include <string>

namespace support_router {

struct HttpResponse {
    long        status_code = 0;   // 0 = transport failure
    std::string body;
    std::string error;

    bool ok() const { return status_code >= 200 && status_code < 300; }
};

using HeaderMap = std::map<std::string, std::string>;

// Blocking HTTPS client on libcurl. Every request uses its own easy handle,
// so one instance may be shared between worker threads. curl_global_init()
// is the caller's job (main does it once).
class HttpClient {
public:
    explicit HttpClient(Millisecs timeout = Millisecs(30000));

    void set_timeout(Millisecs timeout) { timeout_ = timeout; }
    Millisecs timeout() const { return timeout_; }

    // user:password for HTTP basic auth; empty disables it
    void set_basic_auth(const std::string& user, const std::string& password);

    HttpResponse get(const std::string& url, const HeaderMap& headers = HeaderMap());
    HttpResponse post_json(const std::string& url, const std::string& body,
                           const HeaderMap& extra_headers = HeaderMap());
    HttpResponse post_form(const std::string& url,
                           const std::map<std::string, std::string>& form,
                           const HeaderMap& extra_headers = HeaderMap());

    static std::string url_encode(const std::string& s);

private:
    HttpResponse perform(const std::string& method, const std::string& url,
                         const std::string& body, const HeaderMap& headers);

    Millisecs timeout_;
    std::string userpwd_;
};

} // namespace support_router
#endif // CHANNEL_HTTP_CLIENT_H
