#pragma once
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

using HttpHeaders = std::vector<std::pair<std::string, std::string>>;

struct HttpRequest {
    std::string method = "GET";
    std::string url;
    HttpHeaders headers;
    std::string body;
    bool has_body = false;
    long timeout_ms = 0;   // 0: no timeout
};

struct HttpResponse {
    long status = 0;
    std::string status_text;
    HttpHeaders headers;   // names lower-cased
    std::string body;

    bool ok() const { return status >= 200 && status < 300; }
};

// Transport failure: DNS, connect, TLS, timeout. HTTP error statuses are
// responses, not exceptions.
class HttpError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class IHttpClient {
public:
    virtual ~IHttpClient() = default;
    virtual HttpResponse send(const HttpRequest& request) = 0;
};
