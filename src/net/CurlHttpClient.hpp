#pragma once
#include "IHttpClient.hpp"

// libcurl-backed client: follows redirects, honours timeout_ms.
class CurlHttpClient : public IHttpClient {
public:
    CurlHttpClient();
    HttpResponse send(const HttpRequest& request) override;
};
