#include "CurlHttpClient.hpp"

#include <curl/curl.h>

#include <algorithm>
#include <cctype>
#include <memory>
#include <mutex>

namespace {

std::once_flag g_curl_init;

size_t on_body(char* data, size_t size, size_t nmemb, void* userdata) {
    auto* out = static_cast<std::string*>(userdata);
    out->append(data, size * nmemb);
    return size * nmemb;
}

std::string trim(const std::string& s) {
    size_t i = 0;
    while (i < s.size() && std::isspace(static_cast<unsigned char>(s[i]))) ++i;
    size_t j = s.size();
    while (j > i && std::isspace(static_cast<unsigned char>(s[j - 1]))) --j;
    return s.substr(i, j - i);
}

// Header lines arrive one at a time; a new status line (after a redirect)
// resets what was collected so far.
size_t on_header(char* data, size_t size, size_t nmemb, void* userdata) {
    auto* resp = static_cast<HttpResponse*>(userdata);
    std::string line(data, size * nmemb);
    line = trim(line);
    if (line.compare(0, 5, "HTTP/") == 0) {
        resp->headers.clear();
        resp->status_text.clear();
        auto sp1 = line.find(' ');
        auto sp2 = sp1 == std::string::npos ? std::string::npos : line.find(' ', sp1 + 1);
        if (sp2 != std::string::npos) resp->status_text = line.substr(sp2 + 1);
        return size * nmemb;
    }
    auto colon = line.find(':');
    if (colon != std::string::npos) {
        std::string key = trim(line.substr(0, colon));
        std::transform(key.begin(), key.end(), key.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        resp->headers.emplace_back(key, trim(line.substr(colon + 1)));
    }
    return size * nmemb;
}

struct CurlDeleter {
    void operator()(CURL* h) const { curl_easy_cleanup(h); }
};
struct SlistDeleter {
    void operator()(curl_slist* l) const { curl_slist_free_all(l); }
};

}

CurlHttpClient::CurlHttpClient() {
    std::call_once(g_curl_init, [] { curl_global_init(CURL_GLOBAL_DEFAULT); });
}

HttpResponse CurlHttpClient::send(const HttpRequest& request) {
    std::unique_ptr<CURL, CurlDeleter> handle(curl_easy_init());
    if (!handle) throw HttpError("failed to initialise libcurl");
    CURL* h = handle.get();

    HttpResponse resp;
    curl_slist* raw_list = nullptr;
    for (auto& kv : request.headers) {
        std::string line = kv.first + ": " + kv.second;
        raw_list = curl_slist_append(raw_list, line.c_str());
    }
    std::unique_ptr<curl_slist, SlistDeleter> header_list(raw_list);

    curl_easy_setopt(h, CURLOPT_URL, request.url.c_str());
    curl_easy_setopt(h, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(h, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(h, CURLOPT_WRITEFUNCTION, on_body);
    curl_easy_setopt(h, CURLOPT_WRITEDATA, &resp.body);
    curl_easy_setopt(h, CURLOPT_HEADERFUNCTION, on_header);
    curl_easy_setopt(h, CURLOPT_HEADERDATA, &resp);
    if (header_list) curl_easy_setopt(h, CURLOPT_HTTPHEADER, header_list.get());
    if (request.timeout_ms > 0) curl_easy_setopt(h, CURLOPT_TIMEOUT_MS, request.timeout_ms);

    if (request.has_body) {
        curl_easy_setopt(h, CURLOPT_POSTFIELDS, request.body.c_str());
        curl_easy_setopt(h, CURLOPT_POSTFIELDSIZE, static_cast<long>(request.body.size()));
    }
    if (request.method == "HEAD") {
        curl_easy_setopt(h, CURLOPT_NOBODY, 1L);
    } else if (request.method != "GET" || request.has_body) {
        curl_easy_setopt(h, CURLOPT_CUSTOMREQUEST, request.method.c_str());
    }

    CURLcode rc = curl_easy_perform(h);
    if (rc != CURLE_OK) throw HttpError(curl_easy_strerror(rc));

    curl_easy_getinfo(h, CURLINFO_RESPONSE_CODE, &resp.status);
    return resp;
}
