// modules/protocol/http_transport.cpp
#include "protocol/http_transport.h"
#include "core/types/errors.h"
#include <curl/curl.h>
#include <memory>
#include <mutex>

namespace comfyflow {

namespace {

size_t write_to_string(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* out = static_cast<std::string*>(userdata);
    out->append(ptr, size * nmemb);
    return size * nmemb;
}

} // namespace

void ensure_curl_initialized() {
    static std::once_flag flag;
    std::call_once(flag, [] {
        if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK) {
            throw TransportError("curl_global_init failed");
        }
    });
}

CurlHttpTransport::CurlHttpTransport() : CurlHttpTransport(Config{}) {}

CurlHttpTransport::CurlHttpTransport(Config config) : config_(std::move(config)) {
    ensure_curl_initialized();
}

HttpResponse CurlHttpTransport::get(const std::string& url, const HttpHeaders& headers) {
    return perform(url, headers, nullptr);
}

HttpResponse CurlHttpTransport::post(const std::string& url, const std::string& body, const HttpHeaders& headers) {
    return perform(url, headers, &body);
}

HttpResponse CurlHttpTransport::perform(const std::string& url, const HttpHeaders& headers, const std::string* post_body) {
    std::unique_ptr<CURL, decltype(&curl_easy_cleanup)> curl(curl_easy_init(), curl_easy_cleanup);
    if (!curl) {
        throw TransportError("curl_easy_init failed");
    }

    curl_slist* raw_list = nullptr;
    for (const auto& h : headers) {
        curl_slist* next = curl_slist_append(raw_list, h.c_str());
        if (!next) {
            curl_slist_free_all(raw_list);
            throw TransportError("Failed to build request headers");
        }
        raw_list = next;
    }
    std::unique_ptr<curl_slist, decltype(&curl_slist_free_all)> header_list(raw_list, curl_slist_free_all);

    HttpResponse response;
    CURL* h = curl.get();
    curl_easy_setopt(h, CURLOPT_URL, url.c_str());
    curl_easy_setopt(h, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(h, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(h, CURLOPT_TIMEOUT, config_.timeout_sec);
    curl_easy_setopt(h, CURLOPT_USERAGENT, config_.user_agent.c_str());
    curl_easy_setopt(h, CURLOPT_HTTPHEADER, header_list.get());
    curl_easy_setopt(h, CURLOPT_WRITEFUNCTION, write_to_string);
    curl_easy_setopt(h, CURLOPT_WRITEDATA, &response.body);
    if (post_body) {
        curl_easy_setopt(h, CURLOPT_POST, 1L);
        curl_easy_setopt(h, CURLOPT_POSTFIELDS, post_body->data());
        curl_easy_setopt(h, CURLOPT_POSTFIELDSIZE_LARGE, static_cast<curl_off_t>(post_body->size()));
    }

    CURLcode rc = curl_easy_perform(h);
    if (rc != CURLE_OK) {
        throw TransportError(std::string("Request to ") + url + " failed: " + curl_easy_strerror(rc));
    }
    curl_easy_getinfo(h, CURLINFO_RESPONSE_CODE, &response.status);
    if (response.status >= 400) {
        throw TransportError("HTTP " + std::to_string(response.status) + " from " + url + ": " +
                                 response.body.substr(0, 512),
                             response.status);
    }
    return response;
}

} // namespace comfyflow
