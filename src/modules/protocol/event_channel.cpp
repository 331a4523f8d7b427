// modules/protocol/event_channel.cpp
#include "protocol/event_channel.h"
#include "core/types/errors.h"
#include "common/logging/logger.h"
#include <poll.h>

namespace comfyflow {

CurlWebSocketChannel::CurlWebSocketChannel() {
    ensure_curl_initialized();
}

CurlWebSocketChannel::~CurlWebSocketChannel() {
    close();
}

void CurlWebSocketChannel::connect(const std::string& url, const HttpHeaders& headers) {
    close();

    CURL* curl = curl_easy_init();
    if (!curl) {
        throw TransportError("curl_easy_init failed");
    }
    curl_ = curl;

    curl_slist* list = nullptr;
    for (const auto& h : headers) {
        curl_slist* next = curl_slist_append(list, h.c_str());
        if (!next) {
            curl_slist_free_all(list);
            close();
            throw TransportError("Failed to build handshake headers");
        }
        list = next;
    }
    header_list_ = list;

    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_CONNECT_ONLY, 2L);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, list);

    CURLcode rc = curl_easy_perform(curl);
    if (rc != CURLE_OK) {
        close();
        throw TransportError("WebSocket connect to " + url + " failed: " + curl_easy_strerror(rc));
    }
    COMFYFLOW_DEBUG("WebSocket connected: {}", url);
}

bool CurlWebSocketChannel::wait_readable(std::chrono::milliseconds timeout) {
    curl_socket_t sock = CURL_SOCKET_BAD;
    if (curl_easy_getinfo(curl_, CURLINFO_ACTIVESOCKET, &sock) != CURLE_OK ||
        sock == CURL_SOCKET_BAD) {
        throw TransportError("WebSocket has no active socket");
    }
    pollfd pfd{};
    pfd.fd = sock;
    pfd.events = POLLIN;
    int ready = ::poll(&pfd, 1, static_cast<int>(timeout.count()));
    if (ready < 0) {
        throw TransportError("poll() on WebSocket failed");
    }
    return ready > 0;
}

std::optional<EventFrame> CurlWebSocketChannel::receive(std::chrono::milliseconds timeout) {
    if (!curl_) {
        throw TransportError("WebSocket is not connected");
    }
    CURL* curl = curl_;
    const auto deadline = std::chrono::steady_clock::now() + timeout;

    char chunk[16384];
    while (true) {
        size_t received = 0;
        curl_ws_frame* meta = nullptr;
        CURLcode rc = curl_ws_recv(curl, chunk, sizeof(chunk), &received, &meta);

        if (rc == CURLE_AGAIN) {
            auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
                deadline - std::chrono::steady_clock::now());
            if (remaining.count() <= 0 || !wait_readable(remaining)) {
                return std::nullopt; // partial frame (if any) stays buffered
            }
            continue;
        }
        if (rc != CURLE_OK) {
            throw TransportError(std::string("WebSocket receive failed: ") + curl_easy_strerror(rc));
        }
        if (meta->flags & CURLWS_CLOSE) {
            throw TransportError("WebSocket closed by server");
        }
        if (meta->flags & (CURLWS_PING | CURLWS_PONG)) {
            continue; // libcurl answers pings itself
        }

        partial_.append(chunk, received);
        if (meta->flags & CURLWS_BINARY) {
            partial_binary_ = true;
        }
        if (meta->bytesleft == 0 && !(meta->flags & CURLWS_CONT)) {
            EventFrame frame{partial_binary_, std::move(partial_)};
            partial_.clear();
            partial_binary_ = false;
            return frame;
        }
    }
}

void CurlWebSocketChannel::close() noexcept {
    if (curl_) {
        size_t sent = 0;
        if (curl_ws_send(curl_, "", 0, &sent, 0, CURLWS_CLOSE) != CURLE_OK) {
            COMFYFLOW_DEBUG("WebSocket close frame not sent");
        }
        curl_easy_cleanup(curl_);
        curl_ = nullptr;
    }
    if (header_list_) {
        curl_slist_free_all(header_list_);
        header_list_ = nullptr;
    }
    partial_.clear();
    partial_binary_ = false;
}

} // namespace comfyflow
