// modules/protocol/event_channel.h
#ifndef COMFYFLOW_MODULES_PROTOCOL_EVENT_CHANNEL_H
#define COMFYFLOW_MODULES_PROTOCOL_EVENT_CHANNEL_H

#include "protocol/http_transport.h"
#include <curl/curl.h>
#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <string>

namespace comfyflow {

struct EventFrame {
    bool binary = false;
    std::string payload;
};

// Duplex event stream from the engine. One instance per tracked execution.
class EventChannel {
public:
    virtual ~EventChannel() = default;

    virtual void connect(const std::string& url, const HttpHeaders& headers) = 0;
    // Next complete frame, or std::nullopt if nothing arrived within `timeout`
    virtual std::optional<EventFrame> receive(std::chrono::milliseconds timeout) = 0;
    virtual void close() noexcept = 0;
};

using EventChannelFactory = std::function<std::unique_ptr<EventChannel>()>;

// WebSocket channel over libcurl's ws API (CURLOPT_CONNECT_ONLY = 2)
class CurlWebSocketChannel : public EventChannel {
public:
    CurlWebSocketChannel();
    ~CurlWebSocketChannel() override;

    CurlWebSocketChannel(const CurlWebSocketChannel&) = delete;
    CurlWebSocketChannel& operator=(const CurlWebSocketChannel&) = delete;

    void connect(const std::string& url, const HttpHeaders& headers) override;
    std::optional<EventFrame> receive(std::chrono::milliseconds timeout) override;
    void close() noexcept override;

private:
    CURL* curl_ = nullptr;
    curl_slist* header_list_ = nullptr;
    std::string partial_;         // frame fragments received so far
    bool partial_binary_ = false;

    bool wait_readable(std::chrono::milliseconds timeout);
};

} // namespace comfyflow

#endif // COMFYFLOW_MODULES_PROTOCOL_EVENT_CHANNEL_H
