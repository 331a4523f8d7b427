// modules/protocol/generation_client.cpp
#include "protocol/generation_client.h"
#include "core/types/errors.h"
#include "common/utils/media_utils.h"
#include "common/logging/logger.h"
#include <algorithm>
#include <random>
#include <stdexcept>

namespace comfyflow {

namespace {

constexpr std::chrono::milliseconds kStopPollInterval{1000};

// Closes the channel on every exit path of submit_and_track
class ChannelCloser {
public:
    explicit ChannelCloser(EventChannel& channel) : channel_(channel) {}
    ~ChannelCloser() { channel_.close(); }

    ChannelCloser(const ChannelCloser&) = delete;
    ChannelCloser& operator=(const ChannelCloser&) = delete;

private:
    EventChannel& channel_;
};

std::string random_hex(size_t n) {
    static thread_local std::mt19937_64 engine{std::random_device{}()};
    static const char* digits = "0123456789abcdef";
    std::uniform_int_distribution<int> dist(0, 15);
    std::string out(n, '0');
    for (auto& c : out) c = digits[dist(engine)];
    return out;
}

std::string multipart_part(const std::string& boundary,
                           const std::string& name,
                           const std::string& content,
                           const std::string& filename = "",
                           const std::string& content_type = "") {
    std::string part = "--" + boundary + "\r\n";
    part += "Content-Disposition: form-data; name=\"" + name + "\"";
    if (!filename.empty()) {
        part += "; filename=\"" + filename + "\"";
    }
    part += "\r\n";
    if (!content_type.empty()) {
        part += "Content-Type: " + content_type + "\r\n";
    }
    part += "\r\n";
    part += content;
    part += "\r\n";
    return part;
}

} // namespace

std::string make_client_id() {
    std::string hex = random_hex(32);
    hex[12] = '4';
    hex[16] = "89ab"[std::stoi(hex.substr(16, 1), nullptr, 16) & 0x3];
    return hex.substr(0, 8) + "-" + hex.substr(8, 4) + "-" + hex.substr(12, 4) + "-" +
           hex.substr(16, 4) + "-" + hex.substr(20, 12);
}

GenerationClient::GenerationClient(Config config,
                                   std::shared_ptr<HttpTransport> transport,
                                   EventChannelFactory channel_factory,
                                   SteadyClock clock)
    : config_(std::move(config)),
      transport_(std::move(transport)),
      channel_factory_(std::move(channel_factory)),
      clock_(clock ? std::move(clock) : SteadyClock([] { return std::chrono::steady_clock::now(); })),
      extractor_(config_.base_url, config_.artifacts) {
    while (!config_.base_url.empty() && config_.base_url.back() == '/') {
        config_.base_url.pop_back();
    }
    if (!transport_ || !channel_factory_) {
        throw std::invalid_argument("GenerationClient requires a transport and a channel factory");
    }
}

std::unique_ptr<GenerationClient> GenerationClient::create(Config config) {
    CurlHttpTransport::Config http_config;
    http_config.timeout_sec = std::max<long>(1, static_cast<long>(
        std::chrono::duration_cast<std::chrono::seconds>(config.run_timeout).count()));
    auto transport = std::make_shared<CurlHttpTransport>(http_config);
    EventChannelFactory factory = [] { return std::make_unique<CurlWebSocketChannel>(); };
    return std::make_unique<GenerationClient>(std::move(config), std::move(transport), std::move(factory));
}

HttpHeaders GenerationClient::auth_headers() const {
    HttpHeaders headers;
    if (!config_.api_key.empty()) {
        headers.push_back("Authorization: Bearer " + config_.api_key);
    }
    return headers;
}

std::string GenerationClient::ws_url(const std::string& client_id) const {
    std::string base = config_.base_url;
    if (base.rfind("https://", 0) == 0) {
        base = "wss://" + base.substr(8);
    } else if (base.rfind("http://", 0) == 0) {
        base = "ws://" + base.substr(7);
    }
    return base + "/ws?clientId=" + url_encode(client_id);
}

std::string GenerationClient::submit(const NodeGraph& graph, const std::string& client_id) {
    nlohmann::json payload;
    payload["prompt"] = graph;
    payload["client_id"] = client_id;

    HttpHeaders headers = auth_headers();
    headers.push_back("Content-Type: application/json");

    HttpResponse response;
    try {
        response = transport_->post(config_.base_url + "/prompt", payload.dump(), headers);
    } catch (const TransportError& e) {
        if (e.status != 0) {
            // 4xx/5xx from /prompt carries the engine's validation report
            throw ProtocolError(std::string("Prompt rejected: ") + e.what());
        }
        throw;
    }

    nlohmann::json body = nlohmann::json::parse(response.body, nullptr, false);
    if (body.is_discarded() || !body.is_object() || !body.contains("prompt_id") || !body["prompt_id"].is_string()) {
        throw ProtocolError("Engine did not return a prompt_id: " + response.body.substr(0, 512));
    }
    return body["prompt_id"].get<std::string>();
}

void GenerationClient::await_completion(EventChannel& channel, ExecutionTracker& tracker, const std::stop_token& stop) {
    while (!tracker.finished()) {
        if (stop.stop_requested()) {
            throw CanceledError("Generation canceled");
        }
        if (tracker.check_deadline() == TrackState::TIMED_OUT) {
            break;
        }

        auto wait = std::min(config_.event_timeout, tracker.remaining());
        if (stop.stop_possible()) {
            wait = std::min(wait, kStopPollInterval);
        }
        auto frame = channel.receive(wait);
        if (!frame) {
            continue;
        }
        tracker.on_event(parse_execution_event(*frame));
    }

    if (tracker.state() == TrackState::TIMED_OUT) {
        throw TimeoutError("Generation timeout exceeded");
    }
    if (tracker.state() == TrackState::FAILED) {
        throw ProtocolError(tracker.error_message());
    }
}

nlohmann::json GenerationClient::fetch_history_outputs(const std::string& prompt_id) {
    HttpResponse response = transport_->get(config_.base_url + "/history/" + url_encode(prompt_id), auth_headers());
    nlohmann::json history = nlohmann::json::parse(response.body, nullptr, false);
    if (history.is_discarded() || !history.is_object() || !history.contains(prompt_id)) {
        throw ProtocolError("History has no entry for prompt " + prompt_id);
    }
    const auto& entry = history[prompt_id];
    if (!entry.is_object() || !entry.contains("outputs")) {
        return nlohmann::json::object();
    }
    COMFYFLOW_DEBUG("History[{}] outputs nodes: {}", prompt_id, entry["outputs"].size());
    return entry["outputs"];
}

GenerationResult GenerationClient::submit_and_track(const NodeGraph& graph, std::stop_token stop) {
    const std::string client_id = make_client_id();
    std::unique_ptr<EventChannel> channel = channel_factory_();
    if (!channel) {
        throw TransportError("Event channel factory returned no channel");
    }
    ChannelCloser closer(*channel);

    const std::string url = ws_url(client_id);
    COMFYFLOW_DEBUG("WS connecting: {} (client_id={})", url, client_id);
    channel->connect(url, auth_headers());

    const std::string prompt_id = submit(graph, client_id);
    ExecutionTracker tracker(prompt_id, config_.run_timeout, clock_);
    COMFYFLOW_DEBUG("Prompt queued: prompt_id={}", prompt_id);

    await_completion(*channel, tracker, stop);

    GenerationResult result;
    result.artifacts = extractor_.extract(fetch_history_outputs(prompt_id), graph);
    const ExecutionTiming timing = tracker.timing();
    result.queue_duration_sec = timing.queue_duration_sec;
    result.exec_duration_sec = timing.exec_duration_sec;

    COMFYFLOW_DEBUG("Timings: engine_queue={:.3f}s, engine_exec={:.3f}s, media={}",
                    result.queue_duration_sec, result.exec_duration_sec, result.artifacts.size());
    return result;
}

std::string GenerationClient::upload_input_asset(const std::string& bytes, const std::string& filename) {
    const std::string boundary = "----comfyflowBoundary" + random_hex(32);
    std::string body;
    body += multipart_part(boundary, "image", bytes, filename, upload_content_type(filename));
    body += multipart_part(boundary, "type", "input");
    body += "--" + boundary + "--\r\n";

    HttpHeaders headers = auth_headers();
    headers.push_back("Content-Type: multipart/form-data; boundary=" + boundary);

    HttpResponse response;
    try {
        response = transport_->post(config_.base_url + "/upload/image", body, headers);
    } catch (const std::exception& e) {
        throw UploadError(std::string("Upload of ") + filename + " failed: " + e.what());
    }

    nlohmann::json data = nlohmann::json::parse(response.body, nullptr, false);
    if (data.is_discarded() || !data.is_object()) {
        throw UploadError("Upload of " + filename + " returned an unreadable response");
    }
    if (data.contains("name") && data["name"].is_string() && !data["name"].get<std::string>().empty()) {
        return data["name"].get<std::string>();
    }
    return filename;
}

std::string GenerationClient::fetch_artifact_bytes(const std::string& url) {
    return transport_->get(url, auth_headers()).body;
}

bool GenerationClient::health_check() {
    try {
        transport_->get(config_.base_url + "/object_info", auth_headers());
        return true;
    } catch (const std::exception& e) {
        COMFYFLOW_WARN("Engine /object_info failed: {}", e.what());
        return false;
    }
}

} // namespace comfyflow
