// modules/protocol/generation_client.h
#ifndef COMFYFLOW_MODULES_PROTOCOL_GENERATION_CLIENT_H
#define COMFYFLOW_MODULES_PROTOCOL_GENERATION_CLIENT_H

#include "core/types/graph.h"
#include "core/types/job.h"
#include "protocol/artifact_extractor.h"
#include "protocol/event_channel.h"
#include "protocol/execution_tracker.h"
#include "protocol/http_transport.h"
#include <chrono>
#include <memory>
#include <stop_token>
#include <string>

namespace comfyflow {

// Client for the remote execution engine:
//   POST /prompt, WS /ws?clientId=, GET /history/{id}, GET /view, POST /upload/image, GET /object_info
class GenerationClient {
public:
    struct Config {
        std::string base_url;
        std::string api_key;                                 // empty -> no Authorization header
        std::chrono::milliseconds event_timeout{120 * 1000}; // wait per receive() call
        std::chrono::milliseconds run_timeout{300 * 1000};   // whole execution, from submission
        ArtifactExtractor::Config artifacts;
    };

    GenerationClient(Config config,
                     std::shared_ptr<HttpTransport> transport,
                     EventChannelFactory channel_factory,
                     SteadyClock clock = nullptr);

    // libcurl transport and WebSocket channel
    static std::unique_ptr<GenerationClient> create(Config config);

    // Submit a concrete graph and block until the engine finishes it.
    // Throws ProtocolError (engine-reported failure), TimeoutError,
    // CanceledError (stop requested) or TransportError.
    GenerationResult submit_and_track(const NodeGraph& graph, std::stop_token stop = {});

    // Upload one input image; returns the name the engine stored it under.
    // Throws UploadError.
    std::string upload_input_asset(const std::string& bytes, const std::string& filename);

    std::string fetch_artifact_bytes(const std::string& url);

    // GET /object_info; never throws
    bool health_check();

    const Config& config() const { return config_; }

private:
    Config config_;
    std::shared_ptr<HttpTransport> transport_;
    EventChannelFactory channel_factory_;
    SteadyClock clock_;
    ArtifactExtractor extractor_;

    HttpHeaders auth_headers() const;
    std::string ws_url(const std::string& client_id) const;
    std::string submit(const NodeGraph& graph, const std::string& client_id);
    void await_completion(EventChannel& channel, ExecutionTracker& tracker, const std::stop_token& stop);
    nlohmann::json fetch_history_outputs(const std::string& prompt_id);
};

// Random RFC 4122 version 4 id, used as the engine client/session id
std::string make_client_id();

} // namespace comfyflow

#endif // COMFYFLOW_MODULES_PROTOCOL_GENERATION_CLIENT_H
