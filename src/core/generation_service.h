// core/generation_service.h
#ifndef COMFYFLOW_CORE_GENERATION_SERVICE_H
#define COMFYFLOW_CORE_GENERATION_SERVICE_H

#include "core/types/job.h"
#include "modules/protocol/generation_client.h"
#include "modules/scheduler/admission_controller.h"
#include "modules/topics/topic_registry.h"
#include "common/utils/template_renderer.h"
#include <optional>
#include <stop_token>
#include <string>
#include <utility>
#include <vector>

namespace comfyflow {

// Front end collaborator: shows status text on the request's placeholder and
// receives the finished media.
class DeliverySink {
public:
    virtual ~DeliverySink() = default;
    virtual void edit_status(const Job& job, const std::string& text) = 0;
    virtual void deliver_artifact(const Job& job,
                                  const MediaArtifact& artifact,
                                  const std::string& bytes,
                                  const std::optional<std::string>& caption) = 0;
};

struct GenerationRequest {
    int64_t chat_id = 0;
    int64_t thread_id = 0;
    MessageId message_id = 0;     // placeholder id, unique per outstanding job
    RequesterId requester_id = 0;
    std::string topic_alias;
    std::string prompt;
    ParameterSet inline_params = ParameterSet::object();
    std::optional<InputAsset> input_image;
    std::vector<InputAsset> input_images;
    std::optional<std::pair<int, int>> input_dims; // width, height of input_image if known
};

enum class AdmissionOutcome : uint8_t {
    ACCEPTED_RUNNING,
    ACCEPTED_QUEUED,
    REJECTED_CAPACITY,
    REJECTED_UNAVAILABLE
};

const char* to_string(AdmissionOutcome outcome);

// Wires topics, parameters, templating and the engine client into the
// admission controller's processing callback.
class GenerationService {
public:
    static constexpr size_t kMaxInputImages = 10;

    struct Config {
        int per_requester_pending = 3; // <= 0 disables the limit
    };

    GenerationService(Config config,
                      TopicRegistry& topics,
                      AdmissionController& controller,
                      GenerationClient& client,
                      DeliverySink& sink,
                      const InjaTemplateRenderer& texts);

    // Install process() as the controller's processor
    void attach();

    // Reserve -> predict label -> enqueue; releases the reservation if the
    // controller refuses the job.
    AdmissionOutcome submit(const GenerationRequest& request);

    // Cancel a queued request and mark its placeholder
    bool cancel(MessageId message_id, bool by_admin);

    // Full pipeline for one started job. Failures end up as status text.
    void process(const Job& job);

    // Abort in-flight engine waits (used on shutdown)
    void stop() { stop_source_.request_stop(); }

    std::string build_caption(const std::string& prompt,
                              double requester_queue_sec,
                              double engine_queue_sec,
                              double exec_duration_sec) const;

private:
    Config config_;
    TopicRegistry& topics_;
    AdmissionController& controller_;
    GenerationClient& client_;
    DeliverySink& sink_;
    const InjaTemplateRenderer& texts_;
    std::stop_source stop_source_;

    void set_status(const Job& job, const std::string& key, const Context& context = Context::object());
    bool upload_inputs(const Job& job, const TopicConfig& topic, ParameterSet& params);
};

} // namespace comfyflow

#endif // COMFYFLOW_CORE_GENERATION_SERVICE_H
