// core/generation_service.cpp
#include "core/generation_service.h"
#include "core/types/errors.h"
#include "modules/templating/param_resolver.h"
#include "modules/templating/workflow_templater.h"
#include "common/logging/logger.h"
#include <algorithm>
#include <chrono>

namespace comfyflow {

const char* to_string(AdmissionOutcome outcome) {
    switch (outcome) {
        case AdmissionOutcome::ACCEPTED_RUNNING: return "accepted_running";
        case AdmissionOutcome::ACCEPTED_QUEUED: return "accepted_queued";
        case AdmissionOutcome::REJECTED_CAPACITY: return "rejected_capacity";
        case AdmissionOutcome::REJECTED_UNAVAILABLE: return "rejected_unavailable";
    }
    return "rejected_unavailable";
}

GenerationService::GenerationService(Config config,
                                     TopicRegistry& topics,
                                     AdmissionController& controller,
                                     GenerationClient& client,
                                     DeliverySink& sink,
                                     const InjaTemplateRenderer& texts)
    : config_(config),
      topics_(topics),
      controller_(controller),
      client_(client),
      sink_(sink),
      texts_(texts) {}

void GenerationService::attach() {
    controller_.set_processor([this](const Job& job) { process(job); });
}

void GenerationService::set_status(const Job& job, const std::string& key, const Context& context) {
    try {
        sink_.edit_status(job, texts_.render(key, context));
    } catch (const std::exception& e) {
        // status text is informational; the job itself goes on
        COMFYFLOW_WARN("Failed to set status '{}' (corr={}): {}", key, job.correlation_id, e.what());
    }
}

std::string GenerationService::build_caption(const std::string& prompt,
                                              double requester_queue_sec,
                                              double engine_queue_sec,
                                              double exec_duration_sec) const {
    const double total_queue = std::max(0.0, requester_queue_sec + engine_queue_sec);
    Context ctx;
    ctx["prompt"] = prompt;
    ctx["queue"] = format_duration(total_queue);
    ctx["generation"] = format_duration(exec_duration_sec);
    return texts_.render("caption", ctx);
}

AdmissionOutcome GenerationService::submit(const GenerationRequest& request) {
    auto job = std::make_shared<Job>();
    job->chat_id = request.chat_id;
    job->thread_id = request.thread_id;
    job->message_id = request.message_id;
    job->requester_id = request.requester_id;
    job->topic_alias = request.topic_alias;
    job->prompt = request.prompt;
    job->input_image = request.input_image;
    job->input_images = request.input_images;
    job->correlation_id = make_client_id().substr(0, 8);

    if (auto topic = topics_.find(request.topic_alias)) {
        job->params = ParamResolver::resolve(*topic, request.inline_params, request.input_dims);
    } else {
        // process() reports the missing topic on the placeholder
        job->params = normalize_params(request.inline_params);
    }

    const int limit = config_.per_requester_pending;
    bool reserved = false;
    if (limit > 0 && request.requester_id > 0) {
        if (!controller_.reserve_slot(request.requester_id, limit)) {
            Context ctx;
            ctx["pending"] = controller_.pending_count(request.requester_id);
            ctx["limit"] = limit;
            set_status(*job, "rejected_capacity", ctx);
            COMFYFLOW_INFO("Rejected request from {}: pending limit {} reached", request.requester_id, limit);
            return AdmissionOutcome::REJECTED_CAPACITY;
        }
        reserved = true;
    }

    job->initially_queued = controller_.will_queue(request.topic_alias);
    job->enqueued_at = std::chrono::steady_clock::now();

    Context ctx;
    ctx["topic"] = request.topic_alias;
    set_status(*job, job->initially_queued ? "queued" : "running", ctx);

    const bool initially_queued = job->initially_queued;
    if (!controller_.enqueue(request.topic_alias, job, reserved)) {
        if (reserved) {
            controller_.release_slot(request.requester_id);
        }
        set_status(*job, "rejected_unavailable");
        COMFYFLOW_WARN("Controller refused job corr={} for topic {}", job->correlation_id, request.topic_alias);
        return AdmissionOutcome::REJECTED_UNAVAILABLE;
    }

    COMFYFLOW_INFO("Accepted job corr={} topic={} requester={} queued={}",
                   job->correlation_id, request.topic_alias, request.requester_id, initially_queued);
    return initially_queued ? AdmissionOutcome::ACCEPTED_QUEUED : AdmissionOutcome::ACCEPTED_RUNNING;
}

bool GenerationService::cancel(MessageId message_id, bool by_admin) {
    // snapshot first; the worker drops canceled jobs from the registry
    auto job = controller_.get_job(message_id);
    if (!job || !controller_.cancel_job(message_id, by_admin)) {
        return false;
    }
    set_status(*job, "canceled");
    return true;
}

bool GenerationService::upload_inputs(const Job& job, const TopicConfig& topic, ParameterSet& params) {
    if (topic.has_rule(RuleKind::INPUT_IMAGES)) {
        if (job.input_images.empty()) {
            set_status(job, "input_images_required");
            return false;
        }
        nlohmann::json names = nlohmann::json::array();
        const size_t count = std::min(job.input_images.size(), kMaxInputImages);
        try {
            // one at a time so a large album does not flood the engine
            for (size_t i = 0; i < count; ++i) {
                const auto& asset = job.input_images[i];
                names.push_back(client_.upload_input_asset(asset.bytes, asset.filename));
            }
        } catch (const UploadError& e) {
            COMFYFLOW_ERROR("Upload of input images failed (corr={}): {}", job.correlation_id, e.what());
            set_status(job, "upload_failed", {{"error", e.what()}});
            return false;
        }
        params["input_images"] = std::move(names);
    }

    if (topic.has_rule(RuleKind::INPUT_IMAGE)) {
        if (!job.input_image) {
            set_status(job, "input_image_required");
            return false;
        }
        const std::string hint = job.input_image->filename.empty()
            ? "input_" + job.correlation_id + ".png"
            : job.input_image->filename;
        try {
            params["input_image"] = client_.upload_input_asset(job.input_image->bytes, hint);
        } catch (const UploadError& e) {
            COMFYFLOW_ERROR("Upload of input image failed (corr={}): {}", job.correlation_id, e.what());
            set_status(job, "upload_failed", {{"error", e.what()}});
            return false;
        }
    }
    return true;
}

void GenerationService::process(const Job& job) {
    COMFYFLOW_INFO("Processing job corr={} topic={} requester={}", job.correlation_id, job.topic_alias, job.requester_id);

    auto topic = topics_.find(job.topic_alias);
    if (!topic) {
        set_status(job, "topic_not_found", {{"topic", job.topic_alias}});
        return;
    }

    ParameterSet params = job.params;
    if (!upload_inputs(job, *topic, params)) {
        return;
    }

    const double requester_queue_sec = std::chrono::duration<double>(
        std::chrono::steady_clock::now() - job.enqueued_at).count();
    if (job.initially_queued) {
        set_status(job, "generating", {{"topic", job.topic_alias}, {"queue", format_duration(requester_queue_sec)}});
    }

    GenerationResult result;
    try {
        NodeGraph graph = WorkflowTemplater::render(topic->workflow, topic->rules, job.prompt, params);
        result = client_.submit_and_track(graph, stop_source_.get_token());
    } catch (const TimeoutError& e) {
        COMFYFLOW_WARN("Job corr={} timed out: {}", job.correlation_id, e.what());
        set_status(job, "timeout");
        return;
    } catch (const ProtocolError& e) {
        COMFYFLOW_WARN("Job corr={} engine error: {}", job.correlation_id, e.what());
        set_status(job, "engine_error", {{"error", e.what()}});
        return;
    } catch (const CanceledError& e) {
        COMFYFLOW_INFO("Job corr={} canceled: {}", job.correlation_id, e.what());
        set_status(job, "canceled");
        return;
    } catch (const std::exception& e) {
        COMFYFLOW_ERROR("Job corr={} failed: {}", job.correlation_id, e.what());
        set_status(job, "failed", {{"error", e.what()}});
        return;
    }

    if (result.artifacts.empty()) {
        set_status(job, "no_media");
        return;
    }

    const std::string caption = build_caption(job.prompt, requester_queue_sec,
                                              result.queue_duration_sec, result.exec_duration_sec);
    try {
        for (size_t i = 0; i < result.artifacts.size(); ++i) {
            const auto& artifact = result.artifacts[i];
            std::string bytes = client_.fetch_artifact_bytes(artifact.url);
            sink_.deliver_artifact(job, artifact, bytes,
                                   i == 0 ? std::optional<std::string>(caption) : std::nullopt);
        }
    } catch (const std::exception& e) {
        COMFYFLOW_ERROR("Delivering results of corr={} failed: {}", job.correlation_id, e.what());
        set_status(job, "failed", {{"error", e.what()}});
        return;
    }
    COMFYFLOW_INFO("Job corr={} done: {} artifact(s)", job.correlation_id, result.artifacts.size());
}

} // namespace comfyflow
