#ifndef COMFYFLOW_TYPES_JOB_H
#define COMFYFLOW_TYPES_JOB_H

#include "graph.h"
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace comfyflow {

using RequesterId = int64_t;  // <= 0 means "not identified"
using MessageId = int64_t;    // placeholder message id, registry key

struct InputAsset {
    std::string bytes;
    std::string filename;
};

// A generation request. started/canceled/canceled_by_admin are owned by
// AdmissionController and only change under its lock.
struct Job {
    int64_t chat_id = 0;
    int64_t thread_id = 0;
    MessageId message_id = 0;
    RequesterId requester_id = 0;
    std::string topic_alias;
    std::string prompt;
    ParameterSet params = ParameterSet::object();
    std::optional<InputAsset> input_image;
    std::vector<InputAsset> input_images;
    std::string correlation_id;
    std::chrono::steady_clock::time_point enqueued_at = std::chrono::steady_clock::now();
    bool initially_queued = false;

    bool canceled = false;
    bool canceled_by_admin = false;
    bool started = false;
};

enum class MediaKind : uint8_t {
    IMAGE,
    VIDEO,
    AUDIO
};

inline const char* to_string(MediaKind kind) {
    switch (kind) {
        case MediaKind::IMAGE: return "image";
        case MediaKind::VIDEO: return "video";
        case MediaKind::AUDIO: return "audio";
    }
    return "image";
}

struct MediaArtifact {
    std::string url;
    std::string filename;
    std::string subfolder;
    MediaKind kind = MediaKind::IMAGE;
    std::string mime_type = "application/octet-stream";
};

struct GenerationResult {
    std::vector<MediaArtifact> artifacts;
    double queue_duration_sec = 0.0;
    double exec_duration_sec = 0.0;
};

} // namespace comfyflow

#endif // COMFYFLOW_TYPES_JOB_H
