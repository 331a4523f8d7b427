// modules/protocol/artifact_extractor.h
#ifndef COMFYFLOW_MODULES_PROTOCOL_ARTIFACT_EXTRACTOR_H
#define COMFYFLOW_MODULES_PROTOCOL_ARTIFACT_EXTRACTOR_H

#include "core/types/graph.h"
#include "core/types/job.h"
#include <set>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace comfyflow {

// Turns the "outputs" object of a /history entry into MediaArtifacts.
//
// Passes:
//   1. video: node is a save-video node, or its output is flagged "animated";
//      files come from "videos", else "images"
//   2. image: remaining nodes with "images"; if the graph declares save-image
//      nodes, only those count
//   3. audio: any node with "audio" or "audios"
//   4. fallback, only when 1-3 found nothing: every node's
//      videos/images/audio/audios, which may include intermediate outputs
class ArtifactExtractor {
public:
    struct Config {
        std::set<std::string> save_image_classes{"SaveImage"};
        std::set<std::string> save_video_classes{"SaveVideo"};
        std::set<std::string> save_audio_classes{"SaveAudio"};
    };

    ArtifactExtractor(std::string base_url, Config config);
    explicit ArtifactExtractor(std::string base_url) : ArtifactExtractor(std::move(base_url), Config{}) {}

    std::vector<MediaArtifact> extract(const nlohmann::json& outputs, const NodeGraph& submitted_graph) const;

    // <base>/view?filename=..&subfolder=..&type=..
    std::string view_url(const nlohmann::json& file_entry) const;

private:
    std::string base_url_;
    Config config_;

    MediaArtifact make_artifact(const nlohmann::json& file_entry, MediaKind kind) const;
    std::set<std::string> nodes_of_class(const NodeGraph& graph, const std::set<std::string>& classes) const;
};

} // namespace comfyflow

#endif // COMFYFLOW_MODULES_PROTOCOL_ARTIFACT_EXTRACTOR_H
