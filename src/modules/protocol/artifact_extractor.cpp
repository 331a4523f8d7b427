// modules/protocol/artifact_extractor.cpp
#include "protocol/artifact_extractor.h"
#include "common/utils/media_utils.h"
#include "common/logging/logger.h"

namespace comfyflow {

namespace {

bool is_animated(const nlohmann::json& node_out) {
    if (!node_out.contains("animated")) return false;
    const auto& a = node_out["animated"];
    if (a.is_boolean()) return a.get<bool>();
    if (a.is_array()) {
        // the engine reports one flag per file, e.g. [true]
        for (const auto& flag : a) {
            if (flag.is_boolean() && flag.get<bool>()) return true;
        }
        return false;
    }
    if (a.is_number()) return a.get<double>() != 0.0;
    return false;
}

const nlohmann::json& file_list(const nlohmann::json& node_out, const char* key) {
    static const nlohmann::json empty = nlohmann::json::array();
    auto it = node_out.find(key);
    if (it == node_out.end() || !it->is_array()) return empty;
    return *it;
}

std::string string_field(const nlohmann::json& entry, const char* key) {
    auto it = entry.find(key);
    if (it == entry.end() || !it->is_string()) return "";
    return it->get<std::string>();
}

} // namespace

ArtifactExtractor::ArtifactExtractor(std::string base_url, Config config)
    : base_url_(std::move(base_url)), config_(std::move(config)) {
    while (!base_url_.empty() && base_url_.back() == '/') {
        base_url_.pop_back();
    }
}

std::string ArtifactExtractor::view_url(const nlohmann::json& file_entry) const {
    return base_url_ + "/view?" + build_query({
        {"filename", string_field(file_entry, "filename")},
        {"subfolder", string_field(file_entry, "subfolder")},
        {"type", string_field(file_entry, "type")},
    });
}

MediaArtifact ArtifactExtractor::make_artifact(const nlohmann::json& file_entry, MediaKind kind) const {
    MediaArtifact artifact;
    artifact.url = view_url(file_entry);
    artifact.filename = string_field(file_entry, "filename");
    artifact.subfolder = string_field(file_entry, "subfolder");
    artifact.kind = kind;
    artifact.mime_type = guess_mime_type(artifact.filename, kind);
    return artifact;
}

std::set<std::string> ArtifactExtractor::nodes_of_class(const NodeGraph& graph, const std::set<std::string>& classes) const {
    std::set<std::string> ids;
    if (!graph.is_object()) return ids;
    for (auto it = graph.begin(); it != graph.end(); ++it) {
        const auto& node = it.value();
        if (node.is_object() && node.contains("class_type") && node["class_type"].is_string() &&
            classes.count(node["class_type"].get<std::string>()) > 0) {
            ids.insert(it.key());
        }
    }
    return ids;
}

std::vector<MediaArtifact> ArtifactExtractor::extract(const nlohmann::json& outputs, const NodeGraph& submitted_graph) const {
    std::vector<MediaArtifact> media;
    if (!outputs.is_object()) {
        return media;
    }

    const auto save_image = nodes_of_class(submitted_graph, config_.save_image_classes);
    const auto save_video = nodes_of_class(submitted_graph, config_.save_video_classes);
    const auto save_audio = nodes_of_class(submitted_graph, config_.save_audio_classes);
    COMFYFLOW_DEBUG("Save nodes: image={}, video={}, audio={}", save_image.size(), save_video.size(), save_audio.size());

    // 1) videos
    for (auto it = outputs.begin(); it != outputs.end(); ++it) {
        const auto& node_out = it.value();
        if (!node_out.is_object()) continue;
        if (save_video.count(it.key()) == 0 && !is_animated(node_out)) continue;
        const char* key = node_out.contains("videos") ? "videos" : (node_out.contains("images") ? "images" : nullptr);
        if (!key) continue;
        for (const auto& f : file_list(node_out, key)) {
            media.push_back(make_artifact(f, MediaKind::VIDEO));
        }
    }

    // 2) images
    for (auto it = outputs.begin(); it != outputs.end(); ++it) {
        const auto& node_out = it.value();
        if (!node_out.is_object()) continue;
        if (save_video.count(it.key()) > 0 || is_animated(node_out)) continue;
        if (!node_out.contains("images")) continue;
        if (!save_image.empty() && save_image.count(it.key()) == 0) continue;
        for (const auto& f : file_list(node_out, "images")) {
            media.push_back(make_artifact(f, MediaKind::IMAGE));
        }
    }

    // 3) audio
    for (auto it = outputs.begin(); it != outputs.end(); ++it) {
        const auto& node_out = it.value();
        if (!node_out.is_object()) continue;
        const char* key = node_out.contains("audio") ? "audio" : (node_out.contains("audios") ? "audios" : nullptr);
        if (!key) continue;
        for (const auto& f : file_list(node_out, key)) {
            media.push_back(make_artifact(f, MediaKind::AUDIO));
        }
    }

    // 4) fallback over all outputs
    if (media.empty()) {
        COMFYFLOW_DEBUG("No media collected via save-node heuristics, trying raw outputs fallback");
        for (auto it = outputs.begin(); it != outputs.end(); ++it) {
            const auto& node_out = it.value();
            if (!node_out.is_object()) continue;
            for (const char* key : {"videos", "images", "audio", "audios"}) {
                const std::string k = key;
                for (const auto& f : file_list(node_out, key)) {
                    MediaKind kind = MediaKind::IMAGE;
                    if (k == "videos" || is_animated(node_out)) {
                        kind = MediaKind::VIDEO;
                    } else if (k == "audio" || k == "audios") {
                        kind = MediaKind::AUDIO;
                    }
                    media.push_back(make_artifact(f, kind));
                }
            }
        }
    }

    return media;
}

} // namespace comfyflow
