// modules/topics/topic_registry.h
#ifndef COMFYFLOW_MODULES_TOPICS_TOPIC_REGISTRY_H
#define COMFYFLOW_MODULES_TOPICS_TOPIC_REGISTRY_H

#include "core/types/topic.h"
#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace comfyflow {

// alias -> TopicConfig, loaded from <workdir>/<alias>/{meta,nodes,workflow}.json
class TopicRegistry {
public:
    explicit TopicRegistry(std::filesystem::path workdir);

    // Rescan the work directory. Bad topic directories are logged and skipped;
    // returns the number of topics loaded.
    size_t reload();

    // Register a topic built in code; rules are validated against its workflow.
    // Throws ConfigurationError.
    void add(TopicConfig topic);

    std::shared_ptr<const TopicConfig> find(const std::string& alias) const;
    std::vector<std::string> aliases() const;
    size_t size() const;

    // Build a topic from the three parsed documents. Throws ConfigurationError.
    static TopicConfig build_topic(const std::string& alias,
                                   const nlohmann::json& meta,
                                   const nlohmann::json& nodes,
                                   const nlohmann::json& workflow);

    // Read and build one topic directory. Throws ConfigurationError.
    static TopicConfig load_topic_dir(const std::filesystem::path& dir);

private:
    std::filesystem::path workdir_;
    mutable std::mutex mutex_;
    std::map<std::string, std::shared_ptr<const TopicConfig>> topics_;
};

} // namespace comfyflow

#endif // COMFYFLOW_MODULES_TOPICS_TOPIC_REGISTRY_H
