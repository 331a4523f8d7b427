// modules/topics/topic_registry.cpp
#include "topics/topic_registry.h"
#include "core/types/errors.h"
#include "common/logging/logger.h"
#include <fstream>
#include <sstream>

namespace comfyflow {

namespace {

nlohmann::json read_json_file(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file) {
        throw ConfigurationError("Cannot open " + path.string());
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    nlohmann::json doc = nlohmann::json::parse(buffer.str(), nullptr, false);
    if (doc.is_discarded()) {
        throw ConfigurationError("Invalid JSON in " + path.string());
    }
    return doc;
}

// dict.get(key) or {} for objects that may be missing or null
nlohmann::json object_or_empty(const nlohmann::json& doc, const char* key) {
    if (doc.is_object() && doc.contains(key) && doc[key].is_object()) {
        return doc[key];
    }
    return nlohmann::json::object();
}

} // namespace

TopicRegistry::TopicRegistry(std::filesystem::path workdir) : workdir_(std::move(workdir)) {}

TopicConfig TopicRegistry::build_topic(const std::string& alias,
                                       const nlohmann::json& meta,
                                       const nlohmann::json& nodes,
                                       const nlohmann::json& workflow) {
    if (!workflow.is_object()) {
        throw ConfigurationError("workflow.json of topic '" + alias + "' must be an object");
    }
    if (!meta.is_object() || !nodes.is_object()) {
        throw ConfigurationError("meta.json and nodes.json of topic '" + alias + "' must be objects");
    }

    TopicConfig topic;
    topic.alias = alias;
    topic.workflow = workflow;

    try {
        topic.rules = parse_node_rules(nodes.contains("nodes") ? nodes["nodes"] : nlohmann::json());
    } catch (const nlohmann::json::exception& e) {
        throw ConfigurationError("nodes.json of topic '" + alias + "': " + e.what());
    }
    topic.rule_defaults = object_or_empty(nodes, "defaults");
    validate_rules_against_graph(topic.workflow, topic.rules);

    if (meta.contains("title") && meta["title"].is_string() && !meta["title"].get<std::string>().empty()) {
        topic.title = meta["title"].get<std::string>();
    } else {
        topic.title = alias;
    }
    if (meta.contains("description") && meta["description"].is_string()) {
        topic.description = meta["description"].get<std::string>();
    }
    topic.defaults = object_or_empty(meta, "defaults");

    if (meta.contains("inline_allowed") && meta["inline_allowed"].is_array()) {
        std::set<std::string> allowed;
        for (const auto& item : meta["inline_allowed"]) {
            if (item.is_string()) {
                allowed.insert(to_lower_copy(item.get<std::string>()));
            } else if (item.is_primitive() && !item.is_null()) {
                allowed.insert(to_lower_copy(item.dump()));
            }
        }
        topic.inline_allowed = std::move(allowed);
    }
    topic.inline_limits = object_or_empty(meta, "inline_limits");
    return topic;
}

TopicConfig TopicRegistry::load_topic_dir(const std::filesystem::path& dir) {
    const std::string alias = dir.filename().string();
    auto meta = read_json_file(dir / "meta.json");
    auto nodes = read_json_file(dir / "nodes.json");
    auto workflow = read_json_file(dir / "workflow.json");
    return build_topic(alias, meta, nodes, workflow);
}

size_t TopicRegistry::reload() {
    namespace fs = std::filesystem;
    std::map<std::string, std::shared_ptr<const TopicConfig>> loaded;

    std::error_code ec;
    if (!fs::is_directory(workdir_, ec)) {
        COMFYFLOW_WARN("Topics directory {} does not exist", workdir_.string());
    } else {
        for (const auto& entry : fs::directory_iterator(workdir_, ec)) {
            if (!entry.is_directory()) continue;
            const std::string alias = entry.path().filename().string();
            try {
                loaded[alias] = std::make_shared<const TopicConfig>(load_topic_dir(entry.path()));
            } catch (const std::exception& e) {
                COMFYFLOW_ERROR("Bad topic directory {}: {}", alias, e.what());
            }
        }
        if (ec) {
            COMFYFLOW_ERROR("Failed to scan {}: {}", workdir_.string(), ec.message());
        }
    }

    std::lock_guard<std::mutex> lock(mutex_);
    topics_ = std::move(loaded);
    COMFYFLOW_INFO("Loaded {} topic(s) from {}", topics_.size(), workdir_.string());
    return topics_.size();
}

void TopicRegistry::add(TopicConfig topic) {
    if (topic.alias.empty()) {
        throw ConfigurationError("Topic alias must not be empty");
    }
    validate_rules_against_graph(topic.workflow, topic.rules);
    if (topic.title.empty()) {
        topic.title = topic.alias;
    }
    auto shared = std::make_shared<const TopicConfig>(std::move(topic));
    std::lock_guard<std::mutex> lock(mutex_);
    topics_[shared->alias] = std::move(shared);
}

std::shared_ptr<const TopicConfig> TopicRegistry::find(const std::string& alias) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = topics_.find(alias);
    return it == topics_.end() ? nullptr : it->second;
}

std::vector<std::string> TopicRegistry::aliases() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> out;
    out.reserve(topics_.size());
    for (const auto& [alias, topic] : topics_) {
        out.push_back(alias);
    }
    return out;
}

size_t TopicRegistry::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return topics_.size();
}

} // namespace comfyflow
