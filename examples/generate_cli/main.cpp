// main.cpp
#include "core/config/app_config.h"
#include "core/generation_service.h"
#include "common/logging/logger.h"
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <mutex>
#include <sstream>
#include <stdexcept>
#include <thread>
#include <nlohmann/json.hpp>

namespace {

// Prints status lines and writes artifacts into a directory
class FileSink : public comfyflow::DeliverySink {
public:
    explicit FileSink(std::filesystem::path out_dir) : out_dir_(std::move(out_dir)) {}

    void edit_status(const comfyflow::Job& job, const std::string& text) override {
        std::lock_guard<std::mutex> lock(mutex_);
        std::cout << "[" << job.correlation_id << "] " << text << std::endl;
    }

    void deliver_artifact(const comfyflow::Job& job,
                          const comfyflow::MediaArtifact& artifact,
                          const std::string& bytes,
                          const std::optional<std::string>& caption) override {
        std::lock_guard<std::mutex> lock(mutex_);
        std::filesystem::create_directories(out_dir_);
        const auto path = out_dir_ / std::filesystem::path(artifact.filename).filename();
        std::ofstream file(path, std::ios::binary);
        if (!file) {
            throw std::runtime_error("Cannot write " + path.string());
        }
        file.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
        std::cout << "[" << job.correlation_id << "] saved " << comfyflow::to_string(artifact.kind)
                  << " " << path.string() << " (" << artifact.mime_type << ", " << bytes.size() << " bytes)\n";
        if (caption) {
            std::cout << *caption << std::endl;
        }
    }

private:
    std::filesystem::path out_dir_;
    std::mutex mutex_;
};

std::string read_file(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        throw std::runtime_error("Cannot read " + path);
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    return buffer.str();
}

void usage(const char* argv0) {
    std::cerr << "Usage: " << argv0
              << " [--config config.yml] [--out dir] [--image file]... [--param key=value]... <topic> <prompt>\n";
}

} // namespace

int main(int argc, char* argv[]) {
    std::string config_path;
    std::string out_dir = "out";
    std::vector<std::string> images;
    nlohmann::json inline_params = nlohmann::json::object();
    std::vector<std::string> positional;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        auto next = [&]() -> std::string {
            if (i + 1 >= argc) {
                usage(argv[0]);
                std::exit(1);
            }
            return argv[++i];
        };
        if (arg == "--config") {
            config_path = next();
        } else if (arg == "--out") {
            out_dir = next();
        } else if (arg == "--image") {
            images.push_back(next());
        } else if (arg == "--param") {
            std::string kv = next();
            auto eq = kv.find('=');
            if (eq == std::string::npos) {
                usage(argv[0]);
                return 1;
            }
            // numbers and booleans keep their type, anything else is text
            auto value = nlohmann::json::parse(kv.substr(eq + 1), nullptr, false);
            inline_params[kv.substr(0, eq)] = value.is_discarded() ? nlohmann::json(kv.substr(eq + 1)) : value;
        } else if (arg == "-h" || arg == "--help") {
            usage(argv[0]);
            return 0;
        } else {
            positional.push_back(arg);
        }
    }
    if (positional.size() != 2) {
        usage(argv[0]);
        return 1;
    }

    try {
        // 1. 配置与日志
        auto config = comfyflow::AppConfig::load(config_path);
        comfyflow::set_log_level(config.log_level);

        // 2. 主题
        comfyflow::TopicRegistry topics(config.workdir);
        topics.reload();

        // 3. 引擎客户端
        comfyflow::GenerationClient::Config client_config;
        client_config.base_url = config.engine_base_url;
        client_config.api_key = config.engine_api_key;
        client_config.event_timeout = config.event_timeout;
        client_config.run_timeout = config.run_timeout;
        auto client = comfyflow::GenerationClient::create(client_config);
        if (!client->health_check()) {
            std::cerr << "Engine at " << config.engine_base_url << " is not reachable\n";
            return 1;
        }

        // 4. 调度
        comfyflow::AdmissionController controller({config.max_workers, config.per_topic_limit});
        comfyflow::InjaTemplateRenderer texts(config.messages);
        FileSink sink(out_dir);
        comfyflow::GenerationService service({config.per_user_pending}, topics, controller, *client, sink, texts);
        service.attach();

        comfyflow::GenerationRequest request;
        request.message_id = 1;
        request.requester_id = 1;
        request.topic_alias = positional[0];
        request.prompt = positional[1];
        request.inline_params = inline_params;
        for (size_t i = 0; i < images.size(); ++i) {
            comfyflow::InputAsset asset{read_file(images[i]), std::filesystem::path(images[i]).filename().string()};
            if (i == 0) request.input_image = asset;
            request.input_images.push_back(std::move(asset));
        }

        // 5. 提交并等待
        auto outcome = service.submit(request);
        std::cout << "Admission: " << comfyflow::to_string(outcome) << std::endl;
        if (outcome == comfyflow::AdmissionOutcome::REJECTED_CAPACITY ||
            outcome == comfyflow::AdmissionOutcome::REJECTED_UNAVAILABLE) {
            return 1;
        }
        while (controller.get_job(request.message_id)) {
            std::this_thread::sleep_for(std::chrono::milliseconds(200));
        }
        controller.shutdown();
    } catch (const std::exception& e) {
        std::cerr << "[FATAL] " << e.what() << std::endl;
        return 1;
    }
    return 0;
}
