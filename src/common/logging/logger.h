// common/logging/logger.h
#ifndef COMFYFLOW_COMMON_LOGGING_LOGGER_H
#define COMFYFLOW_COMMON_LOGGING_LOGGER_H

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <memory>
#include <string>

namespace comfyflow {

inline spdlog::logger& comfyflow_logger() {
    // function-local static, thread-safe initialization
    static spdlog::logger& ref = []() -> spdlog::logger& {
        auto lg = spdlog::get("comfyflow");
        if (!lg) {
            auto sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
            lg = std::make_shared<spdlog::logger>("comfyflow", sink);
            lg->set_level(spdlog::level::info);
            lg->set_pattern("%Y-%m-%d %H:%M:%S.%e %^%-5l%$ [%t] %v");
            spdlog::register_logger(lg);
        }
        return *lg;
    }();
    return ref;
}

// Accepts spdlog level names: trace, debug, info, warning/warn, error, critical, off
inline void set_log_level(const std::string& level_name) {
    comfyflow_logger().set_level(spdlog::level::from_str(level_name));
}

} // namespace comfyflow

#define COMFYFLOW_DEBUG(...) ::comfyflow::comfyflow_logger().debug(__VA_ARGS__)
#define COMFYFLOW_INFO(...) ::comfyflow::comfyflow_logger().info(__VA_ARGS__)
#define COMFYFLOW_WARN(...) ::comfyflow::comfyflow_logger().warn(__VA_ARGS__)
#define COMFYFLOW_ERROR(...) ::comfyflow::comfyflow_logger().error(__VA_ARGS__)

#endif // COMFYFLOW_COMMON_LOGGING_LOGGER_H
