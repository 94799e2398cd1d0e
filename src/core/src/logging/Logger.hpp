/**
 * @file Logger.hpp
 * @brief Logging framework wrapper using spdlog
 */

#pragma once

#include <spdlog/spdlog.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace ur_teleop {

class Logger {
public:
    /**
     * Initialize (or re-initialize) the logging system
     * @param log_file Path to log file
     * @param level Log level (trace, debug, info, warn, error)
     * @param max_size Maximum file size in bytes (default 10MB)
     * @param max_files Maximum number of rotated files
     * @param console_enabled Attach the colored console sink
     * @param file_enabled Attach the rotating file sink
     */
    static void init(const std::string& log_file = "logs/teleop.log",
                     const std::string& level = "info",
                     size_t max_size = 10 * 1024 * 1024,
                     size_t max_files = 5,
                     bool console_enabled = true,
                     bool file_enabled = true);

    /**
     * Attach an additional sink (e.g. the UI status sink).
     * Survives re-initialization.
     */
    static void addSink(spdlog::sink_ptr sink);

    /**
     * Detach a sink previously added with addSink()
     */
    static void removeSink(const spdlog::sink_ptr& sink);

    /**
     * Get the logger instance
     */
    static std::shared_ptr<spdlog::logger> get();

    static spdlog::level::level_enum parseLevel(const std::string& level);

private:
    // Caller holds s_mutex
    static void replaceSinks(const std::vector<spdlog::sink_ptr>& sinks);

    static std::shared_ptr<spdlog::logger> s_logger;
    static std::vector<spdlog::sink_ptr> s_extra_sinks;
    static std::mutex s_mutex;
    static bool s_initialized;
};

} // namespace ur_teleop

// Convenience macros
#define LOG_TRACE(...) ::ur_teleop::Logger::get()->trace(__VA_ARGS__)
#define LOG_DEBUG(...) ::ur_teleop::Logger::get()->debug(__VA_ARGS__)
#define LOG_INFO(...)  ::ur_teleop::Logger::get()->info(__VA_ARGS__)
#define LOG_WARN(...)  ::ur_teleop::Logger::get()->warn(__VA_ARGS__)
#define LOG_ERROR(...) ::ur_teleop::Logger::get()->error(__VA_ARGS__)
