/**
 * @file Logger.cpp
 * @brief Logger implementation
 */

#include "Logger.hpp"
#include <algorithm>
#include <filesystem>
#include <iostream>

namespace ur_teleop {

std::shared_ptr<spdlog::logger> Logger::s_logger = nullptr;
std::vector<spdlog::sink_ptr> Logger::s_extra_sinks;
std::mutex Logger::s_mutex;
bool Logger::s_initialized = false;

namespace {

std::shared_ptr<spdlog::logger> buildLogger(const std::string& log_file,
                                            const std::string& level,
                                            size_t max_size,
                                            size_t max_files,
                                            bool console_enabled,
                                            bool file_enabled,
                                            const std::vector<spdlog::sink_ptr>& extra) {
    std::vector<spdlog::sink_ptr> sinks;

    // Console sink (colored)
    if (console_enabled) {
        auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
        console_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
        sinks.push_back(console_sink);
    }

    // File sink (rotating)
    if (file_enabled) {
        std::filesystem::path log_path(log_file);
        if (log_path.has_parent_path()) {
            std::filesystem::create_directories(log_path.parent_path());
        }
        auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            log_file, max_size, max_files);
        file_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] [t%t] %v");
        sinks.push_back(file_sink);
    }

    sinks.insert(sinks.end(), extra.begin(), extra.end());

    auto logger = std::make_shared<spdlog::logger>("ur_teleop", sinks.begin(), sinks.end());
    logger->set_level(Logger::parseLevel(level));

    // Flush on warn or above
    logger->flush_on(spdlog::level::warn);
    return logger;
}

} // namespace

void Logger::init(const std::string& log_file,
                  const std::string& level,
                  size_t max_size,
                  size_t max_files,
                  bool console_enabled,
                  bool file_enabled) {
    std::lock_guard<std::mutex> lock(s_mutex);

    try {
        auto logger = buildLogger(log_file, level, max_size, max_files,
                                  console_enabled, file_enabled, s_extra_sinks);

        if (s_logger) {
            s_logger->flush();
        }
        s_logger = logger;

        // Register as default
        spdlog::set_default_logger(s_logger);
        s_initialized = true;

    } catch (const spdlog::spdlog_ex& ex) {
        std::cerr << "Logger initialization failed: " << ex.what() << std::endl;
    } catch (const std::filesystem::filesystem_error& ex) {
        std::cerr << "Logger initialization failed: " << ex.what() << std::endl;
    }

    if (!s_logger) {
        // Never hand out a null logger, even if the file sink could not be created
        s_logger = std::make_shared<spdlog::logger>(
            "ur_teleop", std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
        s_initialized = true;
    }
}

void Logger::addSink(spdlog::sink_ptr sink) {
    get();
    std::lock_guard<std::mutex> lock(s_mutex);
    s_extra_sinks.push_back(sink);

    auto sinks = s_logger->sinks();
    sinks.push_back(std::move(sink));
    replaceSinks(sinks);
}

void Logger::removeSink(const spdlog::sink_ptr& sink) {
    get();
    std::lock_guard<std::mutex> lock(s_mutex);
    s_extra_sinks.erase(std::remove(s_extra_sinks.begin(), s_extra_sinks.end(), sink),
                        s_extra_sinks.end());

    auto sinks = s_logger->sinks();
    sinks.erase(std::remove(sinks.begin(), sinks.end(), sink), sinks.end());
    replaceSinks(sinks);
}

// The sink vector of a published logger is read without locking by every
// log call, so changes go into a fresh logger that replaces it
void Logger::replaceSinks(const std::vector<spdlog::sink_ptr>& sinks) {
    auto logger = std::make_shared<spdlog::logger>(s_logger->name(), sinks.begin(), sinks.end());
    logger->set_level(s_logger->level());
    logger->flush_on(s_logger->flush_level());

    s_logger->flush();
    s_logger = logger;
    spdlog::set_default_logger(s_logger);
}

std::shared_ptr<spdlog::logger> Logger::get() {
    {
        std::lock_guard<std::mutex> lock(s_mutex);
        if (s_initialized) {
            return s_logger;
        }
    }
    init(); // Initialize with defaults
    std::lock_guard<std::mutex> lock(s_mutex);
    return s_logger;
}

spdlog::level::level_enum Logger::parseLevel(const std::string& level) {
    if (level == "trace") return spdlog::level::trace;
    if (level == "debug") return spdlog::level::debug;
    if (level == "info")  return spdlog::level::info;
    if (level == "warn")  return spdlog::level::warn;
    if (level == "error") return spdlog::level::err;
    return spdlog::level::info;
}

} // namespace ur_teleop
