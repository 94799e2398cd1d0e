/**
 * @file ConfigManager.cpp
 * @brief Configuration manager implementation
 */

#include "ConfigManager.hpp"
#include "../logging/Logger.hpp"
#include <yaml-cpp/yaml.h>
#include <nlohmann/json.hpp>
#include <cmath>
#include <filesystem>

namespace ur_teleop {
namespace config {

using json = nlohmann::json;
namespace fs = std::filesystem;

ConfigManager& ConfigManager::instance() {
    static ConfigManager instance;
    return instance;
}

namespace {

// servoL is fed once per tick; RTDE itself runs at 500 Hz
constexpr int MAX_CONTROL_RATE_HZ = 500;
constexpr double MAX_TIMEOUT_S = 60.0;

bool validPort(const char* key, int port) {
    if (port < 1 || port > 65535) {
        LOG_ERROR("{} must be in 1..65535 (got {})", key, port);
        return false;
    }
    return true;
}

bool validTimeout(const char* key, double seconds) {
    if (!(seconds > 0.0 && seconds <= MAX_TIMEOUT_S)) {
        LOG_ERROR("{} must be in (0, {}] seconds (got {})", key, MAX_TIMEOUT_S, seconds);
        return false;
    }
    return true;
}

bool validate(const SystemConfig& cfg) {
    if (cfg.teleop.control_rate_hz <= 0 || cfg.teleop.control_rate_hz > MAX_CONTROL_RATE_HZ) {
        LOG_ERROR("teleop.control_rate_hz must be in 1..{} (got {})",
                  MAX_CONTROL_RATE_HZ, cfg.teleop.control_rate_hz);
        return false;
    }
    if (cfg.scan.first_host < 0 || cfg.scan.last_host > 255 ||
        cfg.scan.first_host > cfg.scan.last_host) {
        LOG_ERROR("Invalid scan host range {}..{}", cfg.scan.first_host, cfg.scan.last_host);
        return false;
    }
    if (!(cfg.gripper.max_width_m > 0.0 && std::isfinite(cfg.gripper.max_width_m))) {
        LOG_ERROR("gripper.max_width_m must be positive (got {})", cfg.gripper.max_width_m);
        return false;
    }
    if (cfg.gripper.connect_timeout_ms <= 0) {
        LOG_ERROR("gripper.connect_timeout_ms must be positive (got {})",
                  cfg.gripper.connect_timeout_ms);
        return false;
    }

    return validPort("robot.rtde_port", cfg.robot.rtde_port) &&
           validPort("gripper.port", cfg.gripper.port) &&
           validPort("scan.port", cfg.scan.port) &&
           validPort("ipc.rep_port", cfg.ipc.rep_port) &&
           validPort("ipc.pub_port", cfg.ipc.pub_port) &&
           validTimeout("robot.connect_timeout_s", cfg.robot.connect_timeout_s) &&
           validTimeout("scan.timeout_s", cfg.scan.timeout_s) &&
           validTimeout("scan.cli_timeout_s", cfg.scan.cli_timeout_s) &&
           validTimeout("scan.cli_check_timeout_s", cfg.scan.cli_check_timeout_s);
}

} // namespace

bool ConfigManager::load(const std::string& filepath) {
    try {
        if (!fs::exists(filepath)) {
            LOG_ERROR("Config file not found: {}", filepath);
            return false;
        }

        LOG_INFO("Loading config from: {}", filepath);
        YAML::Node root = YAML::LoadFile(filepath);

        if (!parse(root)) {
            return false;
        }

        std::lock_guard<std::mutex> lock(m_mutex);
        m_source = filepath;
        return true;

    } catch (const YAML::Exception& e) {
        LOG_ERROR("YAML parse error in {}: {}", filepath, e.what());
        return false;
    } catch (const std::exception& e) {
        LOG_ERROR("Error loading config {}: {}", filepath, e.what());
        return false;
    }
}

bool ConfigManager::loadFromString(const std::string& yaml) {
    try {
        YAML::Node root = YAML::Load(yaml);
        if (!parse(root)) {
            return false;
        }

        std::lock_guard<std::mutex> lock(m_mutex);
        m_source = "<string>";
        return true;

    } catch (const YAML::Exception& e) {
        LOG_ERROR("YAML parse error: {}", e.what());
        return false;
    }
}

void ConfigManager::reset() {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_system_config = SystemConfig{};
    m_layout = gamepad::ControllerLayout::xbox360();
    m_source.clear();
    m_loaded = false;
}

bool ConfigManager::parse(const YAML::Node& root) {
    if (!root.IsMap()) {
        LOG_ERROR("Config root must be a mapping");
        return false;
    }

    try {
        SystemConfig cfg;
        gamepad::ControllerLayout layout = gamepad::ControllerLayout::xbox360();

        cfg.version = root["version"].as<std::string>("1.0.0");

        // Robot
        if (root["robot"]) {
            auto robot = root["robot"];
            cfg.robot.model = robot["model"].as<std::string>("ur3e");
            cfg.robot.driver = robot["driver"].as<std::string>("ur_rtde");
            cfg.robot.default_ip = robot["default_ip"].as<std::string>("");
            cfg.robot.rtde_port = robot["rtde_port"].as<int>(30004);
            cfg.robot.connect_timeout_s = robot["connect_timeout_s"].as<double>(5.0);
            cfg.robot.rtde_frequency = robot["rtde_frequency"].as<double>(500.0);
            cfg.robot.servo_speed = robot["servo_speed"].as<double>(0.5);
            cfg.robot.servo_acceleration = robot["servo_acceleration"].as<double>(0.5);
            cfg.robot.servo_lookahead_time = robot["servo_lookahead_time"].as<double>(0.1);
            cfg.robot.servo_gain = robot["servo_gain"].as<double>(300.0);
        }

        // Gripper
        if (root["gripper"]) {
            auto gripper = root["gripper"];
            cfg.gripper.enabled = gripper["enabled"].as<bool>(true);
            cfg.gripper.port = gripper["port"].as<int>(63352);
            cfg.gripper.max_width_m = gripper["max_width_m"].as<double>(0.085);
            cfg.gripper.speed_m_per_s = gripper["speed_m_per_s"].as<double>(0.05);
            cfg.gripper.connect_timeout_ms = gripper["connect_timeout_ms"].as<int>(2000);
        }

        // Scan
        if (root["scan"]) {
            auto scan = root["scan"];
            if (scan["networks"]) {
                cfg.scan.networks = scan["networks"].as<std::vector<std::string>>();
            }
            cfg.scan.port = scan["port"].as<int>(30004);
            cfg.scan.first_host = scan["first_host"].as<int>(1);
            cfg.scan.last_host = scan["last_host"].as<int>(254);
            cfg.scan.timeout_s = scan["timeout_s"].as<double>(0.3);
            cfg.scan.cli_timeout_s = scan["cli_timeout_s"].as<double>(0.1);
            cfg.scan.cli_check_timeout_s = scan["cli_check_timeout_s"].as<double>(3.0);
        }

        // Teleop
        if (root["teleop"]) {
            auto teleop = root["teleop"];
            cfg.teleop.control_rate_hz = teleop["control_rate_hz"].as<int>(20);
            cfg.teleop.base_linear_speed = teleop["base_linear_speed"].as<double>(0.2);
            cfg.teleop.base_angular_speed = teleop["base_angular_speed"].as<double>(0.6);
            cfg.teleop.default_speed_percent = teleop["default_speed_percent"].as<double>(20.0);
            cfg.teleop.stop_timeout_s = teleop["stop_timeout_s"].as<double>(2.0);
        }

        // Controller
        if (root["controller"]) {
            auto controller = root["controller"];
            cfg.controller.index = controller["index"].as<int>(0);
            cfg.controller.device_dir = controller["device_dir"].as<std::string>("/dev/input");
            cfg.controller.layout = controller["layout"].as<std::string>("xbox360");
            cfg.controller.dead_zone = controller["dead_zone"].as<double>(0.1);

            if (controller["mapping"]) {
                layout = gamepad::ControllerLayout::fromYaml(controller["mapping"]);
            } else if (cfg.controller.layout != "xbox360") {
                LOG_WARN("Unknown controller layout '{}' without mapping, using xbox360",
                         cfg.controller.layout);
            }
        }

        // Recording
        if (root["recording"]) {
            auto recording = root["recording"];
            cfg.recording.directory = recording["directory"].as<std::string>(".");
            cfg.recording.file_prefix = recording["file_prefix"].as<std::string>("ur3e_recording_");
        }

        // IPC
        if (root["ipc"]) {
            auto ipc = root["ipc"];
            cfg.ipc.rep_port = ipc["rep_port"].as<int>(5555);
            cfg.ipc.pub_port = ipc["pub_port"].as<int>(5556);
            cfg.ipc.bind_address = ipc["bind_address"].as<std::string>("*");
            cfg.ipc.view_publish_hz = ipc["view_publish_hz"].as<int>(10);
        }

        // Logging
        if (root["logging"]) {
            auto logging = root["logging"];
            cfg.logging.level = logging["level"].as<std::string>("info");
            cfg.logging.file = logging["file"].as<std::string>("logs/teleop.log");
            cfg.logging.max_size_mb = logging["max_size_mb"].as<int>(10);
            cfg.logging.max_files = logging["max_files"].as<int>(5);
            cfg.logging.console_enabled = logging["console_enabled"].as<bool>(true);
            cfg.logging.file_enabled = logging["file_enabled"].as<bool>(true);
            cfg.logging.status_history = logging["status_history"].as<int>(500);
        }

        if (!validate(cfg)) {
            return false;
        }
        if (cfg.ipc.view_publish_hz <= 0) {
            cfg.ipc.view_publish_hz = 10;
        }

        std::lock_guard<std::mutex> lock(m_mutex);
        m_system_config = cfg;
        m_layout = layout;
        m_loaded = true;

        LOG_INFO("Config loaded: {} via {}, {} scan network(s), layout '{}'",
                 cfg.robot.model, cfg.robot.driver, cfg.scan.networks.size(), layout.name);
        return true;

    } catch (const YAML::Exception& e) {
        LOG_ERROR("Invalid config value: {}", e.what());
        return false;
    }
}

SystemConfig ConfigManager::systemConfig() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_system_config;
}

gamepad::ControllerLayout ConfigManager::controllerLayout() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_layout;
}

std::string ConfigManager::sourcePath() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_source;
}

std::string ConfigManager::toJson() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    const auto& c = m_system_config;

    json j;
    j["version"] = c.version;

    j["robot"] = {
        {"model", c.robot.model},
        {"driver", c.robot.driver},
        {"default_ip", c.robot.default_ip},
        {"rtde_port", c.robot.rtde_port},
        {"connect_timeout_s", c.robot.connect_timeout_s}
    };

    j["gripper"] = {
        {"enabled", c.gripper.enabled},
        {"port", c.gripper.port},
        {"max_width_m", c.gripper.max_width_m}
    };

    j["scan"] = {
        {"networks", c.scan.networks},
        {"port", c.scan.port},
        {"timeout_s", c.scan.timeout_s}
    };

    j["teleop"] = {
        {"control_rate_hz", c.teleop.control_rate_hz},
        {"base_linear_speed", c.teleop.base_linear_speed},
        {"base_angular_speed", c.teleop.base_angular_speed},
        {"default_speed_percent", c.teleop.default_speed_percent}
    };

    j["controller"] = {
        {"index", c.controller.index},
        {"layout", m_layout.name},
        {"dead_zone", c.controller.dead_zone}
    };

    j["recording"] = {
        {"directory", c.recording.directory},
        {"file_prefix", c.recording.file_prefix}
    };

    j["ipc"] = {
        {"rep_port", c.ipc.rep_port},
        {"pub_port", c.ipc.pub_port},
        {"bind_address", c.ipc.bind_address}
    };

    j["logging"] = {
        {"level", c.logging.level},
        {"file", c.logging.file}
    };

    return j.dump();
}

} // namespace config
} // namespace ur_teleop
