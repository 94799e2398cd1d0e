/**
 * @file find_robot.cpp
 * @brief ur_find_robot - locate and verify UR controllers on the LAN
 *
 * Usage: ur_find_robot [IP_ADDRESS] [--config teleop_config.yaml]
 */

#include <iostream>
#include <string>

#include "logging/Logger.hpp"
#include "config/ConfigManager.hpp"
#include "robot/DriverFactory.hpp"
#include "tools/RobotFinder.hpp"

using namespace ur_teleop;

int main(int argc, char* argv[]) {
    std::string ip;
    std::string config_file = "config/teleop_config.yaml";

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            config_file = argv[++i];
        } else if (arg == "-h" || arg == "--help") {
            std::cout << "Usage: ur_find_robot [IP_ADDRESS] [--config FILE]\n";
            return 0;
        } else {
            ip = arg;
        }
    }

    // Driver chatter goes to the log file only
    Logger::init("logs/find_robot.log", "info", 1024 * 1024, 2, false, true);

    auto& config = config::ConfigManager::instance();
    if (!config.load(config_file)) {
        LOG_WARN("Using built-in defaults (config file: {})", config_file);
    }
    config::SystemConfig cfg = config.systemConfig();

    try {
        tools::RobotFinder finder(cfg, robot::makeRobotDriverFactory(cfg.robot));
        int rc = finder.run(ip, std::cout);
        Logger::get()->flush();
        return rc;
    } catch (const std::exception& e) {
        std::cerr << "✗ Error: " << e.what() << std::endl;
        LOG_ERROR("ur_find_robot failed: {}", e.what());
        return 1;
    }
}
