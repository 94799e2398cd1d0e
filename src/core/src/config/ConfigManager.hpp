/**
 * @file ConfigManager.hpp
 * @brief Configuration manager - loads and provides access to configuration
 */

#pragma once

#include <string>
#include <mutex>
#include "SystemConfig.hpp"
#include "../gamepad/ControllerLayout.hpp"

namespace YAML {
class Node;
}

namespace ur_teleop {
namespace config {

/**
 * Configuration Manager (Singleton)
 *
 * Loads config/teleop_config.yaml. Every key has a default, so a missing
 * section (or file) leaves the defaults of SystemConfig in place.
 * Thread-safe for reading after initialization.
 */
class ConfigManager {
public:
    static ConfigManager& instance();

    // Delete copy/move
    ConfigManager(const ConfigManager&) = delete;
    ConfigManager& operator=(const ConfigManager&) = delete;
    ConfigManager(ConfigManager&&) = delete;
    ConfigManager& operator=(ConfigManager&&) = delete;

    /**
     * Load station configuration from a YAML file
     * @param filepath Path to teleop_config.yaml
     * @return true if loaded successfully
     */
    bool load(const std::string& filepath);

    /**
     * Load station configuration from YAML text
     */
    bool loadFromString(const std::string& yaml);

    /**
     * Back to built-in defaults
     */
    void reset();

    /**
     * Copy of the station configuration
     */
    SystemConfig systemConfig() const;

    /**
     * Controller mapping: `controller.layout` preset plus `controller.mapping` overrides
     */
    gamepad::ControllerLayout controllerLayout() const;

    bool isLoaded() const { return m_loaded; }

    std::string sourcePath() const;

    /**
     * Configuration as JSON (GET_CONFIG)
     */
    std::string toJson() const;

private:
    ConfigManager() = default;
    ~ConfigManager() = default;

    bool parse(const YAML::Node& root);

    SystemConfig m_system_config;
    gamepad::ControllerLayout m_layout = gamepad::ControllerLayout::xbox360();
    std::string m_source;
    bool m_loaded = false;
    mutable std::mutex m_mutex;
};

} // namespace config
} // namespace ur_teleop
