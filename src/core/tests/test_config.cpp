/**
 * @file test_config.cpp
 * @brief Configuration tests
 */

#include <gtest/gtest.h>
#include "config/ConfigManager.hpp"
#include "logging/Logger.hpp"
#include <nlohmann/json.hpp>
#include <filesystem>
#include <fstream>

using namespace ur_teleop;
using namespace ur_teleop::config;

namespace fs = std::filesystem;

class ConfigManagerTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::init("test_config.log", "debug");
        ConfigManager::instance().reset();
    }

    void TearDown() override {
        ConfigManager::instance().reset();
    }
};

TEST_F(ConfigManagerTest, SingletonInstance) {
    auto& instance1 = ConfigManager::instance();
    auto& instance2 = ConfigManager::instance();
    EXPECT_EQ(&instance1, &instance2);
}

TEST_F(ConfigManagerTest, DefaultsBeforeLoad) {
    auto& config = ConfigManager::instance();
    EXPECT_FALSE(config.isLoaded());

    SystemConfig cfg = config.systemConfig();
    EXPECT_EQ(cfg.robot.model, "ur3e");
    EXPECT_EQ(cfg.robot.rtde_port, 30004);
    EXPECT_EQ(cfg.scan.networks.size(), 3u);
    EXPECT_EQ(cfg.scan.networks[0], "192.168.0");
    EXPECT_EQ(cfg.scan.networks[2], "10.42.0");
    EXPECT_DOUBLE_EQ(cfg.scan.timeout_s, 0.3);
    EXPECT_EQ(cfg.teleop.control_rate_hz, 20);
    EXPECT_DOUBLE_EQ(cfg.teleop.base_linear_speed, 0.2);
    EXPECT_DOUBLE_EQ(cfg.teleop.base_angular_speed, 0.6);
    EXPECT_DOUBLE_EQ(cfg.teleop.default_speed_percent, 20.0);
    EXPECT_EQ(cfg.recording.file_prefix, "ur3e_recording_");
    EXPECT_EQ(config.controllerLayout().name, "xbox360");
}

TEST_F(ConfigManagerTest, LoadFromStringOverridesValues) {
    auto& config = ConfigManager::instance();
    ASSERT_TRUE(config.loadFromString(R"(
robot:
  driver: sim
  default_ip: 10.42.0.7
scan:
  networks: ["172.16.5"]
  first_host: 10
  last_host: 20
teleop:
  control_rate_hz: 50
  base_linear_speed: 0.1
)"));

    EXPECT_TRUE(config.isLoaded());
    EXPECT_EQ(config.sourcePath(), "<string>");

    SystemConfig cfg = config.systemConfig();
    EXPECT_EQ(cfg.robot.driver, "sim");
    EXPECT_EQ(cfg.robot.default_ip, "10.42.0.7");
    ASSERT_EQ(cfg.scan.networks.size(), 1u);
    EXPECT_EQ(cfg.scan.networks[0], "172.16.5");
    EXPECT_EQ(cfg.scan.first_host, 10);
    EXPECT_EQ(cfg.scan.last_host, 20);
    EXPECT_EQ(cfg.teleop.control_rate_hz, 50);
    EXPECT_DOUBLE_EQ(cfg.teleop.base_linear_speed, 0.1);

    // Keys missing from a present section keep their defaults
    EXPECT_EQ(cfg.robot.rtde_port, 30004);
    EXPECT_DOUBLE_EQ(cfg.teleop.base_angular_speed, 0.6);
    // Absent sections too
    EXPECT_TRUE(cfg.gripper.enabled);
    EXPECT_EQ(cfg.ipc.rep_port, 5555);
}

TEST_F(ConfigManagerTest, RejectsNonPositiveControlRate) {
    auto& config = ConfigManager::instance();
    EXPECT_FALSE(config.loadFromString("teleop:\n  control_rate_hz: 0\n"));
    EXPECT_FALSE(config.isLoaded());
    EXPECT_EQ(config.systemConfig().teleop.control_rate_hz, 20);
}

TEST_F(ConfigManagerTest, RejectsControlRateTooHighForLoopPeriod) {
    auto& config = ConfigManager::instance();
    EXPECT_FALSE(config.loadFromString("teleop:\n  control_rate_hz: 2000000\n"));
    EXPECT_FALSE(config.loadFromString("teleop:\n  control_rate_hz: 501\n"));
    EXPECT_TRUE(config.loadFromString("teleop:\n  control_rate_hz: 500\n"));
}

TEST_F(ConfigManagerTest, RejectsNonPositiveGripperWidth) {
    auto& config = ConfigManager::instance();
    EXPECT_FALSE(config.loadFromString("gripper:\n  max_width_m: -0.01\n"));
    EXPECT_FALSE(config.loadFromString("gripper:\n  max_width_m: 0\n"));
    EXPECT_FALSE(config.loadFromString("gripper:\n  max_width_m: .nan\n"));
    EXPECT_FALSE(config.isLoaded());
    EXPECT_DOUBLE_EQ(config.systemConfig().gripper.max_width_m, 0.085);
}

TEST_F(ConfigManagerTest, RejectsPortsOutsideTcpRange) {
    auto& config = ConfigManager::instance();
    EXPECT_FALSE(config.loadFromString("scan:\n  port: 70000\n"));
    EXPECT_FALSE(config.loadFromString("robot:\n  rtde_port: -1\n"));
    EXPECT_FALSE(config.loadFromString("robot:\n  rtde_port: 0\n"));
    EXPECT_FALSE(config.loadFromString("gripper:\n  port: 65536\n"));
    EXPECT_FALSE(config.loadFromString("ipc:\n  rep_port: 0\n"));
    EXPECT_FALSE(config.loadFromString("ipc:\n  pub_port: 99999\n"));
    EXPECT_FALSE(config.isLoaded());
    EXPECT_EQ(config.systemConfig().scan.port, 30004);
    EXPECT_EQ(config.systemConfig().robot.rtde_port, 30004);

    EXPECT_TRUE(config.loadFromString("scan:\n  port: 65535\nrobot:\n  rtde_port: 1\n"));
    EXPECT_EQ(config.systemConfig().scan.port, 65535);
}

TEST_F(ConfigManagerTest, RejectsOutOfRangeTimeouts) {
    auto& config = ConfigManager::instance();
    EXPECT_FALSE(config.loadFromString("scan:\n  timeout_s: -0.5\n"));
    EXPECT_FALSE(config.loadFromString("scan:\n  timeout_s: 0\n"));
    EXPECT_FALSE(config.loadFromString("scan:\n  cli_timeout_s: 1e300\n"));
    EXPECT_FALSE(config.loadFromString("scan:\n  cli_check_timeout_s: -3\n"));
    EXPECT_FALSE(config.loadFromString("robot:\n  connect_timeout_s: -5\n"));
    EXPECT_FALSE(config.loadFromString("robot:\n  connect_timeout_s: 1e20\n"));
    EXPECT_FALSE(config.loadFromString("gripper:\n  connect_timeout_ms: 0\n"));
    EXPECT_FALSE(config.isLoaded());
    EXPECT_DOUBLE_EQ(config.systemConfig().robot.connect_timeout_s, 5.0);

    EXPECT_TRUE(config.loadFromString("scan:\n  timeout_s: 0.05\n"));
}

TEST_F(ConfigManagerTest, ScalarMappingEntryKeepsRestOfFile) {
    auto& config = ConfigManager::instance();
    ASSERT_TRUE(config.loadFromString(R"(
robot:
  model: ur5e
controller:
  mapping:
    linear_x: 3
    linear_y: { axis: 4 }
)"));

    EXPECT_EQ(config.systemConfig().robot.model, "ur5e");
    auto layout = config.controllerLayout();
    EXPECT_FALSE(layout.twist[gamepad::LINEAR_X].positiveAxis.bound());
    EXPECT_EQ(layout.twist[gamepad::LINEAR_Y].positiveAxis.axis, 4);
}

TEST_F(ConfigManagerTest, RejectsInvalidHostRange) {
    auto& config = ConfigManager::instance();
    EXPECT_FALSE(config.loadFromString("scan:\n  first_host: 200\n  last_host: 100\n"));
    EXPECT_FALSE(config.loadFromString("scan:\n  last_host: 300\n"));
}

TEST_F(ConfigManagerTest, RejectsMalformedYaml) {
    auto& config = ConfigManager::instance();
    EXPECT_FALSE(config.loadFromString("robot: [unterminated"));
    EXPECT_FALSE(config.loadFromString("- just\n- a\n- list\n"));
}

TEST_F(ConfigManagerTest, UnparsableValueKeepsDefault) {
    auto& config = ConfigManager::instance();
    ASSERT_TRUE(config.loadFromString("teleop:\n  control_rate_hz: fast\n"));
    EXPECT_EQ(config.systemConfig().teleop.control_rate_hz, 20);
}

TEST_F(ConfigManagerTest, ViewPublishRateFallsBack) {
    auto& config = ConfigManager::instance();
    ASSERT_TRUE(config.loadFromString("ipc:\n  view_publish_hz: 0\n"));
    EXPECT_EQ(config.systemConfig().ipc.view_publish_hz, 10);
}

TEST_F(ConfigManagerTest, MissingFileFails) {
    auto& config = ConfigManager::instance();
    EXPECT_FALSE(config.load("/nonexistent/teleop_config.yaml"));
    EXPECT_FALSE(config.isLoaded());
}

TEST_F(ConfigManagerTest, LoadFromFile) {
    fs::path dir = fs::temp_directory_path() / "ur_teleop_test_config";
    fs::create_directories(dir);
    fs::path file = dir / "teleop_config.yaml";
    {
        std::ofstream out(file);
        out << "robot:\n  model: ur3e\n  default_ip: 192.168.1.50\n"
            << "recording:\n  directory: /tmp/recordings\n";
    }

    auto& config = ConfigManager::instance();
    ASSERT_TRUE(config.load(file.string()));
    EXPECT_EQ(config.sourcePath(), file.string());
    EXPECT_EQ(config.systemConfig().robot.default_ip, "192.168.1.50");
    EXPECT_EQ(config.systemConfig().recording.directory, "/tmp/recordings");

    fs::remove_all(dir);
}

TEST_F(ConfigManagerTest, ControllerMappingOverridesPreset) {
    auto& config = ConfigManager::instance();
    ASSERT_TRUE(config.loadFromString(R"(
controller:
  dead_zone: 0.2
  mapping:
    name: my_pad
    linear_x: { axis: 3, inverted: true }
    gripper_open_button: 7
)"));

    EXPECT_DOUBLE_EQ(config.systemConfig().controller.dead_zone, 0.2);

    auto layout = config.controllerLayout();
    EXPECT_EQ(layout.name, "my_pad");
    EXPECT_EQ(layout.twist[gamepad::LINEAR_X].positiveAxis.axis, 3);
    EXPECT_TRUE(layout.twist[gamepad::LINEAR_X].positiveAxis.inverted);
    EXPECT_EQ(layout.gripperOpenButton, 7);
    // Untouched entries stay on the Xbox 360 preset
    EXPECT_EQ(layout.twist[gamepad::LINEAR_Y].positiveAxis.axis, 0);
    EXPECT_EQ(layout.gripperCloseButton, 0);
}

TEST_F(ConfigManagerTest, ResetRestoresDefaults) {
    auto& config = ConfigManager::instance();
    ASSERT_TRUE(config.loadFromString("robot:\n  driver: sim\n"));
    config.reset();
    EXPECT_FALSE(config.isLoaded());
    EXPECT_EQ(config.systemConfig().robot.driver, "ur_rtde");
    EXPECT_TRUE(config.sourcePath().empty());
}

TEST_F(ConfigManagerTest, ToJson) {
    auto& config = ConfigManager::instance();
    ASSERT_TRUE(config.loadFromString("robot:\n  default_ip: 10.42.0.3\n"));

    auto j = nlohmann::json::parse(config.toJson());
    EXPECT_EQ(j["robot"]["default_ip"], "10.42.0.3");
    EXPECT_EQ(j["robot"]["rtde_port"], 30004);
    EXPECT_EQ(j["scan"]["networks"].size(), 3u);
    EXPECT_EQ(j["teleop"]["control_rate_hz"], 20);
    EXPECT_EQ(j["controller"]["layout"], "xbox360");
    EXPECT_EQ(j["recording"]["file_prefix"], "ur3e_recording_");
    EXPECT_TRUE(j.contains("ipc"));
    EXPECT_TRUE(j.contains("logging"));
}
