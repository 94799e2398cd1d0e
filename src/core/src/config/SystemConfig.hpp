/**
 * @file SystemConfig.hpp
 * @brief Teleop station configuration data structures
 */

#pragma once

#include <string>
#include <vector>

namespace ur_teleop {
namespace config {

/**
 * Robot session configuration
 */
struct RobotConfig {
    std::string model = "ur3e";
    std::string driver = "ur_rtde";     // "ur_rtde" or "sim"
    std::string default_ip;
    int rtde_port = 30004;
    double connect_timeout_s = 5.0;
    double rtde_frequency = 500.0;

    // servoL parameters (passed through to the driver)
    double servo_speed = 0.5;
    double servo_acceleration = 0.5;
    double servo_lookahead_time = 0.1;
    double servo_gain = 300.0;
};

/**
 * Robotiq gripper configuration
 */
struct GripperConfig {
    bool enabled = true;
    int port = 63352;
    double max_width_m = 0.085;
    double speed_m_per_s = 0.05;     // Width change rate while a button is held
    int connect_timeout_ms = 2000;
};

/**
 * Network scan configuration
 */
struct ScanConfig {
    std::vector<std::string> networks = {"192.168.0", "192.168.1", "10.42.0"};
    int port = 30004;
    int first_host = 1;
    int last_host = 254;
    double timeout_s = 0.3;
    double cli_timeout_s = 0.1;
    double cli_check_timeout_s = 3.0;
};

/**
 * Teleoperation loop configuration
 */
struct TeleopConfig {
    int control_rate_hz = 20;
    double base_linear_speed = 0.2;      // m/s at 100%
    double base_angular_speed = 0.6;     // rad/s at 100%
    double default_speed_percent = 20.0;
    double stop_timeout_s = 2.0;
};

/**
 * Game controller configuration
 */
struct ControllerConfig {
    int index = 0;
    std::string device_dir = "/dev/input";
    std::string layout = "xbox360";
    double dead_zone = 0.1;
};

/**
 * Trajectory recording configuration
 */
struct RecordingConfig {
    std::string directory = ".";
    std::string file_prefix = "ur3e_recording_";
};

/**
 * IPC configuration
 */
struct IpcConfig {
    int rep_port = 5555;
    int pub_port = 5556;
    std::string bind_address = "*";
    int view_publish_hz = 10;
};

/**
 * Logging configuration
 */
struct LoggingConfig {
    std::string level = "info";
    std::string file = "logs/teleop.log";
    int max_size_mb = 10;
    int max_files = 5;
    bool console_enabled = true;
    bool file_enabled = true;
    int status_history = 500;
};

/**
 * Complete station configuration
 */
struct SystemConfig {
    std::string version = "1.0.0";
    RobotConfig robot;
    GripperConfig gripper;
    ScanConfig scan;
    TeleopConfig teleop;
    ControllerConfig controller;
    RecordingConfig recording;
    IpcConfig ipc;
    LoggingConfig logging;
};

} // namespace config
} // namespace ur_teleop
