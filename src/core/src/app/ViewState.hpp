/**
 * @file ViewState.hpp
 * @brief Everything a front end needs to draw the teleop window
 */

#pragma once

#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace ur_teleop {
namespace app {

/**
 * Published on every change (STATUS) and returned by GET_STATUS.
 * Front ends render it as-is; enable flags and labels are decided here.
 */
struct ViewState {
    // Robot Connection
    std::vector<std::string> robot_ips;
    std::string selected_ip;
    bool scanning = false;
    std::string scan_button_text = "Scan Network";
    bool scan_enabled = true;
    bool robot_connected = false;
    bool connecting = false;
    std::string robot_status_text = "Not Connected";
    std::string robot_status_color = "red";
    std::string connect_button_text = "Connect Robot";
    bool connect_enabled = true;
    bool gripper_connected = false;

    // Controller
    bool controller_connected = false;
    std::string controller_name;
    std::string controller_status_text = "Checking...";
    std::string controller_status_color = "orange";

    // Speed Control
    double speed_percent = 20.0;
    std::string speed_label = "20%";

    // Robot Control
    bool running = false;
    bool start_enabled = false;
    bool stop_enabled = false;

    // Recording
    bool recording = false;
    bool record_enabled = false;
    std::string record_button_text = "Start Recording";
    std::string record_status_text = "Not Recording";
    std::string record_status_color = "gray";
    size_t recorded_points = 0;
    bool save_enabled = false;

    // Status
    std::vector<std::string> status_log;

    NLOHMANN_DEFINE_TYPE_INTRUSIVE(ViewState,
        robot_ips, selected_ip, scanning, scan_button_text, scan_enabled,
        robot_connected, connecting, robot_status_text, robot_status_color,
        connect_button_text, connect_enabled, gripper_connected,
        controller_connected, controller_name, controller_status_text, controller_status_color,
        speed_percent, speed_label,
        running, start_enabled, stop_enabled,
        recording, record_enabled, record_button_text, record_status_text,
        record_status_color, recorded_points, save_enabled,
        status_log)
};

/**
 * Dialog box request (error / warning / info)
 */
struct Notification {
    std::string level;      // "error", "warning", "info"
    std::string title;
    std::string message;

    NLOHMANN_DEFINE_TYPE_INTRUSIVE(Notification, level, title, message)
};

} // namespace app
} // namespace ur_teleop
