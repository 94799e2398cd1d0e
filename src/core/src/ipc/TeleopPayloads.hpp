/**
 * @file TeleopPayloads.hpp
 * @brief Request, reply and event payloads of the teleop IPC protocol
 */

#pragma once

#include "../app/ViewState.hpp"
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace ur_teleop {
namespace ipc {

// ============================================================================
// Request Payloads
// ============================================================================

/**
 * Request for SELECT_ROBOT_IP (free text entry or list pick)
 */
struct SelectRobotIpRequest {
    std::string ip;

    NLOHMANN_DEFINE_TYPE_INTRUSIVE(SelectRobotIpRequest, ip)
};

/**
 * Request for SET_SPEED
 */
struct SetSpeedRequest {
    double percent = 20.0;          // 1..100, clamped by the shell

    NLOHMANN_DEFINE_TYPE_INTRUSIVE(SetSpeedRequest, percent)
};

// ============================================================================
// Response Payloads
// ============================================================================

/**
 * ACTION_ACK for every button action; carries the resulting view
 */
struct ActionResponse {
    std::string action;
    bool success = false;
    app::ViewState view;

    NLOHMANN_DEFINE_TYPE_INTRUSIVE(ActionResponse, action, success, view)
};

// ============================================================================
// Published Events
// ============================================================================

/**
 * LOG: one status line, "[HH:MM:SS] message"
 */
struct LogEvent {
    std::string line;

    NLOHMANN_DEFINE_TYPE_INTRUSIVE(LogEvent, line)
};

} // namespace ipc
} // namespace ur_teleop
