/**
 * @file MessageTypes.hpp
 * @brief IPC Message type definitions
 */

#pragma once

#include <string>

namespace ur_teleop {
namespace ipc {

/**
 * Message types for IPC communication
 */
enum class MessageType {
    // Connection
    PING,
    PONG,

    // View state
    GET_STATUS,
    STATUS,

    // Configuration
    GET_CONFIG,
    CONFIG,

    // Robot Connection section
    SCAN_NETWORK,
    STOP_SCAN,
    SELECT_ROBOT_IP,
    CONNECT_ROBOT,
    DISCONNECT_ROBOT,

    // Controller section
    REFRESH_CONTROLLER,

    // Speed / Robot Control sections
    SET_SPEED,
    START_CONTROL,
    STOP_CONTROL,

    // Recording section
    TOGGLE_RECORDING,
    SAVE_RECORDING,

    // Reply to any action
    ACTION_ACK,

    // Published events
    LOG,
    NOTIFY,

    // Errors
    ERROR,

    // Unknown
    UNKNOWN
};

/**
 * Convert MessageType to string
 */
inline std::string messageTypeToString(MessageType type) {
    switch (type) {
        case MessageType::PING:               return "PING";
        case MessageType::PONG:               return "PONG";
        case MessageType::GET_STATUS:         return "GET_STATUS";
        case MessageType::STATUS:             return "STATUS";
        case MessageType::GET_CONFIG:         return "GET_CONFIG";
        case MessageType::CONFIG:             return "CONFIG";
        case MessageType::SCAN_NETWORK:       return "SCAN_NETWORK";
        case MessageType::STOP_SCAN:          return "STOP_SCAN";
        case MessageType::SELECT_ROBOT_IP:    return "SELECT_ROBOT_IP";
        case MessageType::CONNECT_ROBOT:      return "CONNECT_ROBOT";
        case MessageType::DISCONNECT_ROBOT:   return "DISCONNECT_ROBOT";
        case MessageType::REFRESH_CONTROLLER: return "REFRESH_CONTROLLER";
        case MessageType::SET_SPEED:          return "SET_SPEED";
        case MessageType::START_CONTROL:      return "START_CONTROL";
        case MessageType::STOP_CONTROL:       return "STOP_CONTROL";
        case MessageType::TOGGLE_RECORDING:   return "TOGGLE_RECORDING";
        case MessageType::SAVE_RECORDING:     return "SAVE_RECORDING";
        case MessageType::ACTION_ACK:         return "ACTION_ACK";
        case MessageType::LOG:                return "LOG";
        case MessageType::NOTIFY:             return "NOTIFY";
        case MessageType::ERROR:              return "ERROR";
        default:                              return "UNKNOWN";
    }
}

/**
 * Convert string to MessageType
 */
inline MessageType stringToMessageType(const std::string& str) {
    if (str == "PING")               return MessageType::PING;
    if (str == "PONG")               return MessageType::PONG;
    if (str == "GET_STATUS")         return MessageType::GET_STATUS;
    if (str == "STATUS")             return MessageType::STATUS;
    if (str == "GET_CONFIG")         return MessageType::GET_CONFIG;
    if (str == "CONFIG")             return MessageType::CONFIG;
    if (str == "SCAN_NETWORK")       return MessageType::SCAN_NETWORK;
    if (str == "STOP_SCAN")          return MessageType::STOP_SCAN;
    if (str == "SELECT_ROBOT_IP")    return MessageType::SELECT_ROBOT_IP;
    if (str == "CONNECT_ROBOT")      return MessageType::CONNECT_ROBOT;
    if (str == "DISCONNECT_ROBOT")   return MessageType::DISCONNECT_ROBOT;
    if (str == "REFRESH_CONTROLLER") return MessageType::REFRESH_CONTROLLER;
    if (str == "SET_SPEED")          return MessageType::SET_SPEED;
    if (str == "START_CONTROL")      return MessageType::START_CONTROL;
    if (str == "STOP_CONTROL")       return MessageType::STOP_CONTROL;
    if (str == "TOGGLE_RECORDING")   return MessageType::TOGGLE_RECORDING;
    if (str == "SAVE_RECORDING")     return MessageType::SAVE_RECORDING;
    if (str == "ACTION_ACK")         return MessageType::ACTION_ACK;
    if (str == "LOG")                return MessageType::LOG;
    if (str == "NOTIFY")             return MessageType::NOTIFY;
    if (str == "ERROR")              return MessageType::ERROR;
    return MessageType::UNKNOWN;
}

/**
 * Reply type for a request type
 */
inline MessageType responseTypeFor(MessageType request) {
    switch (request) {
        case MessageType::PING:       return MessageType::PONG;
        case MessageType::GET_STATUS: return MessageType::STATUS;
        case MessageType::GET_CONFIG: return MessageType::CONFIG;
        case MessageType::SCAN_NETWORK:
        case MessageType::STOP_SCAN:
        case MessageType::SELECT_ROBOT_IP:
        case MessageType::CONNECT_ROBOT:
        case MessageType::DISCONNECT_ROBOT:
        case MessageType::REFRESH_CONTROLLER:
        case MessageType::SET_SPEED:
        case MessageType::START_CONTROL:
        case MessageType::STOP_CONTROL:
        case MessageType::TOGGLE_RECORDING:
        case MessageType::SAVE_RECORDING:
            return MessageType::ACTION_ACK;
        default:
            return request;
    }
}

} // namespace ipc
} // namespace ur_teleop
