#include "RobotSimulator.hpp"
#include "../logging/Logger.hpp"
#include <algorithm>
#include <stdexcept>

namespace ur_teleop {
namespace robot {

// ============================================================================
// RobotSimulator
// ============================================================================

RobotSimulator::RobotSimulator()
    : RobotSimulator(DEFAULT_POSE) {
}

RobotSimulator::RobotSimulator(const Pose& initialPose)
    : m_pose(initialPose) {
    LOG_DEBUG("RobotSimulator created");
}

std::string RobotSimulator::connect(const std::string& ip) {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (!m_connectError.empty()) {
        LOG_ERROR("RobotSimulator: connect to {} refused: {}", ip, m_connectError);
        return m_connectError;
    }
    m_ip = ip;
    m_connected = true;
    m_servoStopped = false;
    LOG_INFO("RobotSimulator: connected ({})", ip);
    return "";
}

void RobotSimulator::disconnect() {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_connected) {
        LOG_INFO("RobotSimulator: disconnected");
    }
    m_connected = false;
}

Pose RobotSimulator::getTcpPose() {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (!m_connected) {
        throw std::runtime_error("Robot not connected");
    }
    if (!m_fault.empty()) {
        throw std::runtime_error(m_fault);
    }
    return m_pose;
}

bool RobotSimulator::servoTcpPose(const Pose& target, double dt) {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (!m_connected) {
        throw std::runtime_error("Robot not connected");
    }
    if (!m_fault.empty()) {
        throw std::runtime_error(m_fault);
    }
    m_pose = target;
    m_lastServoTime = dt;
    m_servoStopped = false;
    ++m_servoCount;
    return true;
}

void RobotSimulator::servoStop() {
    m_servoStopped = true;
}

void RobotSimulator::setConnectError(const std::string& error) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_connectError = error;
}

void RobotSimulator::setFault(const std::string& message) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_fault = message;
}

void RobotSimulator::clearFault() {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_fault.clear();
}

double RobotSimulator::lastServoTime() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_lastServoTime;
}

std::string RobotSimulator::connectedIp() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_ip;
}

// ============================================================================
// GripperSimulator
// ============================================================================

GripperSimulator::GripperSimulator(double maxWidthM)
    : m_maxWidth(std::max(0.0, maxWidthM))
    , m_width(m_maxWidth) {
}

std::string GripperSimulator::connect(const std::string& ip) {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (!m_connectError.empty()) {
        return m_connectError;
    }
    m_connected = true;
    LOG_DEBUG("GripperSimulator: connected ({})", ip);
    return "";
}

void GripperSimulator::disconnect() {
    m_connected = false;
}

double GripperSimulator::getCurrentWidth() {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (!m_connected) {
        throw std::runtime_error("Gripper not connected");
    }
    return m_width;
}

bool GripperSimulator::move(double widthM) {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (!m_connected) {
        throw std::runtime_error("Gripper not connected");
    }
    m_width = std::clamp(widthM, 0.0, m_maxWidth);
    ++m_moveCount;
    return true;
}

void GripperSimulator::setConnectError(const std::string& error) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_connectError = error;
}

} // namespace robot
} // namespace ur_teleop
