/**
 * @file UrRtdeDriver.cpp
 * @brief ur_rtde backed arm and gripper sessions
 *
 * RTDE framing, servoL interpolation and the Robotiq socket protocol are
 * handled by ur_rtde; this file only maps our session interface onto it.
 */

#include "UrRtdeDriver.hpp"
#include "../logging/Logger.hpp"
#include <ur_rtde/rtde_control_interface.h>
#include <ur_rtde/rtde_receive_interface.h>
#include <ur_rtde/robotiq_gripper.h>
#include <algorithm>
#include <stdexcept>
#include <vector>

namespace ur_teleop {
namespace robot {

// ============================================================================
// UrRtdeDriver
// ============================================================================

struct UrRtdeDriver::Impl {
    std::unique_ptr<ur_rtde::RTDEReceiveInterface> receive;
    std::unique_ptr<ur_rtde::RTDEControlInterface> control;
};

UrRtdeDriver::UrRtdeDriver(const config::RobotConfig& config)
    : m_impl(std::make_unique<Impl>())
    , m_config(config) {
    LOG_DEBUG("UrRtdeDriver created (model {}, {} Hz)", config.model, config.rtde_frequency);
}

UrRtdeDriver::~UrRtdeDriver() {
    disconnect();
}

std::string UrRtdeDriver::connect(const std::string& ip) {
    std::lock_guard<std::mutex> lock(m_mutex);

    m_impl->control.reset();
    m_impl->receive.reset();

    try {
        LOG_INFO("UrRtdeDriver: opening RTDE receive interface on {}", ip);
        m_impl->receive = std::make_unique<ur_rtde::RTDEReceiveInterface>(
            ip, m_config.rtde_frequency);

        LOG_INFO("UrRtdeDriver: opening RTDE control interface on {}", ip);
        m_impl->control = std::make_unique<ur_rtde::RTDEControlInterface>(
            ip, m_config.rtde_frequency);

    } catch (const std::exception& e) {
        LOG_ERROR("UrRtdeDriver: connection to {} failed: {}", ip, e.what());
        m_impl->control.reset();
        m_impl->receive.reset();
        return e.what();
    }

    m_ip = ip;
    LOG_INFO("UrRtdeDriver: connected to {}", ip);
    return "";
}

void UrRtdeDriver::disconnect() {
    std::lock_guard<std::mutex> lock(m_mutex);

    if (m_impl->control) {
        try {
            m_impl->control->servoStop();
            m_impl->control->stopScript();
            m_impl->control->disconnect();
        } catch (const std::exception& e) {
            LOG_WARN("UrRtdeDriver: error closing control interface: {}", e.what());
        }
        m_impl->control.reset();
    }

    if (m_impl->receive) {
        try {
            m_impl->receive->disconnect();
        } catch (const std::exception& e) {
            LOG_WARN("UrRtdeDriver: error closing receive interface: {}", e.what());
        }
        m_impl->receive.reset();
        LOG_INFO("UrRtdeDriver: disconnected from {}", m_ip);
    }
}

bool UrRtdeDriver::isConnected() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_impl->receive && m_impl->control &&
           m_impl->receive->isConnected() && m_impl->control->isConnected();
}

Pose UrRtdeDriver::getTcpPose() {
    std::lock_guard<std::mutex> lock(m_mutex);

    if (!m_impl->receive) {
        throw std::runtime_error("Robot not connected");
    }

    std::vector<double> actual = m_impl->receive->getActualTCPPose();
    if (actual.size() != 6) {
        throw std::runtime_error("Unexpected TCP pose size " + std::to_string(actual.size()));
    }

    Pose pose{};
    std::copy(actual.begin(), actual.end(), pose.begin());
    return pose;
}

bool UrRtdeDriver::servoTcpPose(const Pose& target, double dt) {
    std::lock_guard<std::mutex> lock(m_mutex);

    if (!m_impl->control) {
        throw std::runtime_error("Robot not connected");
    }

    std::vector<double> pose(target.begin(), target.end());
    return m_impl->control->servoL(pose,
                                   m_config.servo_speed,
                                   m_config.servo_acceleration,
                                   dt,
                                   m_config.servo_lookahead_time,
                                   m_config.servo_gain);
}

void UrRtdeDriver::servoStop() {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_impl->control) {
        m_impl->control->servoStop();
    }
}

bool UrRtdeDriver::isProtectiveStopped() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_impl->receive && m_impl->receive->isProtectiveStopped();
}

// ============================================================================
// RobotiqGripperDriver
// ============================================================================

struct RobotiqGripperDriver::Impl {
    std::unique_ptr<ur_rtde::RobotiqGripper> gripper;
};

RobotiqGripperDriver::RobotiqGripperDriver(const config::GripperConfig& config)
    : m_impl(std::make_unique<Impl>())
    , m_config(config) {
}

RobotiqGripperDriver::~RobotiqGripperDriver() {
    disconnect();
}

std::string RobotiqGripperDriver::connect(const std::string& ip) {
    std::lock_guard<std::mutex> lock(m_mutex);

    try {
        auto gripper = std::make_unique<ur_rtde::RobotiqGripper>(ip, m_config.port);
        gripper->connect(static_cast<uint32_t>(m_config.connect_timeout_ms));
        gripper->activate();

        // 0.0 = fully open, 1.0 = fully closed
        gripper->setUnit(ur_rtde::RobotiqGripper::POSITION,
                         ur_rtde::RobotiqGripper::UNIT_NORMALIZED);

        m_impl->gripper = std::move(gripper);
        LOG_INFO("RobotiqGripperDriver: connected to {}:{}", ip, m_config.port);
        return "";

    } catch (const std::exception& e) {
        LOG_ERROR("RobotiqGripperDriver: connection to {}:{} failed: {}",
                  ip, m_config.port, e.what());
        m_impl->gripper.reset();
        return e.what();
    }
}

void RobotiqGripperDriver::disconnect() {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_impl->gripper) {
        try {
            m_impl->gripper->disconnect();
        } catch (const std::exception& e) {
            LOG_WARN("RobotiqGripperDriver: error on disconnect: {}", e.what());
        }
        m_impl->gripper.reset();
    }
}

bool RobotiqGripperDriver::isConnected() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_impl->gripper && m_impl->gripper->isConnected();
}

double RobotiqGripperDriver::getCurrentWidth() {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (!m_impl->gripper) {
        throw std::runtime_error("Gripper not connected");
    }
    double closed = std::clamp(static_cast<double>(m_impl->gripper->getCurrentPosition()), 0.0, 1.0);
    return (1.0 - closed) * m_config.max_width_m;
}

bool RobotiqGripperDriver::move(double widthM) {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (!m_impl->gripper) {
        throw std::runtime_error("Gripper not connected");
    }
    double width = std::clamp(widthM, 0.0, m_config.max_width_m);
    float position = static_cast<float>(1.0 - width / m_config.max_width_m);
    m_impl->gripper->move(position);
    return true;
}

} // namespace robot
} // namespace ur_teleop
