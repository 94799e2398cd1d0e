#include "ConnectionManager.hpp"
#include "../logging/Logger.hpp"
#include <stdexcept>

namespace ur_teleop {
namespace session {

std::string connectionStateToString(ConnectionState state) {
    switch (state) {
        case ConnectionState::DISCONNECTED: return "DISCONNECTED";
        case ConnectionState::CONNECTING:   return "CONNECTING";
        case ConnectionState::CONNECTED:    return "CONNECTED";
        default:                            return "UNKNOWN";
    }
}

ConnectionManager::ConnectionManager(robot::RobotDriverFactory robotFactory,
                                     robot::GripperFactory gripperFactory,
                                     const ConnectionOptions& options,
                                     network::PortProbeFn probe)
    : m_robotFactory(std::move(robotFactory))
    , m_gripperFactory(std::move(gripperFactory))
    , m_options(options)
    , m_probe(probe ? std::move(probe) : network::PortProbeFn(network::probePort)) {
    if (!m_robotFactory) {
        throw std::invalid_argument("ConnectionManager requires a robot driver factory");
    }
}

ConnectionManager::~ConnectionManager() {
    disconnect();
}

ConnectResult ConnectionManager::connect(const std::string& ip) {
    ConnectResult result;

    if (ip.empty()) {
        result.error = "Please select or enter robot IP address";
        return result;
    }

    if (m_state != ConnectionState::DISCONNECTED) {
        disconnect();
    }

    std::lock_guard<std::mutex> lock(m_mutex);
    m_state = ConnectionState::CONNECTING;

    LOG_INFO("Connecting to robot at {}...", ip);

    // Test basic connectivity first
    if (m_options.probeReachability) {
        LOG_DEBUG("Testing network connectivity to {}:{}", ip, m_options.rtdePort);
        if (!m_probe(ip, m_options.rtdePort, m_options.reachTimeout)) {
            result.error = "Cannot reach robot at " + ip + ":" + std::to_string(m_options.rtdePort) +
                           ". Check IP and network connection.";
            LOG_ERROR("Connection failed: {}", result.error);
            m_state = ConnectionState::DISCONNECTED;
            return result;
        }
        LOG_INFO("Network OK, initializing robot...");
    }

    std::shared_ptr<robot::IRobotDriver> robot;
    try {
        robot = m_robotFactory();
        if (!robot) {
            throw std::runtime_error("no robot driver");
        }
    } catch (const std::exception& e) {
        result.error = std::string("Failed to connect to robot: ") + e.what();
        LOG_ERROR("Robot connection failed: {}", e.what());
        m_state = ConnectionState::DISCONNECTED;
        return result;
    }

    std::string error = robot->connect(ip);
    if (!error.empty()) {
        result.error = "Failed to connect to robot: " + error;
        LOG_ERROR("Robot connection failed: {}", error);
        m_state = ConnectionState::DISCONNECTED;
        return result;
    }

    LOG_INFO("Robot connected, checking state...");
    try {
        robot->getTcpPose();
        LOG_INFO("Robot state: Ready for control");
    } catch (const std::exception& e) {
        LOG_WARN("Robot state error: {}", e.what());
        result.warning = NOT_READY_WARNING;
    }

    // Gripper failure is not fatal: teleop runs arm-only
    std::shared_ptr<robot::IGripper> gripper;
    if (m_gripperFactory) {
        LOG_DEBUG("Attempting gripper connection...");
        try {
            gripper = m_gripperFactory();
            std::string gripperError = gripper ? gripper->connect(ip) : "no gripper driver";
            if (gripperError.empty()) {
                LOG_INFO("Gripper connected");
                result.gripperConnected = true;
            } else {
                LOG_WARN("Gripper connection failed: {}", gripperError);
                result.gripperError = gripperError;
                gripper.reset();
            }
        } catch (const std::exception& e) {
            LOG_WARN("Gripper connection failed: {}", e.what());
            result.gripperError = e.what();
            gripper.reset();
        }
    }

    m_robot = std::move(robot);
    m_gripper = std::move(gripper);
    m_ip = ip;
    m_state = ConnectionState::CONNECTED;

    LOG_INFO("Robot connected successfully");
    result.success = true;
    return result;
}

void ConnectionManager::disconnect() {
    std::lock_guard<std::mutex> lock(m_mutex);

    if (m_state == ConnectionState::DISCONNECTED && !m_robot) {
        return;
    }

    if (m_gripper) {
        m_gripper->disconnect();
        m_gripper.reset();
    }
    if (m_robot) {
        m_robot->disconnect();
        m_robot.reset();
    }

    LOG_INFO("Robot disconnected ({})", m_ip);
    m_ip.clear();
    m_state = ConnectionState::DISCONNECTED;
}

std::string ConnectionManager::ip() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_ip;
}

std::shared_ptr<robot::IRobotDriver> ConnectionManager::robot() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_robot;
}

std::shared_ptr<robot::IGripper> ConnectionManager::gripper() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_gripper;
}

} // namespace session
} // namespace ur_teleop
