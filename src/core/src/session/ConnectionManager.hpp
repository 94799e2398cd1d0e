/**
 * @file ConnectionManager.hpp
 * @brief Opens and closes the robot and gripper sessions
 */

#pragma once

#include "../robot/IRobotDriver.hpp"
#include "../network/PortProbe.hpp"
#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <string>

namespace ur_teleop {
namespace session {

enum class ConnectionState : uint8_t {
    DISCONNECTED = 0,
    CONNECTING,
    CONNECTED
};

std::string connectionStateToString(ConnectionState state);

struct ConnectionOptions {
    uint16_t rtdePort = 30004;
    std::chrono::milliseconds reachTimeout{5000};
    bool probeReachability = true;      // Off for simulated robots
};

/**
 * Outcome of connect()
 *
 * success=false: `error` holds the dialog text.
 * success=true with a non-empty `warning`: connected, but the state
 * check failed (protective stop, no program running, ...).
 */
struct ConnectResult {
    bool success = false;
    bool gripperConnected = false;
    std::string error;
    std::string warning;
    std::string gripperError;
};

class ConnectionManager {
public:
    ConnectionManager(robot::RobotDriverFactory robotFactory,
                      robot::GripperFactory gripperFactory,
                      const ConnectionOptions& options = ConnectionOptions{},
                      network::PortProbeFn probe = network::probePort);
    ~ConnectionManager();

    // Non-copyable
    ConnectionManager(const ConnectionManager&) = delete;
    ConnectionManager& operator=(const ConnectionManager&) = delete;

    /**
     * Reachability probe, robot session, state check, then (optionally) gripper.
     * An existing session is closed first.
     */
    ConnectResult connect(const std::string& ip);

    /**
     * Close gripper then robot. Idempotent
     */
    void disconnect();

    bool isConnected() const { return m_state == ConnectionState::CONNECTED; }
    ConnectionState state() const { return m_state; }
    std::string ip() const;

    std::shared_ptr<robot::IRobotDriver> robot() const;
    std::shared_ptr<robot::IGripper> gripper() const;

    static constexpr const char* NOT_READY_WARNING =
        "Robot connected but may not be ready. Ensure robot is:\n"
        "- Powered on\n"
        "- Not in protective stop\n"
        "- Program is running or robot is in remote control mode";

private:
    robot::RobotDriverFactory m_robotFactory;
    robot::GripperFactory m_gripperFactory;
    ConnectionOptions m_options;
    network::PortProbeFn m_probe;

    mutable std::mutex m_mutex;
    std::atomic<ConnectionState> m_state{ConnectionState::DISCONNECTED};
    std::string m_ip;
    std::shared_ptr<robot::IRobotDriver> m_robot;
    std::shared_ptr<robot::IGripper> m_gripper;
};

} // namespace session
} // namespace ur_teleop
