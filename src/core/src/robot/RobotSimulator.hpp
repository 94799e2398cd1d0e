#pragma once

#include "IRobotDriver.hpp"
#include <atomic>
#include <mutex>
#include <string>

namespace ur_teleop {
namespace robot {

/**
 * Simulated arm: servo targets are tracked perfectly.
 *
 * Used for `robot.driver: sim` runs and by the unit tests. A fault can be
 * injected to mimic a robot in protective stop or a dropped RTDE link.
 */
class RobotSimulator : public IRobotDriver {
public:
    RobotSimulator();
    explicit RobotSimulator(const Pose& initialPose);
    ~RobotSimulator() override = default;

    std::string connect(const std::string& ip) override;
    void disconnect() override;
    bool isConnected() const override { return m_connected; }
    Pose getTcpPose() override;
    bool servoTcpPose(const Pose& target, double dt) override;
    void servoStop() override;
    std::string getDriverName() const override { return "RobotSimulator"; }
    bool isSimulation() const override { return true; }

    // Fault injection
    void setConnectError(const std::string& error);
    void setFault(const std::string& message);
    void clearFault();

    // Inspection
    size_t servoCount() const { return m_servoCount; }
    bool servoStopped() const { return m_servoStopped; }
    double lastServoTime() const;
    std::string connectedIp() const;

    static constexpr Pose DEFAULT_POSE{0.3, -0.1, 0.3, 0.0, 3.1416, 0.0};

private:
    mutable std::mutex m_mutex;
    Pose m_pose{};
    std::string m_ip;
    std::string m_connectError;
    std::string m_fault;
    double m_lastServoTime{0.0};

    std::atomic<bool> m_connected{false};
    std::atomic<bool> m_servoStopped{false};
    std::atomic<size_t> m_servoCount{0};
};

/**
 * Simulated gripper: moves reach their target instantly
 */
class GripperSimulator : public IGripper {
public:
    explicit GripperSimulator(double maxWidthM = 0.085);
    ~GripperSimulator() override = default;

    std::string connect(const std::string& ip) override;
    void disconnect() override;
    bool isConnected() const override { return m_connected; }
    double getCurrentWidth() override;
    bool move(double widthM) override;
    double maxWidth() const override { return m_maxWidth; }
    std::string getDriverName() const override { return "GripperSimulator"; }

    void setConnectError(const std::string& error);
    size_t moveCount() const { return m_moveCount; }

private:
    mutable std::mutex m_mutex;
    double m_maxWidth;
    double m_width;
    std::string m_connectError;
    std::atomic<bool> m_connected{false};
    std::atomic<size_t> m_moveCount{0};
};

} // namespace robot
} // namespace ur_teleop
