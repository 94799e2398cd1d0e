/**
 * @file UrRtdeDriver.hpp
 * @brief Universal Robots session over ur_rtde (control + receive interfaces)
 */

#pragma once

#include "IRobotDriver.hpp"
#include "../config/SystemConfig.hpp"
#include <memory>
#include <mutex>
#include <string>

namespace ur_teleop {
namespace robot {

class UrRtdeDriver : public IRobotDriver {
public:
    explicit UrRtdeDriver(const config::RobotConfig& config);
    ~UrRtdeDriver() override;

    // Non-copyable
    UrRtdeDriver(const UrRtdeDriver&) = delete;
    UrRtdeDriver& operator=(const UrRtdeDriver&) = delete;

    std::string connect(const std::string& ip) override;
    void disconnect() override;
    bool isConnected() const override;
    Pose getTcpPose() override;
    bool servoTcpPose(const Pose& target, double dt) override;
    void servoStop() override;
    std::string getDriverName() const override { return "UrRtdeDriver"; }
    bool isSimulation() const override { return false; }

    /**
     * Protective stop flag from the receive interface
     */
    bool isProtectiveStopped() const;

private:
    // RTDE interfaces (implementation in .cpp with ur_rtde)
    struct Impl;
    std::unique_ptr<Impl> m_impl;

    config::RobotConfig m_config;
    std::string m_ip;
    mutable std::mutex m_mutex;
};

/**
 * Robotiq 2F-85 over the URCap socket (ur_rtde::RobotiqGripper, port 63352)
 */
class RobotiqGripperDriver : public IGripper {
public:
    explicit RobotiqGripperDriver(const config::GripperConfig& config);
    ~RobotiqGripperDriver() override;

    // Non-copyable
    RobotiqGripperDriver(const RobotiqGripperDriver&) = delete;
    RobotiqGripperDriver& operator=(const RobotiqGripperDriver&) = delete;

    std::string connect(const std::string& ip) override;
    void disconnect() override;
    bool isConnected() const override;
    double getCurrentWidth() override;
    bool move(double widthM) override;
    double maxWidth() const override { return m_config.max_width_m; }
    std::string getDriverName() const override { return "RobotiqGripperDriver"; }

private:
    struct Impl;
    std::unique_ptr<Impl> m_impl;

    config::GripperConfig m_config;
    mutable std::mutex m_mutex;
};

} // namespace robot
} // namespace ur_teleop
