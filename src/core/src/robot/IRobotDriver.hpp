/**
 * @file IRobotDriver.hpp
 * @brief Abstract interfaces for the arm and gripper sessions (ur_rtde, simulator)
 */

#pragma once

#include "RobotTypes.hpp"
#include <functional>
#include <memory>
#include <string>

namespace ur_teleop {
namespace robot {

/**
 * Robot arm session.
 *
 * ConnectionManager, GameControllerTeleop and the recorder use this
 * interface, so the ur_rtde driver and the simulator are interchangeable.
 * Real-time data exchange and servo control live in the driver library.
 */
class IRobotDriver {
public:
    virtual ~IRobotDriver() = default;

    // Open the session - returns error message (empty = success)
    virtual std::string connect(const std::string& ip) = 0;

    virtual void disconnect() = 0;
    virtual bool isConnected() const = 0;

    // Actual TCP pose. Throws std::runtime_error if the session is unusable
    virtual Pose getTcpPose() = 0;

    // Servo the TCP towards target over dt seconds. False if the driver rejected it
    virtual bool servoTcpPose(const Pose& target, double dt) = 0;

    // Leave servo mode (decelerate)
    virtual void servoStop() = 0;

    // Driver info
    virtual std::string getDriverName() const = 0;
    virtual bool isSimulation() const = 0;
};

/**
 * Parallel gripper session
 */
class IGripper {
public:
    virtual ~IGripper() = default;

    // Open the session - returns error message (empty = success)
    virtual std::string connect(const std::string& ip) = 0;

    virtual void disconnect() = 0;
    virtual bool isConnected() const = 0;

    // Current opening width [m]. Throws std::runtime_error if not connected
    virtual double getCurrentWidth() = 0;

    // Start moving to the given opening width [m] (non-blocking)
    virtual bool move(double widthM) = 0;

    virtual double maxWidth() const = 0;
    virtual std::string getDriverName() const = 0;
};

using RobotDriverFactory = std::function<std::unique_ptr<IRobotDriver>()>;
using GripperFactory = std::function<std::unique_ptr<IGripper>()>;

} // namespace robot
} // namespace ur_teleop
