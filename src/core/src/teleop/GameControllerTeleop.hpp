/**
 * @file GameControllerTeleop.hpp
 * @brief Game controller -> TCP twist -> servo target, plus gripper delta
 */

#pragma once

#include "../robot/IRobotDriver.hpp"
#include "../gamepad/IGameController.hpp"
#include "../gamepad/ControllerLayout.hpp"
#include <atomic>
#include <memory>
#include <optional>

namespace ur_teleop {
namespace teleop {

/**
 * One teleoperation step, split the way the control loop calls it
 */
class ITeleopAdapter {
public:
    virtual ~ITeleopAdapter() = default;

    // Read the controller, servo the arm one period along the commanded twist.
    // Returns the commanded twist (base frame, SI units)
    virtual robot::Twist readTwistAndServoToTarget() = 0;

    // Apply the gripper buttons read by the last readTwistAndServoToTarget()
    virtual void readGripperDeltaAndMoveGripper() = 0;
};

struct TeleopOptions {
    int controlRateHz = 20;
    double linearSpeedScaling = 0.04;   // m/s at full stick (0.2 * 20%)
    double angularSpeedScaling = 0.12;  // rad/s at full stick (0.6 * 20%)
    double deadZone = 0.1;
    double gripperSpeed = 0.05;         // m/s of opening width while a button is held
};

class GameControllerTeleop : public ITeleopAdapter {
public:
    GameControllerTeleop(std::shared_ptr<robot::IRobotDriver> robot,
                         std::shared_ptr<robot::IGripper> gripper,
                         std::unique_ptr<gamepad::IGameController> controller,
                         gamepad::ControllerLayout layout,
                         const TeleopOptions& options);
    ~GameControllerTeleop() override = default;

    robot::Twist readTwistAndServoToTarget() override;
    void readGripperDeltaAndMoveGripper() override;

    // Speed scaling, safe to change while the loop runs
    void setLinearSpeedScaling(double metersPerSecond) { m_linearScaling = metersPerSecond; }
    void setAngularSpeedScaling(double radPerSecond) { m_angularScaling = radPerSecond; }
    double linearSpeedScaling() const { return m_linearScaling; }
    double angularSpeedScaling() const { return m_angularScaling; }

    double period() const { return 1.0 / m_options.controlRateHz; }
    std::optional<robot::Pose> targetPose() const { return m_target; }
    std::optional<double> gripperTarget() const { return m_gripperTarget; }

    /**
     * Move a UR pose along a base-frame twist for dt seconds.
     * Translation is added; rotation is pre-multiplied (R' = exp(w*dt) * R).
     */
    static robot::Pose integratePose(const robot::Pose& pose, const robot::Twist& twist, double dt);

private:
    std::shared_ptr<robot::IRobotDriver> m_robot;
    std::shared_ptr<robot::IGripper> m_gripper;
    std::unique_ptr<gamepad::IGameController> m_controller;
    gamepad::ControllerLayout m_layout;
    TeleopOptions m_options;

    std::atomic<double> m_linearScaling;
    std::atomic<double> m_angularScaling;

    // Servo target is integrated from the previous target, not the measured
    // pose, so tracking lag does not shrink the commanded motion
    std::optional<robot::Pose> m_target;
    std::optional<double> m_gripperTarget;
    int m_gripperDirection{0};
};

} // namespace teleop
} // namespace ur_teleop
