#include "GameControllerTeleop.hpp"
#include "../logging/Logger.hpp"
#include <Eigen/Geometry>
#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace ur_teleop {
namespace teleop {

namespace {

constexpr double ANGLE_EPSILON = 1e-12;

Eigen::Matrix3d rotationFromVector(const Eigen::Vector3d& rv) {
    double angle = rv.norm();
    if (angle < ANGLE_EPSILON) {
        return Eigen::Matrix3d::Identity();
    }
    return Eigen::AngleAxisd(angle, rv / angle).toRotationMatrix();
}

Eigen::Vector3d vectorFromRotation(const Eigen::Matrix3d& R) {
    Eigen::AngleAxisd aa(R);
    if (std::abs(aa.angle()) < ANGLE_EPSILON) {
        return Eigen::Vector3d::Zero();
    }
    return aa.axis() * aa.angle();
}

} // namespace

GameControllerTeleop::GameControllerTeleop(std::shared_ptr<robot::IRobotDriver> robot,
                                           std::shared_ptr<robot::IGripper> gripper,
                                           std::unique_ptr<gamepad::IGameController> controller,
                                           gamepad::ControllerLayout layout,
                                           const TeleopOptions& options)
    : m_robot(std::move(robot))
    , m_gripper(std::move(gripper))
    , m_controller(std::move(controller))
    , m_layout(std::move(layout))
    , m_options(options)
    , m_linearScaling(options.linearSpeedScaling)
    , m_angularScaling(options.angularSpeedScaling) {
    if (!m_robot) {
        throw std::invalid_argument("GameControllerTeleop requires a robot");
    }
    if (!m_controller) {
        throw std::invalid_argument("GameControllerTeleop requires a game controller");
    }
    if (m_options.controlRateHz <= 0) {
        throw std::invalid_argument("Control rate must be positive");
    }

    LOG_INFO("GameControllerTeleop: {} Hz, layout '{}', controller '{}'{}",
             m_options.controlRateHz, m_layout.name, m_controller->name(),
             m_gripper ? "" : " (no gripper)");
}

robot::Twist GameControllerTeleop::readTwistAndServoToTarget() {
    if (!m_controller->poll()) {
        throw std::runtime_error("Game controller disconnected");
    }

    auto command = m_layout.readTwist(*m_controller, m_options.deadZone);
    m_gripperDirection = m_layout.readGripperDirection(*m_controller);

    double linear = m_linearScaling;
    double angular = m_angularScaling;

    robot::Twist twist{};
    for (int i = 0; i < 3; ++i) {
        twist[i] = command[i] * linear;
        twist[i + 3] = command[i + 3] * angular;
    }

    if (!m_target) {
        m_target = m_robot->getTcpPose();
        LOG_DEBUG("GameControllerTeleop: servo target seeded from actual TCP pose");
    }

    double dt = period();
    m_target = integratePose(*m_target, twist, dt);

    if (!m_robot->servoTcpPose(*m_target, dt)) {
        // Driver refused the target: re-seed from the actual pose next tick
        LOG_WARN("GameControllerTeleop: servo target rejected by {}", m_robot->getDriverName());
        m_target.reset();
    }

    return twist;
}

void GameControllerTeleop::readGripperDeltaAndMoveGripper() {
    if (!m_gripper || m_gripperDirection == 0) {
        return;
    }

    if (!m_gripperTarget) {
        m_gripperTarget = m_gripper->getCurrentWidth();
    }

    double delta = m_gripperDirection * m_options.gripperSpeed * period();
    double maxWidth = std::max(0.0, m_gripper->maxWidth());
    double width = std::clamp(*m_gripperTarget + delta, 0.0, maxWidth);

    if (width == *m_gripperTarget) {
        return;     // Already at the end stop
    }

    if (!m_gripper->move(width)) {
        LOG_WARN("GameControllerTeleop: gripper rejected width {:.4f} m", width);
        m_gripperTarget.reset();
        return;
    }
    m_gripperTarget = width;
    LOG_TRACE("GameControllerTeleop: gripper -> {:.4f} m", width);
}

robot::Pose GameControllerTeleop::integratePose(const robot::Pose& pose,
                                                const robot::Twist& twist, double dt) {
    Eigen::Vector3d position(pose[0], pose[1], pose[2]);
    Eigen::Matrix3d R = rotationFromVector(Eigen::Vector3d(pose[3], pose[4], pose[5]));

    Eigen::Vector3d v(twist[0], twist[1], twist[2]);
    Eigen::Vector3d w(twist[3], twist[4], twist[5]);

    position += v * dt;
    R = rotationFromVector(w * dt) * R;

    Eigen::Vector3d rv = vectorFromRotation(R);
    return {position.x(), position.y(), position.z(), rv.x(), rv.y(), rv.z()};
}

} // namespace teleop
} // namespace ur_teleop
