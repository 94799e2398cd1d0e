/**
 * @file RobotTypes.hpp
 * @brief Pose and twist types shared by drivers, teleop and recording
 */

#pragma once

#include <array>

namespace ur_teleop {
namespace robot {

/**
 * TCP pose in UR convention: x, y, z [m], rx, ry, rz rotation vector [rad]
 */
using Pose = std::array<double, 6>;

/**
 * Spatial velocity in the base frame: vx, vy, vz [m/s], wx, wy, wz [rad/s]
 */
using Twist = std::array<double, 6>;

constexpr Twist ZERO_TWIST{0.0, 0.0, 0.0, 0.0, 0.0, 0.0};

} // namespace robot
} // namespace ur_teleop
