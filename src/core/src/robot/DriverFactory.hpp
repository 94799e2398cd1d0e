/**
 * @file DriverFactory.hpp
 * @brief Selects ur_rtde or simulated sessions from configuration
 */

#pragma once

#include "IRobotDriver.hpp"
#include "../config/SystemConfig.hpp"

namespace ur_teleop {
namespace robot {

/**
 * True when `robot.driver` selects the simulator
 */
bool isSimulatedDriver(const config::RobotConfig& config);

RobotDriverFactory makeRobotDriverFactory(const config::RobotConfig& config);
GripperFactory makeGripperFactory(const config::RobotConfig& robotConfig,
                                  const config::GripperConfig& gripperConfig);

} // namespace robot
} // namespace ur_teleop
