/**
 * @file RobotFinder.hpp
 * @brief Command-line robot finder: sweep the LAN, then verify each hit
 */

#pragma once

#include "../config/SystemConfig.hpp"
#include "../network/NetworkScanner.hpp"
#include "../robot/IRobotDriver.hpp"
#include <ostream>
#include <string>
#include <vector>

namespace ur_teleop {
namespace tools {

class RobotFinder {
public:
    RobotFinder(const config::SystemConfig& config,
                robot::RobotDriverFactory robotFactory,
                network::PortProbeFn probe = network::probePort);

    /**
     * Probe the RTDE port, then open a session and read the TCP pose.
     * Prints a ✓/✗ verdict per step.
     * @return true if the robot answered with a pose
     */
    bool checkRobot(const std::string& ip, std::ostream& out);

    /**
     * Sweep the configured networks with the short CLI timeout
     */
    std::vector<std::string> scan(std::ostream& out);

    /**
     * Full CLI run
     * @param ip Address to test, or empty to sweep
     * @return process exit code
     */
    int run(const std::string& ip, std::ostream& out);

private:
    config::SystemConfig m_config;
    robot::RobotDriverFactory m_robotFactory;
    network::PortProbeFn m_probe;
};

} // namespace tools
} // namespace ur_teleop
