/**
 * @file RobotFinder.cpp
 * @brief Robot finder: LAN sweep and per-robot session check
 */

#include "RobotFinder.hpp"
#include "../logging/Logger.hpp"
#include <stdexcept>

namespace ur_teleop {
namespace tools {

RobotFinder::RobotFinder(const config::SystemConfig& config,
                         robot::RobotDriverFactory robotFactory,
                         network::PortProbeFn probe)
    : m_config(config)
    , m_robotFactory(std::move(robotFactory))
    , m_probe(probe ? std::move(probe) : network::PortProbeFn(network::probePort)) {
    if (!m_robotFactory) {
        throw std::invalid_argument("RobotFinder requires a robot driver factory");
    }
}

bool RobotFinder::checkRobot(const std::string& ip, std::ostream& out) {
    uint16_t port = static_cast<uint16_t>(m_config.robot.rtde_port);
    out << "Testing connection to " << ip << "...\n";

    if (!m_probe(ip, port, network::secondsToTimeout(m_config.scan.cli_check_timeout_s))) {
        out << "✗ Cannot connect to RTDE port on " << ip << "\n";
        return false;
    }
    out << "✓ RTDE port (" << port << ") is open on " << ip << "\n";
    out << "Attempting robot connection...\n";

    try {
        auto robotDriver = m_robotFactory();
        if (!robotDriver) {
            throw std::runtime_error("no robot driver");
        }
        std::string error = robotDriver->connect(ip);
        if (!error.empty()) {
            throw std::runtime_error(error);
        }

        robot::Pose pose = robotDriver->getTcpPose();
        LOG_DEBUG("{} TCP pose: [{}, {}, {}, {}, {}, {}]", ip,
                  pose[0], pose[1], pose[2], pose[3], pose[4], pose[5]);
        robotDriver->disconnect();

        out << "✓ Robot connected successfully!\n";
        out << "✓ TCP pose retrieved - Robot is ready\n";
        return true;

    } catch (const std::exception& e) {
        out << "✗ Robot connection failed: " << e.what() << "\n";
        out << "  Robot may be in protective stop or wrong mode\n";
        return false;
    }
}

std::vector<std::string> RobotFinder::scan(std::ostream& out) {
    network::ScanOptions options;
    options.networks = m_config.scan.networks;
    options.port = static_cast<uint16_t>(m_config.scan.port);
    options.firstHost = m_config.scan.first_host;
    options.lastHost = m_config.scan.last_host;
    options.timeout = network::secondsToTimeout(m_config.scan.cli_timeout_s);

    network::NetworkScanner scanner(m_probe);
    scanner.setProgressCallback([&out](const std::string& network) {
        out << "\nScanning " << network << ".x...\n";
    });
    scanner.setFoundCallback([&out](const std::string& ip) {
        out << "Found potential robot at " << ip << "\n";
    });

    out << "Scanning for UR robots...\n";
    return scanner.scanBlocking(options);
}

int RobotFinder::run(const std::string& ip, std::ostream& out) {
    out << "UR3e Robot Finder\n";
    out << "================\n";

    if (!ip.empty()) {
        return checkRobot(ip, out) ? 0 : 1;
    }

    auto robots = scan(out);
    if (robots.empty()) {
        out << "\nNo robots found on network\n";
        out << "\nTo test a specific IP: ur_find_robot <IP_ADDRESS>\n";
        return 1;
    }

    out << "\nFound " << robots.size() << " potential robot(s):\n";
    bool anyReady = false;
    for (const auto& robotIp : robots) {
        out << "\nTesting " << robotIp << ":\n";
        if (checkRobot(robotIp, out)) {
            anyReady = true;
        }
    }
    return anyReady ? 0 : 1;
}

} // namespace tools
} // namespace ur_teleop
