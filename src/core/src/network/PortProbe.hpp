/**
 * @file PortProbe.hpp
 * @brief Single TCP connect probe with timeout (Boost.Asio)
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <string>

namespace ur_teleop {
namespace network {

/**
 * Try to open a TCP connection to ip:port.
 *
 * @return true only if the connection completed before the timeout.
 *         Unparsable addresses, refused connections and timeouts all
 *         return false; this never throws.
 */
bool probePort(const std::string& ip, uint16_t port, std::chrono::milliseconds timeout);

/**
 * Probe function type, injectable for tests and simulated robots
 */
using PortProbeFn = std::function<bool(const std::string& ip, uint16_t port,
                                       std::chrono::milliseconds timeout)>;

/**
 * Convert fractional seconds from the config into a probe timeout
 */
inline std::chrono::milliseconds secondsToTimeout(double seconds) {
    return std::chrono::milliseconds(static_cast<int64_t>(seconds * 1000.0));
}

} // namespace network
} // namespace ur_teleop
