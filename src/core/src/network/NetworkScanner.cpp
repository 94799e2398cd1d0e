/**
 * @file NetworkScanner.cpp
 * @brief Network scanner implementation
 */

#include "NetworkScanner.hpp"
#include "../logging/Logger.hpp"

namespace ur_teleop {
namespace network {

NetworkScanner::NetworkScanner(PortProbeFn probe)
    : m_probe(probe ? std::move(probe) : PortProbeFn(probePort)) {
}

NetworkScanner::~NetworkScanner() {
    stop();
    wait();
}

bool NetworkScanner::start(const ScanOptions& options) {
    std::lock_guard<std::mutex> lock(m_threadMutex);

    if (m_scanning) {
        LOG_WARN("NetworkScanner: scan already in progress");
        return false;
    }

    // Reap a previous, already finished sweep
    if (m_thread.joinable()) {
        m_thread.join();
    }

    m_cancelRequested = false;
    m_scanning = true;

    m_thread = std::thread([this, options]() {
        std::vector<std::string> robots;
        try {
            robots = runSweep(options);
        } catch (const std::exception& e) {
            LOG_ERROR("Scan error: {}", e.what());
        }

        bool cancelled = m_cancelRequested;
        m_scanning = false;

        if (m_completeCallback) {
            m_completeCallback(robots, cancelled);
        }
    });

    return true;
}

void NetworkScanner::stop() {
    if (m_scanning) {
        LOG_DEBUG("NetworkScanner: cancellation requested");
    }
    m_cancelRequested = true;
}

void NetworkScanner::wait() {
    std::lock_guard<std::mutex> lock(m_threadMutex);
    if (m_thread.joinable() && m_thread.get_id() != std::this_thread::get_id()) {
        m_thread.join();
    }
}

std::vector<std::string> NetworkScanner::scanBlocking(const ScanOptions& options) {
    m_cancelRequested = false;
    return runSweep(options);
}

std::vector<std::string> NetworkScanner::candidateAddresses(const ScanOptions& options) {
    std::vector<std::string> addresses;
    for (const auto& network : options.networks) {
        for (int host = options.firstHost; host <= options.lastHost; ++host) {
            addresses.push_back(network + "." + std::to_string(host));
        }
    }
    return addresses;
}

std::vector<std::string> NetworkScanner::runSweep(const ScanOptions& options) {
    std::vector<std::string> robots;
    m_probes = 0;

    LOG_DEBUG("Starting network scan for UR robots (port {}, timeout {} ms)",
             options.port, options.timeout.count());

    for (const auto& network : options.networks) {
        if (m_cancelRequested) {
            break;
        }

        LOG_INFO("Scanning {}.x...", network);
        if (m_progressCallback) {
            m_progressCallback(network);
        }

        for (int host = options.firstHost; host <= options.lastHost; ++host) {
            if (m_cancelRequested) {
                break;
            }

            std::string ip = network + "." + std::to_string(host);
            ++m_probes;

            if (m_probe(ip, options.port, options.timeout)) {
                LOG_INFO("Found UR robot at {}", ip);
                robots.push_back(ip);
                if (m_foundCallback) {
                    m_foundCallback(ip);
                }
            }
        }
    }

    if (m_cancelRequested) {
        LOG_INFO("Network scan cancelled after {} probes", m_probes.load());
    } else {
        LOG_DEBUG("Network scan finished: {} probes, {} hit(s)", m_probes.load(), robots.size());
    }

    return robots;
}

} // namespace network
} // namespace ur_teleop
