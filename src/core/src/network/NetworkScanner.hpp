/**
 * @file NetworkScanner.hpp
 * @brief Sequential TCP sweep for UR controllers on local /24 networks
 */

#pragma once

#include "PortProbe.hpp"
#include <atomic>
#include <chrono>
#include <functional>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace ur_teleop {
namespace network {

/**
 * What to sweep
 */
struct ScanOptions {
    std::vector<std::string> networks = {"192.168.0", "192.168.1", "10.42.0"};
    uint16_t port = 30004;              // UR RTDE port
    int firstHost = 1;
    int lastHost = 254;
    std::chrono::milliseconds timeout{300};
};

/**
 * Brute-force scanner: probes every host of every network, one at a time.
 *
 * Runs on a single background thread. stop() is honoured between hosts;
 * the completion callback always fires, with whatever was found so far.
 */
class NetworkScanner {
public:
    using ProgressCallback = std::function<void(const std::string& network)>;
    using FoundCallback = std::function<void(const std::string& ip)>;
    using CompleteCallback = std::function<void(const std::vector<std::string>& robots,
                                                bool cancelled)>;

    explicit NetworkScanner(PortProbeFn probe = probePort);
    ~NetworkScanner();

    // Non-copyable
    NetworkScanner(const NetworkScanner&) = delete;
    NetworkScanner& operator=(const NetworkScanner&) = delete;

    /**
     * Start a background sweep
     * @return false if a sweep is already in progress
     */
    bool start(const ScanOptions& options);

    /**
     * Request cancellation (returns immediately)
     */
    void stop();

    /**
     * Block until the background sweep has finished
     */
    void wait();

    bool isScanning() const { return m_scanning; }

    /**
     * Sweep on the calling thread. Honours stop() from other threads.
     */
    std::vector<std::string> scanBlocking(const ScanOptions& options);

    void setProgressCallback(ProgressCallback cb) { m_progressCallback = std::move(cb); }
    void setFoundCallback(FoundCallback cb) { m_foundCallback = std::move(cb); }
    void setCompleteCallback(CompleteCallback cb) { m_completeCallback = std::move(cb); }

    /**
     * Number of probes attempted by the last (or current) sweep
     */
    size_t probesAttempted() const { return m_probes; }

    /**
     * Every address a sweep with these options would probe, in order
     */
    static std::vector<std::string> candidateAddresses(const ScanOptions& options);

private:
    std::vector<std::string> runSweep(const ScanOptions& options);

    PortProbeFn m_probe;

    std::thread m_thread;
    std::mutex m_threadMutex;
    std::atomic<bool> m_scanning{false};
    std::atomic<bool> m_cancelRequested{false};
    std::atomic<size_t> m_probes{0};

    ProgressCallback m_progressCallback;
    FoundCallback m_foundCallback;
    CompleteCallback m_completeCallback;
};

} // namespace network
} // namespace ur_teleop
