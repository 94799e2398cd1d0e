/**
 * @file TeleopLoop.hpp
 * @brief Fixed-rate background thread driving a teleop adapter
 */

#pragma once

#include "GameControllerTeleop.hpp"
#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

namespace ur_teleop {
namespace teleop {

/**
 * Control loop
 *
 * Each tick: adapter.readTwistAndServoToTarget(), adapter.readGripperDeltaAndMoveGripper(),
 * then the tick callback (used for recording) with the commanded twist.
 * Any exception ends the loop and is reported through the error callback.
 */
class TeleopLoop {
public:
    using TickCallback = std::function<void(const robot::Twist&)>;
    using ErrorCallback = std::function<void(const std::string& error)>;

    struct Stats {
        uint64_t ticks = 0;
        uint64_t overruns = 0;
        double lastTickMs = 0.0;
        double maxTickMs = 0.0;
    };

    TeleopLoop(std::shared_ptr<ITeleopAdapter> adapter, int rateHz = 20);
    ~TeleopLoop();

    // Non-copyable
    TeleopLoop(const TeleopLoop&) = delete;
    TeleopLoop& operator=(const TeleopLoop&) = delete;

    /**
     * Start the loop thread
     * @return false if already running
     */
    bool start();

    /**
     * Stop the loop and join the thread. Idempotent
     */
    void stop();

    bool isRunning() const { return m_running; }

    /**
     * Error text of the tick that ended the loop (empty if none)
     */
    std::string lastError() const;

    Stats getStats() const;

    std::chrono::microseconds period() const { return m_period; }

    void setTickCallback(TickCallback cb) { m_tickCallback = std::move(cb); }
    void setErrorCallback(ErrorCallback cb) { m_errorCallback = std::move(cb); }

private:
    void controlLoop();

    std::shared_ptr<ITeleopAdapter> m_adapter;
    std::chrono::microseconds m_period;

    std::thread m_thread;
    std::atomic<bool> m_running{false};
    std::mutex m_lifecycleMutex;

    TickCallback m_tickCallback;
    ErrorCallback m_errorCallback;

    mutable std::mutex m_statsMutex;
    Stats m_stats;
    std::string m_lastError;
};

} // namespace teleop
} // namespace ur_teleop
