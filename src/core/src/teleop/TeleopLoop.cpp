#include "TeleopLoop.hpp"
#include "../logging/Logger.hpp"
#include <stdexcept>

namespace ur_teleop {
namespace teleop {

TeleopLoop::TeleopLoop(std::shared_ptr<ITeleopAdapter> adapter, int rateHz)
    : m_adapter(std::move(adapter))
    , m_period(std::chrono::microseconds(1000000 / (rateHz > 0 ? rateHz : 20))) {
    if (!m_adapter) {
        throw std::invalid_argument("TeleopLoop requires an adapter");
    }
}

TeleopLoop::~TeleopLoop() {
    stop();
}

bool TeleopLoop::start() {
    std::lock_guard<std::mutex> lock(m_lifecycleMutex);

    if (m_running) {
        LOG_WARN("TeleopLoop already running");
        return false;
    }

    // Reap a loop that ended on its own (error)
    if (m_thread.joinable()) {
        m_thread.join();
    }

    {
        std::lock_guard<std::mutex> statsLock(m_statsMutex);
        m_stats = Stats{};
        m_lastError.clear();
    }

    m_running = true;
    m_thread = std::thread(&TeleopLoop::controlLoop, this);
    return true;
}

void TeleopLoop::stop() {
    std::lock_guard<std::mutex> lock(m_lifecycleMutex);

    m_running = false;

    if (m_thread.joinable()) {
        if (m_thread.get_id() == std::this_thread::get_id()) {
            // Called from a callback on the loop thread; it exits on its own
            m_thread.detach();
        } else {
            m_thread.join();
        }
    }
}

std::string TeleopLoop::lastError() const {
    std::lock_guard<std::mutex> lock(m_statsMutex);
    return m_lastError;
}

TeleopLoop::Stats TeleopLoop::getStats() const {
    std::lock_guard<std::mutex> lock(m_statsMutex);
    return m_stats;
}

void TeleopLoop::controlLoop() {
    LOG_INFO("Control loop started ({} us period)", m_period.count());

    auto nextTick = std::chrono::steady_clock::now();

    try {
        while (m_running) {
            auto tickStart = std::chrono::steady_clock::now();

            robot::Twist twist = m_adapter->readTwistAndServoToTarget();
            m_adapter->readGripperDeltaAndMoveGripper();

            if (m_tickCallback) {
                m_tickCallback(twist);
            }

            auto tickEnd = std::chrono::steady_clock::now();
            double tickMs = std::chrono::duration<double, std::milli>(tickEnd - tickStart).count();

            nextTick += m_period;
            bool overrun = tickEnd > nextTick;
            {
                std::lock_guard<std::mutex> lock(m_statsMutex);
                ++m_stats.ticks;
                m_stats.lastTickMs = tickMs;
                if (tickMs > m_stats.maxTickMs) {
                    m_stats.maxTickMs = tickMs;
                }
                if (overrun) {
                    ++m_stats.overruns;
                }
            }

            if (overrun) {
                // Do not try to catch up with a burst of ticks
                LOG_DEBUG("Control loop overrun: tick took {:.1f} ms", tickMs);
                nextTick = tickEnd;
            } else {
                std::this_thread::sleep_until(nextTick);
            }
        }

    } catch (const std::exception& e) {
        std::string error = std::string("Control loop error: ") + e.what();
        LOG_ERROR("{}", error);
        {
            std::lock_guard<std::mutex> lock(m_statsMutex);
            m_lastError = error;
        }
        m_running = false;

        if (m_errorCallback) {
            m_errorCallback(error);
        }
    }

    LOG_INFO("Control loop ended");
}

} // namespace teleop
} // namespace ur_teleop
