/**
 * @file test_teleop_loop.cpp
 * @brief Fixed-rate control loop tests
 */

#include <gtest/gtest.h>
#include "teleop/TeleopLoop.hpp"
#include "logging/Logger.hpp"
#include "TestDoubles.hpp"
#include <atomic>
#include <mutex>
#include <stdexcept>

using namespace ur_teleop;
using namespace ur_teleop::teleop;
using ur_teleop::test::waitFor;

namespace {

/**
 * Counts calls; throws from readTwistAndServoToTarget() on tick `failAt` (1-based)
 */
class CountingAdapter : public ITeleopAdapter {
public:
    explicit CountingAdapter(int failAt = 0)
        : m_failAt(failAt) {}

    robot::Twist readTwistAndServoToTarget() override {
        int tick = ++twistCalls;
        if (m_failAt > 0 && tick >= m_failAt) {
            throw std::runtime_error("Robot not connected");
        }
        return {0.04, 0.0, 0.0, 0.0, 0.0, 0.0};
    }

    void readGripperDeltaAndMoveGripper() override {
        ++gripperCalls;
    }

    std::atomic<int> twistCalls{0};
    std::atomic<int> gripperCalls{0};

private:
    int m_failAt;
};

} // namespace

class TeleopLoopTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::init("test_teleop_loop.log", "debug");
    }
};

TEST_F(TeleopLoopTest, RejectsNullAdapter) {
    EXPECT_THROW(TeleopLoop loop(nullptr), std::invalid_argument);
}

TEST_F(TeleopLoopTest, PeriodFromRate) {
    auto adapter = std::make_shared<CountingAdapter>();
    TeleopLoop loop(adapter, 20);
    EXPECT_EQ(loop.period().count(), 50000);

    TeleopLoop fallback(adapter, 0);
    EXPECT_EQ(fallback.period().count(), 50000);
}

TEST_F(TeleopLoopTest, TicksAtConfiguredRate) {
    auto adapter = std::make_shared<CountingAdapter>();
    TeleopLoop loop(adapter, 50);

    std::atomic<int> callbacks{0};
    std::atomic<bool> twistSeen{false};
    loop.setTickCallback([&](const robot::Twist& twist) {
        ++callbacks;
        if (twist[0] == 0.04) {
            twistSeen = true;
        }
    });

    ASSERT_TRUE(loop.start());
    EXPECT_TRUE(loop.isRunning());
    std::this_thread::sleep_for(std::chrono::milliseconds(300));
    loop.stop();
    EXPECT_FALSE(loop.isRunning());

    // 300 ms at 50 Hz is ~15 ticks; allow for scheduler jitter
    int ticks = adapter->twistCalls;
    EXPECT_GE(ticks, 8);
    EXPECT_LE(ticks, 20);
    EXPECT_EQ(adapter->gripperCalls.load(), ticks);
    EXPECT_EQ(callbacks.load(), ticks);
    EXPECT_TRUE(twistSeen);

    auto stats = loop.getStats();
    EXPECT_EQ(stats.ticks, static_cast<uint64_t>(ticks));
    EXPECT_TRUE(loop.lastError().empty());
}

TEST_F(TeleopLoopTest, StartWhileRunningFails) {
    auto adapter = std::make_shared<CountingAdapter>();
    TeleopLoop loop(adapter, 20);

    ASSERT_TRUE(loop.start());
    EXPECT_FALSE(loop.start());
    loop.stop();
}

TEST_F(TeleopLoopTest, StopIsIdempotent) {
    auto adapter = std::make_shared<CountingAdapter>();
    TeleopLoop loop(adapter, 20);

    loop.stop();
    ASSERT_TRUE(loop.start());
    loop.stop();
    loop.stop();
    EXPECT_FALSE(loop.isRunning());
}

TEST_F(TeleopLoopTest, ErrorEndsLoopAndReports) {
    auto adapter = std::make_shared<CountingAdapter>(3);
    TeleopLoop loop(adapter, 100);

    std::mutex mutex;
    std::string reported;
    std::atomic<int> errors{0};
    loop.setErrorCallback([&](const std::string& error) {
        std::lock_guard<std::mutex> lock(mutex);
        reported = error;
        ++errors;
    });

    ASSERT_TRUE(loop.start());
    ASSERT_TRUE(waitFor([&] { return !loop.isRunning(); }));
    ASSERT_TRUE(waitFor([&] { return errors.load() == 1; }));

    EXPECT_EQ(loop.lastError(), "Control loop error: Robot not connected");
    {
        std::lock_guard<std::mutex> lock(mutex);
        EXPECT_EQ(reported, "Control loop error: Robot not connected");
    }
    // The failing tick never reached the gripper
    EXPECT_EQ(adapter->twistCalls.load(), 3);
    EXPECT_EQ(adapter->gripperCalls.load(), 2);

    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    EXPECT_EQ(adapter->twistCalls.load(), 3);
    EXPECT_EQ(errors.load(), 1);
}

TEST_F(TeleopLoopTest, RestartAfterError) {
    auto adapter = std::make_shared<CountingAdapter>(1);
    TeleopLoop loop(adapter, 100);

    ASSERT_TRUE(loop.start());
    ASSERT_TRUE(waitFor([&] { return !loop.isRunning(); }));
    EXPECT_FALSE(loop.lastError().empty());

    // Reaps the finished thread and clears the error
    ASSERT_TRUE(loop.start());
    ASSERT_TRUE(waitFor([&] { return !loop.isRunning(); }));
    EXPECT_EQ(adapter->twistCalls.load(), 2);
    loop.stop();
}

TEST_F(TeleopLoopTest, DestructorStopsLoop) {
    auto adapter = std::make_shared<CountingAdapter>();
    {
        TeleopLoop loop(adapter, 100);
        ASSERT_TRUE(loop.start());
        std::this_thread::sleep_for(std::chrono::milliseconds(30));
    }
    int calls = adapter->twistCalls;
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    EXPECT_EQ(adapter->twistCalls.load(), calls);
}
