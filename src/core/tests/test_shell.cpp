/**
 * @file test_shell.cpp
 * @brief Teleop window logic tests (simulated robot, fake controller)
 *
 * Tests:
 * 1. Initial view and derived labels/colors
 * 2. Scan fills the IP list and selects the first hit, back-to-back sweeps
 * 3. Connect / disconnect and the error dialogs
 * 4. Controller detection states
 * 5. Start / stop control, speed slider, loop errors
 * 6. Recording: toggle, status text, save to JSON
 * 7. Status log history
 */

#include <gtest/gtest.h>
#include "app/TeleopShell.hpp"
#include "robot/RobotSimulator.hpp"
#include "logging/Logger.hpp"
#include "TestDoubles.hpp"
#include <algorithm>
#include <atomic>
#include <cmath>
#include <filesystem>
#include <regex>
#include <set>
#include <thread>

using namespace ur_teleop;
using namespace ur_teleop::app;
using ur_teleop::test::FakeController;
using ur_teleop::test::waitFor;

namespace fs = std::filesystem;

// ============================================================================
// Test Fixture
// ============================================================================

class TeleopShellTest : public ::testing::Test {
protected:
    static constexpr int LY = 1;

    void SetUp() override {
        Logger::init("test_shell.log", "debug");

        recordingDir = fs::temp_directory_path() / "ur_teleop_test_shell";
        fs::remove_all(recordingDir);

        config.robot.driver = "ur_rtde";            // probe before connecting
        config.scan.timeout_s = 0.01;
        config.teleop.control_rate_hz = 50;
        config.recording.directory = recordingDir.string();
    }

    void TearDown() override {
        shell.reset();
        fs::remove_all(recordingDir);
    }

    ShellDependencies dependencies() {
        ShellDependencies deps;
        deps.robotFactory = [this]() -> std::unique_ptr<robot::IRobotDriver> {
            auto sim = std::make_unique<robot::RobotSimulator>();
            if (!robotFault.empty()) sim->setFault(robotFault);
            return sim;
        };
        deps.gripperFactory = []() -> std::unique_ptr<robot::IGripper> {
            return std::make_unique<robot::GripperSimulator>();
        };
        deps.probe = [this](const std::string& ip, uint16_t, std::chrono::milliseconds) {
            return reachable.count(ip) > 0;
        };
        deps.detectController = [this]() -> std::optional<gamepad::ControllerInfo> {
            if (detectorThrows) {
                throw std::runtime_error("permission denied on /dev/input/js0");
            }
            if (!controllerPresent) {
                return std::nullopt;
            }
            gamepad::ControllerInfo info;
            info.name = "Fake Xbox 360 Controller";
            info.devicePath = "/dev/input/js0";
            info.numAxes = 6;
            info.numButtons = 11;
            return info;
        };
        deps.openController = [this]() -> std::unique_ptr<gamepad::IGameController> {
            if (!controllerPresent) {
                return nullptr;
            }
            auto pad = std::make_unique<FakeController>();
            lastPad = pad.get();
            if (padSetup) padSetup(*pad);
            return pad;
        };
        return deps;
    }

    TeleopShell& makeShell() {
        shell = std::make_unique<TeleopShell>(config, dependencies());
        return *shell;
    }

    // Connected robot, detected controller, control loop running
    void startRunning() {
        auto& s = shell ? *shell : makeShell();
        s.selectIp("10.42.0.7");
        ASSERT_TRUE(s.connectRobot());
        ASSERT_TRUE(s.refreshController());
        ASSERT_TRUE(s.startControl());
    }

    std::vector<Notification> notifications() {
        return shell->drainEvents().notifications;
    }

    bool logContains(const std::string& text) const {
        auto history = shell->statusHistory();
        return std::any_of(history.begin(), history.end(), [&](const std::string& line) {
            return line.find(text) != std::string::npos;
        });
    }

    config::SystemConfig config;
    fs::path recordingDir;
    std::set<std::string> reachable{"10.42.0.7", "192.168.1.20"};
    std::string robotFault;
    bool controllerPresent = true;
    bool detectorThrows = false;
    std::function<void(FakeController&)> padSetup;
    FakeController* lastPad = nullptr;
    std::unique_ptr<TeleopShell> shell;
};

// ============================================================================
// Initial view
// ============================================================================

TEST_F(TeleopShellTest, InitialView) {
    auto& s = makeShell();
    ViewState view = s.viewState();

    EXPECT_TRUE(view.robot_ips.empty());
    EXPECT_TRUE(view.selected_ip.empty());
    EXPECT_EQ(view.scan_button_text, "Scan Network");
    EXPECT_TRUE(view.scan_enabled);
    EXPECT_FALSE(view.robot_connected);
    EXPECT_EQ(view.robot_status_text, "Not Connected");
    EXPECT_EQ(view.robot_status_color, "red");
    EXPECT_EQ(view.connect_button_text, "Connect Robot");
    EXPECT_TRUE(view.connect_enabled);
    EXPECT_EQ(view.controller_status_text, "Checking...");
    EXPECT_DOUBLE_EQ(view.speed_percent, 20.0);
    EXPECT_EQ(view.speed_label, "20%");
    EXPECT_FALSE(view.running);
    EXPECT_FALSE(view.start_enabled);
    EXPECT_FALSE(view.stop_enabled);
    EXPECT_FALSE(view.record_enabled);
    EXPECT_EQ(view.record_button_text, "Start Recording");
    EXPECT_EQ(view.record_status_text, "Not Recording");
    EXPECT_FALSE(view.save_enabled);
}

TEST_F(TeleopShellTest, DefaultIpFromConfig) {
    config.robot.default_ip = "192.168.1.20";
    auto& s = makeShell();
    EXPECT_EQ(s.viewState().selected_ip, "192.168.1.20");
}

TEST_F(TeleopShellTest, ViewStateSerializes) {
    auto& s = makeShell();
    nlohmann::json j = s.viewState();
    EXPECT_EQ(j["robot_status_text"], "Not Connected");
    EXPECT_EQ(j["speed_label"], "20%");
    EXPECT_TRUE(j["status_log"].is_array());

    ViewState back = j.get<ViewState>();
    EXPECT_EQ(back.connect_button_text, "Connect Robot");
}

// ============================================================================
// Scan
// ============================================================================

TEST_F(TeleopShellTest, ScanFillsListAndSelectsFirst) {
    auto& s = makeShell();
    ASSERT_TRUE(s.scanNetwork());
    s.waitForScan();

    ViewState view = s.viewState();
    std::vector<std::string> expected = {"192.168.1.20", "10.42.0.7"};
    EXPECT_EQ(view.robot_ips, expected);
    EXPECT_EQ(view.selected_ip, "192.168.1.20");
    EXPECT_FALSE(view.scanning);
    EXPECT_EQ(view.scan_button_text, "Scan Network");

    EXPECT_TRUE(logContains("Scanning for UR robots..."));
    EXPECT_TRUE(logContains("Scanning 192.168.0.x..."));
    EXPECT_TRUE(logContains("Found UR robot at 10.42.0.7"));
    EXPECT_TRUE(logContains("Found 2 robot(s): 192.168.1.20, 10.42.0.7"));
}

TEST_F(TeleopShellTest, ScanWithNoRobots) {
    reachable.clear();
    auto& s = makeShell();
    s.selectIp("10.0.0.1");
    ASSERT_TRUE(s.scanNetwork());
    s.waitForScan();

    ViewState view = s.viewState();
    EXPECT_TRUE(view.robot_ips.empty());
    EXPECT_EQ(view.selected_ip, "10.0.0.1");
    EXPECT_TRUE(logContains("No robots found on network"));
}

TEST_F(TeleopShellTest, EmptyScanKeepsPreviousList) {
    auto& s = makeShell();
    ASSERT_TRUE(s.scanNetwork());
    s.waitForScan();
    ASSERT_EQ(s.viewState().robot_ips.size(), 2u);

    reachable.clear();
    s.selectIp("10.42.0.7");
    ASSERT_TRUE(s.scanNetwork());
    s.waitForScan();

    ViewState view = s.viewState();
    std::vector<std::string> expected = {"192.168.1.20", "10.42.0.7"};
    EXPECT_EQ(view.robot_ips, expected);
    EXPECT_EQ(view.selected_ip, "10.42.0.7");
    EXPECT_TRUE(logContains("No robots found on network"));
}

TEST_F(TeleopShellTest, RescanRightAfterCompletionStaysScanning) {
    config.scan.networks = {"10.42.0"};
    config.scan.first_host = 7;
    config.scan.last_host = 7;

    std::atomic<int> probes{0};
    std::atomic<bool> release{false};
    auto deps = dependencies();
    deps.probe = [&probes, &release](const std::string&, uint16_t, std::chrono::milliseconds) {
        if (++probes >= 2) {
            while (!release) {
                std::this_thread::sleep_for(std::chrono::milliseconds(1));
            }
        }
        return false;
    };
    shell = std::make_unique<TeleopShell>(config, deps);

    // Second sweep is requested as soon as the first one lets go of the scanner
    ASSERT_TRUE(shell->scanNetwork());
    while (!shell->scanNetwork()) {
    }

    EXPECT_TRUE(waitFor([&] { return probes >= 2; }));
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    ViewState view = shell->viewState();
    EXPECT_TRUE(view.scanning);
    EXPECT_FALSE(view.scan_enabled);

    release = true;
    shell->waitForScan();
    EXPECT_FALSE(shell->viewState().scanning);
    EXPECT_TRUE(shell->viewState().scan_enabled);
    shell.reset();
}

TEST_F(TeleopShellTest, ScanButtonDisabledWhileScanning) {
    std::atomic<bool> release{false};
    auto deps = dependencies();
    deps.probe = [&release](const std::string&, uint16_t, std::chrono::milliseconds) {
        while (!release) {
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
        }
        return false;
    };
    shell = std::make_unique<TeleopShell>(config, deps);

    ASSERT_TRUE(shell->scanNetwork());
    ViewState view = shell->viewState();
    EXPECT_TRUE(view.scanning);
    EXPECT_EQ(view.scan_button_text, "Scanning...");
    EXPECT_FALSE(view.scan_enabled);
    EXPECT_FALSE(shell->scanNetwork());

    shell->stopScan();
    release = true;
    shell->waitForScan();
    EXPECT_FALSE(shell->viewState().scanning);
    shell.reset();
}

TEST_F(TeleopShellTest, SelectIpTrimsWhitespace) {
    auto& s = makeShell();
    s.selectIp("  10.42.0.7 \n");
    EXPECT_EQ(s.viewState().selected_ip, "10.42.0.7");
}

// ============================================================================
// Connect
// ============================================================================

TEST_F(TeleopShellTest, ConnectWithoutIpShowsError) {
    auto& s = makeShell();
    EXPECT_FALSE(s.connectRobot());

    auto dialogs = notifications();
    ASSERT_EQ(dialogs.size(), 1u);
    EXPECT_EQ(dialogs[0].level, "error");
    EXPECT_EQ(dialogs[0].title, "Error");
    EXPECT_EQ(dialogs[0].message, "Please select or enter robot IP address");
}

TEST_F(TeleopShellTest, ConnectSuccess) {
    auto& s = makeShell();
    s.selectIp("10.42.0.7");
    ASSERT_TRUE(s.connectRobot());

    ViewState view = s.viewState();
    EXPECT_TRUE(view.robot_connected);
    EXPECT_FALSE(view.connecting);
    EXPECT_EQ(view.robot_status_text, "Connected to 10.42.0.7");
    EXPECT_EQ(view.robot_status_color, "green");
    EXPECT_EQ(view.connect_button_text, "Disconnect");
    EXPECT_TRUE(view.gripper_connected);
    EXPECT_TRUE(notifications().empty());
    EXPECT_TRUE(logContains("Robot connected successfully"));
}

TEST_F(TeleopShellTest, UnreachableRobotShowsConnectionError) {
    auto& s = makeShell();
    s.selectIp("10.42.0.99");
    EXPECT_FALSE(s.connectRobot());

    auto dialogs = notifications();
    ASSERT_EQ(dialogs.size(), 1u);
    EXPECT_EQ(dialogs[0].title, "Connection Error");
    EXPECT_EQ(dialogs[0].message,
              "Cannot reach robot at 10.42.0.99:30004. Check IP and network connection.");
    EXPECT_EQ(s.viewState().robot_status_text, "Not Connected");
}

TEST_F(TeleopShellTest, NotReadyRobotShowsWarning) {
    robotFault = "Robot is in protective stop";
    auto& s = makeShell();
    s.selectIp("10.42.0.7");
    EXPECT_TRUE(s.connectRobot());

    auto dialogs = notifications();
    ASSERT_EQ(dialogs.size(), 1u);
    EXPECT_EQ(dialogs[0].level, "warning");
    EXPECT_EQ(dialogs[0].title, "Robot State");
    EXPECT_EQ(dialogs[0].message, session::ConnectionManager::NOT_READY_WARNING);
    EXPECT_TRUE(s.viewState().robot_connected);
}

TEST_F(TeleopShellTest, Disconnect) {
    auto& s = makeShell();
    s.selectIp("10.42.0.7");
    ASSERT_TRUE(s.connectRobot());
    s.disconnectRobot();

    ViewState view = s.viewState();
    EXPECT_FALSE(view.robot_connected);
    EXPECT_EQ(view.connect_button_text, "Connect Robot");
    EXPECT_FALSE(view.gripper_connected);
    EXPECT_TRUE(logContains("Robot disconnected (10.42.0.7)"));
}

// ============================================================================
// Controller
// ============================================================================

TEST_F(TeleopShellTest, ControllerDetected) {
    auto& s = makeShell();
    EXPECT_TRUE(s.refreshController());

    ViewState view = s.viewState();
    EXPECT_TRUE(view.controller_connected);
    EXPECT_EQ(view.controller_name, "Fake Xbox 360 Controller");
    EXPECT_EQ(view.controller_status_text, "Connected: Fake Xbox 360 Controller");
    EXPECT_EQ(view.controller_status_color, "green");
    EXPECT_TRUE(logContains("Controller detected: Fake Xbox 360 Controller"));
}

TEST_F(TeleopShellTest, NoControllerDetected) {
    controllerPresent = false;
    auto& s = makeShell();
    EXPECT_FALSE(s.refreshController());

    ViewState view = s.viewState();
    EXPECT_FALSE(view.controller_connected);
    EXPECT_EQ(view.controller_status_text, "No Controller Detected");
    EXPECT_EQ(view.controller_status_color, "red");
    EXPECT_TRUE(logContains("No controller detected"));
}

TEST_F(TeleopShellTest, ControllerDetectionError) {
    detectorThrows = true;
    auto& s = makeShell();
    EXPECT_FALSE(s.refreshController());

    ViewState view = s.viewState();
    EXPECT_EQ(view.controller_status_text, "Controller Error");
    EXPECT_EQ(view.controller_status_color, "red");
    EXPECT_TRUE(logContains("Controller error: permission denied on /dev/input/js0"));
}

TEST_F(TeleopShellTest, ControllerReplugged) {
    controllerPresent = false;
    auto& s = makeShell();
    EXPECT_FALSE(s.refreshController());

    controllerPresent = true;
    EXPECT_TRUE(s.refreshController());
    EXPECT_TRUE(s.viewState().controller_connected);
}

// ============================================================================
// Speed
// ============================================================================

TEST_F(TeleopShellTest, SpeedClampedAndLabelled) {
    auto& s = makeShell();

    s.setSpeed(55.4);
    EXPECT_DOUBLE_EQ(s.viewState().speed_percent, 55.4);
    EXPECT_EQ(s.viewState().speed_label, "55%");

    s.setSpeed(150.0);
    EXPECT_DOUBLE_EQ(s.viewState().speed_percent, 100.0);
    EXPECT_EQ(s.viewState().speed_label, "100%");

    s.setSpeed(0.0);
    EXPECT_DOUBLE_EQ(s.viewState().speed_percent, 1.0);
    EXPECT_EQ(s.viewState().speed_label, "1%");

    s.setSpeed(std::nan(""));
    EXPECT_DOUBLE_EQ(s.viewState().speed_percent, 1.0);
}

TEST_F(TeleopShellTest, SpeedLabel) {
    EXPECT_EQ(TeleopShell::speedLabel(20.0), "20%");
    EXPECT_EQ(TeleopShell::speedLabel(99.6), "100%");
}

TEST_F(TeleopShellTest, SpeedChangeReachesRunningLoop) {
    padSetup = [](FakeController& pad) { pad.setAxis(LY, -1.0); };
    startRunning();

    shell->setSpeed(100.0);
    ASSERT_TRUE(shell->toggleRecording());
    ASSERT_TRUE(waitFor([this] { return shell->recorder().size() >= 3; }));
    ASSERT_TRUE(shell->toggleRecording());

    // Full stick forward at 100% of 0.2 m/s
    EXPECT_NEAR(shell->recorder().samples().back().twist[0], 0.2, 1e-9);
}

// ============================================================================
// Robot control
// ============================================================================

TEST_F(TeleopShellTest, StartRequiresRobotAndController) {
    auto& s = makeShell();
    ASSERT_TRUE(s.refreshController());
    EXPECT_FALSE(s.startControl());

    auto dialogs = notifications();
    ASSERT_EQ(dialogs.size(), 1u);
    EXPECT_EQ(dialogs[0].title, "Error");
    EXPECT_EQ(dialogs[0].message, "Robot and controller must be connected");
}

TEST_F(TeleopShellTest, StartEnabledOnlyWhenReady) {
    auto& s = makeShell();
    s.selectIp("10.42.0.7");
    ASSERT_TRUE(s.connectRobot());
    EXPECT_FALSE(s.viewState().start_enabled);

    ASSERT_TRUE(s.refreshController());
    EXPECT_TRUE(s.viewState().start_enabled);
}

TEST_F(TeleopShellTest, StartAndStopControl) {
    startRunning();

    ViewState view = shell->viewState();
    EXPECT_TRUE(view.running);
    EXPECT_FALSE(view.start_enabled);
    EXPECT_TRUE(view.stop_enabled);
    EXPECT_TRUE(view.record_enabled);
    EXPECT_TRUE(logContains("Robot control started - Use Xbox controller to move robot"));
    EXPECT_FALSE(shell->startControl());

    ASSERT_NE(lastPad, nullptr);
    ASSERT_TRUE(waitFor([this] { return lastPad->polls() >= 3; }));

    shell->stopControl();
    view = shell->viewState();
    EXPECT_FALSE(view.running);
    EXPECT_TRUE(view.start_enabled);
    EXPECT_FALSE(view.stop_enabled);
    EXPECT_FALSE(view.record_enabled);
    EXPECT_TRUE(logContains("Robot control stopped"));

    auto arm = std::dynamic_pointer_cast<robot::RobotSimulator>(shell->connection().robot());
    ASSERT_NE(arm, nullptr);
    EXPECT_TRUE(arm->servoStopped());
    EXPECT_GE(arm->servoCount(), 3u);
}

TEST_F(TeleopShellTest, ControllerCannotBeOpened) {
    auto& s = makeShell();
    s.selectIp("10.42.0.7");
    ASSERT_TRUE(s.connectRobot());
    ASSERT_TRUE(s.refreshController());

    controllerPresent = false;      // unplugged after detection
    EXPECT_FALSE(s.startControl());

    auto dialogs = notifications();
    ASSERT_EQ(dialogs.size(), 1u);
    EXPECT_EQ(dialogs[0].message, "Failed to start control: Cannot open game controller");
    EXPECT_FALSE(s.viewState().running);
}

TEST_F(TeleopShellTest, ControlErrorStopsLoopAndNotifies) {
    startRunning();
    shell->drainEvents();

    lastPad->setConnected(false);
    ASSERT_TRUE(waitFor([this] { return !shell->viewState().running; }));

    std::vector<Notification> dialogs;
    ASSERT_TRUE(waitFor([&] {
        auto batch = notifications();
        dialogs.insert(dialogs.end(), batch.begin(), batch.end());
        return !dialogs.empty();
    }));
    EXPECT_EQ(dialogs[0].level, "error");
    EXPECT_EQ(dialogs[0].title, "Control Error");
    EXPECT_EQ(dialogs[0].message, "Control loop error: Game controller disconnected");

    // Robot and controller still flagged: the operator can start again
    EXPECT_TRUE(shell->viewState().start_enabled);
    lastPad = nullptr;
    EXPECT_TRUE(shell->startControl());
    shell->stopControl();
}

TEST_F(TeleopShellTest, ConnectWhileRunningStopsControl) {
    startRunning();
    shell->selectIp("192.168.1.20");
    ASSERT_TRUE(shell->connectRobot());

    ViewState view = shell->viewState();
    EXPECT_FALSE(view.running);
    EXPECT_EQ(view.robot_status_text, "Connected to 192.168.1.20");
}

TEST_F(TeleopShellTest, DisconnectWhileRunningStopsControl) {
    startRunning();
    shell->disconnectRobot();

    ViewState view = shell->viewState();
    EXPECT_FALSE(view.running);
    EXPECT_FALSE(view.robot_connected);
    EXPECT_FALSE(view.start_enabled);
}

// ============================================================================
// Recording
// ============================================================================

TEST_F(TeleopShellTest, RecordingNeedsRunningControl) {
    auto& s = makeShell();
    EXPECT_FALSE(s.toggleRecording());
    EXPECT_FALSE(s.viewState().recording);
    EXPECT_TRUE(logContains("Start robot control before recording"));
}

TEST_F(TeleopShellTest, RecordAndSave) {
    startRunning();

    ASSERT_TRUE(shell->toggleRecording());
    ViewState view = shell->viewState();
    EXPECT_TRUE(view.recording);
    EXPECT_EQ(view.record_button_text, "Stop Recording");
    EXPECT_EQ(view.record_status_text, "Recording...");
    EXPECT_EQ(view.record_status_color, "red");
    EXPECT_FALSE(view.save_enabled);

    ASSERT_TRUE(waitFor([this] { return shell->recorder().size() >= 5; }));

    // Saving is refused while recording
    EXPECT_FALSE(shell->saveRecording());
    auto dialogs = notifications();
    ASSERT_EQ(dialogs.size(), 1u);
    EXPECT_EQ(dialogs[0].message, "Stop recording before saving");

    ASSERT_TRUE(shell->toggleRecording());
    view = shell->viewState();
    size_t points = view.recorded_points;
    EXPECT_GE(points, 5u);
    EXPECT_FALSE(view.recording);
    EXPECT_EQ(view.record_button_text, "Start Recording");
    EXPECT_EQ(view.record_status_text, "Recorded " + std::to_string(points) + " points");
    EXPECT_EQ(view.record_status_color, "blue");
    EXPECT_TRUE(view.save_enabled);
    EXPECT_TRUE(logContains("Recording stopped - " + std::to_string(points) + " data points"));

    ASSERT_TRUE(shell->saveRecording());
    EXPECT_FALSE(shell->viewState().save_enabled);

    std::string path = shell->lastSavedPath();
    ASSERT_TRUE(fs::exists(path));
    EXPECT_EQ(fs::path(path).parent_path().string(), recordingDir.string());

    dialogs = notifications();
    ASSERT_EQ(dialogs.size(), 1u);
    EXPECT_EQ(dialogs[0].level, "info");
    EXPECT_EQ(dialogs[0].title, "Success");
    EXPECT_EQ(dialogs[0].message, "Recording saved to " + path);

    auto recording = recording::Recorder::load(path);
    ASSERT_TRUE(recording.has_value());
    EXPECT_EQ(recording->metadata.robotIp, "10.42.0.7");
    EXPECT_EQ(recording->metadata.dataPoints, points);
    ASSERT_EQ(recording->samples.size(), points);
    ASSERT_TRUE(recording->samples[0].gripperWidth.has_value());
    EXPECT_DOUBLE_EQ(*recording->samples[0].gripperWidth, 0.085);

    shell->stopControl();
}

TEST_F(TeleopShellTest, SaveWithoutDataWarns) {
    auto& s = makeShell();
    EXPECT_FALSE(s.saveRecording());

    auto dialogs = notifications();
    ASSERT_EQ(dialogs.size(), 1u);
    EXPECT_EQ(dialogs[0].level, "warning");
    EXPECT_EQ(dialogs[0].message, "No recording data to save");
}

TEST_F(TeleopShellTest, StopControlEndsRecording) {
    startRunning();
    ASSERT_TRUE(shell->toggleRecording());
    ASSERT_TRUE(waitFor([this] { return shell->recorder().size() >= 2; }));

    shell->stopControl();
    ViewState view = shell->viewState();
    EXPECT_FALSE(view.recording);
    EXPECT_TRUE(view.save_enabled);
    EXPECT_EQ(view.record_status_color, "blue");
}

TEST_F(TeleopShellTest, ControlErrorEndsRecording) {
    startRunning();
    ASSERT_TRUE(shell->toggleRecording());
    ASSERT_TRUE(waitFor([this] { return shell->recorder().size() >= 2; }));

    lastPad->setConnected(false);
    ASSERT_TRUE(waitFor([this] { return !shell->viewState().recording; }));
    EXPECT_TRUE(shell->viewState().save_enabled);
    EXPECT_TRUE(shell->saveRecording());
}

// ============================================================================
// Status log
// ============================================================================

TEST_F(TeleopShellTest, StatusLinesAreTimestamped) {
    auto& s = makeShell();
    s.refreshController();

    auto history = s.statusHistory();
    ASSERT_FALSE(history.empty());
    std::regex stamped(R"(^\[\d{2}:\d{2}:\d{2}\] .+)");
    for (const auto& line : history) {
        EXPECT_TRUE(std::regex_match(line, stamped)) << line;
    }
}

TEST_F(TeleopShellTest, DebugLinesStayOutOfStatusLog) {
    auto& s = makeShell();
    LOG_DEBUG("internal detail");
    EXPECT_FALSE(logContains("internal detail"));
    LOG_INFO("operator message");
    EXPECT_TRUE(logContains("operator message"));
}

TEST_F(TeleopShellTest, StatusHistoryIsBounded) {
    config.logging.status_history = 5;
    auto& s = makeShell();
    s.drainEvents();

    for (int i = 0; i < 10; ++i) {
        s.appendStatusLine("[00:00:0" + std::to_string(i) + "] line " + std::to_string(i));
    }

    auto history = s.statusHistory();
    ASSERT_EQ(history.size(), 5u);
    EXPECT_EQ(history.front(), "[00:00:05] line 5");
    EXPECT_EQ(history.back(), "[00:00:09] line 9");
    EXPECT_EQ(s.viewState().status_log, history);
}

TEST_F(TeleopShellTest, DrainEventsReturnsEachLineOnce) {
    auto& s = makeShell();
    s.drainEvents();

    LOG_INFO("first");
    LOG_INFO("second");

    auto events = s.drainEvents();
    ASSERT_EQ(events.logLines.size(), 2u);
    EXPECT_NE(events.logLines[0].find("first"), std::string::npos);
    EXPECT_NE(events.logLines[1].find("second"), std::string::npos);
    EXPECT_TRUE(s.drainEvents().logLines.empty());
}

TEST_F(TeleopShellTest, VersionChangesOnUpdate) {
    auto& s = makeShell();
    uint64_t before = s.version();
    s.setSpeed(42.0);
    EXPECT_GT(s.version(), before);
}

TEST_F(TeleopShellTest, DestroyingShellDetachesStatusSink) {
    makeShell();
    shell.reset();
    // Logging after the shell is gone must not touch it
    EXPECT_NO_THROW(LOG_INFO("after shell"));
}
