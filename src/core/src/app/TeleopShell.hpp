/**
 * @file TeleopShell.hpp
 * @brief Teleop station window logic: view state, button actions, status log
 */

#pragma once

#include "ViewState.hpp"
#include "../config/SystemConfig.hpp"
#include "../gamepad/ControllerLayout.hpp"
#include "../gamepad/LinuxJoystick.hpp"
#include "../logging/StatusLogSink.hpp"
#include "../network/NetworkScanner.hpp"
#include "../recording/Recorder.hpp"
#include "../session/ConnectionManager.hpp"
#include "../teleop/GameControllerTeleop.hpp"
#include "../teleop/TeleopLoop.hpp"
#include <atomic>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace ur_teleop {
namespace app {

using ControllerDetector = std::function<std::optional<gamepad::ControllerInfo>()>;
using ControllerFactory = std::function<std::unique_ptr<gamepad::IGameController>()>;

/**
 * Hardware seams of the shell. Tests swap in simulators and fakes.
 */
struct ShellDependencies {
    robot::RobotDriverFactory robotFactory;
    robot::GripperFactory gripperFactory;
    network::PortProbeFn probe;                 // Scan and connect reachability
    ControllerDetector detectController;
    ControllerFactory openController;
    gamepad::ControllerLayout layout = gamepad::ControllerLayout::xbox360();

    /**
     * ur_rtde (or simulator) sessions, TCP probes and /dev/input/jsN
     */
    static ShellDependencies fromConfig(const config::SystemConfig& config,
                                        const gamepad::ControllerLayout& layout);
};

/**
 * Events produced since the last drainEvents() call
 */
struct ShellEvents {
    std::vector<std::string> logLines;
    std::vector<Notification> notifications;
};

/**
 * Teleop Shell
 *
 * Owns the scanner, connection, control loop and recorder and turns their
 * state into a ViewState. Actions are called from the IPC thread; scanner
 * and control-loop callbacks arrive on their own threads. Status lines and
 * dialogs are queued, the owner publishes them from a single thread.
 *
 * Every info-or-above log line becomes a status line through a
 * StatusLogSink registered on the logger while the shell exists.
 */
class TeleopShell {
public:
    TeleopShell(const config::SystemConfig& config, ShellDependencies deps);
    ~TeleopShell();

    // Non-copyable
    TeleopShell(const TeleopShell&) = delete;
    TeleopShell& operator=(const TeleopShell&) = delete;

    // ========================================================================
    // Robot Connection
    // ========================================================================

    /**
     * Start a background network scan
     * @return false if a scan is already running
     */
    bool scanNetwork();
    void stopScan();

    /**
     * Block until the current scan has completed
     */
    void waitForScan();

    void selectIp(const std::string& ip);

    bool connectRobot();
    void disconnectRobot();

    // ========================================================================
    // Controller
    // ========================================================================

    /**
     * Re-detect the game controller
     * @return true if a controller is present
     */
    bool refreshController();

    // ========================================================================
    // Speed / Robot Control
    // ========================================================================

    /**
     * Speed in percent of the base speeds, clamped to [1, 100]
     */
    void setSpeed(double percent);

    bool startControl();
    void stopControl();

    // ========================================================================
    // Recording
    // ========================================================================

    /**
     * Start or stop recording
     * @return false if nothing changed (recording needs a running control loop)
     */
    bool toggleRecording();

    bool saveRecording();

    /**
     * Window close: stop control and scanning
     */
    void shutdown();

    // ========================================================================
    // View
    // ========================================================================

    ViewState viewState() const;

    /**
     * Incremented on every visible change
     */
    uint64_t version() const { return m_version; }

    ShellEvents drainEvents();

    /**
     * Add a status line (already timestamped)
     */
    void appendStatusLine(const std::string& line);

    std::vector<std::string> statusHistory() const;

    std::string lastSavedPath() const;
    const recording::Recorder& recorder() const { return m_recorder; }
    const session::ConnectionManager& connection() const { return m_connection; }

    /**
     * "<n>%" label for a speed percentage
     */
    static std::string speedLabel(double percent);

private:
    void doStopControl();
    void stopRecording();
    void applySpeed(teleop::GameControllerTeleop& adapter, double percent) const;
    void onScanComplete(const std::vector<std::string>& robots, bool cancelled);
    void onControlError(const std::string& error);
    void notify(const std::string& level, const std::string& title, const std::string& message);
    void touch() { ++m_version; }

    config::SystemConfig m_config;
    ShellDependencies m_deps;

    network::NetworkScanner m_scanner;
    session::ConnectionManager m_connection;
    recording::Recorder m_recorder;

    // Serializes user actions
    std::mutex m_actionMutex;

    // Window state
    mutable std::mutex m_mutex;
    std::vector<std::string> m_robotIps;
    std::string m_selectedIp;
    bool m_scanning = false;
    uint64_t m_scansStarted = 0;
    uint64_t m_scansFinished = 0;
    bool m_connecting = false;
    std::string m_connectedIp;
    bool m_gripperConnected = false;
    bool m_controllerConnected = false;
    bool m_controllerChecked = false;
    bool m_controllerError = false;
    std::string m_controllerName;
    double m_speedPercent = 20.0;
    bool m_running = false;
    std::string m_recordStatusText = "Not Recording";
    std::string m_recordStatusColor = "gray";
    bool m_saveEnabled = false;
    std::string m_lastSavedPath;
    std::shared_ptr<teleop::GameControllerTeleop> m_teleop;
    std::unique_ptr<teleop::TeleopLoop> m_loop;

    // Status log and pending events (never log while holding this)
    mutable std::mutex m_logMutex;
    std::deque<std::string> m_statusHistory;
    size_t m_historyLimit;
    std::vector<std::string> m_pendingLines;
    std::vector<Notification> m_pendingNotifications;

    std::shared_ptr<StatusLogSinkMt> m_statusSink;
    std::atomic<uint64_t> m_version{0};
};

} // namespace app
} // namespace ur_teleop
