/**
 * @file TeleopShell.cpp
 * @brief Teleop station window logic implementation
 */

#include "TeleopShell.hpp"
#include "../logging/Logger.hpp"
#include "../robot/DriverFactory.hpp"
#include <algorithm>
#include <cmath>
#include <cstdio>

namespace ur_teleop {
namespace app {

namespace {

std::string trim(const std::string& text) {
    const char* whitespace = " \t\r\n";
    auto begin = text.find_first_not_of(whitespace);
    if (begin == std::string::npos) {
        return "";
    }
    auto end = text.find_last_not_of(whitespace);
    return text.substr(begin, end - begin + 1);
}

std::string joinIps(const std::vector<std::string>& ips) {
    std::string joined;
    for (size_t i = 0; i < ips.size(); ++i) {
        if (i > 0) joined += ", ";
        joined += ips[i];
    }
    return joined;
}

session::ConnectionOptions connectionOptions(const config::SystemConfig& config) {
    session::ConnectionOptions options;
    options.rtdePort = static_cast<uint16_t>(config.robot.rtde_port);
    options.reachTimeout = network::secondsToTimeout(config.robot.connect_timeout_s);
    options.probeReachability = !robot::isSimulatedDriver(config.robot);
    return options;
}

} // namespace

// ============================================================================
// Dependencies
// ============================================================================

ShellDependencies ShellDependencies::fromConfig(const config::SystemConfig& config,
                                                const gamepad::ControllerLayout& layout) {
    ShellDependencies deps;
    deps.robotFactory = robot::makeRobotDriverFactory(config.robot);
    deps.gripperFactory = robot::makeGripperFactory(config.robot, config.gripper);
    deps.probe = network::probePort;
    deps.layout = layout;

    std::string deviceDir = config.controller.device_dir;
    int index = config.controller.index;

    deps.detectController = [deviceDir, index]() {
        return gamepad::detectController(deviceDir, index);
    };

    deps.openController = [deviceDir, index]() -> std::unique_ptr<gamepad::IGameController> {
        auto path = gamepad::LinuxJoystick::devicePathForIndex(deviceDir, index);
        if (!path) {
            return nullptr;
        }
        auto joystick = std::make_unique<gamepad::LinuxJoystick>(*path);
        if (!joystick->open()) {
            return nullptr;
        }
        return joystick;
    };

    return deps;
}

// ============================================================================
// Construction
// ============================================================================

TeleopShell::TeleopShell(const config::SystemConfig& config, ShellDependencies deps)
    : m_config(config)
    , m_deps(std::move(deps))
    , m_scanner(m_deps.probe)
    , m_connection(m_deps.robotFactory, m_deps.gripperFactory,
                   connectionOptions(config), m_deps.probe)
    , m_selectedIp(config.robot.default_ip)
    , m_speedPercent(std::clamp(config.teleop.default_speed_percent, 1.0, 100.0))
    , m_historyLimit(config.logging.status_history > 0
                         ? static_cast<size_t>(config.logging.status_history) : 500) {

    m_scanner.setCompleteCallback(
        [this](const std::vector<std::string>& robots, bool cancelled) {
            onScanComplete(robots, cancelled);
        });

    m_statusSink = std::make_shared<StatusLogSinkMt>(
        [this](const std::string& line) { appendStatusLine(line); });
    Logger::addSink(m_statusSink);
}

TeleopShell::~TeleopShell() {
    shutdown();
    Logger::removeSink(m_statusSink);
    m_statusSink->detach();
}

// ============================================================================
// Robot Connection
// ============================================================================

bool TeleopShell::scanNetwork() {
    std::lock_guard<std::mutex> action(m_actionMutex);

    if (m_scanner.isScanning()) {
        LOG_WARN("Scan already in progress");
        return false;
    }

    network::ScanOptions options;
    options.networks = m_config.scan.networks;
    options.port = static_cast<uint16_t>(m_config.scan.port);
    options.firstHost = m_config.scan.first_host;
    options.lastHost = m_config.scan.last_host;
    options.timeout = network::secondsToTimeout(m_config.scan.timeout_s);

    LOG_INFO("Scanning for UR robots...");

    {
        std::lock_guard<std::mutex> lock(m_mutex);
        ++m_scansStarted;
        m_scanning = true;
    }
    touch();

    if (!m_scanner.start(options)) {
        std::lock_guard<std::mutex> lock(m_mutex);
        ++m_scansFinished;
        m_scanning = m_scansFinished != m_scansStarted;
        touch();
        return false;
    }
    return true;
}

void TeleopShell::stopScan() {
    m_scanner.stop();
}

void TeleopShell::waitForScan() {
    m_scanner.wait();
}

void TeleopShell::onScanComplete(const std::vector<std::string>& robots, bool cancelled) {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        // An empty sweep keeps the previous list
        if (!robots.empty()) {
            m_robotIps = robots;
            m_selectedIp = robots.front();
        }
        // The scanner reports completion after it can accept the next sweep, so
        // this may be the previous sweep finishing while a new one already runs
        ++m_scansFinished;
        m_scanning = m_scansFinished != m_scansStarted;
    }

    (void)cancelled;
    if (!robots.empty()) {
        LOG_INFO("Found {} robot(s): {}", robots.size(), joinIps(robots));
    } else {
        LOG_INFO("No robots found on network");
    }
    touch();
}

void TeleopShell::selectIp(const std::string& ip) {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_selectedIp = trim(ip);
    }
    touch();
}

bool TeleopShell::connectRobot() {
    std::lock_guard<std::mutex> action(m_actionMutex);

    std::string ip;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        ip = trim(m_selectedIp);
    }

    if (ip.empty()) {
        notify("error", "Error", "Please select or enter robot IP address");
        return false;
    }

    bool running;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        running = m_running || m_loop != nullptr;
    }
    if (running) {
        doStopControl();
    }

    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_connecting = true;
        m_connectedIp.clear();
        m_gripperConnected = false;
    }
    touch();

    session::ConnectResult result = m_connection.connect(ip);

    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_connecting = false;
        if (result.success) {
            m_connectedIp = ip;
            m_gripperConnected = result.gripperConnected;
        }
    }
    touch();

    if (!result.success) {
        notify("error", "Connection Error", result.error);
        return false;
    }
    if (!result.warning.empty()) {
        notify("warning", "Robot State", result.warning);
    }
    return true;
}

void TeleopShell::disconnectRobot() {
    std::lock_guard<std::mutex> action(m_actionMutex);

    bool running;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        running = m_running || m_loop != nullptr;
    }
    if (running) {
        doStopControl();
    }

    m_connection.disconnect();

    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_connectedIp.clear();
        m_gripperConnected = false;
    }
    touch();
}

// ============================================================================
// Controller
// ============================================================================

bool TeleopShell::refreshController() {
    std::lock_guard<std::mutex> action(m_actionMutex);

    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_controllerChecked = false;
        m_controllerError = false;
        m_controllerConnected = false;
        m_controllerName.clear();
    }
    touch();

    std::string name;
    try {
        std::optional<gamepad::ControllerInfo> info;
        if (m_deps.detectController) {
            info = m_deps.detectController();
        }

        std::lock_guard<std::mutex> lock(m_mutex);
        m_controllerChecked = true;
        if (info) {
            m_controllerConnected = true;
            m_controllerName = info->name;
            name = info->name;
        }
    } catch (const std::exception& e) {
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_controllerChecked = true;
            m_controllerError = true;
        }
        LOG_ERROR("Controller error: {}", e.what());
        touch();
        return false;
    }

    touch();
    if (name.empty()) {
        LOG_WARN("No controller detected");
        return false;
    }
    LOG_INFO("Controller detected: {}", name);
    return true;
}

// ============================================================================
// Speed / Robot Control
// ============================================================================

std::string TeleopShell::speedLabel(double percent) {
    char buf[16];
    std::snprintf(buf, sizeof(buf), "%.0f%%", percent);
    return std::string(buf);
}

void TeleopShell::applySpeed(teleop::GameControllerTeleop& adapter, double percent) const {
    double factor = percent / 100.0;
    adapter.setLinearSpeedScaling(m_config.teleop.base_linear_speed * factor);
    adapter.setAngularSpeedScaling(m_config.teleop.base_angular_speed * factor);
}

void TeleopShell::setSpeed(double percent) {
    if (!std::isfinite(percent)) {
        LOG_WARN("Ignoring invalid speed value");
        return;
    }
    percent = std::clamp(percent, 1.0, 100.0);

    std::shared_ptr<teleop::GameControllerTeleop> adapter;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_speedPercent = percent;
        adapter = m_teleop;
    }

    if (adapter) {
        applySpeed(*adapter, percent);
        LOG_DEBUG("Teleop speed {}: linear {:.3f} m/s, angular {:.3f} rad/s",
                  speedLabel(percent), adapter->linearSpeedScaling(),
                  adapter->angularSpeedScaling());
    }
    touch();
}

bool TeleopShell::startControl() {
    std::lock_guard<std::mutex> action(m_actionMutex);

    double speed;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_running) {
            LOG_WARN("Robot control already running");
            return false;
        }
        speed = m_speedPercent;
    }

    auto robotDriver = m_connection.robot();
    bool controllerConnected;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        controllerConnected = m_controllerConnected;
    }

    if (!robotDriver || !controllerConnected) {
        notify("error", "Error", "Robot and controller must be connected");
        return false;
    }

    // Reap a loop that ended with an error
    std::unique_ptr<teleop::TeleopLoop> previous;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        previous = std::move(m_loop);
    }
    previous.reset();

    try {
        LOG_INFO("Initializing teleoperation...");

        std::unique_ptr<gamepad::IGameController> controller;
        if (m_deps.openController) {
            controller = m_deps.openController();
        }
        if (!controller) {
            throw std::runtime_error("Cannot open game controller");
        }

        teleop::TeleopOptions options;
        options.controlRateHz = m_config.teleop.control_rate_hz;
        options.deadZone = m_config.controller.dead_zone;
        options.gripperSpeed = m_config.gripper.speed_m_per_s;

        auto gripper = m_connection.gripper();
        auto adapter = std::make_shared<teleop::GameControllerTeleop>(
            robotDriver, gripper, std::move(controller), m_deps.layout, options);
        applySpeed(*adapter, speed);

        auto loop = std::make_unique<teleop::TeleopLoop>(adapter, options.controlRateHz);

        loop->setTickCallback([this, robotDriver, gripper](const robot::Twist& twist) {
            if (m_recorder.isRecording()) {
                if (m_recorder.append(recording::Recorder::makeSample(*robotDriver, gripper.get(), twist))) {
                    touch();
                }
            }
        });
        loop->setErrorCallback([this](const std::string& error) {
            onControlError(error);
        });

        teleop::TeleopLoop* loopPtr = loop.get();
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_teleop = adapter;
            m_loop = std::move(loop);
            m_running = true;
        }

        if (!loopPtr->start()) {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_teleop.reset();
            m_loop.reset();
            m_running = false;
            throw std::runtime_error("control loop did not start");
        }

        touch();
        LOG_INFO("Robot control started - Use Xbox controller to move robot");
        return true;

    } catch (const std::exception& e) {
        LOG_ERROR("Control start failed: {}", e.what());
        notify("error", "Error", std::string("Failed to start control: ") + e.what());
        touch();
        return false;
    }
}

void TeleopShell::stopControl() {
    std::lock_guard<std::mutex> action(m_actionMutex);
    doStopControl();
}

void TeleopShell::doStopControl() {
    std::unique_ptr<teleop::TeleopLoop> loop;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        loop = std::move(m_loop);
        m_running = false;
    }

    if (loop) {
        auto begin = std::chrono::steady_clock::now();
        loop->stop();
        double elapsed = std::chrono::duration<double>(std::chrono::steady_clock::now() - begin).count();
        if (elapsed > m_config.teleop.stop_timeout_s) {
            LOG_WARN("Control loop took {:.1f} s to stop", elapsed);
        }

        auto stats = loop->getStats();
        LOG_DEBUG("Control loop: {} ticks, {} overruns, max tick {:.1f} ms",
                  stats.ticks, stats.overruns, stats.maxTickMs);

        auto robotDriver = m_connection.robot();
        if (robotDriver) {
            robotDriver->servoStop();
        }
    }

    if (m_recorder.isRecording()) {
        stopRecording();
    }

    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_teleop.reset();
    }
    touch();
    LOG_INFO("Robot control stopped");
}

void TeleopShell::onControlError(const std::string& error) {
    // Runs on the loop thread; the loop object is reaped by the next start/stop
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_running = false;
        m_teleop.reset();
    }

    if (m_recorder.isRecording()) {
        stopRecording();
    }

    notify("error", "Control Error", error);
    touch();
}

// ============================================================================
// Recording
// ============================================================================

bool TeleopShell::toggleRecording() {
    std::lock_guard<std::mutex> action(m_actionMutex);

    if (m_recorder.isRecording()) {
        stopRecording();
        return true;
    }

    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (!m_running) {
            LOG_WARN("Start robot control before recording");
            return false;
        }
    }

    m_recorder.start();
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_recordStatusText = "Recording...";
        m_recordStatusColor = "red";
        m_saveEnabled = false;
    }
    touch();
    LOG_INFO("Recording started");
    return true;
}

void TeleopShell::stopRecording() {
    size_t points = m_recorder.stop();
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_recordStatusText = "Recorded " + std::to_string(points) + " points";
        m_recordStatusColor = "blue";
        m_saveEnabled = true;
    }
    touch();
    LOG_INFO("Recording stopped - {} data points", points);
}

bool TeleopShell::saveRecording() {
    std::lock_guard<std::mutex> action(m_actionMutex);

    if (m_recorder.isRecording()) {
        notify("warning", "Warning", "Stop recording before saving");
        return false;
    }
    if (m_recorder.empty()) {
        notify("warning", "Warning", "No recording data to save");
        return false;
    }

    std::string robotIp;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        robotIp = m_selectedIp;
    }

    recording::SaveResult result = m_recorder.save(m_config.recording.directory, robotIp,
                                                   m_config.recording.file_prefix);
    if (!result.success) {
        notify("error", "Error", "Failed to save recording: " + result.error);
        return false;
    }

    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_saveEnabled = false;
        m_lastSavedPath = result.path;
    }
    touch();
    notify("info", "Success", "Recording saved to " + result.path);
    return true;
}

void TeleopShell::shutdown() {
    std::lock_guard<std::mutex> action(m_actionMutex);

    bool running;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        running = m_running || m_loop != nullptr;
    }
    if (running) {
        doStopControl();
    }

    m_scanner.stop();
    m_scanner.wait();
}

// ============================================================================
// View
// ============================================================================

ViewState TeleopShell::viewState() const {
    ViewState view;

    {
        std::lock_guard<std::mutex> lock(m_mutex);

        view.robot_ips = m_robotIps;
        view.selected_ip = m_selectedIp;
        view.scanning = m_scanning;
        view.scan_button_text = m_scanning ? "Scanning..." : "Scan Network";
        view.scan_enabled = !m_scanning;

        // Shell copy of the session state; the manager is locked for the whole connect
        view.robot_connected = !m_connectedIp.empty();
        view.connecting = m_connecting;
        if (view.robot_connected) {
            view.robot_status_text = "Connected to " + m_connectedIp;
            view.robot_status_color = "green";
            view.connect_button_text = "Disconnect";
        } else {
            view.robot_status_text = m_connecting ? "Connecting..." : "Not Connected";
            view.robot_status_color = m_connecting ? "orange" : "red";
            view.connect_button_text = "Connect Robot";
        }
        view.connect_enabled = !m_connecting;
        view.gripper_connected = view.robot_connected && m_gripperConnected;

        view.controller_connected = m_controllerConnected;
        view.controller_name = m_controllerName;
        if (!m_controllerChecked) {
            view.controller_status_text = "Checking...";
            view.controller_status_color = "orange";
        } else if (m_controllerError) {
            view.controller_status_text = "Controller Error";
            view.controller_status_color = "red";
        } else if (m_controllerConnected) {
            view.controller_status_text = "Connected: " + m_controllerName;
            view.controller_status_color = "green";
        } else {
            view.controller_status_text = "No Controller Detected";
            view.controller_status_color = "red";
        }

        view.speed_percent = m_speedPercent;
        view.speed_label = speedLabel(m_speedPercent);

        view.running = m_running;
        view.start_enabled = view.robot_connected && m_controllerConnected && !m_running;
        view.stop_enabled = m_running;
        view.record_enabled = m_running;

        view.recording = m_recorder.isRecording();
        view.record_button_text = view.recording ? "Stop Recording" : "Start Recording";
        view.record_status_text = m_recordStatusText;
        view.record_status_color = m_recordStatusColor;
        view.save_enabled = m_saveEnabled && !view.recording;
    }

    view.recorded_points = m_recorder.size();

    {
        std::lock_guard<std::mutex> lock(m_logMutex);
        view.status_log.assign(m_statusHistory.begin(), m_statusHistory.end());
    }

    return view;
}

ShellEvents TeleopShell::drainEvents() {
    ShellEvents events;
    std::lock_guard<std::mutex> lock(m_logMutex);
    events.logLines.swap(m_pendingLines);
    events.notifications.swap(m_pendingNotifications);
    return events;
}

void TeleopShell::appendStatusLine(const std::string& line) {
    {
        std::lock_guard<std::mutex> lock(m_logMutex);
        m_statusHistory.push_back(line);
        while (m_statusHistory.size() > m_historyLimit) {
            m_statusHistory.pop_front();
        }
        m_pendingLines.push_back(line);
        if (m_pendingLines.size() > m_historyLimit) {
            m_pendingLines.erase(m_pendingLines.begin());
        }
    }
    touch();
}

std::vector<std::string> TeleopShell::statusHistory() const {
    std::lock_guard<std::mutex> lock(m_logMutex);
    return std::vector<std::string>(m_statusHistory.begin(), m_statusHistory.end());
}

std::string TeleopShell::lastSavedPath() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_lastSavedPath;
}

void TeleopShell::notify(const std::string& level, const std::string& title, const std::string& message) {
    {
        std::lock_guard<std::mutex> lock(m_logMutex);
        m_pendingNotifications.push_back({level, title, message});
    }
    touch();
}

} // namespace app
} // namespace ur_teleop
