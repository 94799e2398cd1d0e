/**
 * @file main.cpp
 * @brief UR Teleop Core - Entry Point
 */

#include <iostream>
#include <csignal>
#include <atomic>
#include <thread>
#include <chrono>

#include "logging/Logger.hpp"
#include "config/ConfigManager.hpp"
#include "app/TeleopShell.hpp"
#include "ipc/IpcServer.hpp"
#include "ipc/Message.hpp"
#include "ipc/TeleopPayloads.hpp"

using namespace ur_teleop;
using namespace ur_teleop::config;
using namespace ur_teleop::ipc;

// Global flag for graceful shutdown
std::atomic<bool> g_running{true};

void signalHandler(int signal) {
    (void)signal;
    g_running = false;
}

namespace {

/**
 * Register an ACTION_ACK handler that runs a shell action and returns the new view
 */
void registerAction(IpcServer& server, app::TeleopShell& shell, MessageType type,
                    std::function<bool(const Message&)> action) {
    std::string name = messageTypeToString(type);
    server.registerHandler(type, [&shell, action, name](const Message& request) -> nlohmann::json {
        ActionResponse response;
        response.action = name;
        response.success = action(request);
        response.view = shell.viewState();
        return response;
    });
}

void registerHandlers(IpcServer& server, app::TeleopShell& shell, ConfigManager& config) {
    server.registerHandler(MessageType::GET_STATUS,
        [&shell](const Message&) -> nlohmann::json {
            return shell.viewState();
        });

    server.registerHandler(MessageType::GET_CONFIG,
        [&config](const Message&) -> nlohmann::json {
            return nlohmann::json::parse(config.toJson());
        });

    registerAction(server, shell, MessageType::SCAN_NETWORK,
        [&shell](const Message&) { return shell.scanNetwork(); });

    registerAction(server, shell, MessageType::STOP_SCAN,
        [&shell](const Message&) { shell.stopScan(); return true; });

    registerAction(server, shell, MessageType::SELECT_ROBOT_IP,
        [&shell](const Message& request) {
            auto req = request.payloadAs<SelectRobotIpRequest>();
            shell.selectIp(req.ip);
            return true;
        });

    registerAction(server, shell, MessageType::CONNECT_ROBOT,
        [&shell](const Message& request) {
            // Optional IP in the request, as typed in the combo box
            if (request.payload.contains("ip")) {
                shell.selectIp(request.payloadAs<SelectRobotIpRequest>().ip);
            }
            return shell.connectRobot();
        });

    registerAction(server, shell, MessageType::DISCONNECT_ROBOT,
        [&shell](const Message&) { shell.disconnectRobot(); return true; });

    registerAction(server, shell, MessageType::REFRESH_CONTROLLER,
        [&shell](const Message&) { return shell.refreshController(); });

    registerAction(server, shell, MessageType::SET_SPEED,
        [&shell](const Message& request) {
            auto req = request.payloadAs<SetSpeedRequest>();
            shell.setSpeed(req.percent);
            return true;
        });

    registerAction(server, shell, MessageType::START_CONTROL,
        [&shell](const Message&) { return shell.startControl(); });

    registerAction(server, shell, MessageType::STOP_CONTROL,
        [&shell](const Message&) { shell.stopControl(); return true; });

    registerAction(server, shell, MessageType::TOGGLE_RECORDING,
        [&shell](const Message&) { return shell.toggleRecording(); });

    registerAction(server, shell, MessageType::SAVE_RECORDING,
        [&shell](const Message&) { return shell.saveRecording(); });
}

} // namespace

int main(int argc, char* argv[]) {
    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);

    std::string config_file = "config/teleop_config.yaml";
    if (argc > 1) {
        config_file = argv[1];
    }

    // Basic setup, reconfigured after loading config
    Logger::init("logs/teleop.log", "info");

    LOG_INFO("========================================");
    LOG_INFO("UR Teleop Core v1.0.0");
    LOG_INFO("========================================");

    auto& config = ConfigManager::instance();
    if (!config.load(config_file)) {
        LOG_WARN("Using built-in defaults (config file: {})", config_file);
    }
    SystemConfig cfg = config.systemConfig();

    const auto& logConfig = cfg.logging;
    Logger::init(logConfig.file,
                 logConfig.level,
                 static_cast<size_t>(logConfig.max_size_mb) * 1024 * 1024,
                 static_cast<size_t>(logConfig.max_files),
                 logConfig.console_enabled,
                 logConfig.file_enabled);

    LOG_INFO("Robot: {} via {}", cfg.robot.model, cfg.robot.driver);

    app::TeleopShell shell(cfg, app::ShellDependencies::fromConfig(cfg, config.controllerLayout()));

    const auto& ipcConfig = cfg.ipc;
    IpcServer server(ipcConfig);
    registerHandlers(server, shell, config);

    if (!server.start()) {
        LOG_ERROR("Failed to start IPC server");
        return 1;
    }

    LOG_INFO("IPC Server running on ports {} (REP) and {} (PUB)",
             ipcConfig.rep_port, ipcConfig.pub_port);

    shell.refreshController();
    if (!cfg.robot.default_ip.empty()) {
        shell.selectIp(cfg.robot.default_ip);
    }

    // Main loop - the only thread that publishes
    int view_interval_ms = 1000 / ipcConfig.view_publish_hz;
    auto last_view = std::chrono::steady_clock::now();
    uint64_t published_version = 0;

    while (g_running) {
        auto events = shell.drainEvents();
        for (const auto& line : events.logLines) {
            server.publishLog(line);
        }
        for (const auto& notification : events.notifications) {
            server.publishNotify(notification);
        }

        auto now = std::chrono::steady_clock::now();
        auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(now - last_view);
        uint64_t version = shell.version();

        if (version != published_version && elapsed.count() >= view_interval_ms) {
            server.publishStatus(shell.viewState());
            published_version = version;
            last_view = now;
        }

        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }

    LOG_INFO("Shutting down...");
    shell.shutdown();
    server.stop();

    LOG_INFO("UR Teleop Core stopped");
    Logger::get()->flush();
    return 0;
}
