/**
 * @file IpcServer.hpp
 * @brief ZeroMQ front-end link of the teleop core
 */

#pragma once

#include <zmq.hpp>
#include <atomic>
#include <functional>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>
#include <nlohmann/json.hpp>
#include "Message.hpp"
#include "MessageTypes.hpp"
#include "../config/SystemConfig.hpp"

namespace ur_teleop {
namespace ipc {

using json = nlohmann::json;

/**
 * Request handler: returns the reply payload, throws to produce a 500 ERROR
 */
using MessageHandler = std::function<json(const Message&)>;

/**
 * Front-end link
 *
 * REP socket: button actions and queries, answered on a worker thread.
 * PUB socket: two-frame events [topic, message] where the topic is the
 * message type name ("STATUS", "LOG", "NOTIFY"), so a status-log viewer
 * can subscribe to "LOG" alone.
 *
 * The publish calls are not thread-safe; the core publishes from its main
 * loop only.
 */
class IpcServer {
public:
    explicit IpcServer(const std::string& rep_address = "tcp://*:5555",
                       const std::string& pub_address = "tcp://*:5556");

    /**
     * Endpoints from the `ipc` config section
     */
    explicit IpcServer(const config::IpcConfig& config);

    ~IpcServer();

    IpcServer(const IpcServer&) = delete;
    IpcServer& operator=(const IpcServer&) = delete;

    /**
     * Bind both sockets and start the REP worker
     * @return false if an endpoint cannot be bound
     */
    bool start();
    void stop();
    bool isRunning() const { return m_running; }

    const std::string& repAddress() const { return m_rep_address; }
    const std::string& pubAddress() const { return m_pub_address; }

    /**
     * Replaces any handler already registered for the type
     */
    void registerHandler(MessageType type, MessageHandler handler);

    void publish(const Message& message);

    void publishStatus(const json& view);
    void publishLog(const std::string& line);
    void publishNotify(const json& notification);

    /**
     * Turn one raw request into its reply (PONG / STATUS / ACTION_ACK / ERROR)
     */
    Message processMessage(const std::string& raw_message);

    struct Stats {
        uint64_t messages_received = 0;
        uint64_t messages_sent = 0;
        uint64_t events_published = 0;
        uint64_t errors = 0;
        int64_t start_time = 0;
    };
    Stats getStats() const;

    /**
     * "tcp://<bind>:<port>"
     */
    static std::string endpoint(const std::string& bind_address, int port);

private:
    void serveRequests();
    json pingReply() const;
    void countError();

    zmq::context_t m_context;
    zmq::socket_t m_rep_socket;
    zmq::socket_t m_pub_socket;

    std::string m_rep_address;
    std::string m_pub_address;

    std::thread m_rep_thread;
    std::atomic<bool> m_running{false};

    std::unordered_map<MessageType, MessageHandler> m_handlers;
    std::mutex m_handlers_mutex;

    mutable std::mutex m_stats_mutex;
    Stats m_stats;
};

} // namespace ipc
} // namespace ur_teleop
