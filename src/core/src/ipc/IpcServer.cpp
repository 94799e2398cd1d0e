/**
 * @file IpcServer.cpp
 * @brief ZeroMQ front-end link implementation
 */

#include "IpcServer.hpp"
#include "../logging/Logger.hpp"
#include <chrono>

namespace ur_teleop {
namespace ipc {

namespace {

constexpr const char* CORE_NAME = "ur_teleop";
constexpr const char* CORE_VERSION = "1.0.0";

// REP receive timeout; bounds how long stop() waits for the worker
constexpr int REP_POLL_MS = 100;

int64_t nowMs() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

} // namespace

IpcServer::IpcServer(const std::string& rep_address, const std::string& pub_address)
    : m_context(1)
    , m_rep_socket(m_context, zmq::socket_type::rep)
    , m_pub_socket(m_context, zmq::socket_type::pub)
    , m_rep_address(rep_address)
    , m_pub_address(pub_address)
{
    registerHandler(MessageType::PING, [this](const Message&) {
        return pingReply();
    });
}

IpcServer::IpcServer(const config::IpcConfig& config)
    : IpcServer(endpoint(config.bind_address, config.rep_port),
                endpoint(config.bind_address, config.pub_port))
{
}

IpcServer::~IpcServer() {
    stop();
}

std::string IpcServer::endpoint(const std::string& bind_address, int port) {
    return "tcp://" + bind_address + ":" + std::to_string(port);
}

bool IpcServer::start() {
    if (m_running) {
        return true;
    }

    try {
        m_rep_socket.set(zmq::sockopt::linger, 0);
        m_rep_socket.set(zmq::sockopt::rcvtimeo, REP_POLL_MS);
        m_pub_socket.set(zmq::sockopt::linger, 0);

        m_rep_socket.bind(m_rep_address);
        m_pub_socket.bind(m_pub_address);
    } catch (const zmq::error_t& e) {
        LOG_ERROR("IPC bind failed (REP {}, PUB {}): {}", m_rep_address, m_pub_address, e.what());
        return false;
    }

    {
        std::lock_guard<std::mutex> lock(m_stats_mutex);
        m_stats = Stats{};
        m_stats.start_time = nowMs();
    }

    m_running = true;
    m_rep_thread = std::thread(&IpcServer::serveRequests, this);

    LOG_DEBUG("IPC listening: REP {}, PUB {}", m_rep_address, m_pub_address);
    return true;
}

void IpcServer::stop() {
    if (!m_running.exchange(false)) {
        return;
    }

    if (m_rep_thread.joinable()) {
        m_rep_thread.join();
    }

    try {
        m_rep_socket.close();
        m_pub_socket.close();
    } catch (const zmq::error_t& e) {
        LOG_WARN("IPC socket close: {}", e.what());
    }

    LOG_DEBUG("IPC stopped");
}

void IpcServer::registerHandler(MessageType type, MessageHandler handler) {
    std::lock_guard<std::mutex> lock(m_handlers_mutex);
    m_handlers[type] = std::move(handler);
}

void IpcServer::countError() {
    std::lock_guard<std::mutex> lock(m_stats_mutex);
    m_stats.errors++;
}

// ============================================================================
// Publishing
// ============================================================================

void IpcServer::publish(const Message& message) {
    if (!m_running) {
        return;
    }

    // No logging on this path: status lines are published through here
    try {
        std::string topic = messageTypeToString(message.type);
        std::string body = message.serialize();

        auto sentTopic = m_pub_socket.send(zmq::buffer(topic),
                                           zmq::send_flags::sndmore | zmq::send_flags::dontwait);
        if (!sentTopic) {
            countError();
            return;
        }
        auto sentBody = m_pub_socket.send(zmq::buffer(body), zmq::send_flags::dontwait);

        std::lock_guard<std::mutex> lock(m_stats_mutex);
        if (sentBody) {
            m_stats.events_published++;
        } else {
            m_stats.errors++;
        }
    } catch (const zmq::error_t&) {
        countError();
    }
}

void IpcServer::publishStatus(const json& view) {
    publish(Message::create(MessageType::STATUS, view));
}

void IpcServer::publishLog(const std::string& line) {
    publish(Message::create(MessageType::LOG, {{"line", line}}));
}

void IpcServer::publishNotify(const json& notification) {
    publish(Message::create(MessageType::NOTIFY, notification));
}

IpcServer::Stats IpcServer::getStats() const {
    std::lock_guard<std::mutex> lock(m_stats_mutex);
    return m_stats;
}

// ============================================================================
// Requests
// ============================================================================

void IpcServer::serveRequests() {
    while (m_running) {
        try {
            zmq::message_t request;
            if (!m_rep_socket.recv(request, zmq::recv_flags::none)) {
                continue;
            }

            {
                std::lock_guard<std::mutex> lock(m_stats_mutex);
                m_stats.messages_received++;
            }

            std::string reply = processMessage(request.to_string()).serialize();
            m_rep_socket.send(zmq::buffer(reply), zmq::send_flags::none);

            std::lock_guard<std::mutex> lock(m_stats_mutex);
            m_stats.messages_sent++;

        } catch (const zmq::error_t& e) {
            if (m_running) {
                LOG_ERROR("IPC request socket: {}", e.what());
                countError();
            }
        } catch (const std::exception& e) {
            LOG_ERROR("IPC request failed: {}", e.what());
            countError();
        }
    }
}

Message IpcServer::processMessage(const std::string& raw_message) {
    Message request = Message::deserialize(raw_message);
    if (!request.isValid()) {
        LOG_DEBUG("IPC: rejected malformed request");
        return Message::createError(request, 400, "Invalid message format");
    }

    std::string typeName = messageTypeToString(request.type);

    MessageHandler handler;
    {
        std::lock_guard<std::mutex> lock(m_handlers_mutex);
        auto it = m_handlers.find(request.type);
        if (it != m_handlers.end()) {
            handler = it->second;
        }
    }

    if (!handler) {
        LOG_DEBUG("IPC: no handler for {}", typeName);
        Message error = Message::createError(request, 404, "No handler for message type");
        error.payload["type"] = typeName;
        return error;
    }

    try {
        return Message::createResponse(request, responseTypeFor(request.type), handler(request));
    } catch (const std::exception& e) {
        LOG_ERROR("{} failed: {}", typeName, e.what());
        return Message::createError(request, 500, "Handler error", e.what());
    }
}

json IpcServer::pingReply() const {
    Stats stats = getStats();
    return {
        {"core", CORE_NAME},
        {"core_version", CORE_VERSION},
        {"uptime_ms", stats.start_time > 0 ? nowMs() - stats.start_time : 0},
        {"stats", {
            {"messages_received", stats.messages_received},
            {"messages_sent", stats.messages_sent},
            {"events_published", stats.events_published},
            {"errors", stats.errors}
        }}
    };
}

} // namespace ipc
} // namespace ur_teleop
