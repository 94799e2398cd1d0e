/**
 * @file Message.hpp
 * @brief IPC message envelope and its JSON form
 */

#pragma once

#include <atomic>
#include <chrono>
#include <cstdio>
#include <string>
#include <nlohmann/json.hpp>
#include "MessageTypes.hpp"

namespace ur_teleop {
namespace ipc {

using json = nlohmann::json;

namespace detail {

inline int64_t epochMs() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

// "<ns clock hex>-<sequence hex>"; ids are minted on the REP worker and the main loop
inline std::string nextMessageId() {
    static std::atomic<uint64_t> sequence{0};
    auto ns = std::chrono::duration_cast<std::chrono::nanoseconds>(
        std::chrono::steady_clock::now().time_since_epoch()).count();

    char buf[48];
    std::snprintf(buf, sizeof(buf), "%016llx-%08llx",
                  static_cast<unsigned long long>(ns),
                  static_cast<unsigned long long>(++sequence));
    return buf;
}

} // namespace detail

/**
 * Envelope shared by requests, replies and published events:
 *
 *   {"type": "CONNECT_ROBOT", "id": "...", "timestamp": <epoch ms>, "payload": {...}}
 *
 * A reply reuses its request's id; events get a new one.
 */
struct Message {
    MessageType type = MessageType::UNKNOWN;
    std::string id;
    int64_t timestamp = 0;
    json payload = json::object();

    static Message create(MessageType type, const json& payload = json::object()) {
        Message msg;
        msg.type = type;
        msg.id = detail::nextMessageId();
        msg.timestamp = detail::epochMs();
        msg.payload = payload;
        return msg;
    }

    static Message createResponse(const Message& request, MessageType responseType,
                                  const json& payload = json::object()) {
        Message msg = create(responseType, payload);
        if (!request.id.empty()) {
            msg.id = request.id;
        }
        return msg;
    }

    /**
     * ERROR reply. Payload: code, message and (when given) details.
     * Requests that never parsed get a fresh id.
     */
    static Message createError(const Message& request, int code,
                               const std::string& message, const std::string& details = "") {
        json body = {{"code", code}, {"message", message}};
        if (!details.empty()) {
            body["details"] = details;
        }
        return createResponse(request, MessageType::ERROR, body);
    }

    /**
     * Typed payload (TeleopPayloads.hpp); throws json::exception on a
     * missing or mistyped field
     */
    template <typename T>
    T payloadAs() const {
        return payload.get<T>();
    }

    std::string serialize() const {
        return json{
            {"type", messageTypeToString(type)},
            {"id", id},
            {"timestamp", timestamp},
            {"payload", payload}
        }.dump();
    }

    /**
     * Malformed text becomes an id-less ERROR message, which isValid() rejects
     */
    static Message deserialize(const std::string& text) {
        Message msg;
        try {
            json j = json::parse(text);
            if (!j.is_object()) {
                msg.type = MessageType::ERROR;
                msg.payload = {{"error", "Failed to parse message"},
                               {"details", "message must be a JSON object"}};
                return msg;
            }
            msg.type = stringToMessageType(j.value("type", std::string("UNKNOWN")));
            msg.id = j.value("id", std::string());
            msg.timestamp = j.value("timestamp", static_cast<int64_t>(0));
            msg.payload = j.value("payload", json::object());
        } catch (const json::exception& e) {
            msg = Message{};
            msg.type = MessageType::ERROR;
            msg.payload = {{"error", "Failed to parse message"}, {"details", e.what()}};
        }
        return msg;
    }

    bool isValid() const {
        return !id.empty() && type != MessageType::UNKNOWN && type != MessageType::ERROR;
    }
};

} // namespace ipc
} // namespace ur_teleop
