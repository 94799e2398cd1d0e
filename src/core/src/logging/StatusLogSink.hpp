/**
 * @file StatusLogSink.hpp
 * @brief spdlog sink that forwards log lines to the UI status log
 */

#pragma once

#include <spdlog/sinks/base_sink.h>
#include <spdlog/details/log_msg.h>
#include <functional>
#include <mutex>
#include <string>

namespace ur_teleop {

/**
 * Forwards formatted log lines ("[HH:MM:SS] message") to a callback.
 *
 * Only records at or above the sink level are forwarded, so debug chatter
 * from the drivers does not reach the operator.
 */
template <typename Mutex>
class StatusLogSink : public spdlog::sinks::base_sink<Mutex> {
public:
    using LineCallback = std::function<void(const std::string&)>;

    explicit StatusLogSink(LineCallback callback)
        : m_callback(std::move(callback)) {
        this->set_pattern("[%H:%M:%S] %v");
        this->set_level(spdlog::level::info);
    }

    /**
     * Stop forwarding. A caller still logging through a logger obtained
     * before removeSink() may reach this sink afterwards.
     */
    void detach() {
        std::lock_guard<Mutex> lock(this->mutex_);
        m_callback = nullptr;
    }

protected:
    void sink_it_(const spdlog::details::log_msg& msg) override {
        if (!m_callback) return;

        spdlog::memory_buf_t formatted;
        this->formatter_->format(msg, formatted);
        std::string line(formatted.data(), formatted.size());
        while (!line.empty() && (line.back() == '\n' || line.back() == '\r')) {
            line.pop_back();
        }
        m_callback(line);
    }

    void flush_() override {}

private:
    LineCallback m_callback;
};

using StatusLogSinkMt = StatusLogSink<std::mutex>;

} // namespace ur_teleop
