#include "Recorder.hpp"
#include "../logging/Logger.hpp"
#include <ctime>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <sstream>

namespace ur_teleop {
namespace recording {

namespace fs = std::filesystem;

// ============================================================================
// JSON
// ============================================================================

void to_json(json& j, const Sample& sample) {
    j = json{
        {"timestamp", sample.timestamp},
        {"tcp_pose", sample.tcpPose},
        {"twist", sample.twist},
        {"gripper_width", nullptr}
    };
    if (sample.gripperWidth) {
        j["gripper_width"] = *sample.gripperWidth;
    }
}

void from_json(const json& j, Sample& sample) {
    sample.timestamp = j.at("timestamp").get<double>();
    sample.tcpPose = j.at("tcp_pose").get<robot::Pose>();
    sample.twist = j.at("twist").get<robot::Twist>();
    if (j.contains("gripper_width") && !j["gripper_width"].is_null()) {
        sample.gripperWidth = j["gripper_width"].get<double>();
    } else {
        sample.gripperWidth.reset();
    }
}

// ============================================================================
// Recorder
// ============================================================================

void Recorder::start() {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_samples.clear();
    m_recording = true;
    LOG_DEBUG("Recorder armed");
}

size_t Recorder::stop() {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_recording = false;
    LOG_DEBUG("Recorder disarmed with {} samples", m_samples.size());
    return m_samples.size();
}

bool Recorder::append(const Sample& sample) {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (!m_recording) {
        return false;
    }
    m_samples.push_back(sample);
    return true;
}

size_t Recorder::size() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_samples.size();
}

std::vector<Sample> Recorder::samples() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_samples;
}

void Recorder::clear() {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_samples.clear();
}

json Recorder::toJson(const std::string& robotIp, const std::string& recordingTime) const {
    std::lock_guard<std::mutex> lock(m_mutex);

    json j;
    j["metadata"] = {
        {"robot_ip", robotIp},
        {"recording_time", recordingTime},
        {"data_points", m_samples.size()}
    };
    j["data"] = m_samples;
    return j;
}

SaveResult Recorder::save(const std::string& directory,
                          const std::string& robotIp,
                          const std::string& filePrefix) const {
    SaveResult result;

    if (empty()) {
        result.error = "No recording data to save";
        LOG_WARN("{}", result.error);
        return result;
    }

    std::string stamp = timestampString(std::chrono::system_clock::now());
    fs::path path = fs::path(directory.empty() ? "." : directory) / (filePrefix + stamp + ".json");

    try {
        if (path.has_parent_path()) {
            fs::create_directories(path.parent_path());
        }

        json document = toJson(robotIp, stamp);

        std::ofstream out(path);
        if (!out) {
            result.error = "Cannot open " + path.string() + " for writing";
            LOG_ERROR("Save failed: {}", result.error);
            return result;
        }
        out << document.dump(2);
        out.close();
        if (!out) {
            result.error = "Write error on " + path.string();
            LOG_ERROR("Save failed: {}", result.error);
            return result;
        }

        result.success = true;
        result.path = path.string();
        LOG_INFO("Recording saved to {} ({} points)", result.path,
                 document["metadata"]["data_points"].get<size_t>());
        return result;

    } catch (const std::exception& e) {
        result.error = e.what();
        LOG_ERROR("Save failed: {}", e.what());
        return result;
    }
}

std::optional<Recording> Recorder::load(const std::string& path) {
    try {
        std::ifstream in(path);
        if (!in) {
            LOG_ERROR("Recording not found: {}", path);
            return std::nullopt;
        }

        json j = json::parse(in);

        Recording recording;
        const auto& meta = j.at("metadata");
        recording.metadata.robotIp = meta.value("robot_ip", "");
        recording.metadata.recordingTime = meta.value("recording_time", "");
        recording.metadata.dataPoints = meta.value("data_points", static_cast<size_t>(0));
        recording.samples = j.at("data").get<std::vector<Sample>>();
        return recording;

    } catch (const json::exception& e) {
        LOG_ERROR("Invalid recording {}: {}", path, e.what());
        return std::nullopt;
    }
}

Sample Recorder::makeSample(robot::IRobotDriver& robot,
                            robot::IGripper* gripper,
                            const robot::Twist& twist) {
    Sample sample;
    sample.timestamp = std::chrono::duration<double>(
        std::chrono::system_clock::now().time_since_epoch()).count();
    sample.tcpPose = robot.getTcpPose();
    sample.twist = twist;
    if (gripper) {
        sample.gripperWidth = gripper->getCurrentWidth();
    }
    return sample;
}

std::string Recorder::timestampString(std::chrono::system_clock::time_point time) {
    std::time_t t = std::chrono::system_clock::to_time_t(time);
    std::tm local{};
    localtime_r(&t, &local);

    std::ostringstream oss;
    oss << std::put_time(&local, "%Y%m%d_%H%M%S");
    return oss.str();
}

} // namespace recording
} // namespace ur_teleop
