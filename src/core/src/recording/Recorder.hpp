/**
 * @file Recorder.hpp
 * @brief Teleop trajectory recording and JSON export
 */

#pragma once

#include "../robot/IRobotDriver.hpp"
#include <atomic>
#include <chrono>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace ur_teleop {
namespace recording {

using json = nlohmann::json;

/**
 * One recorded control tick
 */
struct Sample {
    double timestamp = 0.0;                 // UNIX time [s]
    robot::Pose tcpPose{};
    robot::Twist twist{};
    std::optional<double> gripperWidth;     // [m], null without a gripper
};

void to_json(json& j, const Sample& sample);
void from_json(const json& j, Sample& sample);

struct RecordingMetadata {
    std::string robotIp;
    std::string recordingTime;              // YYYYmmdd_HHMMSS
    size_t dataPoints = 0;
};

struct Recording {
    RecordingMetadata metadata;
    std::vector<Sample> samples;
};

struct SaveResult {
    bool success = false;
    std::string path;
    std::string error;
};

/**
 * Recorder
 *
 * start() clears previous samples and arms; samples appended from the
 * control loop are kept only while armed. Thread-safe.
 */
class Recorder {
public:
    Recorder() = default;

    // Non-copyable
    Recorder(const Recorder&) = delete;
    Recorder& operator=(const Recorder&) = delete;

    void start();

    /**
     * Disarm
     * @return number of samples recorded
     */
    size_t stop();

    bool isRecording() const { return m_recording; }

    /**
     * Append a sample if armed
     * @return true if the sample was kept
     */
    bool append(const Sample& sample);

    size_t size() const;
    bool empty() const { return size() == 0; }
    std::vector<Sample> samples() const;
    void clear();

    /**
     * Full document: {"metadata": {...}, "data": [...]}
     */
    json toJson(const std::string& robotIp, const std::string& recordingTime) const;

    /**
     * Write `<directory>/<prefix><YYYYmmdd_HHMMSS>.json` (indent 2).
     * An empty recording is an error.
     */
    SaveResult save(const std::string& directory,
                    const std::string& robotIp,
                    const std::string& filePrefix = "ur3e_recording_") const;

    /**
     * Read a recording written by save()
     */
    static std::optional<Recording> load(const std::string& path);

    /**
     * Build a sample from the live session (reads TCP pose and gripper width)
     */
    static Sample makeSample(robot::IRobotDriver& robot,
                             robot::IGripper* gripper,
                             const robot::Twist& twist);

    /**
     * Local time formatted as YYYYmmdd_HHMMSS
     */
    static std::string timestampString(std::chrono::system_clock::time_point time);

private:
    mutable std::mutex m_mutex;
    std::vector<Sample> m_samples;
    std::atomic<bool> m_recording{false};
};

} // namespace recording
} // namespace ur_teleop
