/**
 * @file LinuxJoystick.cpp
 * @brief Linux joystick API reader
 *
 * The device is opened non-blocking; poll() drains every queued js_event
 * so the cached axes/buttons always reflect the latest state.
 */

#include "LinuxJoystick.hpp"
#include "../logging/Logger.hpp"
#include <linux/joystick.h>
#include <fcntl.h>
#include <sys/ioctl.h>
#include <unistd.h>
#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstring>
#include <filesystem>

namespace ur_teleop {
namespace gamepad {

namespace fs = std::filesystem;

namespace {

constexpr double AXIS_FULL_SCALE = 32767.0;

// "js12" -> 12, anything else -> -1
int jsIndex(const std::string& filename) {
    if (filename.size() < 3 || filename.compare(0, 2, "js") != 0) {
        return -1;
    }
    std::string digits = filename.substr(2);
    if (!std::all_of(digits.begin(), digits.end(),
                     [](unsigned char c) { return std::isdigit(c) != 0; })) {
        return -1;
    }
    return std::stoi(digits);
}

} // namespace

LinuxJoystick::LinuxJoystick(std::string devicePath)
    : m_devicePath(std::move(devicePath)) {
}

LinuxJoystick::~LinuxJoystick() {
    close();
}

bool LinuxJoystick::open() {
    close();

    m_fd = ::open(m_devicePath.c_str(), O_RDONLY | O_NONBLOCK);
    if (m_fd < 0) {
        LOG_DEBUG("LinuxJoystick: cannot open {}: {}", m_devicePath, std::strerror(errno));
        return false;
    }

    char name[128] = {0};
    if (::ioctl(m_fd, JSIOCGNAME(sizeof(name) - 1), name) < 0) {
        name[0] = '\0';
    }
    m_name = deviceName(name, sizeof(name));

    unsigned char axes = 0;
    unsigned char buttons = 0;
    if (::ioctl(m_fd, JSIOCGAXES, &axes) < 0 || ::ioctl(m_fd, JSIOCGBUTTONS, &buttons) < 0) {
        LOG_WARN("LinuxJoystick: {} did not report axis/button counts: {}",
                 m_devicePath, std::strerror(errno));
    }
    m_axes.assign(axes, 0.0);
    m_buttons.assign(buttons, false);

    LOG_INFO("LinuxJoystick: opened {} '{}' ({} axes, {} buttons)",
             m_devicePath, m_name, static_cast<int>(axes), static_cast<int>(buttons));

    // Consume the synthetic JS_EVENT_INIT burst so state starts populated
    return poll();
}

void LinuxJoystick::close() {
    if (m_fd >= 0) {
        ::close(m_fd);
        m_fd = -1;
        LOG_DEBUG("LinuxJoystick: closed {}", m_devicePath);
    }
}

bool LinuxJoystick::poll() {
    if (m_fd < 0) {
        return false;
    }

    js_event event{};
    while (true) {
        ssize_t n = ::read(m_fd, &event, sizeof(event));
        if (n == static_cast<ssize_t>(sizeof(event))) {
            uint8_t type = event.type & static_cast<uint8_t>(~JS_EVENT_INIT);
            if (type == JS_EVENT_AXIS && event.number < m_axes.size()) {
                m_axes[event.number] = std::clamp(event.value / AXIS_FULL_SCALE, -1.0, 1.0);
            } else if (type == JS_EVENT_BUTTON && event.number < m_buttons.size()) {
                m_buttons[event.number] = event.value != 0;
            }
            continue;
        }

        if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
            return true;    // Queue drained
        }
        if (n < 0 && errno == EINTR) {
            continue;
        }

        // ENODEV or short read: controller unplugged
        LOG_WARN("LinuxJoystick: {} lost ({})", m_devicePath,
                 n < 0 ? std::strerror(errno) : "short read");
        close();
        return false;
    }
}

double LinuxJoystick::axis(int index) const {
    if (index < 0 || index >= static_cast<int>(m_axes.size())) {
        return 0.0;
    }
    return m_axes[index];
}

bool LinuxJoystick::button(int index) const {
    if (index < 0 || index >= static_cast<int>(m_buttons.size())) {
        return false;
    }
    return m_buttons[index];
}

std::string LinuxJoystick::deviceName(const char* buffer, size_t size) {
    size_t length = ::strnlen(buffer, size);
    if (length == 0) {
        return "Unknown controller";
    }
    return std::string(buffer, length);
}

std::vector<std::string> LinuxJoystick::listDevices(const std::string& deviceDir) {
    std::vector<std::pair<int, std::string>> found;

    std::error_code ec;
    for (fs::directory_iterator it(deviceDir, ec), end; !ec && it != end; it.increment(ec)) {
        int index = jsIndex(it->path().filename().string());
        if (index >= 0) {
            found.emplace_back(index, it->path().string());
        }
    }
    if (ec) {
        LOG_DEBUG("LinuxJoystick: cannot list {}: {}", deviceDir, ec.message());
    }

    std::sort(found.begin(), found.end());

    std::vector<std::string> devices;
    for (auto& entry : found) {
        devices.push_back(std::move(entry.second));
    }
    return devices;
}

std::optional<std::string> LinuxJoystick::devicePathForIndex(const std::string& deviceDir, int index) {
    auto devices = listDevices(deviceDir);
    if (index < 0 || index >= static_cast<int>(devices.size())) {
        return std::nullopt;
    }
    return devices[index];
}

std::optional<ControllerInfo> detectController(const std::string& deviceDir, int index) {
    auto path = LinuxJoystick::devicePathForIndex(deviceDir, index);
    if (!path) {
        return std::nullopt;
    }

    LinuxJoystick joystick(*path);
    if (!joystick.open()) {
        return std::nullopt;
    }

    ControllerInfo info;
    info.name = joystick.name();
    info.devicePath = *path;
    info.numAxes = joystick.numAxes();
    info.numButtons = joystick.numButtons();
    return info;
}

} // namespace gamepad
} // namespace ur_teleop
