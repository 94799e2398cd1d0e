/**
 * @file LinuxJoystick.hpp
 * @brief Game controller on the Linux joystick API (/dev/input/jsN)
 */

#pragma once

#include "IGameController.hpp"
#include <optional>
#include <string>
#include <vector>

namespace ur_teleop {
namespace gamepad {

class LinuxJoystick : public IGameController {
public:
    explicit LinuxJoystick(std::string devicePath);
    ~LinuxJoystick() override;

    // Non-copyable
    LinuxJoystick(const LinuxJoystick&) = delete;
    LinuxJoystick& operator=(const LinuxJoystick&) = delete;

    // ========================================================================
    // Connection Management
    // ========================================================================

    bool open();
    void close();
    bool isConnected() const override { return m_fd >= 0; }

    // ========================================================================
    // IGameController
    // ========================================================================

    bool poll() override;
    double axis(int index) const override;
    bool button(int index) const override;
    int numAxes() const override { return static_cast<int>(m_axes.size()); }
    int numButtons() const override { return static_cast<int>(m_buttons.size()); }
    std::string name() const override { return m_name; }

    const std::string& devicePath() const { return m_devicePath; }

    /**
     * Joystick device nodes (js0, js1, ...) in a directory, sorted by index
     */
    static std::vector<std::string> listDevices(const std::string& deviceDir = "/dev/input");

    /**
     * Path of controller number `index`, or nothing if there are fewer controllers
     */
    static std::optional<std::string> devicePathForIndex(const std::string& deviceDir, int index);

    /**
     * Name from a JSIOCGNAME buffer, which is not NUL-terminated when the
     * name fills it
     */
    static std::string deviceName(const char* buffer, size_t size);

private:
    std::string m_devicePath;
    std::string m_name;
    int m_fd{-1};
    std::vector<double> m_axes;
    std::vector<bool> m_buttons;
};

/**
 * Detected controller info for the Controller section of the UI
 */
struct ControllerInfo {
    std::string name;
    std::string devicePath;
    int numAxes = 0;
    int numButtons = 0;
};

/**
 * Open controller `index` briefly to read its name and capabilities.
 * Returns nothing if no such controller exists or it cannot be opened.
 */
std::optional<ControllerInfo> detectController(const std::string& deviceDir, int index);

} // namespace gamepad
} // namespace ur_teleop
