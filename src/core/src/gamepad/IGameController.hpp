/**
 * @file IGameController.hpp
 * @brief Abstract game controller (Linux joystick device, test doubles)
 */

#pragma once

#include <string>

namespace ur_teleop {
namespace gamepad {

class IGameController {
public:
    virtual ~IGameController() = default;

    virtual bool isConnected() const = 0;

    // Drain pending input events. Returns false if the device was lost
    virtual bool poll() = 0;

    // Axis value in [-1, 1] (0 for unknown axes)
    virtual double axis(int index) const = 0;

    // Button state (false for unknown buttons)
    virtual bool button(int index) const = 0;

    virtual int numAxes() const = 0;
    virtual int numButtons() const = 0;

    virtual std::string name() const = 0;
};

} // namespace gamepad
} // namespace ur_teleop
