#include "ControllerLayout.hpp"
#include "../logging/Logger.hpp"
#include <yaml-cpp/yaml.h>
#include <algorithm>
#include <cmath>

namespace ur_teleop {
namespace gamepad {

namespace {

// Linux xpad indices
constexpr int XPAD_AXIS_LX = 0;
constexpr int XPAD_AXIS_LY = 1;
constexpr int XPAD_AXIS_LT = 2;
constexpr int XPAD_AXIS_RX = 3;
constexpr int XPAD_AXIS_RY = 4;
constexpr int XPAD_AXIS_RT = 5;

constexpr int XPAD_BUTTON_A = 0;
constexpr int XPAD_BUTTON_B = 1;
constexpr int XPAD_BUTTON_LB = 4;
constexpr int XPAD_BUTTON_RB = 5;

const char* const COMPONENT_KEYS[6] = {
    "linear_x", "linear_y", "linear_z", "angular_x", "angular_y", "angular_z"
};

double applyDeadZone(double value, double deadZone) {
    double magnitude = std::abs(value);
    if (magnitude <= deadZone) {
        return 0.0;
    }
    if (deadZone >= 1.0) {
        return 0.0;
    }
    // Rescale so the output starts at 0 just outside the dead zone
    double scaled = (magnitude - deadZone) / (1.0 - deadZone);
    return std::copysign(std::min(scaled, 1.0), value);
}

TwistBinding parseBinding(const YAML::Node& node) {
    TwistBinding binding;
    binding.positiveAxis.axis = node["axis"].as<int>(-1);
    binding.positiveAxis.inverted = node["inverted"].as<bool>(false);
    binding.positiveAxis.trigger = node["trigger"].as<bool>(false);
    binding.negativeAxis.axis = node["negative_axis"].as<int>(-1);
    binding.negativeAxis.inverted = node["negative_inverted"].as<bool>(false);
    binding.negativeAxis.trigger = node["negative_trigger"].as<bool>(false);
    binding.positiveButton = node["button"].as<int>(-1);
    binding.negativeButton = node["negative_button"].as<int>(-1);
    return binding;
}

} // namespace

double AxisBinding::read(const IGameController& controller, double deadZone) const {
    if (!bound()) {
        return 0.0;
    }

    double value = controller.axis(axis);
    if (inverted) {
        value = -value;
    }
    if (trigger) {
        value = (value + 1.0) / 2.0;
    }
    return applyDeadZone(std::clamp(value, -1.0, 1.0), deadZone);
}

double TwistBinding::read(const IGameController& controller, double deadZone) const {
    double value = positiveAxis.read(controller, deadZone) - negativeAxis.read(controller, deadZone);
    if (positiveButton >= 0 && controller.button(positiveButton)) {
        value += 1.0;
    }
    if (negativeButton >= 0 && controller.button(negativeButton)) {
        value -= 1.0;
    }
    return std::clamp(value, -1.0, 1.0);
}

const char* twistComponentName(int component) {
    if (component < 0 || component >= 6) {
        return "unknown";
    }
    return COMPONENT_KEYS[component];
}

std::array<double, 6> ControllerLayout::readTwist(const IGameController& controller,
                                                  double deadZone) const {
    std::array<double, 6> command{};
    for (size_t i = 0; i < twist.size(); ++i) {
        command[i] = twist[i].read(controller, deadZone);
    }
    return command;
}

int ControllerLayout::readGripperDirection(const IGameController& controller) const {
    bool open = gripperOpenButton >= 0 && controller.button(gripperOpenButton);
    bool close = gripperCloseButton >= 0 && controller.button(gripperCloseButton);
    if (open == close) {
        return 0;
    }
    return open ? 1 : -1;
}

ControllerLayout ControllerLayout::xbox360() {
    ControllerLayout layout;
    layout.name = "xbox360";

    layout.twist[LINEAR_X].positiveAxis = {XPAD_AXIS_LY, true, false};
    layout.twist[LINEAR_Y].positiveAxis = {XPAD_AXIS_LX, true, false};
    layout.twist[LINEAR_Z].positiveAxis = {XPAD_AXIS_RT, false, true};
    layout.twist[LINEAR_Z].negativeAxis = {XPAD_AXIS_LT, false, true};
    layout.twist[ANGULAR_X].positiveAxis = {XPAD_AXIS_RY, true, false};
    layout.twist[ANGULAR_Y].positiveAxis = {XPAD_AXIS_RX, false, false};
    layout.twist[ANGULAR_Z].positiveButton = XPAD_BUTTON_LB;
    layout.twist[ANGULAR_Z].negativeButton = XPAD_BUTTON_RB;

    layout.gripperOpenButton = XPAD_BUTTON_B;
    layout.gripperCloseButton = XPAD_BUTTON_A;
    return layout;
}

ControllerLayout ControllerLayout::fromYaml(const YAML::Node& node) {
    ControllerLayout layout = xbox360();
    if (!node || !node.IsMap()) {
        return layout;
    }

    layout.name = node["name"].as<std::string>("custom");
    for (int i = 0; i < 6; ++i) {
        YAML::Node entry = node[COMPONENT_KEYS[i]];
        if (!entry) {
            continue;
        }
        if (!entry.IsMap()) {
            LOG_WARN("Controller mapping '{}' is not a mapping, leaving it unbound",
                     COMPONENT_KEYS[i]);
            layout.twist[i] = TwistBinding{};
            continue;
        }
        layout.twist[i] = parseBinding(entry);
    }
    layout.gripperOpenButton = node["gripper_open_button"].as<int>(layout.gripperOpenButton);
    layout.gripperCloseButton = node["gripper_close_button"].as<int>(layout.gripperCloseButton);
    return layout;
}

} // namespace gamepad
} // namespace ur_teleop
