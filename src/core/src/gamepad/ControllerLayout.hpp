/**
 * @file ControllerLayout.hpp
 * @brief Mapping from controller axes/buttons to twist components and gripper
 */

#pragma once

#include "IGameController.hpp"
#include <array>
#include <string>

namespace YAML {
class Node;
}

namespace ur_teleop {
namespace gamepad {

/**
 * One analog input.
 * Triggers rest at -1 and are rescaled to [0, 1].
 */
struct AxisBinding {
    int axis = -1;          // -1 = unbound
    bool inverted = false;
    bool trigger = false;

    double read(const IGameController& controller, double deadZone) const;
    bool bound() const { return axis >= 0; }
};

/**
 * Everything that drives one twist component:
 * positive axis - negative axis + positive button - negative button, clamped to [-1, 1]
 */
struct TwistBinding {
    AxisBinding positiveAxis;
    AxisBinding negativeAxis;
    int positiveButton = -1;
    int negativeButton = -1;

    double read(const IGameController& controller, double deadZone) const;
};

enum TwistComponent : int {
    LINEAR_X = 0,
    LINEAR_Y,
    LINEAR_Z,
    ANGULAR_X,
    ANGULAR_Y,
    ANGULAR_Z
};

const char* twistComponentName(int component);

struct ControllerLayout {
    std::string name = "xbox360";
    std::array<TwistBinding, 6> twist{};
    int gripperOpenButton = -1;
    int gripperCloseButton = -1;

    /**
     * Normalized twist command, each component in [-1, 1]
     */
    std::array<double, 6> readTwist(const IGameController& controller, double deadZone) const;

    /**
     * +1 open, -1 close, 0 idle (both held = idle)
     */
    int readGripperDirection(const IGameController& controller) const;

    /**
     * Xbox 360 pad on the Linux xpad driver:
     *  left stick  -> X/Y translation
     *  triggers    -> Z translation (RT up, LT down)
     *  right stick -> rotation about X/Y
     *  bumpers     -> rotation about Z
     *  B / A       -> gripper open / close
     */
    static ControllerLayout xbox360();

    /**
     * Build a layout from a YAML mapping; unspecified entries keep the
     * Xbox 360 defaults. An entry that is present but unparsable is unbound.
     */
    static ControllerLayout fromYaml(const YAML::Node& node);
};

} // namespace gamepad
} // namespace ur_teleop
