#include "DriverFactory.hpp"
#include "RobotSimulator.hpp"
#include "UrRtdeDriver.hpp"
#include "../logging/Logger.hpp"

namespace ur_teleop {
namespace robot {

bool isSimulatedDriver(const config::RobotConfig& config) {
    return config.driver == "sim";
}

RobotDriverFactory makeRobotDriverFactory(const config::RobotConfig& config) {
    if (isSimulatedDriver(config)) {
        LOG_INFO("Robot driver: simulator");
        return []() -> std::unique_ptr<IRobotDriver> {
            return std::make_unique<RobotSimulator>();
        };
    }

    if (config.driver != "ur_rtde") {
        LOG_WARN("Unknown robot driver '{}', using ur_rtde", config.driver);
    }
    LOG_INFO("Robot driver: ur_rtde ({})", config.model);
    return [config]() -> std::unique_ptr<IRobotDriver> {
        return std::make_unique<UrRtdeDriver>(config);
    };
}

GripperFactory makeGripperFactory(const config::RobotConfig& robotConfig,
                                  const config::GripperConfig& gripperConfig) {
    if (!gripperConfig.enabled) {
        return nullptr;
    }
    if (isSimulatedDriver(robotConfig)) {
        double maxWidth = gripperConfig.max_width_m;
        return [maxWidth]() -> std::unique_ptr<IGripper> {
            return std::make_unique<GripperSimulator>(maxWidth);
        };
    }
    return [gripperConfig]() -> std::unique_ptr<IGripper> {
        return std::make_unique<RobotiqGripperDriver>(gripperConfig);
    };
}

} // namespace robot
} // namespace ur_teleop
