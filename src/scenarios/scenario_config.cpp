/**
 * @file scenario_config.cpp
 * @brief Maps a scenario configuration onto the simulator configuration
 */

#include "diagramsim/scenarios/scenario_config.hpp"

#include <cmath>

SystemConfig makeSystemConfig(const ScenarioConfig &cfg) {
    SystemConfig sys;
    sys.TimeAcceleration = (std::isfinite(cfg.TimeAcceleration) && cfg.TimeAcceleration > 0.0)
                               ? cfg.TimeAcceleration
                               : 1.0;
    sys.activeSystems = cfg.activeSystems;
    return sys;
}
