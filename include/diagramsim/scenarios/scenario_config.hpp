/**
 * @file scenario_config.hpp
 * @brief Configuration for a simulation scenario.
 */

#pragma once

#include <optional>
#include <string>
#include <vector>

#include "diagramsim/core/coordinates.hpp"
#include "diagramsim/core/system_config.hpp"
#include "diagramsim/normalization/scene_normalizer.hpp"
#include "diagramsim/systems/systems.hpp"

/**
 * @brief How a scenario wants its scene prepared and stepped.
 *
 * A scenario built from a diagram carries the source image size. When it also
 * asks for normalization, the scene is fitted inside that image before it is
 * loaded.
 */
struct ScenarioConfig {
    std::string name;

    std::optional<Simulation::ImageSize> imageSize;

    bool normalize = false;
    Normalization::NormalizationOptions normalization;

    double TimeAcceleration = 1.0;

    // Active ECS systems for this scenario.
    std::vector<Systems::SystemType> activeSystems = {
        Systems::SystemType::GRAVITY,
        Systems::SystemType::MOVEMENT,
        Systems::SystemType::PULLEY,
    };
};

/**
 * @brief Builds the simulator configuration for a scenario.
 *
 * The time step is left at its default; the simulator takes it from the
 * scene's world settings.
 */
SystemConfig makeSystemConfig(const ScenarioConfig &cfg);
