#pragma once

#include <vector>
#include "diagramsim/systems/systems.hpp"

/**
 * @struct SystemConfig
 * @brief Holds all system configuration parameters for the simulation.
 */
struct SystemConfig {
    double SecondsPerTick = 0.016;
    double TimeAcceleration = 1.0;

    std::vector<Systems::SystemType> activeSystems = {
        Systems::SystemType::GRAVITY,
        Systems::SystemType::MOVEMENT,
        Systems::SystemType::PULLEY,
    };
};
