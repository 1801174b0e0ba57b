#pragma once

/**
 * @brief Defines available ECS systems for the diagram simulator.
 */
namespace Systems {

/**
 * @enum SystemType
 * @brief The ECS systems that can be activated for a scene, in tick order.
 */
enum class SystemType {
    GRAVITY,
    MOVEMENT,
    PULLEY,
};

} // namespace Systems
