/**
 * @file gravity.hpp
 * @brief Uniform gravitational field along -y
 *
 * Required components:
 * - BodyKind (only Dynamic bodies are accelerated)
 * - Velocity (to modify)
 */

#ifndef DIAGRAMSIM_GRAVITY_SYSTEM_HPP
#define DIAGRAMSIM_GRAVITY_SYSTEM_HPP

#include <entt/entt.hpp>
#include "diagramsim/systems/i_system.hpp"

namespace Systems {

/**
 * @struct GravityConfig
 * @brief Configuration parameters specific to the gravity system
 */
struct GravityConfig {
    // Gravitational acceleration magnitude in m/s²
    double gravitationalAcceleration = 9.81;
};

/**
 * @class BasicGravitySystem
 * @brief Applies constant downward acceleration to dynamic bodies
 */
class BasicGravitySystem : public ConfigurableSystem<GravityConfig> {
public:
    BasicGravitySystem();
    ~BasicGravitySystem() override = default;

    void update(entt::registry& registry) override;
};

} // namespace Systems

#endif
