/**
 * @file movement.hpp
 * @brief System for updating positions and angles from velocities
 *
 * Required components:
 * - Position (to modify)
 * - Velocity (to read)
 * - BodyKind (static bodies never move)
 *
 * Optional components:
 * - AngularPosition and AngularVelocity (integrated together)
 */

#ifndef DIAGRAMSIM_MOVEMENT_SYSTEM_HPP
#define DIAGRAMSIM_MOVEMENT_SYSTEM_HPP

#include <entt/entt.hpp>
#include "diagramsim/systems/i_system.hpp"

namespace Systems {

/**
 * @brief Explicit Euler position update for every non-static body
 */
class MovementSystem : public ISystem {
public:
    MovementSystem();
    ~MovementSystem() override = default;

    void update(entt::registry &registry) override;
};

} // namespace Systems

#endif
