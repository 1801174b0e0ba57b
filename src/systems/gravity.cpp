/**
 * @file gravity.cpp
 * @brief Implementation of the uniform gravity system
 */

#include "diagramsim/core/profile.hpp"
#include "diagramsim/systems/gravity.hpp"
#include "diagramsim/components/basic.hpp"
#include "diagramsim/components/sim.hpp"
#include "diagramsim/core/constants.hpp"
#include <cmath>

namespace Systems {

BasicGravitySystem::BasicGravitySystem() {
    specificConfig.gravitationalAcceleration = SimulatorConstants::DefaultGravity;
}

void BasicGravitySystem::update(entt::registry& registry) {
    PROFILE_SCOPE("BasicGravitySystem");

    const auto& state = registry.get<Components::SimulatorState>(
        registry.view<Components::SimulatorState>().front()
    );

    double const gravity = std::isfinite(specificConfig.gravitationalAcceleration)
                               ? specificConfig.gravitationalAcceleration
                               : SimulatorConstants::DefaultGravity;

    double const dt = sysConfig.SecondsPerTick *
                state.baseTimeAcceleration *
                state.timeScale;

    auto view = registry.view<Components::BodyKind, Components::Velocity>();
    for (auto [entity, kind, vel] : view.each()) {
        if (kind.type != Simulation::BodyType::Dynamic) {
            continue;
        }
        vel.y -= gravity * dt;
    }
}

} // namespace Systems
