#include "diagramsim/systems/movement.hpp"
#include "diagramsim/components/basic.hpp"
#include "diagramsim/components/sim.hpp"
#include "diagramsim/core/profile.hpp"

namespace Systems {

MovementSystem::MovementSystem() = default;

void MovementSystem::update(entt::registry &registry) {
    PROFILE_SCOPE("MovementSystem");

    const auto& state = registry.get<Components::SimulatorState>(
        registry.view<Components::SimulatorState>().front()
    );

    // Time step in real seconds (with all time scaling)
    double const dt = sysConfig.SecondsPerTick * state.baseTimeAcceleration * state.timeScale;

    auto view = registry.view<Components::Position, Components::Velocity, Components::BodyKind>();
    for (auto [entity, pos, vel, kind] : view.each()) {
        if (kind.type == Simulation::BodyType::Static) {
            continue;
        }

        pos.x += vel.x * dt;
        pos.y += vel.y * dt;

        auto* angle = registry.try_get<Components::AngularPosition>(entity);
        const auto* omega = registry.try_get<Components::AngularVelocity>(entity);
        if (angle && omega) {
            angle->angle += omega->omega * dt;
        }
    }
}

} // namespace Systems
