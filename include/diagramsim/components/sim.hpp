#pragma once

#include <string>

#include <entt/entt.hpp>

#include "diagramsim/math/vector_math.hpp"

namespace Components {
    struct SimulatorState {
        double baseTimeAcceleration = 1.0;
        double timeScale = 1.0;
        double elapsedSeconds = 0.0;

        SimulatorState(double bta = 1.0, double ts = 1.0)
            : baseTimeAcceleration(bta)
            , timeScale(ts) {}
    };

    // Ideal fixed pulley joining two body entities over a fixed wheel
    struct PulleyRope {
        std::string id;
        entt::entity bodyA = entt::null;
        entt::entity bodyB = entt::null;
        Position anchor;
        double totalLength = 0.0;
        double wheelRadius = 0.0;
    };
}
