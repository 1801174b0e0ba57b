#ifndef DIAGRAMSIM_COMPONENTS_BASIC_HPP
#define DIAGRAMSIM_COMPONENTS_BASIC_HPP

#include <string>

#include "diagramsim/math/vector_math.hpp" // for Position, Vector
#include "diagramsim/scene/scene.hpp"

namespace Components {

    // Meters, Y up
    using Position = ::Position;
    using Velocity = ::Vector;

    struct Mass {
        double value;
    };

    // Angular components
    struct AngularPosition {
        double angle; // radians
    };

    struct AngularVelocity {
        double omega; // radians per second
    };

    // Scene id of the body an entity was built from
    struct BodyId {
        std::string value;
    };

    struct BodyKind {
        Simulation::BodyType type;
    };

    // Polygon vertices are stored relative to the body position
    struct Collider {
        Simulation::Collider shape;
    };

    struct Material {
        Simulation::Material value;
    };

} // namespace Components

#endif
