#include "diagramsim/scene/frame.hpp"

#include "diagramsim/scene/scene_geometry.hpp"

namespace Simulation {

const FrameBodyState* SimulationFrame::find(const std::string& id) const {
    for (const auto& b : bodies) {
        if (b.id == id) {
            return &b;
        }
    }
    return nullptr;
}

std::optional<Aabb> motionBounds(const std::vector<SimulationFrame>& frames) {
    Aabb bounds;
    for (const auto& frame : frames) {
        for (const auto& b : frame.bodies) {
            if (b.position_m.isFinite()) {
                bounds.expand(b.position_m);
            }
        }
    }
    if (bounds.isEmpty()) {
        return std::nullopt;
    }
    return bounds;
}

std::optional<Aabb> sceneBounds(const Scene& scene) {
    Aabb bounds;
    for (const auto& body : scene.bodies) {
        if (auto box = bodyAabb(body)) {
            bounds.merge(*box);
        }
    }
    if (bounds.isEmpty()) {
        return std::nullopt;
    }
    return bounds;
}

} // namespace Simulation
