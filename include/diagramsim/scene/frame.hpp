/**
 * @file frame.hpp
 * @brief Snapshots of body state produced while stepping a scene
 */

#pragma once

#include <optional>
#include <string>
#include <vector>

#include "diagramsim/math/aabb.hpp"
#include "diagramsim/math/vector_math.hpp"
#include "diagramsim/scene/scene.hpp"

namespace Simulation {

struct FrameBodyState {
    std::string id;
    Position position_m;
    Vector velocity_m_s;
    double angle_rad = 0.0;
    double angular_velocity_rad_s = 0.0;
};

struct SimulationFrame {
    double t = 0.0;  ///< Seconds since the scene was loaded
    std::vector<FrameBodyState> bodies;

    /** @brief State of one body, or nullptr */
    const FrameBodyState* find(const std::string& id) const;
};

/**
 * @brief Union of all finite body positions over the frames.
 * @return nullopt when no frame holds a finite position
 */
std::optional<Aabb> motionBounds(const std::vector<SimulationFrame>& frames);

/**
 * @brief Union of the AABBs of every body in the scene.
 * @return nullopt when no body has a finite position
 */
std::optional<Aabb> sceneBounds(const Scene& scene);

} // namespace Simulation
