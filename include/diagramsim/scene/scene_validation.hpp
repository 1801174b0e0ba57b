/**
 * @file scene_validation.hpp
 * @brief Reference checks and derived defaults for freshly parsed scenes
 */

#pragma once

#include <string>
#include <vector>

#include "diagramsim/scene/scene.hpp"

namespace Simulation {

/**
 * @brief Problems found in a scene. None of them stop processing.
 */
struct SceneIssues {
    std::vector<std::string> warnings;

    bool empty() const { return warnings.empty(); }
};

/**
 * @brief Looks up a body by id.
 * @return Pointer into scene.bodies, or nullptr if absent
 */
const Body* findBody(const Scene& scene, const std::string& id);

/**
 * @brief Checks for duplicate body ids, non-finite body positions and
 * constraints that reference unknown bodies.
 */
SceneIssues validateScene(const Scene& scene);

/**
 * @brief Returns a copy of scene where every pulley without a rope length
 * gets the sum of its two initial anchor distances.
 *
 * Pulleys whose bodies are missing are left unchanged.
 */
Scene resolveRopeLengths(const Scene& scene);

} // namespace Simulation
