#include "diagramsim/scene/scene_validation.hpp"

#include <sstream>
#include <unordered_set>

#include "diagramsim/core/debug.hpp"

namespace Simulation {

const Body* findBody(const Scene& scene, const std::string& id) {
    for (const auto& body : scene.bodies) {
        if (body.id == id) {
            return &body;
        }
    }
    return nullptr;
}

SceneIssues validateScene(const Scene& scene) {
    SceneIssues issues;
    std::unordered_set<std::string> seen;

    for (const auto& body : scene.bodies) {
        if (!seen.insert(body.id).second) {
            issues.warnings.push_back("Duplicate body id " + body.id);
        }
        if (!body.position_m.isFinite()) {
            issues.warnings.push_back("Body " + body.id + " has a non-finite position");
        }
    }

    for (const auto& constraint : scene.constraints) {
        for (const auto& ref : referencedBodies(constraint)) {
            if (seen.count(ref) == 0) {
                std::ostringstream msg;
                msg << "Constraint " << constraintId(constraint) << " (" << constraintKind(constraint)
                    << ") references unknown body " << ref;
                issues.warnings.push_back(msg.str());
            }
        }
    }

    for (const auto& w : issues.warnings) {
        DIAGRAMSIM_WARN(w);
    }
    return issues;
}

Scene resolveRopeLengths(const Scene& scene) {
    Scene out = scene;
    for (auto& constraint : out.constraints) {
        auto* pulley = std::get_if<IdealFixedPulleyConstraint>(&constraint);
        if (pulley == nullptr || pulley->rope_length_m) {
            continue;
        }
        const Body* a = findBody(out, pulley->body_a);
        const Body* b = findBody(out, pulley->body_b);
        if (a == nullptr || b == nullptr) {
            continue;
        }
        pulley->rope_length_m = a->position_m.dist(pulley->pulley_anchor_m) +
                                b->position_m.dist(pulley->pulley_anchor_m);
    }
    return out;
}

} // namespace Simulation
