/**
 * @file pulley_constraint.hpp
 * @brief Ideal fixed pulley: keeps the summed rope length of two bodies constant
 *
 * The integrator has no notion of a rope over a wheel, so after every step the
 * two bodies are projected back onto the rope length and the part of their
 * velocities that would stretch or slacken the rope is removed.
 *
 * Required components:
 * - PulleyRope (one entity per pulley)
 * - Position, Velocity, Mass, BodyKind (on the two body entities)
 */

#ifndef DIAGRAMSIM_PULLEY_CONSTRAINT_HPP
#define DIAGRAMSIM_PULLEY_CONSTRAINT_HPP

#include <string>
#include <unordered_map>
#include <vector>

#include <entt/entt.hpp>

#include "diagramsim/components/sim.hpp"
#include "diagramsim/scene/scene.hpp"
#include "diagramsim/systems/i_system.hpp"

namespace Systems {

/**
 * @struct PulleyConfig
 * @brief Tolerances below which a pulley is left alone
 */
struct PulleyConfig {
    // Rope length error in meters
    double lengthTolerance = 1e-4;

    // Summed rope-direction speed in m/s
    double speedTolerance = 1e-5;
};

class PulleyConstraintSystem : public ConfigurableSystem<PulleyConfig> {
public:
    PulleyConstraintSystem();
    ~PulleyConstraintSystem() override = default;

    /**
     * @brief Creates a PulleyRope entity for every ideal fixed pulley in the scene
     *
     * The rope length is the declared one when positive, otherwise the sum of
     * the initial anchor to body distances.
     *
     * @param registry Registry holding the body entities
     * @param scene Scene the entities were built from
     * @param bodies Scene body id to entity
     * @return One warning per pulley skipped for a dangling body reference
     */
    static std::vector<std::string> registerPulleys(
        entt::registry& registry,
        const Simulation::Scene& scene,
        const std::unordered_map<std::string, entt::entity>& bodies);

    /**
     * @brief Projects one pulley back onto its rope length
     *
     * @return true if a position or velocity was corrected
     */
    static bool enforce(entt::registry& registry,
                        const Components::PulleyRope& rope,
                        const PulleyConfig& config);

    void update(entt::registry& registry) override;
};

} // namespace Systems

#endif
