/**
 * @file simulator.hpp
 * @brief Steps a scene with ECS systems and reads the body state back out
 */

#pragma once

#include <cstddef>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

#include <entt/entt.hpp>

#include "diagramsim/core/system_config.hpp"
#include "diagramsim/scene/frame.hpp"
#include "diagramsim/scene/scene.hpp"
#include "diagramsim/systems/i_system.hpp"

/**
 * @class ECSSimulator
 * @brief Owns an ECS registry built from a Scene and the systems that step it.
 *
 * One tick runs gravity, movement and pulley correction in that order.
 */
class ECSSimulator {
private:
    entt::registry registry;
    std::vector<std::unique_ptr<Systems::ISystem>> systems;
    SystemConfig currentConfig;

    Simulation::Scene loadedScene;
    std::vector<entt::entity> bodyOrder;
    std::unordered_map<std::string, entt::entity> bodyEntities;
    std::vector<std::string> loadWarnings;

    void createSystems();

public:
    ECSSimulator();
    ~ECSSimulator();

    /**
     * @brief Replaces the shared system configuration.
     *
     * Takes effect on the next loadScene() or reset(). The time step is always
     * taken from the scene's world settings.
     */
    void applyConfig(const SystemConfig& cfg);

    /**
     * @brief Clears the registry and builds one entity per scene body plus one
     * per ideal fixed pulley.
     *
     * A non-positive or non-finite world time step falls back to 0.016 s.
     * Validation and registration problems end up in warnings().
     */
    void loadScene(const Simulation::Scene& scene);

    /** @brief Reloads the last scene passed to loadScene() */
    void reset();

    /** @brief Steps every active system once */
    void tick();

    /** @brief Current state of every body, in scene order */
    Simulation::SimulationFrame snapshot() const;

    /**
     * @brief Ticks until duration_s has elapsed or maxSteps steps were taken.
     * @return The current state followed by one frame per step
     */
    std::vector<Simulation::SimulationFrame> run(double duration_s = 5.0, std::size_t maxSteps = 1000);

    /**
     * @brief Copy of scene with the simulated state of matching bodies.
     *
     * Bodies are matched by id. Polygon vertices follow their body.
     */
    Simulation::Scene writeBack(const Simulation::Scene& scene) const;

    double elapsedSeconds() const;
    double timeStep() const { return currentConfig.SecondsPerTick; }

    const std::vector<std::string>& warnings() const { return loadWarnings; }
    const Simulation::Scene& scene() const { return loadedScene; }

    entt::registry& getRegistry();
    const entt::registry& getRegistry() const;
};
