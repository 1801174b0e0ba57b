/**
 * @fileoverview simulator.cpp
 * @brief Implementation of ECSSimulator.
 */

#include "diagramsim/core/simulator.hpp"

#include <algorithm>
#include <cmath>
#include <memory>

#include "diagramsim/components/basic.hpp"
#include "diagramsim/components/sim.hpp"
#include "diagramsim/core/constants.hpp"
#include "diagramsim/core/debug.hpp"
#include "diagramsim/core/profile.hpp"
#include "diagramsim/scene/scene_geometry.hpp"
#include "diagramsim/scene/scene_validation.hpp"
#include "diagramsim/systems/gravity.hpp"
#include "diagramsim/systems/movement.hpp"
#include "diagramsim/systems/pulley_constraint.hpp"

ECSSimulator::ECSSimulator() = default;

ECSSimulator::~ECSSimulator() = default;

void ECSSimulator::applyConfig(const SystemConfig& cfg) {
  currentConfig = cfg;

  for (auto& system : systems) {
    system->setSystemConfig(currentConfig);
  }
}

void ECSSimulator::loadScene(const Simulation::Scene& scene) {
  loadedScene = scene;
  loadWarnings = Simulation::validateScene(scene).warnings;

  double const dt = scene.world.time_step_s;
  currentConfig.SecondsPerTick = (std::isfinite(dt) && dt > 0.0) ? dt : SimulatorConstants::DefaultTimeStep;

  registry.clear();
  bodyOrder.clear();
  bodyEntities.clear();

  auto stateEntity = registry.create();
  registry.emplace<Components::SimulatorState>(stateEntity, currentConfig.TimeAcceleration, 1.0);

  for (const auto& body : scene.bodies) {
    auto entity = registry.create();
    registry.emplace<Components::Position>(entity, body.position_m);
    registry.emplace<Components::Velocity>(entity, body.velocity_m_s.isFinite() ? body.velocity_m_s : Vector());
    registry.emplace<Components::AngularPosition>(entity, finiteOr(body.angle_rad, 0.0));
    registry.emplace<Components::AngularVelocity>(entity, finiteOr(body.angular_velocity_rad_s, 0.0));
    registry.emplace<Components::Mass>(entity, body.mass_kg);
    registry.emplace<Components::BodyId>(entity, body.id);
    registry.emplace<Components::BodyKind>(entity, body.type);
    Simulation::Collider local = body.collider;
    if (body.position_m.isFinite()) {
      for (auto& v : local.vertices_m) {
        v -= body.position_m;
      }
    }
    registry.emplace<Components::Collider>(entity, local);
    registry.emplace<Components::Material>(entity, body.material);

    bodyOrder.push_back(entity);
    bodyEntities.emplace(body.id, entity);
  }

  auto pulleyWarnings = Systems::PulleyConstraintSystem::registerPulleys(registry, scene, bodyEntities);
  loadWarnings.insert(loadWarnings.end(), pulleyWarnings.begin(), pulleyWarnings.end());

  createSystems();

  DIAGRAMSIM_INFO("Loaded scene: " << scene.bodies.size() << " bodies, "
                  << scene.constraints.size() << " constraints, dt " << currentConfig.SecondsPerTick << " s");
}

void ECSSimulator::reset() {
  Simulation::Scene const scene = loadedScene;
  loadScene(scene);
}

void ECSSimulator::createSystems() {
  systems.clear();

  for (auto type : currentConfig.activeSystems) {
    switch (type) {
      case Systems::SystemType::GRAVITY: {
        auto gravity = std::make_unique<Systems::BasicGravitySystem>();
        Systems::GravityConfig cfg;
        cfg.gravitationalAcceleration = finiteOr(loadedScene.world.gravity_m_s2, SimulatorConstants::DefaultGravity);
        gravity->setSpecificConfig(cfg);
        systems.push_back(std::move(gravity));
        break;
      }
      case Systems::SystemType::MOVEMENT:
        systems.push_back(std::make_unique<Systems::MovementSystem>());
        break;
      case Systems::SystemType::PULLEY:
        systems.push_back(std::make_unique<Systems::PulleyConstraintSystem>());
        break;
    }
  }

  for (auto& system : systems) {
    system->setSystemConfig(currentConfig);
  }
}

void ECSSimulator::tick() {
  PROFILE_SCOPE("ECSSimulator::tick");

  if (bodyOrder.empty()) {
    return;
  }

  for (auto& system : systems) {
    system->update(registry);
  }

  auto& state = registry.get<Components::SimulatorState>(
      registry.view<Components::SimulatorState>().front());
  state.elapsedSeconds += currentConfig.SecondsPerTick * state.baseTimeAcceleration * state.timeScale;
}

double ECSSimulator::elapsedSeconds() const {
  auto view = registry.view<const Components::SimulatorState>();
  if (view.empty()) {
    return 0.0;
  }
  return view.get<const Components::SimulatorState>(view.front()).elapsedSeconds;
}

Simulation::SimulationFrame ECSSimulator::snapshot() const {
  Simulation::SimulationFrame frame;
  frame.t = elapsedSeconds();
  frame.bodies.reserve(bodyOrder.size());

  for (auto entity : bodyOrder) {
    Simulation::FrameBodyState body;
    body.id = registry.get<Components::BodyId>(entity).value;
    body.position_m = registry.get<Components::Position>(entity);
    body.velocity_m_s = registry.get<Components::Velocity>(entity);
    body.angle_rad = registry.get<Components::AngularPosition>(entity).angle;
    body.angular_velocity_rad_s = registry.get<Components::AngularVelocity>(entity).omega;
    frame.bodies.push_back(body);
  }
  return frame;
}

std::vector<Simulation::SimulationFrame> ECSSimulator::run(double duration_s, std::size_t maxSteps) {
  PROFILE_SCOPE("ECSSimulator::run");

  std::vector<Simulation::SimulationFrame> frames;
  frames.push_back(snapshot());

  double const duration = (std::isfinite(duration_s) && duration_s > 0.0) ? duration_s : 0.0;
  auto const wanted = static_cast<std::size_t>(std::ceil(duration / currentConfig.SecondsPerTick - EPSILON));
  std::size_t const steps = std::min(wanted, maxSteps);

  frames.reserve(steps + 1);
  for (std::size_t i = 0; i < steps; ++i) {
    tick();
    frames.push_back(snapshot());
  }
  return frames;
}

Simulation::Scene ECSSimulator::writeBack(const Simulation::Scene& scene) const {
  Simulation::Scene out = scene;
  for (auto& body : out.bodies) {
    auto it = bodyEntities.find(body.id);
    if (it == bodyEntities.end()) {
      continue;
    }
    const auto& pos = registry.get<Components::Position>(it->second);
    if (body.position_m.isFinite() && pos.isFinite()) {
      Simulation::translateBody(body, Vector(pos - body.position_m));
    }
    body.position_m = pos;
    body.velocity_m_s = registry.get<Components::Velocity>(it->second);
    body.angle_rad = registry.get<Components::AngularPosition>(it->second).angle;
    body.angular_velocity_rad_s = registry.get<Components::AngularVelocity>(it->second).omega;
  }
  return out;
}

entt::registry& ECSSimulator::getRegistry() {
  return registry;
}

const entt::registry& ECSSimulator::getRegistry() const {
  return registry;
}
