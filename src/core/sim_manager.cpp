/**
 * @file sim_manager.cpp
 * @brief Implementation of SimManager, which orchestrates the simulator, renderer and scenarios.
 */

#include <sstream>

#include <SFML/System/Clock.hpp>
#include <SFML/Window/Event.hpp>

#include "diagramsim/core/constants.hpp"
#include "diagramsim/core/debug.hpp"
#include "diagramsim/core/profile.hpp"
#include "diagramsim/core/sim_manager.hpp"
#include "diagramsim/scene/frame.hpp"

SimManager::SimManager()
    : renderer(static_cast<int>(SimulatorConstants::ScreenWidth),
               static_cast<int>(SimulatorConstants::ScreenHeight))
    , simulator()
    , scenarioManager()
    , running(true)
    , paused(false)
    , stepFrame(false)
{
}

bool SimManager::init()
{
    if (!renderer.init())
    {
        DIAGRAMSIM_WARN("Renderer initialization failed.");
        return false;
    }

    scenarioManager.buildScenarioList();
    scenarioManager.setInitialScenario(SimulatorConstants::SimulationType::PULLEY);
    selectScenario(scenarioManager.getCurrentScenario());
    return true;
}

void SimManager::run()
{
    sf::Clock clock;
    while (running && renderer.getWindow().isOpen())
    {
        float const elapsed = clock.restart().asSeconds();
        float const fps = elapsed > 0.F ? 1.F / elapsed : 0.F;

        if (!handleEvents())
        {
            break;
        }
        tick();
        render(fps);
    }
    renderer.getWindow().close();
}

bool SimManager::handleEvents()
{
    sf::RenderWindow& window = renderer.getWindow();

    sf::Event event;
    while (window.pollEvent(event))
    {
        if (event.type == sf::Event::Closed)
        {
            running = false;
        }
        else if (event.type == sf::Event::Resized)
        {
            renderer.resize(event.size.width, event.size.height);
        }
        else if (event.type == sf::Event::KeyPressed)
        {
            switch (event.key.code)
            {
                case sf::Keyboard::Escape:
                    running = false;
                    break;
                case sf::Keyboard::P:
                    togglePause();
                    break;
                case sf::Keyboard::Space:
                    if (paused)
                    {
                        stepOnce();
                    }
                    break;
                case sf::Keyboard::R:
                    resetSimulator();
                    break;
                case sf::Keyboard::Num1:
                    selectScenario(SimulatorConstants::SimulationType::PULLEY);
                    break;
                case sf::Keyboard::Num2:
                    selectScenario(SimulatorConstants::SimulationType::GROUND_BLOCK);
                    break;
                case sf::Keyboard::Num3:
                    selectScenario(SimulatorConstants::SimulationType::RAMP_BLOCK);
                    break;
                default:
                    break;
            }
        }
    }
    return running;
}

void SimManager::tick()
{
    if (!paused || stepFrame)
    {
        simulator.tick();
        stepFrame = false;
    }
}

void SimManager::render(float fps)
{
    PROFILE_SCOPE("SimManager::render");

    renderer.clear();
    renderer.renderImageBounds();
    renderer.renderPulleys(simulator.getRegistry());
    renderer.renderBodies(simulator.getRegistry());

    renderer.renderFPS(fps);

    std::ostringstream status;
    status << scenarioManager.getCurrentConfig().name
           << "  t = " << simulator.elapsedSeconds() << " s"
           << (paused ? "  [paused]" : "");
    renderer.renderText(status.str(), 10, 30);

    const auto& report = scenarioManager.getLastNormalization();
    int y = 50;
    for (const auto& warning : simulator.warnings())
    {
        renderer.renderText(warning, 10, y, sf::Color(240, 200, 80));
        y += 20;
    }
    for (const auto& warning : report.warnings)
    {
        renderer.renderText(warning, 10, y, sf::Color(240, 200, 80));
        y += 20;
    }

    renderer.present();
}

void SimManager::togglePause()
{
    paused = !paused;
}

void SimManager::resetSimulator()
{
    simulator.reset();
    paused = false;
}

void SimManager::stepOnce()
{
    stepFrame = true;
}

void SimManager::selectScenario(SimulatorConstants::SimulationType scenario)
{
    scenarioManager.updateSimulatorState(simulator, scenario);
    refreshTransform();
    paused = false;
}

void SimManager::refreshTransform()
{
    const Simulation::Scene& scene = simulator.scene();

    ECSSimulator preview;
    preview.applyConfig(makeSystemConfig(scenarioManager.getCurrentConfig()));
    preview.loadScene(scene);
    auto bounds = Simulation::motionBounds(preview.run());

    if (auto sceneBox = Simulation::sceneBounds(scene))
    {
        if (bounds)
        {
            bounds->merge(*sceneBox);
        }
        else
        {
            bounds = sceneBox;
        }
    }

    renderer.updateTransform(scene, scenarioManager.getCurrentConfig().imageSize, bounds);
}
