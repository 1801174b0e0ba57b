/**
 * @file renderer.hpp
 * @brief SFML drawing of a running scene
 *
 * This system handles:
 * - The letterboxed outline of the source image, when the scene has one
 * - Body shapes (circles, rotated rectangles, polygons)
 * - Pulley wheels and rope segments
 * - Status text (scenario, time, pause state, FPS)
 *
 * Every frame maps meters to window pixels through a Coordinates object that
 * is refreshed whenever the scene or the window size changes.
 */

#ifndef DIAGRAMSIM_RENDERER_HPP
#define DIAGRAMSIM_RENDERER_HPP

#include <entt/entt.hpp>
#include <optional>
#include <string>
#include <SFML/Graphics.hpp>

#include "diagramsim/core/coordinates.hpp"
#include "diagramsim/scene/scene.hpp"

class Renderer {
public:
    Renderer(int screenWidth, int screenHeight);
    ~Renderer();

    /**
     * @brief Opens the window and loads the UI font
     * @return false if the window could not be created
     */
    bool init();

    void clear();
    void present();

    /** @brief Window size as seen by the coordinate transform */
    Simulation::ContainerSize containerSize() const;

    /**
     * @brief Tracks a window resize and recomputes the transform
     */
    void resize(unsigned int width, unsigned int height);

    /**
     * @brief Recomputes the meter to pixel transform
     *
     * @param scene Scene being shown (its mapping decides the transform)
     * @param imageSize Source diagram size, if any
     * @param motionBounds Region the bodies are expected to sweep
     */
    void updateTransform(const Simulation::Scene& scene,
                         const std::optional<Simulation::ImageSize>& imageSize,
                         const std::optional<Aabb>& motionBounds);

    /** @brief Outline of the source image inside the window */
    void renderImageBounds();

    void renderBodies(const entt::registry& registry);

    /** @brief Rope segments from each body to its wheel, and the wheel */
    void renderPulleys(const entt::registry& registry);

    void renderFPS(float fps);

    void renderText(const std::string& text, int x, int y, sf::Color color = sf::Color::White);

    bool isInitialized() const { return initialized; }

    const Simulation::Coordinates& getCoordinates() const { return coordinates; }

    sf::RenderWindow& getWindow() { return window; }

private:
    sf::RenderWindow window;
    sf::Font font;
    bool fontLoaded;
    bool initialized;
    int screenWidth;
    int screenHeight;

    Simulation::Coordinates coordinates;
    Simulation::Scene shownScene;
    std::optional<Simulation::ImageSize> shownImage;
    std::optional<Aabb> shownBounds;

    sf::Vector2f toScreen(const Position& pointM) const;
};

#endif
