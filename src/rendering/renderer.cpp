#include "diagramsim/rendering/renderer.hpp"
#include "diagramsim/core/constants.hpp"
#include "diagramsim/core/debug.hpp"
#include "diagramsim/components/basic.hpp"
#include "diagramsim/components/sim.hpp"

#include <sstream>
#include <iomanip>
#include <algorithm>
#include <cmath>

static sf::Color bodyColor(Simulation::BodyType type) {
    switch (type) {
        case Simulation::BodyType::Static:    return {110, 110, 120};
        case Simulation::BodyType::Kinematic: return {90, 160, 220};
        case Simulation::BodyType::Dynamic:
        default:                              return {230, 150, 60};
    }
}

Renderer::Renderer(int screenWidth, int screenHeight)
    : fontLoaded(false)
    , initialized(false)
    , screenWidth(screenWidth)
    , screenHeight(screenHeight)
{
}

Renderer::~Renderer() = default;

bool Renderer::init() {
    window.create(sf::VideoMode(screenWidth, screenHeight), "Diagram Simulator");
    if (!window.isOpen()) {
        DIAGRAMSIM_WARN("Failed to create the render window");
        return false;
    }
    window.setFramerateLimit(SimulatorConstants::StepsPerSecond);

    // Text is optional; shapes still draw without a font
    fontLoaded = font.loadFromFile("assets/fonts/arial.ttf");
    if (!fontLoaded) {
        DIAGRAMSIM_WARN("Failed to load font assets/fonts/arial.ttf; text is disabled");
    }
    initialized = true;
    return true;
}

void Renderer::clear() {
    window.clear(sf::Color(20, 20, 24));
}

void Renderer::present() {
    window.display();
}

Simulation::ContainerSize Renderer::containerSize() const {
    return {static_cast<double>(screenWidth), static_cast<double>(screenHeight)};
}

void Renderer::resize(unsigned int width, unsigned int height) {
    screenWidth = static_cast<int>(width);
    screenHeight = static_cast<int>(height);
    window.setView(sf::View(sf::FloatRect(0.F, 0.F, static_cast<float>(width), static_cast<float>(height))));
    coordinates.update(shownScene, shownImage, containerSize(), shownBounds);
}

void Renderer::updateTransform(const Simulation::Scene& scene,
                               const std::optional<Simulation::ImageSize>& imageSize,
                               const std::optional<Aabb>& motionBounds) {
    shownScene = scene;
    shownImage = imageSize;
    shownBounds = motionBounds;
    coordinates.update(shownScene, shownImage, containerSize(), shownBounds);
}

sf::Vector2f Renderer::toScreen(const Position& pointM) const {
    Position const px = coordinates.toCanvas(pointM);
    return {static_cast<float>(px.x), static_cast<float>(px.y)};
}

void Renderer::renderImageBounds() {
    const auto& t = coordinates.getTransform();
    if (!t.hasMapping || !shownImage || !shownImage->isUsable()) {
        return;
    }

    auto const w = static_cast<float>(shownImage->width * t.letterboxScale);
    auto const h = static_cast<float>(shownImage->height * t.letterboxScale);
    sf::RectangleShape frame(sf::Vector2f(w, h));
    frame.setPosition(static_cast<float>(t.letterboxOffset.x), static_cast<float>(t.letterboxOffset.y));
    frame.setFillColor(sf::Color(32, 32, 38));
    frame.setOutlineColor(sf::Color(80, 80, 90));
    frame.setOutlineThickness(1.F);
    window.draw(frame);
}

void Renderer::renderBodies(const entt::registry& registry) {
    auto view = registry.view<Components::Position, Components::Collider, Components::BodyKind>();
    for (auto entity : view) {
        const auto& pos = view.get<Components::Position>(entity);
        const auto& shape = view.get<Components::Collider>(entity).shape;
        const auto& kind = view.get<Components::BodyKind>(entity);
        if (!pos.isFinite()) {
            continue;
        }

        sf::Color const fillColor = bodyColor(kind.type);
        sf::Vector2f const center = toScreen(pos);

        double angleDeg = 0.0;
        if (const auto* angPos = registry.try_get<Components::AngularPosition>(entity)) {
            angleDeg = angPos->angle * 180.0 / SimulatorConstants::Pi;
        }

        switch (shape.type) {
            case Simulation::ColliderType::Polygon: {
                sf::ConvexShape convex;
                convex.setPointCount(shape.vertices_m.size());
                for (size_t i = 0; i < shape.vertices_m.size(); ++i) {
                    convex.setPoint(i, toScreen(pos + shape.vertices_m[i]));
                }
                convex.setFillColor(fillColor);
                window.draw(convex);
                break;
            }
            case Simulation::ColliderType::Circle: {
                double const r = shape.radius_m > 0.0 ? shape.radius_m : SimulatorConstants::DefaultColliderHalfExtent;
                auto const radiusPixels = static_cast<float>(std::max(1.0, coordinates.metersToPixels(r)));
                sf::CircleShape circle(radiusPixels);
                circle.setOrigin(radiusPixels, radiusPixels);
                circle.setPosition(center);
                circle.setFillColor(fillColor);
                window.draw(circle);
                break;
            }
            case Simulation::ColliderType::Rectangle:
            case Simulation::ColliderType::None:
            default: {
                double const fallback = SimulatorConstants::DefaultColliderHalfExtent * 2.0;
                double const w = shape.width_m > 0.0 ? shape.width_m : fallback;
                double const h = shape.height_m > 0.0 ? shape.height_m : fallback;
                auto const wPx = static_cast<float>(std::max(1.0, coordinates.metersToPixels(w)));
                auto const hPx = static_cast<float>(std::max(1.0, coordinates.metersToPixels(h)));
                sf::RectangleShape rect(sf::Vector2f(wPx, hPx));
                rect.setOrigin(wPx / 2.F, hPx / 2.F);
                rect.setPosition(center);
                // Canvas Y points down, so a counter-clockwise angle is a negative SFML rotation
                rect.setRotation(static_cast<float>(-angleDeg));
                rect.setFillColor(fillColor);
                window.draw(rect);
                break;
            }
        }
    }
}

void Renderer::renderPulleys(const entt::registry& registry) {
    sf::Color const ropeColor(220, 220, 220);

    auto view = registry.view<Components::PulleyRope>();
    for (auto entity : view) {
        const auto& rope = view.get<Components::PulleyRope>(entity);
        sf::Vector2f const wheel = toScreen(rope.anchor);

        for (auto body : {rope.bodyA, rope.bodyB}) {
            if (!registry.valid(body)) {
                continue;
            }
            const auto& pos = registry.get<Components::Position>(body);
            sf::Vertex line[2] = {
                sf::Vertex(wheel, ropeColor),
                sf::Vertex(toScreen(pos), ropeColor)
            };
            window.draw(line, 2, sf::Lines);
        }

        auto const radiusPixels = static_cast<float>(std::max(2.0, coordinates.metersToPixels(rope.wheelRadius)));
        sf::CircleShape disc(radiusPixels);
        disc.setOrigin(radiusPixels, radiusPixels);
        disc.setPosition(wheel);
        disc.setFillColor(sf::Color::Transparent);
        disc.setOutlineColor(ropeColor);
        disc.setOutlineThickness(2.F);
        window.draw(disc);
    }
}

void Renderer::renderFPS(float fps) {
    std::stringstream ss;
    ss << std::fixed << std::setprecision(1) << fps << " FPS";
    renderText(ss.str(), 10, 10, sf::Color::White);
}

void Renderer::renderText(const std::string &text, int x, int y, sf::Color color) {
    if (!fontLoaded) {
        return;
    }
    sf::Text sfText;
    sfText.setFont(font);
    sfText.setString(text);
    sfText.setCharacterSize(16);
    sfText.setFillColor(color);
    sfText.setPosition(static_cast<float>(x), static_cast<float>(y));
    window.draw(sfText);
}
