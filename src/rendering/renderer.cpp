#include "liquid/rendering/renderer.hpp"

#include <algorithm>
#include <cmath>
#include <iomanip>
#include <iostream>
#include <sstream>

#include "liquid/components/basic.hpp"
#include "liquid/core/constants.hpp"
#include "liquid/math/polygon.hpp"

// Half the side of a particle quad, in pixels
static constexpr float ParticleHalfSize = 3.0F;

static sf::Color shapeColor(const entt::registry &registry, entt::entity entity) {
    if (const auto *col = registry.try_get<Components::Color>(entity)) {
        return sf::Color(col->r, col->g, col->b);
    }
    return sf::Color(128, 128, 128);
}

Renderer::Renderer(int screenWidth, int screenHeight)
    : particleQuads(sf::Quads)
    , initialized(false)
    , screenWidth(screenWidth)
    , screenHeight(screenHeight)
{
}

Renderer::~Renderer() = default;

bool Renderer::init() {
    window.create(sf::VideoMode(screenWidth, screenHeight), "Liquid");
    window.setFramerateLimit(SimulatorConstants::StepsPerSecond);

    if (!font.loadFromFile("assets/fonts/arial.ttf")) {
        std::cerr << "Failed to load font assets/fonts/arial.ttf\n";
        return false;
    }
    initialized = true;
    return true;
}

void Renderer::clear() {
    window.clear(sf::Color::Black);
}

void Renderer::present() {
    window.display();
}

void Renderer::renderShapes(const entt::registry &registry) {
    auto polyView = registry.view<Components::Position, PolygonShape>();
    for (auto [entity, pos, poly] : polyView.each()) {
        double angle = 0.0;
        if (const auto *angPos = registry.try_get<Components::AngularPosition>(entity)) {
            angle = angPos->angle;
        }

        std::vector<Vector> const world = getWorldSpacePolygon(poly, pos, angle);

        sf::ConvexShape convex;
        convex.setPointCount(world.size());
        for (size_t i = 0; i < world.size(); ++i) {
            auto const px = static_cast<float>(SimulatorConstants::metersToPixels(world[i].x));
            auto const py = static_cast<float>(SimulatorConstants::metersToPixels(world[i].y));
            convex.setPoint(i, sf::Vector2f(px, py));
        }
        convex.setFillColor(shapeColor(registry, entity));
        window.draw(convex);
    }

    auto circleView = registry.view<Components::Position, CircleShape>();
    for (auto [entity, pos, circle] : circleView.each()) {
        float const radiusPixels = static_cast<float>(std::max(1.0, SimulatorConstants::metersToPixels(circle.radius)));
        sf::CircleShape shape(radiusPixels);
        shape.setOrigin(radiusPixels, radiusPixels);
        shape.setPosition(static_cast<float>(SimulatorConstants::metersToPixels(pos.x)),
                          static_cast<float>(SimulatorConstants::metersToPixels(pos.y)));
        shape.setFillColor(shapeColor(registry, entity));
        window.draw(shape);
    }
}

void Renderer::renderFluid(const Systems::Fluid::ParticlePool &pool) {
    const auto &active = pool.getActive();
    particleQuads.resize(active.size() * 4);

    sf::Color const water(70, 140, 255);

    for (size_t k = 0; k < active.size(); ++k) {
        const Position &pos = pool[active[k]].position;
        auto const px = static_cast<float>(SimulatorConstants::metersToPixels(pos.x));
        auto const py = static_cast<float>(SimulatorConstants::metersToPixels(pos.y));

        sf::Vertex *quad = &particleQuads[k * 4];
        quad[0].position = sf::Vector2f(px - ParticleHalfSize, py - ParticleHalfSize);
        quad[1].position = sf::Vector2f(px + ParticleHalfSize, py - ParticleHalfSize);
        quad[2].position = sf::Vector2f(px + ParticleHalfSize, py + ParticleHalfSize);
        quad[3].position = sf::Vector2f(px - ParticleHalfSize, py + ParticleHalfSize);
        for (int v = 0; v < 4; ++v) {
            quad[v].color = water;
        }
    }

    window.draw(particleQuads);
}

void Renderer::renderFPS(float fps) {
    // Display fps with one decimal place
    std::stringstream ss;
    ss << std::fixed << std::setprecision(1) << fps << " FPS";
    renderText(ss.str(), 10, 10, sf::Color::White);
}

void Renderer::renderStatus(int activeParticles, int capacity, bool paused, bool collisions,
                            const std::string &scenarioName) {
    std::stringstream ss;
    ss << scenarioName << "  |  " << activeParticles << " / " << capacity << " particles"
       << "  |  collisions " << (collisions ? "on" : "off");
    if (paused) {
        ss << "  |  PAUSED";
    }
    renderText(ss.str(), 10, 30, sf::Color::White);
}

void Renderer::renderText(const std::string &text, int x, int y, sf::Color color) {
    sf::Text sfText;
    sfText.setFont(font);
    sfText.setString(text);
    sfText.setCharacterSize(16);
    sfText.setFillColor(color);
    sfText.setPosition(static_cast<float>(x), static_cast<float>(y));
    window.draw(sfText);
}
