/**
 * @file renderer.hpp
 * @brief Graphics rendering using SFML
 *
 * This system handles:
 * - Rigid shape rendering (polygons and circles from the registry)
 * - Fluid particle rendering as small quads in one vertex array
 * - Text overlays (FPS, particle count, paused/collision state)
 */

#pragma once

#include <string>

#include <entt/entt.hpp>
#include <SFML/Graphics.hpp>

#include "liquid/systems/fluid/particle_pool.hpp"

/**
 * @class Renderer
 * @brief Owns the window and draws one frame at a time
 */
class Renderer {
public:
    /**
     * @brief Constructs renderer with given screen dimensions
     * @param screenWidth Width of the window
     * @param screenHeight Height of the window
     */
    Renderer(int screenWidth, int screenHeight);
    ~Renderer();

    /**
     * @brief Initializes SFML window and loads font
     * @return true if success, false otherwise
     */
    bool init();

    /** Clears the screen to black */
    void clear();

    /** Presents the rendered frame to display */
    void present();

    /**
     * @brief Draws every PolygonShape and CircleShape entity
     */
    void renderShapes(const entt::registry& registry);

    /**
     * @brief Draws each active particle as a quad centered on its position
     */
    void renderFluid(const Systems::Fluid::ParticlePool& pool);

    /**
     * @brief Renders the current FPS in top-left corner
     */
    void renderFPS(float fps);

    /**
     * @brief Particle count, capacity and mode flags under the FPS line
     */
    void renderStatus(int activeParticles, int capacity, bool paused, bool collisions,
                      const std::string& scenarioName);

    sf::RenderWindow& getWindow() { return window; }

private:
    void renderText(const std::string& text, int x, int y, sf::Color color);

    sf::RenderWindow window;
    sf::Font font;
    sf::VertexArray particleQuads;
    bool initialized;
    int screenWidth;
    int screenHeight;
};
