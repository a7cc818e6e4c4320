/**
 * @file shapes.hpp
 * @brief Helpers for placing static rigid shapes in a scenario
 */

#pragma once

#include <entt/entt.hpp>

#include "liquid/components/basic.hpp"

namespace Scenarios {

/**
 * @brief Creates a rectangle entity centered at (cx, cy), rotated by angle.
 */
entt::entity makeBox(entt::registry &registry,
                     double cx, double cy,
                     double halfW, double halfH,
                     double angle,
                     const Components::Color &color);

/**
 * @brief Creates the four walls enclosing a width x height world.
 *
 * Walls sit just inside the world edges.
 */
void makeEnclosure(entt::registry &registry, double width, double height, double thickness);

entt::entity makeCircle(entt::registry &registry,
                        double cx, double cy,
                        double radius,
                        const Components::Color &color);

} // namespace Scenarios
