#include "liquid/scenarios/shapes.hpp"

#include "liquid/math/polygon.hpp"

namespace Scenarios {

entt::entity makeBox(entt::registry &registry,
                     double cx, double cy,
                     double halfW, double halfH,
                     double angle,
                     const Components::Color &color)
{
    auto ent = registry.create();
    registry.emplace<Components::Position>(ent, cx, cy);
    registry.emplace<Components::AngularPosition>(ent, angle);
    registry.emplace<Components::Color>(ent, color);

    PolygonShape poly;
    poly.vertices.emplace_back(-halfW, -halfH);
    poly.vertices.emplace_back(-halfW,  halfH);
    poly.vertices.emplace_back( halfW,  halfH);
    poly.vertices.emplace_back( halfW, -halfH);
    registry.emplace<PolygonShape>(ent, poly);

    return ent;
}

void makeEnclosure(entt::registry &registry, double width, double height, double thickness)
{
    const Components::Color wallColor(90, 90, 110);
    double const half = thickness * 0.5;

    // Floor and ceiling (y grows downward)
    makeBox(registry, width * 0.5, height - half, width * 0.5, half, 0.0, wallColor);
    makeBox(registry, width * 0.5, half, width * 0.5, half, 0.0, wallColor);

    // Left and right
    makeBox(registry, half, height * 0.5, half, height * 0.5, 0.0, wallColor);
    makeBox(registry, width - half, height * 0.5, half, height * 0.5, 0.0, wallColor);
}

entt::entity makeCircle(entt::registry &registry,
                        double cx, double cy,
                        double radius,
                        const Components::Color &color)
{
    auto ent = registry.create();
    registry.emplace<Components::Position>(ent, cx, cy);
    registry.emplace<Components::Color>(ent, color);
    registry.emplace<CircleShape>(ent, radius);
    return ent;
}

} // namespace Scenarios
