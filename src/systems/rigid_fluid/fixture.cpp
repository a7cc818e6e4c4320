#include "liquid/systems/rigid_fluid/fixture.hpp"

#include <algorithm>
#include <cstddef>
#include <limits>
#include <utility>

#include "liquid/math/polygon.hpp"

namespace Systems {
namespace RigidFluid {

// Helper for std::visit with lambdas
template<class... Ts> struct overloaded : Ts... { using Ts::operator()...; };
template<class... Ts> overloaded(Ts...) -> overloaded<Ts...>;

Fixture makePolygonFixture(const std::vector<Vector>& worldVertices, entt::entity owner) {
    PolygonFixture poly;
    poly.vertices = worldVertices;
    poly.normals = computeOutwardNormals(worldVertices);

    AABB box{
        std::numeric_limits<double>::max(),
        std::numeric_limits<double>::max(),
        std::numeric_limits<double>::lowest(),
        std::numeric_limits<double>::lowest()
    };
    for (const auto& v : worldVertices) {
        box.minX = std::min(box.minX, v.x);
        box.minY = std::min(box.minY, v.y);
        box.maxX = std::max(box.maxX, v.x);
        box.maxY = std::max(box.maxY, v.y);
    }
    if (worldVertices.empty()) {
        box = AABB{};
    }

    return Fixture{std::move(poly), box, owner};
}

Fixture makeCircleFixture(const Position& center, double radius, entt::entity owner) {
    AABB const box{center.x - radius, center.y - radius, center.x + radius, center.y + radius};
    return Fixture{CircleFixture{center, radius}, box, owner};
}

bool containsPoint(const Fixture& fixture, const Position& point) {
    return std::visit(overloaded{
        [&](const PolygonFixture& poly) {
            if (poly.vertices.size() < 3) {
                return false;
            }
            // Inside a convex polygon means behind every edge
            for (std::size_t i = 0; i < poly.vertices.size(); ++i) {
                Vector const rel = Vector(point) - poly.vertices[i];
                if (poly.normals[i].dotProduct(rel) > 0.0) {
                    return false;
                }
            }
            return true;
        },
        [&](const CircleFixture& circle) {
            return point.distSquared(circle.center) <= circle.radius * circle.radius;
        }
    }, fixture.shape);
}

BoundaryPoint closestBoundary(const Fixture& fixture, const Position& point) {
    return std::visit(overloaded{
        [&](const PolygonFixture& poly) {
            double best = std::numeric_limits<double>::max();
            Vector bestNormal(1.0, 0.0);

            for (std::size_t i = 0; i < poly.vertices.size(); ++i) {
                double const distance = poly.normals[i].dotProduct(poly.vertices[i] - Vector(point));
                if (distance < best) {
                    best = distance;
                    bestNormal = poly.normals[i];
                }
            }
            if (poly.vertices.empty()) {
                best = 0.0;
            }

            return BoundaryPoint{point + bestNormal * best, bestNormal};
        },
        [&](const CircleFixture& circle) {
            Vector const normal = (point - circle.center).normalized();
            return BoundaryPoint{circle.center + normal * circle.radius, normal};
        }
    }, fixture.shape);
}

} // namespace RigidFluid
} // namespace Systems
