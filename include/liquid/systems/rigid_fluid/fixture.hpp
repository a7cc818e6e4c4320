/**
 * @file fixture.hpp
 * @brief World-space rigid shapes the fluid collides against
 *
 * A Fixture is a snapshot of one rigid shape for the current tick: its
 * world-space geometry, bounding box and owning entity. The fluid reads
 * fixtures and never writes them back.
 */

#pragma once

#include <variant>
#include <vector>

#include <entt/entt.hpp>

#include "liquid/math/vector_math.hpp"

namespace Systems {
namespace RigidFluid {

struct AABB {
    double minX = 0.0;
    double minY = 0.0;
    double maxX = 0.0;
    double maxY = 0.0;

    bool overlaps(const AABB& other) const {
        return minX <= other.maxX && maxX >= other.minX &&
               minY <= other.maxY && maxY >= other.minY;
    }

    AABB padded(double amount) const {
        return AABB{minX - amount, minY - amount, maxX + amount, maxY + amount};
    }
};

/** Convex polygon; normals[i] is the outward unit normal of edge i -> i+1. */
struct PolygonFixture {
    std::vector<Vector> vertices;
    std::vector<Vector> normals;
};

struct CircleFixture {
    Position center;
    double radius = 0.0;
};

using FixtureShape = std::variant<PolygonFixture, CircleFixture>;

struct Fixture {
    FixtureShape shape;
    AABB bounds;
    entt::entity owner = entt::null;
};

/** Nearest surface point to a query point and the outward normal there */
struct BoundaryPoint {
    Position point;
    Vector normal;
};

/**
 * @brief Builds a polygon fixture from world-space vertices.
 *
 * Accepts either winding; normals are oriented outward.
 */
Fixture makePolygonFixture(const std::vector<Vector>& worldVertices, entt::entity owner = entt::null);

Fixture makeCircleFixture(const Position& center, double radius, entt::entity owner = entt::null);

/** @brief True if point lies inside or on the fixture */
bool containsPoint(const Fixture& fixture, const Position& point);

/**
 * @brief Projects a point onto the fixture's surface.
 *
 * For polygons the point is projected onto the edge line with the smallest
 * normal . (vertex - point): the nearest edge for a point inside, the edge it
 * lies furthest beyond for a point outside. For circles the projection is
 * radial; a point at the exact center falls back to the +x normal.
 */
BoundaryPoint closestBoundary(const Fixture& fixture, const Position& point);

} // namespace RigidFluid
} // namespace Systems
