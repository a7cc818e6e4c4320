/**
 * @file polygon.hpp
 * @brief Rigid shape components and their world-space geometry helpers
 *
 * Shapes are stored on registry entities in local space (relative to the
 * entity's Position, rotated by its AngularPosition). The helpers here turn
 * them into the world-space data the fluid collision code consumes:
 * - transformed polygon vertices
 * - outward edge normals regardless of vertex winding
 */

#ifndef LIQUID_POLYGON_SHAPE_HPP
#define LIQUID_POLYGON_SHAPE_HPP

#include <vector>

#include "liquid/math/vector_math.hpp"

/**
 * @brief Convex polygon in local space
 *
 * Vertices may be wound either way; normals are derived from the signed area.
 */
struct PolygonShape {
    std::vector<Vector> vertices;       ///< Vertices in local space coordinates
};

/**
 * @brief Circle centered on its entity's position
 */
struct CircleShape {
    double radius;                      ///< Radius of the circle
};

/**
 * @brief Transforms local polygon vertices into world space
 *
 * @param poly The polygon to transform
 * @param pos World position of the owning body
 * @param angle Rotation angle in radians
 * @return World-space vertices in the same order as the local ones
 */
std::vector<Vector> getWorldSpacePolygon(const PolygonShape& poly,
                                         const Position& pos,
                                         double angle);

/**
 * @brief Signed area of a closed polygon (positive for counter-clockwise)
 */
double signedArea(const std::vector<Vector>& vertices);

/**
 * @brief Outward unit normals, one per edge
 *
 * normals[i] belongs to the edge vertices[i] -> vertices[i+1] (wrapping).
 * Degenerate edges get the default direction of Vector::normalized().
 */
std::vector<Vector> computeOutwardNormals(const std::vector<Vector>& vertices);

#endif // LIQUID_POLYGON_SHAPE_HPP
