#include "liquid/math/polygon.hpp"

#include <cstddef>

std::vector<Vector> getWorldSpacePolygon(const PolygonShape& poly,
                                         const Position& pos,
                                         double angle) {
    std::vector<Vector> worldVerts;
    worldVerts.reserve(poly.vertices.size());

    for (const auto& v : poly.vertices) {
        Vector const rotated = v.rotateByAngle(angle);
        worldVerts.emplace_back(pos.x + rotated.x, pos.y + rotated.y);
    }

    return worldVerts;
}

double signedArea(const std::vector<Vector>& vertices) {
    double area = 0.0;
    std::size_t const n = vertices.size();
    for (std::size_t i = 0; i < n; ++i) {
        const Vector& a = vertices[i];
        const Vector& b = vertices[(i + 1) % n];
        area += a.cross(b);
    }
    return area * 0.5;
}

std::vector<Vector> computeOutwardNormals(const std::vector<Vector>& vertices) {
    std::vector<Vector> normals;
    std::size_t const n = vertices.size();
    normals.reserve(n);

    // For a counter-clockwise polygon the outward normal of edge (a, b) is
    // (b - a) rotated clockwise; flip for clockwise winding.
    double const orientation = signedArea(vertices) >= 0.0 ? 1.0 : -1.0;

    for (std::size_t i = 0; i < n; ++i) {
        Vector const edge = vertices[(i + 1) % n] - vertices[i];
        Vector const outward(edge.y * orientation, -edge.x * orientation);
        normals.push_back(outward.normalized());
    }

    return normals;
}
