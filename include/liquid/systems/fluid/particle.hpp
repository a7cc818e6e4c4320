/**
 * @file particle.hpp
 * @brief Per-particle record of the fluid pool
 */

#pragma once

#include <vector>

#include "liquid/math/vector_math.hpp"

namespace Systems {
namespace Fluid {

/**
 * @struct Particle
 * @brief One fluid sample point.
 *
 * Records live in a fixed-capacity arena and keep their index for the life of
 * the pool. The neighbor, distance and shape arrays are allocated once at
 * their caps; the matching counts say how many slots are in use this tick.
 */
struct Particle {
    Position position;
    Position oldPosition;
    Vector velocity;        // world units per second

    bool alive = false;
    int index = 0;

    // Grid cell, floor(position / cellSize) after each integrate
    int cellX = 0;
    int cellY = 0;

    // Scaled position/velocity cached in prepare for the pressure and force phases
    Vector scaledPosition;
    Vector scaledVelocity;

    std::vector<int> neighbors;
    std::vector<double> distances;  // scaled; parallel to neighbors
    int neighborCount = 0;

    double pressure = 0.0;
    double nearPressure = 0.0;

    // Indices into the tick's fixture list
    std::vector<int> pendingShapes;
    int pendingShapeCount = 0;
};

} // namespace Fluid
} // namespace Systems
