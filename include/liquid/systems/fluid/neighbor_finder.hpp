/**
 * @file neighbor_finder.hpp
 * @brief Bounded neighbor search over the 3x3 grid block around a particle
 */

#pragma once

#include "liquid/systems/fluid/particle.hpp"
#include "liquid/systems/fluid/spatial_grid.hpp"

namespace Systems {
namespace Fluid {

/**
 * @brief Fills particle.neighbors from the particle's own cell and the 8 around it.
 *
 * Every index other than the particle's own is taken in grid visiting order
 * until maxNeighbors is reached; the scan stops there. Reads the grid only.
 *
 * @return The new neighborCount
 */
int findNeighbors(Particle& particle, const SpatialGrid& grid, int maxNeighbors);

} // namespace Fluid
} // namespace Systems
