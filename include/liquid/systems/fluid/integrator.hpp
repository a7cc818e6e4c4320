/**
 * @file integrator.hpp
 * @brief Applies the accumulated impulse and re-homes particles in the grid
 */

#pragma once

#include "liquid/systems/fluid/fluid_config.hpp"
#include "liquid/systems/fluid/particle.hpp"
#include "liquid/systems/fluid/spatial_grid.hpp"

namespace Systems {
namespace Fluid {

/**
 * @brief Advances one particle by dt.
 *
 * oldPosition = position; velocity += delta / (multiplier * dt);
 * position += velocity * dt. When the particle's cell changes the grid entry
 * is moved. Mutates the grid, so callers must run it sequentially.
 */
void integrate(Particle& particle, const Vector& delta, SpatialGrid& grid, const FluidConfig& config);

} // namespace Fluid
} // namespace Systems
