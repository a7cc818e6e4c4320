/**
 * @file pressure_solver.hpp
 * @brief Double-density pressure accumulation
 */

#pragma once

#include <limits>

#include "liquid/systems/fluid/fluid_config.hpp"
#include "liquid/systems/fluid/particle_pool.hpp"

namespace Systems {
namespace Fluid {

/// Cached distance for a neighbor outside the interaction radius
constexpr double OutOfRangeDistance = std::numeric_limits<double>::max();

/**
 * @brief Computes pressure and near-pressure of one particle from its neighbors.
 *
 * Works on the scaled positions cached in prepare. For every neighbor within
 * idealRadius the scaled distance d is cached in distances[] and
 * (1 - d/idealRadius)^2 and ^3 are added to pressure and nearPressure. Other
 * neighbors get OutOfRangeDistance. Writes only to the given particle.
 */
void computePressure(Particle& particle, const ParticlePool& pool, const FluidConfig& config);

} // namespace Fluid
} // namespace Systems
