/**
 * @file force_accumulator.hpp
 * @brief Pairwise pressure and viscosity impulses
 */

#pragma once

#include <vector>

#include "liquid/systems/fluid/fluid_config.hpp"
#include "liquid/systems/fluid/particle_pool.hpp"

namespace Systems {
namespace Fluid {

/**
 * @brief Adds the impulses between a particle and its in-range neighbors.
 *
 * For each neighbor j at cached scaled distance d < idealRadius, with
 * q = d / idealRadius:
 *
 *   delta = rel * (1-q) * ((p_i - restDensity)/2 + (pn_i/2)(1-q)) / (2 max(d, minDistance))
 *   delta -= relVelocity * viscosity * (1-q) * dt
 *
 * where rel and relVelocity are j minus i in scaled space. scratch[j] gets
 * +delta and scratch[i] gets -delta. Reads pressure and distances computed by
 * computePressure this tick. scratch must be sized to pool capacity.
 */
void accumulateForces(const Particle& particle,
                      const ParticlePool& pool,
                      const FluidConfig& config,
                      std::vector<Vector>& scratch);

/** @brief velocity += gravity * dt */
void applyGravity(Particle& particle, const FluidConfig& config);

} // namespace Fluid
} // namespace Systems
