/**
 * @file collision_resolver.hpp
 * @brief Fluid particles against rigid fixtures
 *
 * Two parts:
 * - broad phase (sequential): query the rigid world around the particles and
 *   stamp each fixture onto the particles in the grid cells it covers
 * - narrow phase (per particle, parallel safe): test the predicted position
 *   against the stamped fixtures and push the particle out on contact
 */

#pragma once

#include <vector>

#include "liquid/systems/fluid/fluid_config.hpp"
#include "liquid/systems/fluid/particle_pool.hpp"
#include "liquid/systems/fluid/spatial_grid.hpp"
#include "liquid/systems/rigid_fluid/rigid_world.hpp"

namespace Systems {
namespace Fluid {

/**
 * @brief Collects fixtures near the active particles and stamps them.
 *
 * The query box is the bounds of all active positions padded by one cell.
 * Each fixture's bounds become an inclusive cell range grown by one cell on
 * every side (clipped to the particles' cell range) and its index in
 * fixtures is appended to
 * pendingShapes of every particle in those buckets, up to
 * maxFixturesPerParticle. pendingShapeCount must already be zero.
 *
 * @param fixtures Receives the fixtures found this tick; cleared first
 */
void broadPhase(ParticlePool& pool,
                const SpatialGrid& grid,
                const RigidFluid::IRigidWorld& world,
                const FluidConfig& config,
                std::vector<RigidFluid::Fixture>& fixtures);

/**
 * @brief Resolves contacts of one particle against its stamped fixtures.
 *
 * For each fixture in stamped order the position the integrator would
 * produce, position + velocity*dt + delta/multiplier, is tested. On contact
 * the current position is projected onto the fixture's surface and moved
 * collisionEpsilon further along the normal. The normal velocity is reflected
 * with restitution, the result scaled by friction, and delta is cleared.
 * Later fixtures see the position and velocity left by earlier contacts.
 *
 * @return Number of contacts resolved
 */
int resolveCollisions(Particle& particle,
                      Vector& delta,
                      const std::vector<RigidFluid::Fixture>& fixtures,
                      const FluidConfig& config);

} // namespace Fluid
} // namespace Systems
