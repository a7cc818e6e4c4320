#include "liquid/systems/fluid/force_accumulator.hpp"

#include <algorithm>

namespace Systems {
namespace Fluid {

void accumulateForces(const Particle& particle,
                      const ParticlePool& pool,
                      const FluidConfig& config,
                      std::vector<Vector>& scratch) {
    double const ideal = config.idealRadius;
    double const pressureTerm = (particle.pressure - config.restDensity) / 2.0;
    double const nearTerm = particle.nearPressure / 2.0;

    Vector total(0.0, 0.0);

    for (int a = 0; a < particle.neighborCount; ++a) {
        std::size_t const slot = static_cast<std::size_t>(a);
        double const d = particle.distances[slot];
        if (d >= ideal) {
            continue;
        }

        int const j = particle.neighbors[slot];
        const Particle& other = pool[j];

        double const oneMinusQ = 1.0 - d / ideal;
        double const factor = oneMinusQ * (pressureTerm + nearTerm * oneMinusQ)
                              / (2.0 * std::max(d, config.minDistance));

        Vector const rel = other.scaledPosition - particle.scaledPosition;
        Vector const relVelocity = other.scaledVelocity - particle.scaledVelocity;

        Vector delta = rel * factor;
        delta -= relVelocity * (config.viscosity * oneMinusQ * config.dt);

        scratch[static_cast<std::size_t>(j)] += delta;
        total -= delta;
    }

    scratch[static_cast<std::size_t>(particle.index)] += total;
}

void applyGravity(Particle& particle, const FluidConfig& config) {
    particle.velocity += config.gravity * config.dt;
}

} // namespace Fluid
} // namespace Systems
