#include "liquid/systems/fluid/pressure_solver.hpp"

#include <cmath>

namespace Systems {
namespace Fluid {

void computePressure(Particle& particle, const ParticlePool& pool, const FluidConfig& config) {
    double const ideal = config.idealRadius;
    double const idealSq = ideal * ideal;

    double pressure = 0.0;
    double nearPressure = 0.0;

    for (int a = 0; a < particle.neighborCount; ++a) {
        std::size_t const slot = static_cast<std::size_t>(a);
        const Particle& other = pool[particle.neighbors[slot]];

        Vector const rel = other.scaledPosition - particle.scaledPosition;
        double const distSq = rel.lengthSquared();

        if (distSq < idealSq) {
            double const d = std::sqrt(distSq);
            double const oneMinusQ = 1.0 - d / ideal;
            pressure += oneMinusQ * oneMinusQ;
            nearPressure += oneMinusQ * oneMinusQ * oneMinusQ;
            particle.distances[slot] = d;
        } else {
            particle.distances[slot] = OutOfRangeDistance;
        }
    }

    particle.pressure = pressure;
    particle.nearPressure = nearPressure;
}

} // namespace Fluid
} // namespace Systems
