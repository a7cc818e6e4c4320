#include "liquid/systems/fluid/integrator.hpp"

namespace Systems {
namespace Fluid {

void integrate(Particle& particle, const Vector& delta, SpatialGrid& grid, const FluidConfig& config) {
    particle.oldPosition = particle.position;
    particle.velocity += delta / (config.multiplier() * config.dt);
    particle.position += particle.velocity * config.dt;

    Cell const from{particle.cellX, particle.cellY};
    Cell const to = grid.cellOf(particle.position);
    if (from != to) {
        grid.move(particle.index, from, to);
        particle.cellX = to.x;
        particle.cellY = to.y;
    }
}

} // namespace Fluid
} // namespace Systems
