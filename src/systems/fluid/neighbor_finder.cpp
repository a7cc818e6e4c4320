#include "liquid/systems/fluid/neighbor_finder.hpp"

#include <algorithm>

namespace Systems {
namespace Fluid {

int findNeighbors(Particle& particle, const SpatialGrid& grid, int maxNeighbors) {
    int const cap = std::min(maxNeighbors, static_cast<int>(particle.neighbors.size()));
    int count = 0;

    grid.neighborhood(particle.cellX, particle.cellY, [&](const SpatialGrid::Bucket& bucket) {
        for (int other : bucket) {
            if (count >= cap) {
                return false;
            }
            if (other == particle.index) {
                continue;
            }
            particle.neighbors[static_cast<std::size_t>(count++)] = other;
        }
        return count < cap;
    });

    particle.neighborCount = count;
    return count;
}

} // namespace Fluid
} // namespace Systems
