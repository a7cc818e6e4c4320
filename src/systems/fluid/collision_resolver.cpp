#include "liquid/systems/fluid/collision_resolver.hpp"

#include <algorithm>
#include <cmath>
#include <limits>

namespace Systems {
namespace Fluid {

void broadPhase(ParticlePool& pool,
                const SpatialGrid& grid,
                const RigidFluid::IRigidWorld& world,
                const FluidConfig& config,
                std::vector<RigidFluid::Fixture>& fixtures) {
    fixtures.clear();

    const auto& active = pool.getActive();
    if (active.empty()) {
        return;
    }

    RigidFluid::AABB particleBox{
        std::numeric_limits<double>::max(),
        std::numeric_limits<double>::max(),
        std::numeric_limits<double>::lowest(),
        std::numeric_limits<double>::lowest()
    };
    for (int idx : active) {
        const Position& p = pool[idx].position;
        particleBox.minX = std::min(particleBox.minX, p.x);
        particleBox.minY = std::min(particleBox.minY, p.y);
        particleBox.maxX = std::max(particleBox.maxX, p.x);
        particleBox.maxY = std::max(particleBox.maxY, p.y);
    }
    particleBox = particleBox.padded(config.cellSize);

    world.queryAABB(particleBox, [&](const RigidFluid::Fixture& fixture) {
        fixtures.push_back(fixture);
        return true;
    });

    Cell const particleMin = grid.cellOf(Position(particleBox.minX, particleBox.minY));
    Cell const particleMax = grid.cellOf(Position(particleBox.maxX, particleBox.maxY));
    int const cap = config.maxFixturesPerParticle;

    for (std::size_t f = 0; f < fixtures.size(); ++f) {
        const RigidFluid::AABB& bounds = fixtures[f].bounds;
        Cell const lo = grid.cellOf(Position(bounds.minX, bounds.minY));
        Cell const hi = grid.cellOf(Position(bounds.maxX, bounds.maxY));

        // One cell of slack so particles about to cross into the fixture are tested
        int const x0 = std::max(lo.x - 1, particleMin.x);
        int const x1 = std::min(hi.x + 1, particleMax.x);
        int const y0 = std::max(lo.y - 1, particleMin.y);
        int const y1 = std::min(hi.y + 1, particleMax.y);

        for (int cx = x0; cx <= x1; ++cx) {
            for (int cy = y0; cy <= y1; ++cy) {
                const SpatialGrid::Bucket* bucket = grid.bucket(cx, cy);
                if (!bucket) {
                    continue;
                }
                for (int idx : *bucket) {
                    Particle& p = pool[idx];
                    if (p.pendingShapeCount < cap) {
                        p.pendingShapes[static_cast<std::size_t>(p.pendingShapeCount++)] = static_cast<int>(f);
                    }
                }
            }
        }
    }
}

int resolveCollisions(Particle& particle,
                      Vector& delta,
                      const std::vector<RigidFluid::Fixture>& fixtures,
                      const FluidConfig& config) {
    int contacts = 0;
    double const multiplier = config.multiplier();

    for (int s = 0; s < particle.pendingShapeCount; ++s) {
        const RigidFluid::Fixture& fixture = fixtures[static_cast<std::size_t>(particle.pendingShapes[static_cast<std::size_t>(s)])];

        Position const predicted = particle.position + particle.velocity * config.dt + delta / multiplier;
        if (!RigidFluid::containsPoint(fixture, predicted)) {
            continue;
        }

        // Push out from where the particle is now; integrate adds this tick's motion
        RigidFluid::BoundaryPoint const boundary = RigidFluid::closestBoundary(fixture, particle.position);
        particle.position = boundary.point + boundary.normal * config.collisionEpsilon;

        double const normalSpeed = particle.velocity.dotProduct(boundary.normal);
        particle.velocity = (particle.velocity - boundary.normal * ((1.0 + config.restitution) * normalSpeed))
                            * config.friction;

        delta = Vector(0.0, 0.0);
        ++contacts;
    }

    return contacts;
}

} // namespace Fluid
} // namespace Systems
