#include "liquid/systems/rigid_fluid/rigid_world.hpp"

#include <utility>

#include "liquid/components/basic.hpp"
#include "liquid/math/polygon.hpp"

namespace Systems {
namespace RigidFluid {

static void queryFixtures(const std::vector<Fixture>& fixtures,
                          const AABB& box,
                          const IRigidWorld::QueryCallback& callback) {
    for (const auto& fixture : fixtures) {
        if (!fixture.bounds.overlaps(box)) {
            continue;
        }
        if (!callback(fixture)) {
            return;
        }
    }
}

RegistryRigidWorld::RegistryRigidWorld(entt::registry& registry) {
    auto polyView = registry.view<Components::Position, PolygonShape>();
    for (auto [entity, pos, poly] : polyView.each()) {
        double angle = 0.0;
        if (auto* angPos = registry.try_get<Components::AngularPosition>(entity)) {
            angle = angPos->angle;
        }
        fixtures.push_back(makePolygonFixture(getWorldSpacePolygon(poly, pos, angle), entity));
    }

    auto circleView = registry.view<Components::Position, CircleShape>();
    for (auto [entity, pos, circle] : circleView.each()) {
        fixtures.push_back(makeCircleFixture(pos, circle.radius, entity));
    }
}

void RegistryRigidWorld::queryAABB(const AABB& box, const QueryCallback& callback) const {
    queryFixtures(fixtures, box, callback);
}

FixtureListWorld::FixtureListWorld(std::vector<Fixture> fixtures)
    : fixtures(std::move(fixtures))
{
}

void FixtureListWorld::queryAABB(const AABB& box, const QueryCallback& callback) const {
    queryFixtures(fixtures, box, callback);
}

} // namespace RigidFluid
} // namespace Systems
