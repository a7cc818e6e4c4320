/**
 * @file rigid_world.hpp
 * @brief Query interface between the fluid and the rigid shapes around it
 */

#pragma once

#include <functional>
#include <utility>
#include <vector>

#include <entt/entt.hpp>

#include "liquid/systems/rigid_fluid/fixture.hpp"

namespace Systems {
namespace RigidFluid {

/**
 * @class IRigidWorld
 * @brief Source of fixtures for fluid collision
 */
class IRigidWorld {
public:
    /** Return false from the callback to stop the query */
    using QueryCallback = std::function<bool(const Fixture&)>;

    virtual ~IRigidWorld() = default;

    /**
     * @brief Invokes callback for every fixture whose bounds overlap box.
     */
    virtual void queryAABB(const AABB& box, const QueryCallback& callback) const = 0;
};

/**
 * @class RegistryRigidWorld
 * @brief IRigidWorld over registry entities with a Position and a shape.
 *
 * Entities holding PolygonShape or CircleShape are snapshot into world-space
 * fixtures on construction, using AngularPosition when present.
 */
class RegistryRigidWorld : public IRigidWorld {
public:
    explicit RegistryRigidWorld(entt::registry& registry);

    void queryAABB(const AABB& box, const QueryCallback& callback) const override;

    const std::vector<Fixture>& getFixtures() const { return fixtures; }

private:
    std::vector<Fixture> fixtures;
};

/**
 * @class FixtureListWorld
 * @brief IRigidWorld over a plain list of fixtures
 */
class FixtureListWorld : public IRigidWorld {
public:
    FixtureListWorld() = default;
    explicit FixtureListWorld(std::vector<Fixture> fixtures);

    void add(Fixture fixture) { fixtures.push_back(std::move(fixture)); }

    void queryAABB(const AABB& box, const QueryCallback& callback) const override;

    const std::vector<Fixture>& getFixtures() const { return fixtures; }

private:
    std::vector<Fixture> fixtures;
};

} // namespace RigidFluid
} // namespace Systems
