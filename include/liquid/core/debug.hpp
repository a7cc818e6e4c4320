#pragma once

#include <algorithm>
#include <cstddef>
#include <iostream>

// Set to 1 to enable debug output, 0 to disable
#ifndef LIQUID_ENABLE_DEBUG
#define LIQUID_ENABLE_DEBUG 0
#endif

// Debug levels
#define LIQUID_DEBUG_LEVEL_NONE 0
#define LIQUID_DEBUG_LEVEL_BASIC 1
#define LIQUID_DEBUG_LEVEL_VERBOSE 2

// Set current debug level
#ifndef LIQUID_DEBUG_LEVEL
#define LIQUID_DEBUG_LEVEL LIQUID_DEBUG_LEVEL_BASIC
#endif

// Debug macros
#define LIQUID_DEBUG_MSG(level, x) do { \
    if (LIQUID_ENABLE_DEBUG && level <= LIQUID_DEBUG_LEVEL) { \
        std::cout << x; \
    } \
} while(0)

// Per-tick fluid statistics. Only touched from the coordinating thread.
class DebugStats {
public:
    static void reset() {
        active_particles = 0;
        spawned_particles = 0;
        fixtures_found = 0;
        collisions_resolved = 0;
        max_speed = 0.0;
    }

    static void recordActive(std::size_t count) { active_particles = count; }
    static void recordSpawned(std::size_t count) { spawned_particles += count; }
    static void recordFixtures(std::size_t count) { fixtures_found = count; }
    static void recordCollisions(std::size_t count) { collisions_resolved += count; }

    static void updateSpeed(double speed) {
        max_speed = std::max(max_speed, speed);
    }

    static std::size_t activeParticles() { return active_particles; }
    static std::size_t spawnedParticles() { return spawned_particles; }
    static std::size_t fixturesFound() { return fixtures_found; }
    static std::size_t collisionsResolved() { return collisions_resolved; }
    static double maxSpeed() { return max_speed; }

    static void printStepStats() {
        LIQUID_DEBUG_MSG(LIQUID_DEBUG_LEVEL_VERBOSE,
            "Fluid step:\n"
            "  Active particles: " << active_particles << "\n"
            "  Spawned: " << spawned_particles << "\n"
            "  Fixtures in range: " << fixtures_found << "\n"
            "  Collisions resolved: " << collisions_resolved << "\n"
            "  Max speed: " << max_speed << " m/s\n"
        );
    }

private:
    static std::size_t active_particles;
    static std::size_t spawned_particles;
    static std::size_t fixtures_found;
    static std::size_t collisions_resolved;
    static double max_speed;
};
