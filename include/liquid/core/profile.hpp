/**
 * @file profile.hpp
 * @brief Lightweight section timer for the simulation loop
 *
 * Sections are identified by name and may nest; each records its call count,
 * accumulated time and the fastest/slowest single call. Nesting depth is kept
 * only to indent the printed report.
 *
 * Example usage:
 * @code
 * void FluidSystem::step(...) {
 *     LIQUID_PROFILE_SCOPE("FluidSystem::step");
 *     // ... phases ...
 * }
 *
 * Profiling::Profiler::printStats();
 * @endcode
 *
 * The profiler keeps a single scope stack and must only be used from the
 * thread that drives the simulation, never from inside worker blocks.
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <unordered_map>
#include <vector>

namespace Profiling {

class Profiler {
public:
    using Clock     = std::chrono::steady_clock;
    using TimePoint = Clock::time_point;
    using Duration  = std::chrono::nanoseconds;

    /**
     * @brief Aggregated timing for one named section
     */
    struct ProfileData {
        Duration total_time{0};
        Duration min_time{Duration::max()};
        Duration max_time{0};
        uint64_t call_count{0};
        int depth{0};              ///< Nesting depth the section was first seen at
    };

    /**
     * @brief Start timing a named section.
     */
    static void startSection(const std::string& name);

    /**
     * @brief Stop timing a named section; must match the innermost open one.
     */
    static void endSection(const std::string& name);

    /**
     * @brief Print all sections in first-seen order, indented by depth.
     */
    static void printStats();

    /**
     * @brief Look up a section's numbers; returns nullptr for unknown names.
     */
    static const ProfileData* getStats(const std::string& name);

    /**
     * @brief Drop all recorded data.
     */
    static void reset();

private:
    struct OpenSection {
        std::string name;
        TimePoint start_time;
    };

    std::unordered_map<std::string, ProfileData> sections;
    std::vector<std::string> order;
    std::vector<OpenSection> open;

    Profiler() = default;

    static Profiler& getInstance();
};

/**
 * @brief RAII guard timing the enclosing scope
 */
class ScopedProfiler {
public:
    explicit ScopedProfiler(std::string name);
    ~ScopedProfiler();

    ScopedProfiler(const ScopedProfiler&) = delete;
    ScopedProfiler& operator=(const ScopedProfiler&) = delete;

private:
    std::string section_name;
};

} // namespace Profiling

#define LIQUID_PROFILE_CONCAT_INNER(a, b) a##b
#define LIQUID_PROFILE_CONCAT(a, b) LIQUID_PROFILE_CONCAT_INNER(a, b)

/**
 * @brief Times the rest of the enclosing scope under the given name.
 */
#define LIQUID_PROFILE_SCOPE(name) \
    ::Profiling::ScopedProfiler LIQUID_PROFILE_CONCAT(_scopedProfiler, __LINE__) { name }
