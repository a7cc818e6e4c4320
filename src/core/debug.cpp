#include "liquid/core/debug.hpp"

// Initialize static members
std::size_t DebugStats::active_particles = 0;
std::size_t DebugStats::spawned_particles = 0;
std::size_t DebugStats::fixtures_found = 0;
std::size_t DebugStats::collisions_resolved = 0;
double DebugStats::max_speed = 0.0;
