/**
 * @file profile.cpp
 * @brief Implementation of the section timer described in profile.hpp
 */

#include "liquid/core/profile.hpp"

#include <iomanip>
#include <iostream>
#include <utility>

namespace Profiling {

Profiler& Profiler::getInstance() {
    static Profiler instance;
    return instance;
}

void Profiler::startSection(const std::string& name) {
    auto& instance = getInstance();

    auto it = instance.sections.find(name);
    if (it == instance.sections.end()) {
        ProfileData data;
        data.depth = static_cast<int>(instance.open.size());
        instance.sections.emplace(name, data);
        instance.order.push_back(name);
    }

    instance.open.push_back({name, Clock::now()});
}

void Profiler::endSection(const std::string& name) {
    auto& instance = getInstance();

    if (instance.open.empty()) {
        std::cerr << "[Profiler] Warning: endSection(\"" << name << "\") with no open section.\n";
        return;
    }
    if (instance.open.back().name != name) {
        std::cerr << "[Profiler] Warning: endSection(\"" << name
                  << "\") but innermost section is \"" << instance.open.back().name << "\".\n";
        return;
    }

    Duration const duration = std::chrono::duration_cast<Duration>(
        Clock::now() - instance.open.back().start_time);
    instance.open.pop_back();

    auto it = instance.sections.find(name);
    if (it == instance.sections.end()) {
        ProfileData fresh;
        fresh.depth = static_cast<int>(instance.open.size());
        it = instance.sections.emplace(name, fresh).first;
        instance.order.push_back(name);
    }

    auto& data = it->second;
    data.total_time += duration;
    data.call_count += 1;
    if (duration < data.min_time) {
        data.min_time = duration;
    }
    if (duration > data.max_time) {
        data.max_time = duration;
    }
}

void Profiler::printStats() {
    const auto& instance = getInstance();
    std::cout << "\nProfiling Statistics:\n";

    for (const auto& name : instance.order) {
        const auto& pd = instance.sections.at(name);
        double const totalMs = pd.total_time.count() / 1e6;
        double const avgMs = pd.call_count > 0 ? totalMs / static_cast<double>(pd.call_count) : 0.0;
        double const maxMs = pd.max_time.count() / 1e6;

        std::cout << std::string(static_cast<std::size_t>(pd.depth) * 2, ' ')
                  << name << " [" << pd.call_count << " calls] "
                  << std::fixed << std::setprecision(2)
                  << totalMs << "ms total, "
                  << avgMs << "ms avg, "
                  << maxMs << "ms max\n";
    }
}

const Profiler::ProfileData* Profiler::getStats(const std::string& name) {
    const auto& instance = getInstance();
    auto it = instance.sections.find(name);
    return it == instance.sections.end() ? nullptr : &it->second;
}

void Profiler::reset() {
    auto& instance = getInstance();
    instance.sections.clear();
    instance.order.clear();
}

// ------------------ ScopedProfiler RAII Wrapper ------------------

ScopedProfiler::ScopedProfiler(std::string name)
    : section_name(std::move(name))
{
    Profiler::startSection(section_name);
}

ScopedProfiler::~ScopedProfiler() {
    Profiler::endSection(section_name);
}

} // namespace Profiling
