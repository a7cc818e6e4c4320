#include <gtest/gtest.h>

#include "liquid/core/debug.hpp"
#include "liquid/core/profile.hpp"

using Profiling::Profiler;

class ProfilerTest : public ::testing::Test {
protected:
    void SetUp() override { Profiler::reset(); }
    void TearDown() override { Profiler::reset(); }
};

TEST_F(ProfilerTest, ScopesCountCallsAndNest) {
    for (int i = 0; i < 3; ++i) {
        LIQUID_PROFILE_SCOPE("outer");
        {
            LIQUID_PROFILE_SCOPE("inner");
        }
    }

    const auto* outer = Profiler::getStats("outer");
    const auto* inner = Profiler::getStats("inner");
    ASSERT_NE(outer, nullptr);
    ASSERT_NE(inner, nullptr);

    EXPECT_EQ(outer->call_count, 3u);
    EXPECT_EQ(inner->call_count, 3u);
    EXPECT_EQ(outer->depth, 0);
    EXPECT_EQ(inner->depth, 1);
    EXPECT_GE(outer->total_time, inner->total_time);
    EXPECT_LE(outer->min_time, outer->max_time);
}

TEST_F(ProfilerTest, UnknownSectionHasNoStats) {
    EXPECT_EQ(Profiler::getStats("never-run"), nullptr);
}

TEST_F(ProfilerTest, ResetDropsSections) {
    {
        LIQUID_PROFILE_SCOPE("once");
    }
    ASSERT_NE(Profiler::getStats("once"), nullptr);
    Profiler::reset();
    EXPECT_EQ(Profiler::getStats("once"), nullptr);
}

TEST(DebugStatsTest, AccumulatesAndResets) {
    DebugStats::reset();
    DebugStats::recordSpawned(4);
    DebugStats::recordSpawned(4);
    DebugStats::recordCollisions(2);
    DebugStats::recordActive(8);
    DebugStats::updateSpeed(3.0);
    DebugStats::updateSpeed(1.0);

    EXPECT_EQ(DebugStats::spawnedParticles(), 8u);
    EXPECT_EQ(DebugStats::collisionsResolved(), 2u);
    EXPECT_EQ(DebugStats::activeParticles(), 8u);
    EXPECT_DOUBLE_EQ(DebugStats::maxSpeed(), 3.0);

    DebugStats::reset();
    EXPECT_EQ(DebugStats::spawnedParticles(), 0u);
    EXPECT_DOUBLE_EQ(DebugStats::maxSpeed(), 0.0);
}
