/// @file tests/intensity/test_graded_pace.cpp
/// @brief Tests for GradedPace: grade factor and Normalized Graded Pace.

#include <gtest/gtest.h>
#include "loadcal/intensity.hpp"
#include "loadcal/constants.hpp"

#include <vector>

using namespace loadcal::intensity;
using namespace loadcal::constants;

// ─── Grade adjustment factor ──────────────────────────────────────────────────

TEST(GradeFactor, FlatIsOne) {
    EXPECT_DOUBLE_EQ(GradedPace::grade_adjustment_factor(0.0), 1.0);
}

TEST(GradeFactor, ModerateClimbCostsMore) {
    // Minetti cost at +10 %: 5.968 J/(kg·m) vs 3.6 on the flat.
    EXPECT_NEAR(GradedPace::grade_adjustment_factor(10.0), 5.968214 / 3.6, 1e-6);
}

TEST(GradeFactor, MonotonicOnModerateClimbs) {
    double prev = GradedPace::grade_adjustment_factor(0.0);
    for (double g = 1.0; g <= 12.0; g += 1.0) {
        const double f = GradedPace::grade_adjustment_factor(g);
        EXPECT_GT(f, prev) << "grade " << g;
        prev = f;
    }
}

TEST(GradeFactor, ClampedAtBothEnds) {
    EXPECT_DOUBLE_EQ(GradedPace::grade_adjustment_factor(40.0), GRADE_FACTOR_MAX);
    EXPECT_DOUBLE_EQ(GradedPace::grade_adjustment_factor(-10.0), GRADE_FACTOR_MIN);
}

// ─── from_track ───────────────────────────────────────────────────────────────

TEST(GradedPaceTrack, FlatTrackEqualsPace) {
    std::vector<TrackPoint> track;
    for (int i = 0; i < 20; ++i) {
        track.push_back({static_cast<double>(i * 10), 300.0, 50.0});
    }
    const auto ngp = GradedPace::from_track(track);
    ASSERT_TRUE(ngp.has_value());
    EXPECT_NEAR(*ngp, 300.0, 1e-9);
}

TEST(GradedPaceTrack, ClimbMakesEquivalentPaceFaster) {
    // 10 s at 300 s/km covers 33.3 m; 1 m rise per segment ≈ 3 % grade.
    std::vector<TrackPoint> track;
    for (int i = 0; i < 20; ++i) {
        track.push_back({static_cast<double>(i * 10), 300.0, 50.0 + i});
    }
    const auto ngp = GradedPace::from_track(track);
    ASSERT_TRUE(ngp.has_value());
    EXPECT_LT(*ngp, 300.0);
    EXPECT_NEAR(*ngp, 300.0 / GradedPace::grade_adjustment_factor(3.0), 1e-6);
}

TEST(GradedPaceTrack, SkipsDegenerateSegments) {
    const std::vector<TrackPoint> track = {
        {0.0, 300.0, 10.0},
        {0.0, 300.0, 10.0},   // zero Δt
        {10.0, 0.0, 10.0},    // zero pace
        {20.0, 300.0, 10.0},
    };
    const auto ngp = GradedPace::from_track(track);
    ASSERT_TRUE(ngp.has_value());
    EXPECT_NEAR(*ngp, 300.0, 1e-9);
}

TEST(GradedPaceTrack, FewerThanTwoPoints_Nullopt) {
    const std::vector<TrackPoint> one = {{0.0, 300.0, 0.0}};
    EXPECT_FALSE(GradedPace::from_track(one).has_value());
    EXPECT_FALSE(GradedPace::from_track({}).has_value());
}

// ─── from_totals ──────────────────────────────────────────────────────────────

TEST(GradedPaceTotals, NoElevationIsAveragePace) {
    const auto ngp = GradedPace::from_totals(300.0, 0.0, 0.0, 10000.0);
    ASSERT_TRUE(ngp.has_value());
    EXPECT_DOUBLE_EQ(*ngp, 300.0);
}

TEST(GradedPaceTotals, RollingCourseCostsMore) {
    // Net zero, 200 m of vertical travel over 10 km → 1 % effective grade.
    const auto ngp = GradedPace::from_totals(300.0, 100.0, 100.0, 10000.0);
    ASSERT_TRUE(ngp.has_value());
    EXPECT_NEAR(*ngp, 300.0 / GradedPace::grade_adjustment_factor(1.0), 1e-9);
    EXPECT_LT(*ngp, 300.0);
}

TEST(GradedPaceTotals, InvalidInputs_Nullopt) {
    EXPECT_FALSE(GradedPace::from_totals(0.0, 10.0, 10.0, 5000.0).has_value());
    EXPECT_FALSE(GradedPace::from_totals(300.0, 10.0, 10.0, 0.0).has_value());
}
