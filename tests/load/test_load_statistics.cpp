/// @file tests/load/test_load_statistics.cpp
/// @brief Tests for ACWR, form advice, monotony and strain.

#include <gtest/gtest.h>
#include "loadcal/load_model.hpp"

#include <cmath>
#include <vector>

using namespace loadcal::load;

// ─── ACWR ─────────────────────────────────────────────────────────────────────

TEST(Acwr, ZeroChronicLoad_Nullopt) {
    EXPECT_FALSE(LoadModel::acwr({0.0, 20.0}).has_value());
    EXPECT_EQ(LoadModel::classify_acwr(std::nullopt), AcwrStatus::Unknown);
}

TEST(Acwr, RatioIsAcuteOverChronic) {
    const auto r = LoadModel::acwr({50.0, 60.0});
    ASSERT_TRUE(r.has_value());
    EXPECT_DOUBLE_EQ(*r, 1.2);
}

TEST(Acwr, DailyPointDelegates) {
    DailyLoadPoint p{};
    p.ctl = 40.0;
    p.atl = 20.0;
    ASSERT_TRUE(p.acwr().has_value());
    EXPECT_DOUBLE_EQ(*p.acwr(), 0.5);
}

TEST(Acwr, ClassificationBands) {
    EXPECT_EQ(LoadModel::classify_acwr(0.3), AcwrStatus::VeryLow);
    EXPECT_EQ(LoadModel::classify_acwr(0.5), AcwrStatus::Undertraining);
    EXPECT_EQ(LoadModel::classify_acwr(0.8), AcwrStatus::Optimal);
    EXPECT_EQ(LoadModel::classify_acwr(1.3), AcwrStatus::Optimal);
    EXPECT_EQ(LoadModel::classify_acwr(1.4), AcwrStatus::Caution);
    EXPECT_EQ(LoadModel::classify_acwr(1.5), AcwrStatus::HighRisk);
    EXPECT_EQ(LoadModel::classify_acwr(2.5), AcwrStatus::HighRisk);
}

// ─── Form ─────────────────────────────────────────────────────────────────────

TEST(Form, ClassificationBands) {
    EXPECT_EQ(LoadModel::classify_form(30.0).status, FormStatus::VeryFresh);
    EXPECT_EQ(LoadModel::classify_form(25.0).status, FormStatus::VeryFresh);
    EXPECT_EQ(LoadModel::classify_form(12.0).status, FormStatus::Fresh);
    EXPECT_EQ(LoadModel::classify_form(0.0).status, FormStatus::Neutral);
    EXPECT_EQ(LoadModel::classify_form(-10.0).status, FormStatus::Neutral);
    EXPECT_EQ(LoadModel::classify_form(-18.0).status, FormStatus::Tired);
    EXPECT_EQ(LoadModel::classify_form(-40.0).status, FormStatus::VeryTired);
}

TEST(Form, SuggestedRangeShrinksWithFatigue) {
    const auto fresh = LoadModel::classify_form(15.0);
    const auto tired = LoadModel::classify_form(-30.0);
    EXPECT_LT(fresh.suggested_stress_min, fresh.suggested_stress_max);
    EXPECT_GT(fresh.suggested_stress_max, tired.suggested_stress_max);
}

// ─── Monotony / strain ────────────────────────────────────────────────────────

TEST(Monotony, FewerThanSevenDays_Nullopt) {
    const std::vector<double> six(6, 50.0);
    EXPECT_FALSE(LoadModel::monotony(six).has_value());
    EXPECT_FALSE(LoadModel::strain(six).has_value());
}

TEST(Monotony, IdenticalDays_Nullopt) {
    const std::vector<double> flat(7, 60.0);
    EXPECT_FALSE(LoadModel::monotony(flat).has_value());
}

TEST(Monotony, AllRest_Nullopt) {
    const std::vector<double> rest(7, 0.0);
    EXPECT_FALSE(LoadModel::monotony(rest).has_value());
}

TEST(Monotony, AlternatingWeek) {
    // mean = 400/7, population σ = 100·√12/7, so monotony = 4/√12.
    const std::vector<double> week = {100.0, 0.0, 100.0, 0.0, 100.0, 0.0, 100.0};
    const auto m = LoadModel::monotony(week);
    ASSERT_TRUE(m.has_value());
    EXPECT_NEAR(*m, 4.0 / std::sqrt(12.0), 1e-9);

    const auto s = LoadModel::strain(week);
    ASSERT_TRUE(s.has_value());
    EXPECT_NEAR(*s, 400.0 * 4.0 / std::sqrt(12.0), 1e-6);
}

TEST(Monotony, UsesOnlyLastSevenDays) {
    std::vector<double> history = {900.0, 900.0, 900.0};
    const std::vector<double> week = {100.0, 0.0, 100.0, 0.0, 100.0, 0.0, 100.0};
    history.insert(history.end(), week.begin(), week.end());
    EXPECT_DOUBLE_EQ(*LoadModel::monotony(history), *LoadModel::monotony(week));
}
