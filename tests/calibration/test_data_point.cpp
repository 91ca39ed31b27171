/// @file tests/calibration/test_data_point.cpp
/// @brief Tests for CalibrationDataPoint derivations and the point store.

#include <gtest/gtest.h>
#include "loadcal/calibration.hpp"

using namespace loadcal;
using namespace loadcal::calibration;
using namespace std::chrono;

namespace {
const Day kToday = sys_days{year{2024} / April / 30};
} // anonymous namespace

// ─── Derived quantities ───────────────────────────────────────────────────────

TEST(DataPoint, ScalingRatio) {
    const auto p = CalibrationDataPoint::direct(kToday, 120.0, 100.0, 0.9);
    ASSERT_TRUE(p.scaling_ratio().has_value());
    EXPECT_DOUBLE_EQ(*p.scaling_ratio(), 1.2);
    EXPECT_EQ(p.method, DerivationMethod::Direct);

    const auto zero = CalibrationDataPoint::direct(kToday, 120.0, 0.0, 0.9);
    EXPECT_FALSE(zero.scaling_ratio().has_value());
    EXPECT_FALSE(zero.usable_for_learning());
}

TEST(DataPoint, TimeWeightHalvesEveryThirtyDays) {
    const auto p = CalibrationDataPoint::direct(kToday - days{30}, 100.0, 100.0, 0.8);
    EXPECT_EQ(p.age_days(kToday), 30);
    EXPECT_NEAR(p.time_weight(kToday), 0.5, 1e-12);
    EXPECT_NEAR(p.learning_weight(kToday), 0.4, 1e-12);

    const auto older = CalibrationDataPoint::direct(kToday - days{60}, 100.0, 100.0, 0.8);
    EXPECT_NEAR(older.time_weight(kToday), 0.25, 1e-12);
}

TEST(DataPoint, FutureDateHasZeroAge) {
    const auto p = CalibrationDataPoint::direct(kToday + days{3}, 100.0, 100.0, 0.8);
    EXPECT_EQ(p.age_days(kToday), 0);
    EXPECT_DOUBLE_EQ(p.time_weight(kToday), 1.0);
}

TEST(DataPoint, UsabilityNeedsConfidenceAndValidity) {
    auto p = CalibrationDataPoint::direct(kToday, 100.0, 90.0, 0.5);
    EXPECT_TRUE(p.usable_for_learning());

    p.source_confidence = 0.49;
    EXPECT_FALSE(p.usable_for_learning());

    p.source_confidence = 0.9;
    p.is_valid = false;
    EXPECT_FALSE(p.usable_for_learning());
}

TEST(DataPoint, ConfidenceIsClamped) {
    EXPECT_DOUBLE_EQ(CalibrationDataPoint::direct(kToday, 1.0, 1.0, 1.7).source_confidence, 1.0);
    EXPECT_DOUBLE_EQ(CalibrationDataPoint::direct(kToday, 1.0, 1.0, -0.2).source_confidence, 0.0);
}

// ─── Load-curve inversions ────────────────────────────────────────────────────

TEST(DataPoint, FromCtlInvertsRecurrence) {
    // CTL 50 → 51 with τ = 42 implies a 92 TSS day.
    const auto p = CalibrationDataPoint::from_ctl(kToday, 51.0, 50.0, 80.0, 0.9);
    EXPECT_EQ(p.method, DerivationMethod::CtlDerived);
    EXPECT_NEAR(p.extracted_value, 92.0, 1e-9);
    EXPECT_NEAR(p.source_confidence, 0.81, 1e-12);
    EXPECT_NEAR(*p.scaling_ratio(), 1.15, 1e-9);
}

TEST(DataPoint, FromAtlClampsNegativeToZero) {
    const auto p = CalibrationDataPoint::from_atl(kToday, 40.0, 50.0, 80.0, 0.9);
    EXPECT_EQ(p.method, DerivationMethod::AtlDerived);
    EXPECT_DOUBLE_EQ(p.extracted_value, 0.0);
}

TEST(DataPoint, FromAtlInvertsRecurrence) {
    // ATL 50 → 56 with τ = 7 implies 92.
    const auto p = CalibrationDataPoint::from_atl(kToday, 56.0, 50.0, 92.0, 1.0);
    EXPECT_NEAR(p.extracted_value, 92.0, 1e-9);
    EXPECT_NEAR(*p.scaling_ratio(), 1.0, 1e-9);
}

TEST(DataPoint, CrossValidatedAgreeingEstimates) {
    const auto p = CalibrationDataPoint::cross_validated(
        kToday, load::LoadState{51.0, 56.0}, load::LoadState{50.0, 50.0}, 80.0, 0.9);
    ASSERT_TRUE(p.has_value());
    EXPECT_EQ(p->method, DerivationMethod::CrossValidated);
    EXPECT_NEAR(p->extracted_value, 92.0, 1e-9);
    EXPECT_NEAR(p->source_confidence, 0.9, 1e-12);
}

TEST(DataPoint, CrossValidatedPartialAgreementScalesConfidence) {
    // CTL implies 92, ATL implies 99: agreement 1 − 7/95.5.
    const auto p = CalibrationDataPoint::cross_validated(
        kToday, load::LoadState{51.0, 57.0}, load::LoadState{50.0, 50.0}, 80.0, 1.0);
    ASSERT_TRUE(p.has_value());
    EXPECT_NEAR(p->extracted_value, 95.5, 1e-9);
    EXPECT_NEAR(p->source_confidence, 1.0 - 7.0 / 95.5, 1e-9);
}

TEST(DataPoint, CrossValidatedDisagreementIsRejected) {
    // CTL implies 92, ATL implies 120: agreement ≈ 0.74.
    EXPECT_FALSE(CalibrationDataPoint::cross_validated(
        kToday, load::LoadState{51.0, 60.0}, load::LoadState{50.0, 50.0}, 80.0, 0.9)
        .has_value());
}

TEST(DataPoint, CrossValidatedNegativeEstimateIsRejected) {
    EXPECT_FALSE(CalibrationDataPoint::cross_validated(
        kToday, load::LoadState{49.0, 40.0}, load::LoadState{50.0, 50.0}, 80.0, 0.9)
        .has_value());
}

// ─── CalibrationPointStore ────────────────────────────────────────────────────

TEST(PointStore, AssignsIncreasingIds) {
    CalibrationPointStore store;
    const auto a = store.add(CalibrationDataPoint::direct(kToday, 1.0, 1.0, 1.0));
    const auto b = store.add(CalibrationDataPoint::direct(kToday, 2.0, 1.0, 1.0));
    EXPECT_EQ(a, 1u);
    EXPECT_EQ(b, 2u);
    EXPECT_EQ(store.size(), 2u);
    EXPECT_EQ(store.all()[1].id, 2u);
}

TEST(PointStore, InvalidateIsSoftAndOnce) {
    CalibrationPointStore store;
    const auto a = store.add(CalibrationDataPoint::direct(kToday, 1.0, 1.0, 1.0));
    store.add(CalibrationDataPoint::direct(kToday, 2.0, 1.0, 1.0));

    EXPECT_TRUE(store.invalidate(a, "misread"));
    EXPECT_FALSE(store.invalidate(a, "again"));
    EXPECT_FALSE(store.invalidate(99, "unknown"));

    EXPECT_EQ(store.size(), 2u);
    EXPECT_EQ(store.valid().size(), 1u);
    EXPECT_EQ(store.all()[0].invalid_reason, "misread");

    store.clear();
    EXPECT_EQ(store.size(), 0u);
}
