/**
 * @file  prop_learning_convergence.cpp
 * @brief Property: ∀ consistent evidence: the learned factor equals the ratio
 *
 * Run with 10,000 random inputs:
 *   RC_PARAMS="max_success=10000" ./prop_learning_convergence
 *
 * Mathematical basis:
 *   The global factor is the weighted mean Σ wᵢ·rᵢ / Σ wᵢ with
 *   wᵢ = 0.5^(ageᵢ/30) · confidenceᵢ > 0. A weighted mean is a convex
 *   combination of the ratios, so:
 *     • it equals r when every rᵢ = r
 *     • it lies in [min rᵢ, max rᵢ]
 *     • it does not depend on the order of the points
 *   Confidence is a blend of three [0, 1] terms and is clamped to [0, 1].
 */

#include <rapidcheck.h>

#include <algorithm>
#include <cmath>
#include <vector>

#include "loadcal/calibration.hpp"

using namespace loadcal;
using namespace loadcal::calibration;
using namespace std::chrono;

namespace {

const Day kToday = sys_days{year{2024} / June / 1};

CalibrationDataPoint random_point(double ratio) {
    const int age = *rc::gen::inRange(0, 180);
    const double confidence = static_cast<double>(*rc::gen::inRange(50, 101)) / 100.0;
    const double calculated = static_cast<double>(*rc::gen::inRange(20, 300));
    return CalibrationDataPoint::direct(kToday - days{age}, calculated * ratio,
                                        calculated, confidence);
}

double random_ratio() {
    return static_cast<double>(*rc::gen::inRange(80, 151)) / 100.0;
}

} // anonymous namespace

int main() {
    bool ok = true;

    // ── Property 1: a constant ratio is learned exactly ──────────────────────
    ok &= rc::check(
        "learning_convergence: constant ratio r gives factor r",
        []() {
            const double r = random_ratio();
            const auto n = *rc::gen::inRange(3, 40);
            std::vector<CalibrationDataPoint> points;
            for (int i = 0; i < n; ++i) points.push_back(random_point(r));

            const auto profile = LearningEngine::recompute(ScalingProfile{}, points, kToday);
            RC_ASSERT(std::abs(profile.global_factor - r) < 1e-9);
            RC_ASSERT(profile.global_sample_count == static_cast<std::size_t>(n));
            RC_ASSERT(profile.global_confidence >= 0.0);
            RC_ASSERT(profile.global_confidence <= 1.0);
        });

    // ── Property 2: the factor is bracketed by the observed ratios ───────────
    ok &= rc::check(
        "learning_convergence: min ratio <= factor <= max ratio",
        []() {
            const auto n = *rc::gen::inRange(1, 40);
            std::vector<CalibrationDataPoint> points;
            double lo = 1e9;
            double hi = -1e9;
            for (int i = 0; i < n; ++i) {
                points.push_back(random_point(random_ratio()));
                const double ratio = *points.back().scaling_ratio();
                lo = std::min(lo, ratio);
                hi = std::max(hi, ratio);
            }

            const auto profile = LearningEngine::recompute(ScalingProfile{}, points, kToday);
            RC_ASSERT(profile.global_factor >= lo - 1e-9);
            RC_ASSERT(profile.global_factor <= hi + 1e-9);
            RC_ASSERT(profile.global_confidence >= 0.0);
            RC_ASSERT(profile.global_confidence <= 1.0);
        });

    // ── Property 3: point order is irrelevant ────────────────────────────────
    ok &= rc::check(
        "learning_convergence: recompute is order invariant",
        []() {
            const auto n = *rc::gen::inRange(2, 30);
            std::vector<CalibrationDataPoint> points;
            for (int i = 0; i < n; ++i) points.push_back(random_point(random_ratio()));

            std::vector<CalibrationDataPoint> reversed(points.rbegin(), points.rend());
            const auto a = LearningEngine::recompute(ScalingProfile{}, points, kToday);
            const auto b = LearningEngine::recompute(ScalingProfile{}, reversed, kToday);
            RC_ASSERT(std::abs(a.global_factor - b.global_factor) < 1e-9);
            RC_ASSERT(std::abs(a.global_confidence - b.global_confidence) < 1e-9);
            RC_ASSERT(a.global_sample_count == b.global_sample_count);
        });

    return ok ? 0 : 1;
}
