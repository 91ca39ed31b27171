/**
 * @file  prop_stress_scaling.cpp
 * @brief Property: ∀ workouts: TSS = hours·IF²·100 and scaling applies once
 *
 * Run with 10,000 random inputs:
 *   RC_PARAMS="max_success=10000" ./prop_stress_scaling
 *
 * Mathematical basis:
 *   Every strategy reduces to TSS = (duration / 3600) · IF² · 100, so
 *     • TSS is linear in duration and quadratic in IF
 *     • one hour at threshold (IF = 1) is exactly 100
 *   Learned scaling multiplies the value by the profile factor f, records
 *   the pre-scaling value, and refuses to apply a second time.
 */

#include <rapidcheck.h>

#include <cmath>

#include "loadcal/stress.hpp"

using namespace loadcal;
using namespace loadcal::stress;
using loadcal::calibration::ScalingProfile;

namespace {

double to_range(double raw, double lo, double hi) {
    if (!std::isfinite(raw)) return lo;
    return lo + (std::tanh(raw) + 1.0) * 0.5 * (hi - lo);
}

} // anonymous namespace

int main() {
    bool ok = true;

    // ── Property 1: power TSS matches the closed form ────────────────────────
    ok &= rc::check(
        "stress_scaling: from_power == hours * (NP/FTP)^2 * 100",
        [](double raw_np, double raw_dur, double raw_ftp) {
            const double np  = to_range(raw_np, 50.0, 500.0);
            const double dur = to_range(raw_dur, 60.0, 6.0 * 3600.0);
            const double ftp = to_range(raw_ftp, 100.0, 450.0);

            const auto r = StressScorer::from_power(np, dur, ftp);
            const double expected = dur / 3600.0 * (np / ftp) * (np / ftp) * 100.0;
            RC_ASSERT(r.method == StressMethod::Power);
            RC_ASSERT(std::abs(r.value - expected) <= 1e-9 * expected);
        });

    // ── Property 2: one hour at threshold is 100 in every modality ───────────
    ok &= rc::check(
        "stress_scaling: threshold hour is 100 TSS for power, pace and HR",
        [](double raw_threshold) {
            const double t = to_range(raw_threshold, 60.0, 400.0);
            RC_ASSERT(std::abs(StressScorer::from_power(t, 3600.0, t).value - 100.0) < 1e-9);
            RC_ASSERT(std::abs(StressScorer::from_pace(t, 3600.0, t).value - 100.0) < 1e-9);
            RC_ASSERT(std::abs(StressScorer::from_swim_pace(t, 3600.0, t).value - 100.0) < 1e-9);
            RC_ASSERT(std::abs(StressScorer::from_heart_rate(t, 3600.0, t).value - 100.0) < 1e-9);
        });

    // ── Property 3: estimate intensity is always within [0.5, 1.1] ───────────
    ok &= rc::check(
        "stress_scaling: estimated IF stays in [0.5, 1.1] for any perceived effort",
        [](double p, double raw_dur) {
            const double dur = to_range(raw_dur, 1.0, 20000.0);
            const auto r = StressScorer::estimate(dur, p);
            RC_ASSERT(r.intensity_factor >= 0.5 - 1e-12);
            RC_ASSERT(r.intensity_factor <= 1.1 + 1e-12);
            RC_ASSERT(r.value >= 0.0);
        });

    // ── Property 4: scaling multiplies once and records the original ─────────
    ok &= rc::check(
        "stress_scaling: apply_scaling multiplies by the factor exactly once",
        [](double raw_factor, double raw_np) {
            ScalingProfile profile;
            profile.global_factor       = to_range(raw_factor, 0.8, 1.5);
            profile.global_confidence   = 0.9;
            profile.global_sample_count = 5;

            auto r = StressScorer::from_power(to_range(raw_np, 50.0, 400.0), 3600.0, 250.0);
            const double before = r.value;

            RC_ASSERT(StressScorer::apply_scaling(r, profile, ActivityCategory::Bike));
            RC_ASSERT(std::abs(r.value - before * profile.global_factor) <= 1e-9 * before);
            RC_ASSERT(r.scaling->pre_scaling_value == before);

            const double once = r.value;
            RC_ASSERT(!StressScorer::apply_scaling(r, profile, ActivityCategory::Bike));
            RC_ASSERT(r.value == once);
        });

    // ── Property 5: closed gates never change the value ──────────────────────
    ok &= rc::check(
        "stress_scaling: disabled learning or thin evidence leaves TSS unchanged",
        [](double raw_factor, bool disable) {
            ScalingProfile profile;
            profile.global_factor       = to_range(raw_factor, 0.8, 1.5);
            profile.global_confidence   = 0.9;
            profile.global_sample_count = disable ? 10 : 2;
            profile.learning_enabled    = !disable;

            auto r = StressScorer::from_power(200.0, 3600.0, 250.0);
            const double before = r.value;
            RC_ASSERT(!StressScorer::apply_scaling(r, profile, ActivityCategory::Bike));
            RC_ASSERT(r.value == before);
            RC_ASSERT(!r.scaling_applied());
        });

    return ok ? 0 : 1;
}
