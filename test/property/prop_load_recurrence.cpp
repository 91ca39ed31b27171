/**
 * @file  prop_load_recurrence.cpp
 * @brief Property: ∀ state, stress ≥ 0: each PMC step is a convex blend
 *
 * Run with 10,000 random inputs:
 *   RC_PARAMS="max_success=10000" ./prop_load_recurrence
 *
 * Mathematical basis:
 *   CTL_t = CTL_{t−1} + (S_t − CTL_{t−1}) / τ
 *         = (1 − 1/τ)·CTL_{t−1} + (1/τ)·S_t
 *
 *   For τ ≥ 1 the new value is a convex combination of the previous value
 *   and today's stress, so it lies between them. Consequences checked here:
 *     • a series driven by stress in [0, S] never leaves [0, S]
 *     • the recurrence is linear: doubling every input doubles every output
 *     • recomputing forward from an edited day equals a full recompute
 */

#include <rapidcheck.h>

#include <algorithm>
#include <cmath>
#include <map>
#include <vector>

#include "loadcal/load_model.hpp"

using namespace loadcal;
using namespace loadcal::load;
using namespace std::chrono;

namespace {

const Day kStart = sys_days{year{2024} / January / 1};

/// Map an arbitrary double into [0, hi).
double to_range(double raw, double hi) {
    if (!std::isfinite(raw)) return 0.0;
    return (std::tanh(raw) + 1.0) * 0.5 * hi;
}

} // anonymous namespace

int main() {
    bool ok = true;

    // ── Property 1: one step stays between the previous value and stress ─────
    ok &= rc::check(
        "load_recurrence: advance is a convex blend of previous and today",
        [](double raw_ctl, double raw_atl, double raw_stress) {
            const LoadState prev{to_range(raw_ctl, 200.0), to_range(raw_atl, 200.0)};
            const double stress = to_range(raw_stress, 500.0);
            const LoadState next = LoadModel::advance(prev, stress);

            RC_ASSERT(next.ctl >= std::min(prev.ctl, stress) - 1e-9);
            RC_ASSERT(next.ctl <= std::max(prev.ctl, stress) + 1e-9);
            RC_ASSERT(next.atl >= std::min(prev.atl, stress) - 1e-9);
            RC_ASSERT(next.atl <= std::max(prev.atl, stress) + 1e-9);
        });

    // ── Property 2: bounded input keeps the series bounded ───────────────────
    ok &= rc::check(
        "load_recurrence: series from stress in [0, S] stays in [0, S]",
        []() {
            const auto n = *rc::gen::inRange(1, 200);
            const auto cap = *rc::gen::inRange(1, 400);
            std::map<Day, double> daily;
            for (int d = 0; d < n; ++d) {
                daily[kStart + days{d}] =
                    static_cast<double>(*rc::gen::inRange(0, cap + 1));
            }
            const auto series =
                LoadModel::compute_series(daily, kStart, kStart + days{n - 1});
            RC_ASSERT(series.size() == static_cast<std::size_t>(n));
            for (const auto& p : series) {
                RC_ASSERT(p.ctl >= 0.0);
                RC_ASSERT(p.atl >= 0.0);
                RC_ASSERT(p.ctl <= cap + 1e-9);
                RC_ASSERT(p.atl <= cap + 1e-9);
            }
        });

    // ── Property 3: linearity from a zero start ──────────────────────────────
    ok &= rc::check(
        "load_recurrence: doubling daily stress doubles CTL and ATL",
        []() {
            const auto n = *rc::gen::inRange(1, 120);
            std::map<Day, double> daily;
            std::map<Day, double> doubled;
            for (int d = 0; d < n; ++d) {
                const double s = static_cast<double>(*rc::gen::inRange(0, 300));
                daily[kStart + days{d}]   = s;
                doubled[kStart + days{d}] = 2.0 * s;
            }
            const Day end = kStart + days{n - 1};
            const auto a = LoadModel::compute_series(daily, kStart, end);
            const auto b = LoadModel::compute_series(doubled, kStart, end);
            for (std::size_t i = 0; i < a.size(); ++i) {
                RC_ASSERT(std::abs(b[i].ctl - 2.0 * a[i].ctl) < 1e-9);
                RC_ASSERT(std::abs(b[i].atl - 2.0 * a[i].atl) < 1e-9);
            }
        });

    // ── Property 4: forward recompute equals full recompute ──────────────────
    ok &= rc::check(
        "load_recurrence: recompute_forward after an edit matches compute_series",
        []() {
            const auto n = *rc::gen::inRange(2, 90);
            std::map<Day, double> daily;
            for (int d = 0; d < n; ++d) {
                daily[kStart + days{d}] = static_cast<double>(*rc::gen::inRange(0, 250));
            }
            const Day end = kStart + days{n - 1};
            auto series = LoadModel::compute_series(daily, kStart, end);

            const auto edited = *rc::gen::inRange(0, n);
            daily[kStart + days{edited}] = static_cast<double>(*rc::gen::inRange(0, 250));
            LoadModel::recompute_forward(series, kStart + days{edited}, daily);

            const auto full = LoadModel::compute_series(daily, kStart, end);
            RC_ASSERT(series.size() == full.size());
            for (std::size_t i = 0; i < full.size(); ++i) {
                RC_ASSERT(std::abs(series[i].ctl - full[i].ctl) < 1e-9);
                RC_ASSERT(std::abs(series[i].atl - full[i].atl) < 1e-9);
                RC_ASSERT(series[i].daily_stress == full[i].daily_stress);
            }
        });

    return ok ? 0 : 1;
}
