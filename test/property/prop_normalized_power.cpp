/**
 * @file  prop_normalized_power.cpp
 * @brief Property: ∀ power series: NP ≥ mean of the 30 s rolling averages
 *
 * Run with 10,000 random inputs:
 *   RC_PARAMS="max_success=10000" ./prop_normalized_power
 *
 * Mathematical basis:
 *   NP = (mean(r_i⁴))^(1/4) where r_i are the 30 s trailing means.
 *   By the power-mean inequality M₄(r) ≥ M₁(r), with equality iff every
 *   r_i is equal. Hence:
 *     • NP of a constant series is that constant
 *     • NP is never below the mean of the rolling averages
 *     • NP is positively homogeneous: NP(k·p) = k·NP(p) for k > 0
 */

#include <rapidcheck.h>

#include <cmath>
#include <numeric>
#include <vector>

#include "loadcal/intensity.hpp"

using namespace loadcal;
using namespace loadcal::intensity;

namespace {

std::vector<double> random_ride() {
    const auto n = *rc::gen::inRange<std::size_t>(31, 600);
    const auto watts = *rc::gen::container<std::vector<int>>(n, rc::gen::inRange(0, 1500));
    return std::vector<double>(watts.begin(), watts.end());
}

} // anonymous namespace

int main() {
    bool ok = true;

    // ── Property 1: constant power has NP equal to that power ────────────────
    ok &= rc::check(
        "normalized_power: constant series has NP == constant",
        []() {
            const auto n = *rc::gen::inRange<std::size_t>(31, 2000);
            const double w = static_cast<double>(*rc::gen::inRange(1, 1500));
            const std::vector<double> series(n, w);
            const auto np = NormalizedPower::from_uniform(series);
            RC_ASSERT(np.has_value());
            RC_ASSERT(std::abs(*np - w) < 1e-9 * w);
        });

    // ── Property 2: power-mean inequality ────────────────────────────────────
    ok &= rc::check(
        "normalized_power: NP >= mean of rolling averages",
        []() {
            const auto series = random_ride();
            const auto np = NormalizedPower::from_uniform(series);
            RC_ASSERT(np.has_value());

            const auto rolling = NormalizedPower::rolling_average(series, 30);
            RC_ASSERT(!rolling.empty());
            const double mean =
                std::accumulate(rolling.begin(), rolling.end(), 0.0)
                / static_cast<double>(rolling.size());
            RC_ASSERT(*np >= mean - 1e-9 * (1.0 + mean));
            RC_ASSERT(*np <= 1500.0 * (1.0 + 1e-9));
        });

    // ── Property 3: homogeneity ──────────────────────────────────────────────
    ok &= rc::check(
        "normalized_power: NP(k * p) == k * NP(p)",
        []() {
            const auto series = random_ride();
            const double k = static_cast<double>(*rc::gen::inRange(1, 40)) / 10.0;
            std::vector<double> scaled(series);
            for (double& v : scaled) v *= k;

            const auto a = NormalizedPower::from_uniform(series);
            const auto b = NormalizedPower::from_uniform(scaled);
            RC_ASSERT(a.has_value());
            RC_ASSERT(b.has_value());
            RC_ASSERT(std::abs(*b - k * *a) <= 1e-9 * (1.0 + k * *a));
        });

    // ── Property 4: too-short series never yield a value ─────────────────────
    ok &= rc::check(
        "normalized_power: series no longer than the window give nullopt",
        []() {
            const auto n = *rc::gen::inRange<std::size_t>(0, 31);
            const std::vector<double> series(n, 250.0);
            RC_ASSERT(!NormalizedPower::from_uniform(series).has_value());
        });

    return ok ? 0 : 1;
}
