/// @file src/intensity/graded_pace.cpp
/// @brief GradedPace — Minetti grade adjustment and Normalized Graded Pace.

#include "loadcal/intensity.hpp"

#include <algorithm>
#include <cmath>

namespace loadcal::intensity {

namespace {

/// Metabolic cost of running (J/(kg·m)) at fractional gradient `g`
/// (Minetti et al. 2002, valid for roughly −0.45 ≤ g ≤ 0.45).
[[nodiscard]] double running_cost(double g) noexcept {
    const double g2 = g * g;
    const double g3 = g2 * g;
    const double g4 = g3 * g;
    const double g5 = g4 * g;
    return 155.4 * g5 - 30.4 * g4 - 43.3 * g3 + 46.3 * g2 + 19.5 * g
         + constants::FLAT_RUNNING_COST;
}

} // anonymous namespace

// ─── grade_adjustment_factor ──────────────────────────────────────────────────

double GradedPace::grade_adjustment_factor(double grade_percent) noexcept {
    if (!std::isfinite(grade_percent)) {
        return 1.0;
    }
    const double factor = running_cost(grade_percent / 100.0)
                        / constants::FLAT_RUNNING_COST;
    return std::clamp(factor, constants::GRADE_FACTOR_MIN,
                      constants::GRADE_FACTOR_MAX);
}

// ─── from_track ───────────────────────────────────────────────────────────────

std::optional<double>
GradedPace::from_track(std::span<const TrackPoint> points) noexcept {
    if (points.size() < 2) {
        return std::nullopt;
    }

    double sum   = 0.0;
    std::size_t count = 0;
    for (std::size_t i = 1; i < points.size(); ++i) {
        const TrackPoint& prev = points[i - 1];
        const TrackPoint& cur  = points[i];

        const double dt = cur.time_s - prev.time_s;
        if (dt <= 0.0 || cur.pace_s_per_km <= 0.0) {
            continue;
        }
        const double distance_m = dt / cur.pace_s_per_km * 1000.0;
        if (distance_m <= 0.0) {
            continue;
        }

        const double grade_pct =
            (cur.elevation_m - prev.elevation_m) / distance_m * 100.0;
        const double factor = grade_adjustment_factor(grade_pct);

        // A steeper climb at the same pace is harder, i.e. a faster flat pace.
        sum += cur.pace_s_per_km / factor;
        ++count;
    }

    if (count == 0) {
        return std::nullopt;
    }
    return sum / static_cast<double>(count);
}

// ─── from_totals ──────────────────────────────────────────────────────────────

std::optional<double>
GradedPace::from_totals(double average_pace_s_per_km,
                        double total_ascent_m,
                        double total_descent_m,
                        double distance_m) noexcept {
    if (average_pace_s_per_km <= 0.0 || distance_m <= 0.0) {
        return std::nullopt;
    }
    const double ascent  = std::max(0.0, total_ascent_m);
    const double descent = std::max(0.0, total_descent_m);

    const double net_grade    = (ascent - descent) / distance_m * 100.0;
    const double rolling_cost = (ascent + descent) / distance_m * 50.0;
    const double factor = grade_adjustment_factor(net_grade + rolling_cost);
    return average_pace_s_per_km / factor;
}

} // namespace loadcal::intensity
