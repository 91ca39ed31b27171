#pragma once

/// @file src/matcher/match_scoring.hpp
/// @brief Additive score tables used by WorkoutMatcher.
///
/// Relative differences are fractions (0.02 = 2 %). Each table returns the
/// points for the first bucket the difference falls strictly below.

#include <optional>

namespace loadcal::matcher::scoring {

/// Precise start-time proximity. Nullopt rejects the candidate.
[[nodiscard]] inline std::optional<double>
precise_time_points(double abs_seconds, bool same_local_day) noexcept {
    if (abs_seconds < 60.0)  return 50.0;
    if (abs_seconds < 120.0) return 35.0;
    if (abs_seconds < 300.0) return 20.0;
    if (same_local_day)      return 10.0;
    return std::nullopt;
}

/// Start time known only to the day.
[[nodiscard]] inline std::optional<double>
imprecise_time_points(int abs_day_difference) noexcept {
    if (abs_day_difference == 0) return 40.0;
    if (abs_day_difference == 1) return 20.0;
    return std::nullopt;
}

[[nodiscard]] inline double duration_points(double rel_diff) noexcept {
    if (rel_diff < 0.02) return 30.0;
    if (rel_diff < 0.05) return 25.0;
    if (rel_diff < 0.10) return 15.0;
    if (rel_diff < 0.20) return 5.0;
    return 0.0;
}

static constexpr double CATEGORY_POINTS = 25.0;

[[nodiscard]] inline double distance_points(double rel_diff) noexcept {
    if (rel_diff < 0.02) return 15.0;
    if (rel_diff < 0.05) return 10.0;
    if (rel_diff < 0.10) return 5.0;
    return 0.0;
}

} // namespace loadcal::matcher::scoring
