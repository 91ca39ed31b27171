#pragma once

/// @file include/loadcal/types.hpp
/// @brief Shared primitive types for the loadcal training-load engine.
///
/// Every module includes this file. It defines the calendar/time vocabulary,
/// the activity and intensity enumerations, and the Eigen aliases used for
/// sample arithmetic.

#include <Eigen/Dense>

#include <chrono>
#include <optional>
#include <string_view>

namespace loadcal {

// ─── Time ─────────────────────────────────────────────────────────────────────

/// An instant, second resolution, UTC.
using Timestamp = std::chrono::sys_seconds;

/// A calendar day. Always the athlete's local day unless stated otherwise.
using Day = std::chrono::sys_days;

/// Local calendar day of an instant under a fixed UTC offset.
[[nodiscard]] inline Day local_day(Timestamp t,
                                   std::chrono::minutes utc_offset) noexcept {
    return std::chrono::floor<std::chrono::days>(t + utc_offset);
}

/// Local wall-clock time since midnight of an instant.
[[nodiscard]] inline std::chrono::seconds
local_time_of_day(Timestamp t, std::chrono::minutes utc_offset) noexcept {
    const auto local = t + utc_offset;
    return local - std::chrono::floor<std::chrono::days>(local);
}

/// Signed whole-day distance `to − from`.
[[nodiscard]] inline int days_between(Day from, Day to) noexcept {
    return static_cast<int>((to - from).count());
}

// ─── Activity Category ────────────────────────────────────────────────────────

enum class ActivityCategory {
    Run,
    Bike,
    Swim,
    Strength,
    Other,
};

[[nodiscard]] constexpr std::string_view
to_string(ActivityCategory c) noexcept {
    switch (c) {
        case ActivityCategory::Run:      return "run";
        case ActivityCategory::Bike:     return "bike";
        case ActivityCategory::Swim:     return "swim";
        case ActivityCategory::Strength: return "strength";
        case ActivityCategory::Other:    return "other";
    }
    return "other";
}

/// Parse a category name ("run", "Bike", "ride", ...). Unknown → nullopt.
[[nodiscard]] std::optional<ActivityCategory>
parse_category(std::string_view name);

// ─── Intensity Band ───────────────────────────────────────────────────────────

/// Intensity-factor bucket used to learn per-intensity correction factors.
///   Recovery      IF < 0.75
///   Endurance     0.75 ≤ IF < 0.90
///   Tempo         0.90 ≤ IF < 1.05
///   HighIntensity IF ≥ 1.05
enum class IntensityBand {
    Recovery,
    Endurance,
    Tempo,
    HighIntensity,
};

[[nodiscard]] IntensityBand intensity_band_for(double intensity_factor) noexcept;

[[nodiscard]] constexpr std::string_view to_string(IntensityBand b) noexcept {
    switch (b) {
        case IntensityBand::Recovery:      return "recovery";
        case IntensityBand::Endurance:     return "endurance";
        case IntensityBand::Tempo:         return "tempo";
        case IntensityBand::HighIntensity: return "high";
    }
    return "recovery";
}

// ─── Linear Algebra Aliases ───────────────────────────────────────────────────

/// Uniformly spaced sample series (1 Hz power, ratios, weights, ...).
using SampleVector = Eigen::VectorXd;

} // namespace loadcal
