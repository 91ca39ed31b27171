#pragma once

/// @file include/loadcal/intensity.hpp
/// @brief Intensity Smoothing — Normalized Power and Normalized Graded Pace.
///
/// # Module: Intensity Smoothing
///
/// ## Responsibility
/// Turn raw, irregular sensor streams into a single physiologically
/// representative intensity value:
///   - Normalized Power: 30 s rolling mean → 4th power → mean → 4th root
///   - Normalized Graded Pace: per-segment grade adjustment via the Minetti
///     metabolic cost polynomial, averaged over the track
///
/// ## Guarantees
/// - Pure and `noexcept`; insufficient data yields `std::nullopt`
/// - NP ≥ mean of the rolling averages it is built from (power-mean inequality)
/// - Grade adjustment factor always in [0.7, 2.0]
///
/// ## NOT Responsible For
/// - Converting intensity into stress (see stress.hpp)

#include "loadcal/constants.hpp"
#include "loadcal/types.hpp"

#include <optional>
#include <span>
#include <vector>

namespace loadcal::intensity {

// ─── Samples ──────────────────────────────────────────────────────────────────

/// One power-meter reading. `time_s` is seconds from any fixed origin.
struct PowerSample {
    double time_s;
    double watts;
};

/// One heart-rate reading.
struct HeartRateSample {
    double time_s;
    double bpm;
};

/// One running trackpoint with instantaneous pace and altitude.
struct TrackPoint {
    double time_s;
    double pace_s_per_km;  ///< Instantaneous pace, seconds per kilometre
    double elevation_m;
};

// ─── NormalizedPower ──────────────────────────────────────────────────────────

class NormalizedPower {
public:
    NormalizedPower() = delete;

    /// Resample to 1 Hz over [first.time, last.time) by linear interpolation
    /// between the bracketing samples. Samples must be time-ordered.
    /// Fewer than two samples → empty.
    [[nodiscard]] static std::vector<double>
    resample_to_one_second(std::span<const PowerSample> samples);

    /// Trailing `window`-point means, one per index from window−1 onward.
    /// Empty when `values.size() < window` or `window == 0`.
    [[nodiscard]] static std::vector<double>
    rolling_average(std::span<const double> values, std::size_t window);

    /// NP of a uniformly spaced 1 Hz series.
    /// Nullopt unless `values.size() > window`.
    [[nodiscard]] static std::optional<double>
    from_uniform(std::span<const double> values,
                 std::size_t window = constants::NP_ROLLING_WINDOW_SECONDS);

    /// NP of an irregular series (resampled to 1 Hz first).
    [[nodiscard]] static std::optional<double>
    from_samples(std::span<const PowerSample> samples,
                 std::size_t window = constants::NP_ROLLING_WINDOW_SECONDS) noexcept;

    /// Arithmetic mean of the sample values. Empty input → nullopt.
    [[nodiscard]] static std::optional<double>
    average_power(std::span<const PowerSample> samples) noexcept;

    /// NP / average power; 1.0 when the average is ≤ 0.
    [[nodiscard]] static double variability_index(double normalized_power,
                                                  double average_power) noexcept;
};

// ─── GradedPace ───────────────────────────────────────────────────────────────

class GradedPace {
public:
    GradedPace() = delete;

    /// Energy-cost ratio of running at `grade_percent` relative to the flat,
    /// clamped to [GRADE_FACTOR_MIN, GRADE_FACTOR_MAX].
    [[nodiscard]] static double grade_adjustment_factor(double grade_percent) noexcept;

    /// Normalized graded pace (s/km) of a track.
    ///
    /// Each adjacent pair forms a segment whose horizontal distance is
    /// Δt / pace × 1000 m and whose grade is Δelevation / distance. Segments
    /// with non-positive Δt, pace or distance are skipped. Nullopt with fewer
    /// than two points or no usable segment.
    [[nodiscard]] static std::optional<double>
    from_track(std::span<const TrackPoint> points) noexcept;

    /// Normalized graded pace from whole-activity totals.
    ///
    /// Effective grade = net climb / distance × 100 plus half of the total
    /// vertical travel / distance × 100, so rolling courses cost more than
    /// their net gradient suggests. Nullopt for non-positive pace or
    /// distance.
    [[nodiscard]] static std::optional<double>
    from_totals(double average_pace_s_per_km,
                double total_ascent_m,
                double total_descent_m,
                double distance_m) noexcept;
};

} // namespace loadcal::intensity
