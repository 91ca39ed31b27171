#pragma once

/// @file include/loadcal/stress.hpp
/// @brief Stress Scorer — Training Stress Score per workout.
///
/// # Module: Stress Scorer
///
/// ## Responsibility
/// Compute one workout's TSS from whichever signals it carries, using the
/// highest-fidelity strategy whose threshold is known:
///
///   power (cycling FTP / running FTP)
///     > pace (running threshold pace / swim threshold pace)
///     > heart rate (lactate-threshold HR)
///     > estimate (perceived intensity)
///
/// Every strategy reduces to TSS = hours × IF² × 100 with its own IF.
///
/// ## Guarantees
/// - Never throws; a non-positive threshold, duration or pace yields a zero
///   result tagged with the attempted method
/// - A result is scaled by a learned factor at most once
///
/// ## NOT Responsible For
/// - Learning the factors (see calibration.hpp)
/// - Aggregating workouts into days (see engine.hpp)

#include "loadcal/intensity.hpp"
#include "loadcal/scaling_profile.hpp"
#include "loadcal/types.hpp"

#include <optional>
#include <string_view>
#include <vector>

namespace loadcal::stress {

enum class StressMethod {
    Power,
    RunningPower,
    Pace,
    HeartRate,
    Estimated,
};

[[nodiscard]] std::string_view to_string(StressMethod m) noexcept;

/// Describe an intensity factor ("Threshold", "Tempo", ...).
[[nodiscard]] std::string_view describe_intensity(double intensity_factor) noexcept;

/// Record of a learned factor applied to a result.
struct ScalingRecord {
    double factor;
    double pre_scaling_value;
};

struct StressResult {
    double       value            = 0.0;  ///< TSS, ≥ 0
    StressMethod method           = StressMethod::Estimated;
    double       intensity_factor = 0.0;

    /// Normalized power (W) for power methods, normalized pace (s/km, or
    /// s/100 m for swims) for the pace method, absent otherwise.
    std::optional<double> derived_metric;

    std::optional<ScalingRecord> scaling;

    [[nodiscard]] bool scaling_applied() const noexcept { return scaling.has_value(); }

    /// Stress rate for the given duration; 0 for non-positive durations.
    [[nodiscard]] double stress_per_hour(double duration_s) const noexcept;

    [[nodiscard]] IntensityBand intensity_band() const noexcept {
        return intensity_band_for(intensity_factor);
    }
};

// ─── Inputs ───────────────────────────────────────────────────────────────────

/// Athlete thresholds. An absent or non-positive value disables the
/// strategies that depend on it.
struct AthleteThresholds {
    std::optional<double> ftp_watts;
    std::optional<double> running_ftp_watts;
    std::optional<double> threshold_pace_s_per_km;
    std::optional<double> swim_threshold_pace_s_per_100m;
    std::optional<double> threshold_hr_bpm;
};

/// Everything the scorer may use about one workout.
struct WorkoutSignals {
    ActivityCategory category   = ActivityCategory::Other;
    double           duration_s = 0.0;

    std::optional<double> distance_m;

    std::vector<intensity::PowerSample>     power;
    std::vector<intensity::HeartRateSample> heart_rate;
    std::vector<intensity::TrackPoint>      track;

    /// Device-reported summaries, used when streams are absent.
    std::optional<double> normalized_power_w;
    std::optional<double> average_power_w;
    std::optional<double> average_hr_bpm;
    std::optional<double> total_ascent_m;
    std::optional<double> total_descent_m;

    /// Perceived effort in [0, 1]; category default when absent.
    std::optional<double> perceived_intensity;
};

// ─── StressScorer ─────────────────────────────────────────────────────────────

class StressScorer {
public:
    StressScorer() = delete;

    [[nodiscard]] static StressResult
    from_power(double normalized_power_w, double duration_s,
               double ftp_watts) noexcept;

    [[nodiscard]] static StressResult
    from_running_power(double normalized_power_w, double duration_s,
                       double running_ftp_watts) noexcept;

    /// Running pace: IF = threshold pace / actual pace (both s/km).
    [[nodiscard]] static StressResult
    from_pace(double normalized_pace_s_per_km, double duration_s,
              double threshold_pace_s_per_km) noexcept;

    /// Swim pace: IF = threshold pace / actual pace (both s/100 m).
    [[nodiscard]] static StressResult
    from_swim_pace(double pace_s_per_100m, double duration_s,
                   double threshold_pace_s_per_100m) noexcept;

    [[nodiscard]] static StressResult
    from_heart_rate(double average_hr_bpm, double duration_s,
                    double threshold_hr_bpm) noexcept;

    /// IF = 0.5 + p × 0.6 with `perceived_intensity` clamped to [0, 1].
    [[nodiscard]] static StressResult
    estimate(double duration_s, double perceived_intensity) noexcept;

    [[nodiscard]] static double
    default_perceived_intensity(ActivityCategory category) noexcept;

    /// Highest-fidelity method usable for these signals and thresholds.
    [[nodiscard]] static StressMethod
    select_method(const WorkoutSignals& workout,
                  const AthleteThresholds& thresholds) noexcept;

    /// Score with the method chosen by `select_method`.
    [[nodiscard]] static StressResult
    score(const WorkoutSignals& workout,
          const AthleteThresholds& thresholds) noexcept;

    /// Multiply `result` by the profile's factor for this workout.
    ///
    /// No-op when the profile's gates fail or the result is already scaled.
    /// `band` defaults to the result's own intensity band.
    /// Returns true if this call applied scaling.
    static bool apply_scaling(StressResult& result,
                              const calibration::ScalingProfile& profile,
                              ActivityCategory category,
                              std::optional<IntensityBand> band = std::nullopt) noexcept;
};

} // namespace loadcal::stress
