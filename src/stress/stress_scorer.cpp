/// @file src/stress/stress_scorer.cpp
/// @brief StressScorer — strategy selection, per-modality TSS and scaling.

#include "loadcal/stress.hpp"
#include "loadcal/constants.hpp"

#include <algorithm>
#include <cmath>

namespace loadcal::stress {

using intensity::GradedPace;
using intensity::NormalizedPower;

// ─── Internal helpers ─────────────────────────────────────────────────────────

namespace {

[[nodiscard]] bool positive(std::optional<double> v) noexcept {
    return v.has_value() && std::isfinite(*v) && *v > 0.0;
}

/// TSS = hours × IF² × 100.
[[nodiscard]] StressResult make_result(StressMethod method, double intensity_factor,
                                       double duration_s,
                                       std::optional<double> derived) noexcept {
    const double hours = duration_s / constants::SECONDS_PER_HOUR;
    StressResult r;
    r.method           = method;
    r.intensity_factor = intensity_factor;
    r.value = hours * intensity_factor * intensity_factor
            * constants::STRESS_PER_THRESHOLD_HOUR;
    r.derived_metric = derived;
    return r;
}

[[nodiscard]] StressResult zero_result(StressMethod method) noexcept {
    StressResult r;
    r.method = method;
    return r;
}

[[nodiscard]] bool valid_inputs(double metric, double duration_s,
                                double threshold) noexcept {
    return std::isfinite(metric) && std::isfinite(duration_s)
        && std::isfinite(threshold)
        && metric > 0.0 && duration_s > 0.0 && threshold > 0.0;
}

[[nodiscard]] bool has_power_signal(const WorkoutSignals& w) noexcept {
    return positive(w.normalized_power_w) || positive(w.average_power_w)
        || !w.power.empty();
}

[[nodiscard]] bool has_distance(const WorkoutSignals& w) noexcept {
    return positive(w.distance_m) && w.duration_s > 0.0;
}

/// Best available NP: reported value, computed value, then plain average.
[[nodiscard]] double best_normalized_power(const WorkoutSignals& w) noexcept {
    if (positive(w.normalized_power_w)) {
        return *w.normalized_power_w;
    }
    if (auto np = NormalizedPower::from_samples(w.power)) {
        return *np;
    }
    if (auto avg = NormalizedPower::average_power(w.power)) {
        return *avg;
    }
    return w.average_power_w.value_or(0.0);
}

/// Best available running pace: track NGP, totals NGP, then average pace.
[[nodiscard]] double best_running_pace(const WorkoutSignals& w) noexcept {
    if (auto ngp = GradedPace::from_track(w.track)) {
        return *ngp;
    }
    if (!has_distance(w)) {
        return 0.0;
    }
    const double avg_pace = w.duration_s / (*w.distance_m / 1000.0);
    if (w.total_ascent_m || w.total_descent_m) {
        if (auto ngp = GradedPace::from_totals(avg_pace,
                                               w.total_ascent_m.value_or(0.0),
                                               w.total_descent_m.value_or(0.0),
                                               *w.distance_m)) {
            return *ngp;
        }
    }
    return avg_pace;
}

[[nodiscard]] double best_average_hr(const WorkoutSignals& w) noexcept {
    if (positive(w.average_hr_bpm)) {
        return *w.average_hr_bpm;
    }
    if (w.heart_rate.empty()) {
        return 0.0;
    }
    double sum = 0.0;
    for (const auto& s : w.heart_rate) {
        sum += s.bpm;
    }
    return sum / static_cast<double>(w.heart_rate.size());
}

} // anonymous namespace

// ─── Names ────────────────────────────────────────────────────────────────────

std::string_view to_string(StressMethod m) noexcept {
    switch (m) {
        case StressMethod::Power:        return "power";
        case StressMethod::RunningPower: return "running power";
        case StressMethod::Pace:         return "pace";
        case StressMethod::HeartRate:    return "heart rate";
        case StressMethod::Estimated:    return "estimated";
    }
    return "estimated";
}

std::string_view describe_intensity(double intensity_factor) noexcept {
    if (intensity_factor >= 1.05) return "All Out";
    if (intensity_factor >= 0.95) return "Threshold";
    if (intensity_factor >= 0.85) return "Tempo";
    if (intensity_factor >= 0.75) return "Endurance";
    if (intensity_factor >= 0.55) return "Recovery";
    return "Easy";
}

double StressResult::stress_per_hour(double duration_s) const noexcept {
    if (duration_s <= 0.0) {
        return 0.0;
    }
    return value / (duration_s / constants::SECONDS_PER_HOUR);
}

// ─── Per-modality scoring ─────────────────────────────────────────────────────

StressResult StressScorer::from_power(double normalized_power_w, double duration_s,
                                      double ftp_watts) noexcept {
    if (!valid_inputs(normalized_power_w, duration_s, ftp_watts)) {
        return zero_result(StressMethod::Power);
    }
    return make_result(StressMethod::Power, normalized_power_w / ftp_watts,
                       duration_s, normalized_power_w);
}

StressResult StressScorer::from_running_power(double normalized_power_w,
                                              double duration_s,
                                              double running_ftp_watts) noexcept {
    if (!valid_inputs(normalized_power_w, duration_s, running_ftp_watts)) {
        return zero_result(StressMethod::RunningPower);
    }
    return make_result(StressMethod::RunningPower,
                       normalized_power_w / running_ftp_watts,
                       duration_s, normalized_power_w);
}

StressResult StressScorer::from_pace(double normalized_pace_s_per_km,
                                     double duration_s,
                                     double threshold_pace_s_per_km) noexcept {
    if (!valid_inputs(normalized_pace_s_per_km, duration_s,
                      threshold_pace_s_per_km)) {
        return zero_result(StressMethod::Pace);
    }
    // Pace is inverse speed: a faster (smaller) pace means a higher IF.
    return make_result(StressMethod::Pace,
                       threshold_pace_s_per_km / normalized_pace_s_per_km,
                       duration_s, normalized_pace_s_per_km);
}

StressResult StressScorer::from_swim_pace(double pace_s_per_100m, double duration_s,
                                          double threshold_pace_s_per_100m) noexcept {
    if (!valid_inputs(pace_s_per_100m, duration_s, threshold_pace_s_per_100m)) {
        return zero_result(StressMethod::Pace);
    }
    return make_result(StressMethod::Pace,
                       threshold_pace_s_per_100m / pace_s_per_100m,
                       duration_s, pace_s_per_100m);
}

StressResult StressScorer::from_heart_rate(double average_hr_bpm, double duration_s,
                                           double threshold_hr_bpm) noexcept {
    if (!valid_inputs(average_hr_bpm, duration_s, threshold_hr_bpm)) {
        return zero_result(StressMethod::HeartRate);
    }
    return make_result(StressMethod::HeartRate, average_hr_bpm / threshold_hr_bpm,
                       duration_s, std::nullopt);
}

StressResult StressScorer::estimate(double duration_s,
                                    double perceived_intensity) noexcept {
    if (!std::isfinite(duration_s) || duration_s <= 0.0) {
        return zero_result(StressMethod::Estimated);
    }
    const double p = std::isfinite(perceived_intensity)
                   ? std::clamp(perceived_intensity, 0.0, 1.0)
                   : 0.5;
    const double intensity_factor =
        constants::ESTIMATE_BASE_IF + p * constants::ESTIMATE_IF_SLOPE;
    return make_result(StressMethod::Estimated, intensity_factor, duration_s,
                       std::nullopt);
}

double StressScorer::default_perceived_intensity(ActivityCategory category) noexcept {
    switch (category) {
        case ActivityCategory::Run:      return 0.7;
        case ActivityCategory::Bike:     return 0.65;
        case ActivityCategory::Swim:     return 0.7;
        case ActivityCategory::Strength: return 0.6;
        case ActivityCategory::Other:    return 0.5;
    }
    return 0.5;
}

// ─── Strategy selection ───────────────────────────────────────────────────────

StressMethod StressScorer::select_method(const WorkoutSignals& w,
                                         const AthleteThresholds& t) noexcept {
    switch (w.category) {
        case ActivityCategory::Bike:
            if (positive(t.ftp_watts) && has_power_signal(w)) {
                return StressMethod::Power;
            }
            break;
        case ActivityCategory::Run:
            if (positive(t.running_ftp_watts) && has_power_signal(w)) {
                return StressMethod::RunningPower;
            }
            if (positive(t.threshold_pace_s_per_km)
                && (w.track.size() >= 2 || has_distance(w))) {
                return StressMethod::Pace;
            }
            break;
        case ActivityCategory::Swim:
            if (positive(t.swim_threshold_pace_s_per_100m) && has_distance(w)) {
                return StressMethod::Pace;
            }
            break;
        case ActivityCategory::Strength:
        case ActivityCategory::Other:
            break;
    }

    if (positive(t.threshold_hr_bpm)
        && (positive(w.average_hr_bpm) || !w.heart_rate.empty())) {
        return StressMethod::HeartRate;
    }
    return StressMethod::Estimated;
}

StressResult StressScorer::score(const WorkoutSignals& w,
                                 const AthleteThresholds& t) noexcept {
    switch (select_method(w, t)) {
        case StressMethod::Power:
            return from_power(best_normalized_power(w), w.duration_s,
                              *t.ftp_watts);
        case StressMethod::RunningPower:
            return from_running_power(best_normalized_power(w), w.duration_s,
                                      *t.running_ftp_watts);
        case StressMethod::Pace:
            if (w.category == ActivityCategory::Swim) {
                const double pace_100m = w.duration_s / (*w.distance_m / 100.0);
                return from_swim_pace(pace_100m, w.duration_s,
                                      *t.swim_threshold_pace_s_per_100m);
            }
            return from_pace(best_running_pace(w), w.duration_s,
                             *t.threshold_pace_s_per_km);
        case StressMethod::HeartRate:
            return from_heart_rate(best_average_hr(w), w.duration_s,
                                   *t.threshold_hr_bpm);
        case StressMethod::Estimated:
            break;
    }
    return estimate(w.duration_s,
                    w.perceived_intensity.value_or(
                        default_perceived_intensity(w.category)));
}

// ─── apply_scaling ────────────────────────────────────────────────────────────

bool StressScorer::apply_scaling(StressResult& result,
                                 const calibration::ScalingProfile& profile,
                                 ActivityCategory category,
                                 std::optional<IntensityBand> band) noexcept {
    if (result.scaling_applied() || !profile.can_apply_scaling()) {
        return false;
    }
    const double factor =
        profile.factor_for(category, band.value_or(result.intensity_band()));

    result.scaling = ScalingRecord{factor, result.value};
    result.value  *= factor;
    return true;
}

} // namespace loadcal::stress
