#pragma once

/// @file include/loadcal/engine.hpp
/// @brief Core Integration Engine — public API.
///
/// # Module: Integration Engine
///
/// ## Responsibility
/// Wire the modules into the two pipelines an application runs:
///   workouts → StressScorer (+ learned scaling) → daily totals → LoadModel
///   ground truth → LearningEngine → ScalingProfile snapshot
/// and turn matcher output into a reconcile decision for incoming records.
///
/// ## Usage
/// ```cpp
/// Engine engine{EngineConfig{.thresholds = {.ftp_watts = 250.0}}};
/// std::vector<ScoredWorkout> history;
/// history.push_back(engine.score(observation, signals));
/// auto series = engine.pmc_series(history, first_day, today);
/// ```
///
/// ## Guarantees
/// - Scoring reads one profile snapshot per call
/// - Calibration compares ground truth with unscaled stress
/// - No I/O beyond the log sink

#include "loadcal/calibration.hpp"
#include "loadcal/load_model.hpp"
#include "loadcal/matcher.hpp"
#include "loadcal/screenshot.hpp"
#include "loadcal/stress.hpp"
#include "loadcal/types.hpp"

#include <chrono>
#include <map>
#include <optional>
#include <span>
#include <vector>

namespace loadcal::core {

// ─── EngineConfig ─────────────────────────────────────────────────────────────

struct EngineConfig {
    load::TimeConstants          tau{};
    stress::AthleteThresholds    thresholds{};
    matcher::MatcherConfig       matcher{};
    calibration::LearningConfig  learning{};

    /// Offset of the athlete's local clock; also forwarded to the matcher.
    std::chrono::minutes utc_offset{0};

    /// Multiply new scores by the learned factor when the profile allows it.
    bool apply_learned_scaling = true;
};

// ─── Records ──────────────────────────────────────────────────────────────────

/// A canonical workout and its score.
struct ScoredWorkout {
    matcher::WorkoutObservation observation;
    stress::StressResult        stress;

    /// Stress before any learned scaling.
    [[nodiscard]] double unscaled_stress() const noexcept {
        return stress.scaling ? stress.scaling->pre_scaling_value : stress.value;
    }
};

/// Per-day aggregate of scored workouts.
struct DaySummary {
    Day         date;
    double      total_stress    = 0.0;
    double      unscaled_stress = 0.0;
    std::size_t workout_count   = 0;

    /// Category carrying the most stress.
    std::optional<ActivityCategory> primary_category;
    bool multi_sport = false;
};

enum class ReconcileAction {
    New,        ///< No existing record matches
    Duplicate,  ///< Matches and adds nothing
    Enrich,     ///< Matches and fills fields the existing record lacks
};

struct ReconcileDecision {
    ReconcileAction                   action = ReconcileAction::New;
    std::optional<matcher::MatchResult> match;
};

/// Fill fields absent from `canonical` with values from `incoming`.
/// Present fields are never overwritten. Returns true if anything changed.
bool merge_missing_fields(matcher::WorkoutObservation& canonical,
                          const matcher::WorkoutObservation& incoming);

// ─── Engine ───────────────────────────────────────────────────────────────────

class Engine {
public:
    explicit Engine(EngineConfig config = EngineConfig{});

    /// Score a workout, applying the current learned scaling if enabled.
    [[nodiscard]] stress::StressResult
    score_workout(const stress::WorkoutSignals& signals) const;

    /// Score and pair with its observation.
    [[nodiscard]] ScoredWorkout score(const matcher::WorkoutObservation& observation,
                                      const stress::WorkoutSignals& signals) const;

    /// Local-day totals of (scaled) stress.
    [[nodiscard]] std::map<Day, double>
    daily_stress(std::span<const ScoredWorkout> workouts) const;

    /// Date-ordered per-day summaries of the days that have workouts.
    [[nodiscard]] std::vector<DaySummary>
    summarize_days(std::span<const ScoredWorkout> workouts) const;

    /// Gap-free PMC series over [start, end].
    [[nodiscard]] std::vector<load::DailyLoadPoint>
    pmc_series(std::span<const ScoredWorkout> workouts, Day start, Day end,
               load::LoadState initial = {}) const;

    /// Decide how an incoming observation relates to existing records.
    [[nodiscard]] ReconcileDecision
    reconcile(const matcher::WorkoutObservation& incoming,
              std::span<const matcher::WorkoutObservation> existing,
              Timestamp now) const;

    /// Feed one day of ground truth into the learning engine. Our own stress
    /// and previous-day load for that day are derived from `history`.
    calibration::CalibrationOutcome
    calibrate(const calibration::GroundTruthObservation& observation,
              std::span<const ScoredWorkout> history, Day today);

    /// Parse a dashboard screenshot and calibrate against it.
    /// Nullopt when the screenshot holds no readable values.
    std::optional<calibration::CalibrationOutcome>
    calibrate_from_screenshot(std::span<const calibration::TextFragment> fragments,
                              Day effective_date,
                              std::span<const ScoredWorkout> history, Day today);

    /// Match a platform-reported workout to a local one and record the
    /// stress comparison. Nullopt when no local workout matches.
    std::optional<calibration::CalibrationOutcome>
    record_platform_stress(const matcher::WorkoutObservation& external,
                           double external_stress,
                           std::span<const ScoredWorkout> local,
                           Timestamp now, Day today);

    [[nodiscard]] calibration::LearningEngine& learning() noexcept { return learning_; }
    [[nodiscard]] const calibration::LearningEngine& learning() const noexcept {
        return learning_;
    }

    [[nodiscard]] const EngineConfig& config() const noexcept { return config_; }

private:
    [[nodiscard]] Day day_of(const ScoredWorkout& w) const noexcept;

    EngineConfig                 config_;
    matcher::WorkoutMatcher      matcher_;
    calibration::LearningEngine  learning_;
};

} // namespace loadcal::core
