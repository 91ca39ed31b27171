/// @file src/core/engine.cpp
/// @brief Engine — scoring, daily aggregation, reconciliation and calibration.

#include "loadcal/engine.hpp"
#include "loadcal/log.hpp"

#include <algorithm>

namespace loadcal::core {

namespace {

constexpr std::string_view kTag = "engine";

[[nodiscard]] matcher::MatcherConfig
local_matcher_config(matcher::MatcherConfig cfg, std::chrono::minutes offset) {
    cfg.utc_offset = offset;
    return cfg;
}

template <typename T>
bool fill(std::optional<T>& target, const std::optional<T>& source) {
    if (target || !source) {
        return false;
    }
    target = source;
    return true;
}

} // anonymous namespace

// ─── merge_missing_fields ─────────────────────────────────────────────────────

bool merge_missing_fields(matcher::WorkoutObservation& canonical,
                          const matcher::WorkoutObservation& incoming) {
    bool changed = false;
    changed |= fill(canonical.distance_m, incoming.distance_m);
    changed |= fill(canonical.average_hr_bpm, incoming.average_hr_bpm);
    changed |= fill(canonical.average_power_w, incoming.average_power_w);
    changed |= fill(canonical.normalized_power_w, incoming.normalized_power_w);
    return changed;
}

// ─── Engine ───────────────────────────────────────────────────────────────────

Engine::Engine(EngineConfig config)
    : config_(config),
      matcher_(local_matcher_config(config.matcher, config.utc_offset)),
      learning_(config.learning) {}

Day Engine::day_of(const ScoredWorkout& w) const noexcept {
    return local_day(w.observation.start_time, config_.utc_offset);
}

stress::StressResult
Engine::score_workout(const stress::WorkoutSignals& signals) const {
    auto result = stress::StressScorer::score(signals, config_.thresholds);
    if (config_.apply_learned_scaling) {
        const auto profile = learning_.profile();
        stress::StressScorer::apply_scaling(result, *profile, signals.category);
    }
    log::debug(kTag, "{} workout: {:.1f} TSS via {} (IF {:.2f}{})",
               to_string(signals.category), result.value,
               stress::to_string(result.method), result.intensity_factor,
               result.scaling_applied() ? ", scaled" : "");
    return result;
}

ScoredWorkout Engine::score(const matcher::WorkoutObservation& observation,
                            const stress::WorkoutSignals& signals) const {
    return ScoredWorkout{observation, score_workout(signals)};
}

// ─── Aggregation ──────────────────────────────────────────────────────────────

std::map<Day, double>
Engine::daily_stress(std::span<const ScoredWorkout> workouts) const {
    std::map<Day, double> totals;
    for (const auto& w : workouts) {
        totals[day_of(w)] += std::max(0.0, w.stress.value);
    }
    return totals;
}

std::vector<DaySummary>
Engine::summarize_days(std::span<const ScoredWorkout> workouts) const {
    std::map<Day, DaySummary> days;
    std::map<Day, std::map<ActivityCategory, double>> by_category;

    for (const auto& w : workouts) {
        const Day d = day_of(w);
        DaySummary& s = days[d];
        s.date = d;
        s.total_stress    += std::max(0.0, w.stress.value);
        s.unscaled_stress += std::max(0.0, w.unscaled_stress());
        ++s.workout_count;
        by_category[d][w.observation.category] += w.stress.value;
    }

    std::vector<DaySummary> out;
    out.reserve(days.size());
    for (auto& [d, s] : days) {
        const auto& cats = by_category[d];
        s.multi_sport = cats.size() > 1;
        const auto top = std::max_element(
            cats.begin(), cats.end(),
            [](const auto& a, const auto& b) { return a.second < b.second; });
        if (top != cats.end()) {
            s.primary_category = top->first;
        }
        out.push_back(s);
    }
    return out;
}

std::vector<load::DailyLoadPoint>
Engine::pmc_series(std::span<const ScoredWorkout> workouts, Day start, Day end,
                   load::LoadState initial) const {
    return load::LoadModel::compute_series(daily_stress(workouts), start, end,
                                           initial, config_.tau);
}

// ─── reconcile ────────────────────────────────────────────────────────────────

ReconcileDecision
Engine::reconcile(const matcher::WorkoutObservation& incoming,
                  std::span<const matcher::WorkoutObservation> existing,
                  Timestamp now) const {
    ReconcileDecision decision;
    decision.match = matcher_.find_best(incoming, existing, now);
    if (!decision.match) {
        return decision;
    }

    matcher::WorkoutObservation probe = existing[decision.match->candidate_index];
    decision.action = merge_missing_fields(probe, incoming)
                    ? ReconcileAction::Enrich
                    : ReconcileAction::Duplicate;
    return decision;
}

// ─── Calibration ──────────────────────────────────────────────────────────────

calibration::CalibrationOutcome
Engine::calibrate(const calibration::GroundTruthObservation& observation,
                  std::span<const ScoredWorkout> history, Day today) {
    calibration::DayContext ctx;

    std::map<Day, double> unscaled;
    std::optional<Day> first_day;
    for (const auto& summary : summarize_days(history)) {
        unscaled[summary.date] = summary.unscaled_stress;
        if (!first_day) first_day = summary.date;
        if (summary.date == observation.effective_date) {
            ctx.calculated_stress = summary.unscaled_stress;
            ctx.primary_category  = summary.primary_category;
            ctx.multi_sport       = summary.multi_sport;
        }
    }

    const Day previous = observation.effective_date - std::chrono::days{1};
    if (first_day && *first_day <= previous) {
        const auto series = load::LoadModel::compute_series(
            unscaled, *first_day, previous, {}, config_.tau);
        if (!series.empty()) {
            ctx.previous_day_load = series.back().state();
        }
    }

    return learning_.process_observation(observation, ctx, today);
}

std::optional<calibration::CalibrationOutcome>
Engine::calibrate_from_screenshot(std::span<const calibration::TextFragment> fragments,
                                  Day effective_date,
                                  std::span<const ScoredWorkout> history, Day today) {
    const auto reading = calibration::ScreenshotParser::parse(fragments);
    if (!reading) {
        return std::nullopt;
    }
    return calibrate(reading->to_observation(effective_date), history, today);
}

std::optional<calibration::CalibrationOutcome>
Engine::record_platform_stress(const matcher::WorkoutObservation& external,
                               double external_stress,
                               std::span<const ScoredWorkout> local,
                               Timestamp now, Day today) {
    std::vector<matcher::WorkoutObservation> pool;
    pool.reserve(local.size());
    for (const auto& w : local) {
        pool.push_back(w.observation);
    }

    const auto match = matcher_.find_best(external, pool, now);
    if (!match) {
        log::info(kTag, "no local workout matches {}", external.source_id);
        return std::nullopt;
    }
    const ScoredWorkout& mine = local[match->candidate_index];

    calibration::DirectComparison cmp;
    cmp.date              = day_of(mine);
    cmp.category          = mine.observation.category;
    cmp.external_stress   = external_stress;
    cmp.calculated_stress = mine.unscaled_stress();
    cmp.match_confidence  = match->confidence;
    if (mine.stress.intensity_factor > 0.0) {
        cmp.intensity_factor = mine.stress.intensity_factor;
    }
    return learning_.record_direct_comparison(cmp, today);
}

} // namespace loadcal::core
