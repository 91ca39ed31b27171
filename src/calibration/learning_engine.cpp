/// @file src/calibration/learning_engine.cpp
/// @brief LearningEngine — ingestion state machine and profile recompute.

#include "loadcal/calibration.hpp"
#include "loadcal/log.hpp"
#include "ratio_statistics.hpp"

#include <map>

namespace loadcal::calibration {

namespace {

constexpr std::string_view kTag = "learning";

[[nodiscard]] ScalingProfile initial_profile(const ScalingPolicy& policy) {
    ScalingProfile p;
    p.policy = policy;
    return p;
}

/// Recompute the factor for every key present in `groups`; absent keys
/// keep whatever `target` already holds.
template <typename Key>
void recompute_groups(std::map<Key, LearnedFactor>& target,
                      const std::map<Key, std::vector<const CalibrationDataPoint*>>& groups,
                      Day today) {
    for (const auto& [key, members] : groups) {
        if (auto stats = detail::ratio_statistics(members, today)) {
            target[key] = LearnedFactor{stats->factor, stats->count};
        }
    }
}

} // anonymous namespace

std::string_view to_string(CalibrationStage s) noexcept {
    switch (s) {
        case CalibrationStage::Idle:              return "idle";
        case CalibrationStage::ProfileLoaded:     return "profile loaded";
        case CalibrationStage::DataPointsCreated: return "data points created";
        case CalibrationStage::FactorsRecomputed: return "factors recomputed";
        case CalibrationStage::Persisted:         return "persisted";
    }
    return "idle";
}

std::string_view to_string(SkipReason r) noexcept {
    switch (r) {
        case SkipReason::LearningDisabled:      return "learning disabled";
        case SkipReason::NoGroundTruth:         return "no ground truth";
        case SkipReason::NonPositiveCalculated: return "calculated stress is not positive";
        case SkipReason::NoPreviousDayLoad:     return "previous day load unknown";
        case SkipReason::DerivationRejected:    return "derived stress rejected";
    }
    return "unknown";
}

std::string_view LearningStatistics::confidence_level() const noexcept {
    if (global_confidence >= 0.9) return "Very High";
    if (global_confidence >= 0.7) return "High";
    if (global_confidence >= 0.5) return "Medium";
    if (global_confidence >= 0.3) return "Low";
    return "Insufficient";
}

// ─── recompute ────────────────────────────────────────────────────────────────

ScalingProfile LearningEngine::recompute(const ScalingProfile& prior,
                                         std::span<const CalibrationDataPoint> points,
                                         Day today) {
    ScalingProfile next = prior;

    std::vector<const CalibrationDataPoint*> usable;
    std::map<ActivityCategory, std::vector<const CalibrationDataPoint*>> by_category;
    std::map<IntensityBand, std::vector<const CalibrationDataPoint*>>    by_band;

    for (const auto& p : points) {
        if (!p.usable_for_learning()) {
            continue;
        }
        usable.push_back(&p);
        if (p.category && !p.multi_sport) {
            by_category[*p.category].push_back(&p);
        }
        if (p.intensity_band) {
            by_band[*p.intensity_band].push_back(&p);
        }
    }

    const auto global = detail::ratio_statistics(usable, today);
    if (!global) {
        // Factors are kept; the gates close until new evidence arrives.
        next.global_sample_count = 0;
        next.global_confidence   = 0.0;
        return next;
    }

    next.global_factor       = global->factor;
    next.global_confidence   = global->confidence;
    next.global_sample_count = global->count;

    recompute_groups(next.per_category, by_category, today);
    recompute_groups(next.per_band, by_band, today);
    return next;
}

// ─── LearningEngine ───────────────────────────────────────────────────────────

LearningEngine::LearningEngine(LearningConfig config)
    : config_(config), store_(initial_profile(config.policy)) {}

std::shared_ptr<const ScalingProfile> LearningEngine::profile() const {
    return store_.snapshot();
}

std::vector<CalibrationDataPoint> LearningEngine::points() const {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto all = points_.all();
    return std::vector<CalibrationDataPoint>(all.begin(), all.end());
}

CalibrationOutcome
LearningEngine::skip(SkipReason reason, CalibrationStage stage,
                     std::shared_ptr<const ScalingProfile> profile) const {
    log::info(kTag, "calibration skipped: {}", to_string(reason));
    CalibrationOutcome out;
    out.stage   = stage;
    out.profile = std::move(profile);
    out.skipped = reason;
    return out;
}

std::optional<load::LoadState>
LearningEngine::previous_day_load(Day date, const DayContext& day) const {
    if (const auto it = known_loads_.find(date - std::chrono::days{1});
        it != known_loads_.end()) {
        return it->second;
    }
    return day.previous_day_load;
}

void LearningEngine::remember_load(Day date, load::LoadState platform_load) {
    known_loads_[date] = platform_load;

    // Only the day before an observation is ever looked up.
    const Day horizon = known_loads_.rbegin()->first
                      - std::chrono::days{constants::RECENT_CALIBRATION_DAYS};
    known_loads_.erase(known_loads_.begin(), known_loads_.lower_bound(horizon));
}

CalibrationOutcome
LearningEngine::ingest(std::vector<CalibrationDataPoint> created, Day today,
                       std::shared_ptr<const ScalingProfile> loaded) {
    CalibrationOutcome out;
    out.stage   = CalibrationStage::DataPointsCreated;
    out.profile = std::move(loaded);

    for (auto& p : created) {
        p.id = points_.add(p);
        log::debug(kTag, "point {} ({}) ratio {:.3f} confidence {:.2f}",
                   p.id, to_string(p.method),
                   p.scaling_ratio().value_or(0.0), p.source_confidence);
    }
    out.created = std::move(created);

    const auto all = points_.all();
    out.profile = store_.update([&](ScalingProfile& p) {
        p = recompute(p, all, today);
    });
    out.stage = CalibrationStage::Persisted;

    log::info(kTag, "profile v{}: factor {:.3f}, confidence {:.2f}, {} samples",
              out.profile->version, out.profile->global_factor,
              out.profile->global_confidence, out.profile->global_sample_count);
    return out;
}

// ─── process_observation ──────────────────────────────────────────────────────

CalibrationOutcome
LearningEngine::process_observation(const GroundTruthObservation& obs,
                                    const DayContext& day, Day today) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto loaded = store_.snapshot();

    // Platform load is ground truth for the next day's derivation even when
    // this day yields no point.
    if (obs.ctl && obs.atl) {
        remember_load(obs.effective_date, load::LoadState{*obs.ctl, *obs.atl});
    }

    if (!loaded->learning_enabled) {
        return skip(SkipReason::LearningDisabled, CalibrationStage::Idle, loaded);
    }

    const bool has_direct = obs.daily_stress && *obs.daily_stress > 0.0;
    if (!has_direct && !obs.ctl && !obs.atl) {
        return skip(SkipReason::NoGroundTruth, CalibrationStage::ProfileLoaded, loaded);
    }
    if (!(day.calculated_stress > 0.0)) {
        return skip(SkipReason::NonPositiveCalculated,
                    CalibrationStage::ProfileLoaded, loaded);
    }

    std::optional<CalibrationDataPoint> point;
    if (has_direct) {
        point = CalibrationDataPoint::direct(obs.effective_date, *obs.daily_stress,
                                             day.calculated_stress, obs.confidence);
    } else {
        const auto prev = previous_day_load(obs.effective_date, day);
        if (!prev) {
            return skip(SkipReason::NoPreviousDayLoad,
                        CalibrationStage::ProfileLoaded, loaded);
        }
        if (obs.ctl && obs.atl) {
            point = CalibrationDataPoint::cross_validated(
                obs.effective_date, load::LoadState{*obs.ctl, *obs.atl}, *prev,
                day.calculated_stress, obs.confidence, config_.tau);
        }
        if (!point && obs.ctl) {
            point = CalibrationDataPoint::from_ctl(
                obs.effective_date, *obs.ctl, prev->ctl, day.calculated_stress,
                obs.confidence, config_.tau.ctl_days);
        } else if (!point && obs.atl) {
            point = CalibrationDataPoint::from_atl(
                obs.effective_date, *obs.atl, prev->atl, day.calculated_stress,
                obs.confidence, config_.tau.atl_days);
        }
        // A rest day read back from a load curve carries no information.
        if (!point || !(point->extracted_value > 0.0)) {
            return skip(SkipReason::DerivationRejected,
                        CalibrationStage::ProfileLoaded, loaded);
        }
    }

    point->multi_sport = day.multi_sport;
    if (!day.multi_sport) {
        point->category = day.primary_category;
    }

    return ingest({*point}, today, std::move(loaded));
}

// ─── Direct comparisons ───────────────────────────────────────────────────────

CalibrationOutcome
LearningEngine::record_direct_comparison(const DirectComparison& cmp, Day today) {
    std::lock_guard<std::mutex> lock(mutex_);
    return record_direct_locked(cmp, today);
}

CalibrationOutcome
LearningEngine::record_combined(const DirectComparison& cmp,
                                load::LoadState platform_load, Day today) {
    std::lock_guard<std::mutex> lock(mutex_);
    remember_load(cmp.date, platform_load);
    return record_direct_locked(cmp, today);
}

CalibrationOutcome
LearningEngine::record_direct_locked(const DirectComparison& cmp, Day today) {
    auto loaded = store_.snapshot();

    if (!loaded->learning_enabled) {
        return skip(SkipReason::LearningDisabled, CalibrationStage::Idle, loaded);
    }
    if (!(cmp.external_stress > 0.0)) {
        return skip(SkipReason::NoGroundTruth, CalibrationStage::ProfileLoaded, loaded);
    }
    if (!(cmp.calculated_stress > 0.0)) {
        return skip(SkipReason::NonPositiveCalculated,
                    CalibrationStage::ProfileLoaded, loaded);
    }

    auto point = CalibrationDataPoint::direct(cmp.date, cmp.external_stress,
                                              cmp.calculated_stress,
                                              cmp.match_confidence);
    point.category = cmp.category;
    point.workout_intensity_factor = cmp.intensity_factor;
    if (cmp.intensity_factor) {
        point.intensity_band = intensity_band_for(*cmp.intensity_factor);
    }
    return ingest({point}, today, std::move(loaded));
}

// ─── Maintenance ──────────────────────────────────────────────────────────────

bool LearningEngine::invalidate_point(std::uint64_t id, std::string reason,
                                      Day today) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!points_.invalidate(id, reason)) {
        return false;
    }
    log::info(kTag, "point {} invalidated: {}", id, reason);

    const auto all = points_.all();
    store_.update([&](ScalingProfile& p) { p = recompute(p, all, today); });
    return true;
}

void LearningEngine::set_learning_enabled(bool enabled) {
    std::lock_guard<std::mutex> lock(mutex_);
    store_.update([enabled](ScalingProfile& p) { p.learning_enabled = enabled; });
    log::info(kTag, "learning {}", enabled ? "enabled" : "disabled");
}

void LearningEngine::reset() {
    std::lock_guard<std::mutex> lock(mutex_);
    points_.clear();
    known_loads_.clear();
    store_.update([](ScalingProfile& p) {
        ScalingProfile fresh;
        fresh.policy           = p.policy;
        fresh.learning_enabled = p.learning_enabled;
        p = std::move(fresh);
    });
    log::info(kTag, "learning reset");
}

// ─── statistics ───────────────────────────────────────────────────────────────

LearningStatistics LearningEngine::statistics(Day today) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto profile = store_.snapshot();

    LearningStatistics s;
    s.total_points = points_.size();
    for (const auto& p : points_.all()) {
        if (!p.is_valid) continue;
        ++s.valid_points;
        if (p.age_days(today) <= constants::RECENT_CALIBRATION_DAYS) {
            ++s.recent_points;
        }
    }
    s.global_factor        = profile->global_factor;
    s.global_confidence    = profile->global_confidence;
    s.calibration_progress = profile->calibration_progress();
    s.calibration_complete = profile->is_calibration_complete();
    s.can_disable_learning = s.valid_points >= 10 && profile->global_confidence >= 0.9;
    return s;
}

} // namespace loadcal::calibration
