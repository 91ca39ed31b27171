/// @file src/matcher/workout_matcher.cpp
/// @brief WorkoutMatcher — additive fuzzy scoring and candidate selection.

#include "loadcal/matcher.hpp"
#include "loadcal/log.hpp"
#include "match_scoring.hpp"

#include <algorithm>
#include <cmath>

namespace loadcal::matcher {

namespace {

[[nodiscard]] double relative_difference(double candidate, double reference) noexcept {
    return std::abs(candidate - reference) / std::max(1.0, reference);
}

} // anonymous namespace

std::string_view to_string(MatchQuality q) noexcept {
    switch (q) {
        case MatchQuality::Excellent: return "Excellent";
        case MatchQuality::Good:      return "Good";
        case MatchQuality::Possible:  return "Possible";
        case MatchQuality::Low:       return "Low";
    }
    return "Low";
}

MatchQuality MatchResult::quality() const noexcept {
    if (confidence >= 0.9) return MatchQuality::Excellent;
    if (confidence >= 0.7) return MatchQuality::Good;
    if (confidence >= 0.5) return MatchQuality::Possible;
    return MatchQuality::Low;
}

// ─── WorkoutMatcher ───────────────────────────────────────────────────────────

WorkoutMatcher::WorkoutMatcher(MatcherConfig config) : config_(config) {}

bool WorkoutMatcher::has_imprecise_time(const WorkoutObservation& obs,
                                        Timestamp now) const noexcept {
    // Sources without a start time report local midnight.
    if (local_time_of_day(obs.start_time, config_.utc_offset).count() < 60) {
        return true;
    }
    // Sources that stamp "now" when the start time is missing.
    const auto since_now = std::chrono::abs(now - obs.start_time);
    return static_cast<double>(since_now.count())
         < constants::IMPRECISE_TIME_WINDOW_SECONDS;
}

bool WorkoutMatcher::within_days(const WorkoutObservation& obs,
                                 const WorkoutObservation& candidate,
                                 int window_days) const noexcept {
    const int diff = days_between(local_day(obs.start_time, config_.utc_offset),
                                  local_day(candidate.start_time, config_.utc_offset));
    return std::abs(diff) <= window_days;
}

bool WorkoutMatcher::within_search_window(const WorkoutObservation& obs,
                                          const WorkoutObservation& candidate) const noexcept {
    return within_days(obs, candidate, config_.search_window_days);
}

// ─── score ────────────────────────────────────────────────────────────────────

std::optional<MatchResult>
WorkoutMatcher::score(const WorkoutObservation& obs,
                      const WorkoutObservation& candidate,
                      Timestamp now) const noexcept {
    MatchDetails details;
    details.imprecise_time = has_imprecise_time(obs, now);

    const double abs_seconds = static_cast<double>(
        std::chrono::abs(candidate.start_time - obs.start_time).count());
    details.time_difference_s = abs_seconds;

    const int day_diff = std::abs(days_between(
        local_day(obs.start_time, config_.utc_offset),
        local_day(candidate.start_time, config_.utc_offset)));

    const auto time_points = details.imprecise_time
        ? scoring::imprecise_time_points(day_diff)
        : scoring::precise_time_points(abs_seconds, day_diff == 0);
    if (!time_points) {
        return std::nullopt;
    }
    double total = *time_points;

    const double dur_diff = relative_difference(candidate.duration_s, obs.duration_s);
    details.duration_difference_pct = dur_diff * 100.0;
    total += scoring::duration_points(dur_diff);

    if (candidate.category == obs.category) {
        details.category_matched = true;
        total += scoring::CATEGORY_POINTS;
    }

    if (obs.distance_m && candidate.distance_m && *obs.distance_m > 0.0) {
        const double dist_diff =
            std::abs(*candidate.distance_m - *obs.distance_m) / *obs.distance_m;
        details.distance_difference_pct = dist_diff * 100.0;
        total += scoring::distance_points(dist_diff);
    }

    MatchResult r;
    r.score      = total;
    r.confidence = std::min(1.0, total / config_.normalisation_score);
    r.details    = details;
    return r;
}

// ─── find_best ────────────────────────────────────────────────────────────────

std::optional<MatchResult>
WorkoutMatcher::find_best(const WorkoutObservation& obs,
                          std::span<const WorkoutObservation> pool,
                          Timestamp now) const {
    std::optional<MatchResult> best;
    for (std::size_t i = 0; i < pool.size(); ++i) {
        if (!within_search_window(obs, pool[i])) {
            continue;
        }
        auto r = score(obs, pool[i], now);
        if (!r || r->score < config_.min_score) {
            continue;
        }
        // Strictly greater: an equal later score never displaces the first.
        if (!best || r->score > best->score) {
            r->candidate_index = i;
            best = r;
        }
    }

    if (best) {
        log::debug("matcher", "{} matched candidate {} (score {:.0f}, {})",
                   obs.source_id, pool[best->candidate_index].source_id,
                   best->score, to_string(best->quality()));
    }
    return best;
}

// ─── find_all ─────────────────────────────────────────────────────────────────

std::vector<MatchResult>
WorkoutMatcher::find_all(const WorkoutObservation& obs,
                         std::span<const WorkoutObservation> pool,
                         Timestamp now) const {
    std::vector<MatchResult> out;
    for (std::size_t i = 0; i < pool.size(); ++i) {
        if (!within_days(obs, pool[i], config_.listing_window_days)) {
            continue;
        }
        auto r = score(obs, pool[i], now);
        if (r && r->score >= config_.min_score) {
            r->candidate_index = i;
            r->confidence = std::min(1.0, r->score / config_.listing_normalisation_score);
            out.push_back(*r);
        }
    }
    std::stable_sort(out.begin(), out.end(),
                     [](const MatchResult& a, const MatchResult& b) {
                         return a.score > b.score;
                     });
    return out;
}

// ─── find_same_day_link ───────────────────────────────────────────────────────

std::optional<std::size_t>
WorkoutMatcher::find_same_day_link(const WorkoutObservation& obs,
                                   std::span<const WorkoutObservation> pool) const {
    const Day day = local_day(obs.start_time, config_.utc_offset);
    const bool has_obs_distance = obs.distance_m && *obs.distance_m > 0.0;

    std::optional<std::size_t> best_distance;
    double best_distance_diff = 0.0;
    bool   best_same_category = false;

    std::optional<std::size_t> same_category_duration;
    std::optional<std::size_t> tight_duration;

    for (std::size_t i = 0; i < pool.size(); ++i) {
        const WorkoutObservation& c = pool[i];
        if (local_day(c.start_time, config_.utc_offset) != day) {
            continue;
        }
        const bool same_category = c.category == obs.category;
        const double dur_diff = relative_difference(c.duration_s, obs.duration_s);

        if (has_obs_distance && c.distance_m && *c.distance_m > 0.0) {
            const double dist_diff =
                std::abs(*c.distance_m - *obs.distance_m) / *obs.distance_m;
            const double tolerance = same_category ? 0.10 : 0.05;
            if (dist_diff <= tolerance && dur_diff <= 0.25) {
                const bool better =
                    !best_distance
                    || (same_category && !best_same_category)
                    || (same_category == best_same_category
                        && dist_diff < best_distance_diff);
                if (better) {
                    best_distance      = i;
                    best_distance_diff = dist_diff;
                    best_same_category = same_category;
                }
            }
        }

        if (!same_category_duration && same_category && dur_diff <= 0.10) {
            same_category_duration = i;
        }
        if (!tight_duration && dur_diff <= 0.02) {
            tight_duration = i;
        }
    }

    if (best_distance) return best_distance;
    if (same_category_duration) return same_category_duration;
    return tight_duration;
}

} // namespace loadcal::matcher
