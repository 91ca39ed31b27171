#pragma once

/// @file include/loadcal/matcher.hpp
/// @brief Record Fusion / Matcher — fuzzy matching of workout observations.
///
/// # Module: Matcher
///
/// ## Responsibility
/// Decide whether a workout observed by one source (wearable, platform
/// import, manual entry) is the same session as one already held, scoring
/// start-time proximity, duration, category and distance additively.
///
/// ## Usage
/// ```cpp
/// WorkoutMatcher matcher{MatcherConfig{.utc_offset = std::chrono::hours{1}}};
/// if (auto m = matcher.find_best(incoming, existing, now)) {
///     // m->candidate_index is a duplicate of incoming
/// }
/// ```
///
/// ## Guarantees
/// - Side-effect free: observations and pools are never modified
/// - Ties go to the earliest candidate in the pool
/// - An observation scored against an identical copy of itself is accepted
///
/// ## NOT Responsible For
/// - Acting on a match (deduplication or enrichment is the caller's job)

#include "loadcal/constants.hpp"
#include "loadcal/types.hpp"

#include <chrono>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace loadcal::matcher {

/// One workout as reported by a source. Immutable once constructed.
struct WorkoutObservation {
    std::string           source_id;
    Timestamp             start_time;
    double                duration_s = 0.0;
    std::optional<double> distance_m;
    ActivityCategory      category = ActivityCategory::Other;
    std::optional<double> average_hr_bpm;
    std::optional<double> average_power_w;
    std::optional<double> normalized_power_w;
};

struct MatcherConfig {
    double min_score           = constants::MATCH_MIN_SCORE;
    double normalisation_score = constants::MATCH_NORMALISATION_SCORE;

    /// Observation day ± this many local days is searched.
    int search_window_days = constants::MATCH_SEARCH_WINDOW_DAYS;

    /// Window and normalisation used by `find_all`.
    int    listing_window_days         = constants::MATCH_LISTING_SEARCH_WINDOW_DAYS;
    double listing_normalisation_score = constants::MATCH_LISTING_NORMALISATION_SCORE;

    /// Offset from UTC of the athlete's local clock.
    std::chrono::minutes utc_offset{0};
};

/// Why a candidate scored what it did.
struct MatchDetails {
    double                time_difference_s        = 0.0;  ///< |Δstart|
    double                duration_difference_pct  = 0.0;
    bool                  category_matched         = false;
    std::optional<double> distance_difference_pct;
    bool                  imprecise_time           = false;
};

enum class MatchQuality { Excellent, Good, Possible, Low };

[[nodiscard]] std::string_view to_string(MatchQuality q) noexcept;

struct MatchResult {
    std::size_t  candidate_index = 0;  ///< Index into the candidate pool
    double       score           = 0.0;
    double       confidence      = 0.0;  ///< min(1, score / normalisation)
    MatchDetails details{};

    [[nodiscard]] bool is_high_confidence() const noexcept {
        return confidence >= constants::MATCH_HIGH_CONFIDENCE;
    }

    [[nodiscard]] MatchQuality quality() const noexcept;
};

// ─── WorkoutMatcher ───────────────────────────────────────────────────────────

class WorkoutMatcher {
public:
    explicit WorkoutMatcher(MatcherConfig config = MatcherConfig{});

    /// True if the observation's start time cannot be trusted to the minute:
    /// exactly 00:00 local, or within 300 s of `now` (a fallback timestamp).
    [[nodiscard]] bool has_imprecise_time(const WorkoutObservation& obs,
                                          Timestamp now) const noexcept;

    /// Raw additive score, nullopt when the candidate is rejected on time.
    /// No minimum-score threshold is applied here.
    [[nodiscard]] std::optional<MatchResult>
    score(const WorkoutObservation& obs,
          const WorkoutObservation& candidate,
          Timestamp now) const noexcept;

    /// Candidate lies within the local-day search window of the observation.
    [[nodiscard]] bool within_search_window(const WorkoutObservation& obs,
                                            const WorkoutObservation& candidate) const noexcept;

    /// Highest-scoring candidate at or above `min_score`.
    [[nodiscard]] std::optional<MatchResult>
    find_best(const WorkoutObservation& obs,
              std::span<const WorkoutObservation> pool,
              Timestamp now) const;

    /// Every candidate at or above `min_score` within `listing_window_days`,
    /// highest score first. Confidence is normalised against
    /// `listing_normalisation_score`. Equal scores keep pool order.
    [[nodiscard]] std::vector<MatchResult>
    find_all(const WorkoutObservation& obs,
             std::span<const WorkoutObservation> pool,
             Timestamp now) const;

    /// Distance-first same-day link used when enriching canonical records
    /// from a platform import:
    ///   1. distance within 5 % (10 % for the same category) and duration
    ///      within 25 %; same category preferred, then smallest distance gap
    ///   2. same category with duration within 10 %
    ///   3. any category with duration within 2 %
    [[nodiscard]] std::optional<std::size_t>
    find_same_day_link(const WorkoutObservation& obs,
                       std::span<const WorkoutObservation> pool) const;

    [[nodiscard]] const MatcherConfig& config() const noexcept { return config_; }

private:
    [[nodiscard]] bool within_days(const WorkoutObservation& obs,
                                   const WorkoutObservation& candidate,
                                   int window_days) const noexcept;

    MatcherConfig config_;
};

} // namespace loadcal::matcher
