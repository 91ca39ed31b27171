#pragma once

/// @file include/loadcal/load_model.hpp
/// @brief Load Model — fitness/fatigue/form (CTL/ATL/TSB) public API.
///
/// # Module: Load Model
///
/// ## Responsibility
/// Fold a day-indexed stress sequence into the exponentially weighted
/// chronic (CTL, τ = 42 d) and acute (ATL, τ = 7 d) training loads:
///
///   CTL_t = CTL_{t−1} + (S_t − CTL_{t−1}) / τ_ctl
///   ATL_t = ATL_{t−1} + (S_t − ATL_{t−1}) / τ_atl
///   TSB_t = CTL_t − ATL_t
///
/// and answer forward-looking questions on the same recurrence (projection,
/// taper length, workload ratio, monotony).
///
/// ## Guarantees
/// - Deterministic: the result depends only on the arguments
/// - Series are gap-free: one point per calendar day, missing days are zero
/// - TSB is always derived from CTL and ATL, never stored
/// - Non-positive or non-finite time constants throw `std::invalid_argument`
///
/// ## NOT Responsible For
/// - Scoring individual workouts (see stress.hpp)
/// - Storing series between calls

#include "loadcal/constants.hpp"
#include "loadcal/types.hpp"

#include <map>
#include <optional>
#include <span>
#include <string_view>
#include <vector>

namespace loadcal::load {

// ─── Configuration ────────────────────────────────────────────────────────────

/// Time constants of the two exponential filters, in days.
struct TimeConstants {
    double ctl_days = constants::CTL_TIME_CONSTANT;
    double atl_days = constants::ATL_TIME_CONSTANT;
};

// ─── State ────────────────────────────────────────────────────────────────────

/// Accumulator carried by the fold.
struct LoadState {
    double ctl = 0.0;
    double atl = 0.0;

    [[nodiscard]] double tsb() const noexcept { return ctl - atl; }
};

/// One day of a performance-management series.
struct DailyLoadPoint {
    Day    date;
    double daily_stress = 0.0;  ///< Aggregated TSS for the day, ≥ 0
    double ctl          = 0.0;
    double atl          = 0.0;

    [[nodiscard]] double tsb() const noexcept { return ctl - atl; }

    [[nodiscard]] LoadState state() const noexcept { return {ctl, atl}; }

    /// Acute:chronic workload ratio, nullopt when CTL ≤ 0.
    [[nodiscard]] std::optional<double> acwr() const noexcept;
};

// ─── Classification ───────────────────────────────────────────────────────────

/// Acute:chronic workload ratio bands.
enum class AcwrStatus {
    Unknown,        ///< CTL ≤ 0
    VeryLow,        ///< < 0.5
    Undertraining,  ///< [0.5, 0.8)
    Optimal,        ///< [0.8, 1.3]
    Caution,        ///< (1.3, 1.5)
    HighRisk,       ///< ≥ 1.5
};

enum class FormStatus {
    VeryFresh,  ///< TSB ≥ 25
    Fresh,      ///< 10 ≤ TSB < 25
    Neutral,    ///< −10 ≤ TSB < 10
    Tired,      ///< −25 ≤ TSB < −10
    VeryTired,  ///< TSB < −25
};

/// Form classification with a suggested next-day stress range.
struct FormAdvice {
    FormStatus status;
    double     suggested_stress_min;
    double     suggested_stress_max;
};

[[nodiscard]] std::string_view to_string(AcwrStatus s) noexcept;
[[nodiscard]] std::string_view to_string(FormStatus s) noexcept;

// ─── LoadModel ────────────────────────────────────────────────────────────────

/// Stateless calculator for the CTL/ATL/TSB recurrence.
class LoadModel {
public:
    LoadModel() = delete;

    /// One step of the recurrence.
    ///
    /// # Throws
    /// `std::invalid_argument` if either time constant is ≤ 0 or non-finite.
    [[nodiscard]] static LoadState advance(LoadState previous,
                                           double today_stress,
                                           TimeConstants tau = {});

    /// Fold daily stress over every calendar day of [start, end].
    ///
    /// Days absent from `daily_stress` contribute zero. Returns an empty
    /// series when `end < start`.
    ///
    /// # Throws
    /// `std::invalid_argument` for invalid time constants.
    [[nodiscard]] static std::vector<DailyLoadPoint>
    compute_series(const std::map<Day, double>& daily_stress,
                   Day start, Day end,
                   LoadState initial = {},
                   TimeConstants tau = {});

    /// Re-fold `series` from `first_affected` forward using `daily_stress`.
    ///
    /// Points before `first_affected` are kept. The point on the previous
    /// day seeds the fold, or a zero state if there is none. The series end
    /// date is unchanged. A `first_affected` past the end is a no-op.
    static void recompute_forward(std::vector<DailyLoadPoint>& series,
                                  Day first_affected,
                                  const std::map<Day, double>& daily_stress,
                                  TimeConstants tau = {});

    /// Run the recurrence over a planned stress sequence starting the day
    /// after `current`, dated from `first_day`.
    [[nodiscard]] static std::vector<DailyLoadPoint>
    project(LoadState current,
            std::span<const double> planned_stress,
            Day first_day,
            TimeConstants tau = {});

    /// Number of zero-stress days until TSB ≥ `target_tsb`.
    ///
    /// Returns 0 if the current state already meets the target and nullopt
    /// if it is not reached within `max_days`.
    [[nodiscard]] static std::optional<int>
    days_to_target_tsb(LoadState current,
                       double target_tsb,
                       int max_days = constants::DEFAULT_TAPER_HORIZON_DAYS,
                       TimeConstants tau = {});

    /// ATL / CTL, nullopt when CTL ≤ 0.
    [[nodiscard]] static std::optional<double> acwr(LoadState state) noexcept;

    [[nodiscard]] static AcwrStatus
    classify_acwr(std::optional<double> ratio) noexcept;

    [[nodiscard]] static FormAdvice classify_form(double tsb) noexcept;

    /// Foster monotony (mean / population σ) over the last 7 daily values.
    /// Nullopt with fewer than 7 days, zero mean or zero deviation.
    [[nodiscard]] static std::optional<double>
    monotony(std::span<const double> daily_stress) noexcept;

    /// Weekly load × monotony over the last 7 daily values.
    [[nodiscard]] static std::optional<double>
    strain(std::span<const double> daily_stress) noexcept;

private:
    static void validate(TimeConstants tau);
};

} // namespace loadcal::load
