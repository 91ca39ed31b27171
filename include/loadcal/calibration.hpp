#pragma once

/// @file include/loadcal/calibration.hpp
/// @brief Calibration Learning Engine — correction factors from ground truth.
///
/// # Module: Calibration Learning Engine
///
/// ## Responsibility
/// Ingest externally observed ground truth (a daily stress value, or the
/// CTL/ATL/TSB triple read from another platform), turn each observation into
/// a confidence-weighted calibration point comparing it with our own
/// computed value, and recompute the ScalingProfile from all usable points:
///
///   factor     = Σ ratioᵢ·wᵢ / Σ wᵢ,   wᵢ = 0.5^(ageᵢ/30) · confidenceᵢ
///   confidence = 0.4·min(1, n/10)
///              + 0.4·max(0, 1 − σ(ratio)/0.3)
///              + 0.2·mean(time weight)
///
/// Each ingestion walks Idle → ProfileLoaded → DataPointsCreated →
/// FactorsRecomputed → Persisted; disabled learning stops at Idle.
///
/// ## Guarantees
/// - Ingestions and recomputes are serialized; readers see whole snapshots
/// - Recompute is a deterministic pure function of the point set and "today"
/// - A subset with no usable points leaves its prior factor untouched
/// - Skips are reported in the outcome and logged, never thrown
///
/// ## NOT Responsible For
/// - Reading screenshots (see screenshot.hpp for the layout parser)
/// - Persisting points or profiles between processes

#include "loadcal/constants.hpp"
#include "loadcal/load_model.hpp"
#include "loadcal/scaling_profile.hpp"
#include "loadcal/types.hpp"

#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace loadcal::calibration {

// ─── CalibrationDataPoint ─────────────────────────────────────────────────────

enum class DerivationMethod {
    Direct,          ///< External daily stress value
    CtlDerived,      ///< Inverted from the day's CTL change
    AtlDerived,      ///< Inverted from the day's ATL change
    CrossValidated,  ///< CTL and ATL inversions that agree
};

[[nodiscard]] std::string_view to_string(DerivationMethod m) noexcept;

struct CalibrationDataPoint {
    std::uint64_t id = 0;  ///< Assigned by the point store
    Day           effective_date;

    double extracted_value   = 0.0;  ///< Ground-truth stress
    double calculated_value  = 0.0;  ///< Our stress for the same scope
    double source_confidence = 0.0;  ///< [0, 1]

    std::optional<ActivityCategory> category;  ///< Absent for multi-sport days
    std::optional<IntensityBand>    intensity_band;
    std::optional<double>           workout_intensity_factor;

    DerivationMethod method      = DerivationMethod::Direct;
    bool             multi_sport = false;

    bool        is_valid = true;
    std::string invalid_reason;

    /// extracted / calculated, nullopt when calculated ≤ 0.
    [[nodiscard]] std::optional<double> scaling_ratio() const noexcept;

    /// Whole days from the effective date to `today`, never negative.
    [[nodiscard]] int age_days(Day today) const noexcept;

    /// 0.5^(age / 30).
    [[nodiscard]] double time_weight(Day today) const noexcept;

    /// time_weight × source_confidence.
    [[nodiscard]] double learning_weight(Day today) const noexcept;

    /// Valid, ratio defined and confidence ≥ 0.5.
    [[nodiscard]] bool usable_for_learning() const noexcept;

    // ── Factories ────────────────────────────────────────────────────────────

    [[nodiscard]] static CalibrationDataPoint
    direct(Day date, double extracted, double calculated, double confidence);

    /// TSS = τ_ctl·(CTL_today − CTL_yesterday) + CTL_yesterday, clamped ≥ 0,
    /// confidence × 0.9.
    [[nodiscard]] static CalibrationDataPoint
    from_ctl(Day date, double ctl_today, double ctl_yesterday,
             double calculated, double confidence,
             double ctl_time_constant = constants::CTL_TIME_CONSTANT);

    /// TSS = τ_atl·(ATL_today − ATL_yesterday) + ATL_yesterday, clamped ≥ 0,
    /// confidence × 0.9.
    [[nodiscard]] static CalibrationDataPoint
    from_atl(Day date, double atl_today, double atl_yesterday,
             double calculated, double confidence,
             double atl_time_constant = constants::ATL_TIME_CONSTANT);

    /// Mean of the CTL and ATL inversions when both are ≥ 0 and their
    /// agreement 1 − |a − b| / mean is at least 0.8; confidence × agreement.
    [[nodiscard]] static std::optional<CalibrationDataPoint>
    cross_validated(Day date,
                    load::LoadState today, load::LoadState yesterday,
                    double calculated, double confidence,
                    load::TimeConstants tau = {});
};

// ─── CalibrationPointStore ────────────────────────────────────────────────────

/// In-memory point set with soft deletion. Not synchronized: owned and
/// serialized by LearningEngine.
class CalibrationPointStore {
public:
    /// Store a point, assigning the next id. Returns the id.
    std::uint64_t add(CalibrationDataPoint point);

    /// Mark a point invalid. False if the id is unknown or already invalid.
    bool invalidate(std::uint64_t id, std::string reason);

    [[nodiscard]] std::span<const CalibrationDataPoint> all() const noexcept {
        return points_;
    }

    [[nodiscard]] std::vector<CalibrationDataPoint> valid() const;

    [[nodiscard]] std::size_t size() const noexcept { return points_.size(); }

    void clear() noexcept;

private:
    std::vector<CalibrationDataPoint> points_;
    std::uint64_t                     next_id_ = 1;
};

// ─── Inputs ───────────────────────────────────────────────────────────────────

/// Ground truth observed for one day. Any subset of fields may be present.
struct GroundTruthObservation {
    Day                   effective_date;
    std::optional<double> daily_stress;
    std::optional<double> ctl;
    std::optional<double> atl;
    std::optional<double> tsb;
    double                confidence = 0.0;
};

/// Our own view of the same day.
struct DayContext {
    double                          calculated_stress = 0.0;
    std::optional<ActivityCategory> primary_category;
    bool                            multi_sport = false;

    /// Our CTL/ATL for the previous day; used when no earlier ground truth
    /// is known for it.
    std::optional<load::LoadState> previous_day_load;
};

/// A single workout whose stress was reported by another platform.
struct DirectComparison {
    Day              date;
    ActivityCategory category = ActivityCategory::Other;
    double           external_stress   = 0.0;
    double           calculated_stress = 0.0;
    double           match_confidence  = 0.0;
    std::optional<double> intensity_factor;
};

// ─── Outcome ──────────────────────────────────────────────────────────────────

enum class CalibrationStage {
    Idle,
    ProfileLoaded,
    DataPointsCreated,
    FactorsRecomputed,
    Persisted,
};

enum class SkipReason {
    LearningDisabled,
    NoGroundTruth,
    NonPositiveCalculated,
    NoPreviousDayLoad,
    DerivationRejected,
};

[[nodiscard]] std::string_view to_string(CalibrationStage s) noexcept;
[[nodiscard]] std::string_view to_string(SkipReason r) noexcept;

struct CalibrationOutcome {
    CalibrationStage                      stage = CalibrationStage::Idle;
    std::vector<CalibrationDataPoint>     created;
    std::shared_ptr<const ScalingProfile> profile;
    std::optional<SkipReason>             skipped;
};

struct LearningConfig {
    ScalingPolicy       policy{};
    load::TimeConstants tau{};
};

/// Aggregate view for reporting.
struct LearningStatistics {
    std::size_t total_points  = 0;
    std::size_t valid_points  = 0;
    std::size_t recent_points = 0;  ///< Valid, within the last 30 days
    double      global_factor     = 1.0;
    double      global_confidence = 0.0;
    double      calibration_progress = 0.0;
    bool        calibration_complete = false;
    bool        can_disable_learning = false;

    [[nodiscard]] std::string_view confidence_level() const noexcept;
};

// ─── LearningEngine ───────────────────────────────────────────────────────────

class LearningEngine {
public:
    explicit LearningEngine(LearningConfig config = LearningConfig{});

    /// Create points from one day of ground truth and recompute.
    CalibrationOutcome process_observation(const GroundTruthObservation& obs,
                                           const DayContext& day,
                                           Day today);

    /// Create a direct point from a matched workout and recompute.
    CalibrationOutcome record_direct_comparison(const DirectComparison& cmp,
                                                Day today);

    /// As `record_direct_comparison`, also remembering the platform's load
    /// for that day as ground truth for later CTL/ATL derivations. Both
    /// happen under one lock.
    CalibrationOutcome record_combined(const DirectComparison& cmp,
                                       load::LoadState platform_load,
                                       Day today);

    /// Soft-delete a point and recompute. False if the id is unknown.
    bool invalidate_point(std::uint64_t id, std::string reason, Day today);

    void set_learning_enabled(bool enabled);

    /// Drop every point and known load and publish a default profile
    /// (keeping the policy and the enabled flag).
    void reset();

    [[nodiscard]] std::shared_ptr<const ScalingProfile> profile() const;

    [[nodiscard]] std::vector<CalibrationDataPoint> points() const;

    [[nodiscard]] LearningStatistics statistics(Day today) const;

    /// New profile from `prior` and a point set. Pure.
    [[nodiscard]] static ScalingProfile
    recompute(const ScalingProfile& prior,
              std::span<const CalibrationDataPoint> points,
              Day today);

private:
    CalibrationOutcome ingest(std::vector<CalibrationDataPoint> created,
                              Day today,
                              std::shared_ptr<const ScalingProfile> loaded);

    CalibrationOutcome skip(SkipReason reason, CalibrationStage stage,
                            std::shared_ptr<const ScalingProfile> profile) const;

    [[nodiscard]] std::optional<load::LoadState>
    previous_day_load(Day date, const DayContext& day) const;

    // Callers hold mutex_.
    CalibrationOutcome record_direct_locked(const DirectComparison& cmp, Day today);

    /// Keeps platform loads within RECENT_CALIBRATION_DAYS of the newest.
    void remember_load(Day date, load::LoadState platform_load);

    LearningConfig             config_;
    mutable std::mutex         mutex_;
    ScalingProfileStore        store_;
    CalibrationPointStore      points_;
    std::map<Day, load::LoadState> known_loads_;
};

} // namespace loadcal::calibration
