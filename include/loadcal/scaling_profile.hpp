#pragma once

/// @file include/loadcal/scaling_profile.hpp
/// @brief ScalingProfile — learned stress correction factors and their store.
///
/// # Module: Scaling Profile
///
/// ## Responsibility
/// Hold the correction factors produced by the learning engine (global,
/// per activity category, per intensity band) together with the policy that
/// decides when they may be applied, and publish them as immutable,
/// versioned snapshots.
///
/// ## Guarantees
/// - A published profile is never mutated; readers see whole snapshots
/// - Writers are serialized; each publication increments `version`
///
/// ## NOT Responsible For
/// - Computing factors (see calibration.hpp)
/// - Applying factors to a stress result (see stress.hpp)

#include "loadcal/constants.hpp"
#include "loadcal/types.hpp"

#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>

namespace loadcal::calibration {

/// Gates that decide whether learned factors are trusted.
struct ScalingPolicy {
    std::size_t min_samples    = constants::DEFAULT_MIN_SCALING_SAMPLES;
    double      min_confidence = constants::DEFAULT_MIN_SCALING_CONFIDENCE;
    double      min_factor     = constants::DEFAULT_MIN_SCALING_FACTOR;
    double      max_factor     = constants::DEFAULT_MAX_SCALING_FACTOR;
};

/// A learned factor and the number of points behind it.
struct LearnedFactor {
    double      factor       = 1.0;
    std::size_t sample_count = 0;
};

struct ScalingProfile {
    double      global_factor       = 1.0;
    double      global_confidence   = 0.0;
    std::size_t global_sample_count = 0;

    std::map<ActivityCategory, LearnedFactor> per_category;
    std::map<IntensityBand, LearnedFactor>    per_band;

    bool          learning_enabled = true;
    std::uint64_t version          = 0;
    ScalingPolicy policy{};

    /// True when learning is enabled, enough confident samples exist and the
    /// global factor lies inside the policy bounds.
    [[nodiscard]] bool can_apply_scaling() const noexcept;

    /// Factor for a workout: category factor if backed by `min_samples`,
    /// else band factor if backed by `min_samples`, else the global factor.
    [[nodiscard]] double factor_for(ActivityCategory category,
                                    std::optional<IntensityBand> band) const noexcept;

    /// Progress toward a complete calibration, in [0, 1].
    [[nodiscard]] double calibration_progress() const noexcept;

    /// Confidence has reached the completion threshold.
    [[nodiscard]] bool is_calibration_complete() const noexcept;
};

// ─── ScalingProfileStore ──────────────────────────────────────────────────────

/// Single-writer, many-reader holder of the current profile snapshot.
class ScalingProfileStore {
public:
    explicit ScalingProfileStore(ScalingProfile initial = ScalingProfile{});

    /// Current snapshot. Never null.
    [[nodiscard]] std::shared_ptr<const ScalingProfile> snapshot() const;

    /// Copy the current profile, let `mutate` edit the copy, then publish it
    /// with an incremented version. Returns the published snapshot.
    template <typename Fn>
    std::shared_ptr<const ScalingProfile> update(Fn&& mutate) {
        std::lock_guard<std::mutex> writer(writer_mutex_);
        ScalingProfile next = *snapshot();
        mutate(next);
        next.version = current_version() + 1;
        return publish(std::move(next));
    }

private:
    [[nodiscard]] std::uint64_t current_version() const;
    std::shared_ptr<const ScalingProfile> publish(ScalingProfile next);

    std::mutex                            writer_mutex_;
    mutable std::mutex                    swap_mutex_;
    std::shared_ptr<const ScalingProfile> current_;
};

} // namespace loadcal::calibration
