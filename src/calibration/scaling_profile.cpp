/// @file src/calibration/scaling_profile.cpp
/// @brief ScalingProfile gates and the snapshot store.

#include "loadcal/scaling_profile.hpp"

#include <algorithm>

namespace loadcal::calibration {

// ─── ScalingProfile ───────────────────────────────────────────────────────────

bool ScalingProfile::can_apply_scaling() const noexcept {
    return learning_enabled
        && global_sample_count >= policy.min_samples
        && global_confidence >= policy.min_confidence
        && global_factor >= policy.min_factor
        && global_factor <= policy.max_factor;
}

double ScalingProfile::factor_for(ActivityCategory category,
                                  std::optional<IntensityBand> band) const noexcept {
    if (const auto it = per_category.find(category);
        it != per_category.end() && it->second.sample_count >= policy.min_samples) {
        return it->second.factor;
    }
    if (band) {
        if (const auto it = per_band.find(*band);
            it != per_band.end() && it->second.sample_count >= policy.min_samples) {
            return it->second.factor;
        }
    }
    return global_factor;
}

double ScalingProfile::calibration_progress() const noexcept {
    const double sample_progress =
        std::min(1.0, static_cast<double>(global_sample_count)
                      / constants::CONFIDENCE_SAMPLE_SATURATION);
    const double confidence_progress =
        std::min(1.0, global_confidence
                      / constants::CALIBRATION_COMPLETE_CONFIDENCE);
    return (sample_progress + confidence_progress) / 2.0;
}

bool ScalingProfile::is_calibration_complete() const noexcept {
    return global_confidence >= constants::CALIBRATION_COMPLETE_CONFIDENCE;
}

// ─── ScalingProfileStore ──────────────────────────────────────────────────────

ScalingProfileStore::ScalingProfileStore(ScalingProfile initial)
    : current_(std::make_shared<const ScalingProfile>(std::move(initial))) {}

std::shared_ptr<const ScalingProfile> ScalingProfileStore::snapshot() const {
    std::lock_guard<std::mutex> lock(swap_mutex_);
    return current_;
}

std::uint64_t ScalingProfileStore::current_version() const {
    std::lock_guard<std::mutex> lock(swap_mutex_);
    return current_->version;
}

std::shared_ptr<const ScalingProfile>
ScalingProfileStore::publish(ScalingProfile next) {
    auto ptr = std::make_shared<const ScalingProfile>(std::move(next));
    std::lock_guard<std::mutex> lock(swap_mutex_);
    current_ = ptr;
    return ptr;
}

} // namespace loadcal::calibration
