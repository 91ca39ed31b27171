#pragma once

/// @file src/calibration/ratio_statistics.hpp
/// @brief Weighted scaling-ratio statistics shared by every profile subset.

#include "loadcal/calibration.hpp"

#include <optional>
#include <span>

namespace loadcal::calibration::detail {

struct RatioStatistics {
    double      factor;      ///< Σ ratio·w / Σ w
    double      confidence;  ///< Sample-size, consistency and recency blend
    std::size_t count;
};

/// Statistics over points already filtered to `usable_for_learning()`.
/// Nullopt for an empty set or a zero total weight.
[[nodiscard]] std::optional<RatioStatistics>
ratio_statistics(std::span<const CalibrationDataPoint* const> points, Day today);

} // namespace loadcal::calibration::detail
