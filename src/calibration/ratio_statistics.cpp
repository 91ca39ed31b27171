/// @file src/calibration/ratio_statistics.cpp
/// @brief Weighted factor and confidence over calibration ratios (Eigen).

#include "ratio_statistics.hpp"
#include "loadcal/constants.hpp"

#include <Eigen/Dense>

#include <algorithm>
#include <cmath>

namespace loadcal::calibration::detail {

std::optional<RatioStatistics>
ratio_statistics(std::span<const CalibrationDataPoint* const> points, Day today) {
    if (points.empty()) {
        return std::nullopt;
    }

    const auto n = static_cast<Eigen::Index>(points.size());
    SampleVector ratios(n);
    SampleVector weights(n);
    SampleVector recency(n);
    for (Eigen::Index i = 0; i < n; ++i) {
        const CalibrationDataPoint& p = *points[static_cast<std::size_t>(i)];
        ratios(i)  = p.scaling_ratio().value_or(1.0);
        recency(i) = p.time_weight(today);
        weights(i) = recency(i) * p.source_confidence;
    }

    const double total_weight = weights.sum();
    if (!(total_weight > 0.0)) {
        return std::nullopt;
    }
    const double factor = ratios.dot(weights) / total_weight;

    // Sample (n − 1) standard deviation of the unweighted ratios.
    double stddev = 0.0;
    if (n > 1) {
        const double mean = ratios.mean();
        const double ss   = (ratios.array() - mean).square().sum();
        stddev = std::sqrt(ss / static_cast<double>(n - 1));
    }

    const double sample_term =
        std::min(1.0, static_cast<double>(n) / constants::CONFIDENCE_SAMPLE_SATURATION);
    const double consistency_term =
        std::max(0.0, 1.0 - stddev / constants::CONFIDENCE_STDDEV_SCALE);
    const double recency_term = recency.mean();

    const double confidence =
        constants::CONFIDENCE_WEIGHT_SAMPLES * sample_term
        + constants::CONFIDENCE_WEIGHT_CONSISTENCY * consistency_term
        + constants::CONFIDENCE_WEIGHT_RECENCY * recency_term;

    return RatioStatistics{factor, std::clamp(confidence, 0.0, 1.0),
                           points.size()};
}

} // namespace loadcal::calibration::detail
