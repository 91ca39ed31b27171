/// @file src/intensity/normalized_power.cpp
/// @brief NormalizedPower — 1 Hz resampling and the 30 s / 4th-power average.

#include "loadcal/intensity.hpp"

#include <cmath>
#include <numeric>

namespace loadcal::intensity {

// ─── resample_to_one_second ───────────────────────────────────────────────────

std::vector<double>
NormalizedPower::resample_to_one_second(std::span<const PowerSample> samples) {
    std::vector<double> out;
    if (samples.size() < 2) {
        return out;
    }

    const double t0    = samples.front().time_s;
    const double total = samples.back().time_s - t0;
    if (!(total >= 1.0)) {
        return out;
    }
    const auto n = static_cast<std::size_t>(total);
    out.reserve(n);

    // Single forward sweep: `j` is the index of the right bracketing sample.
    std::size_t j = 1;
    for (std::size_t s = 0; s < n; ++s) {
        const double t = t0 + static_cast<double>(s);
        while (j < samples.size() - 1 && samples[j].time_s < t) {
            ++j;
        }
        const PowerSample& lo = samples[j - 1];
        const PowerSample& hi = samples[j];

        const double span_t = hi.time_s - lo.time_s;
        if (t <= lo.time_s || span_t <= 0.0) {
            out.push_back(lo.watts);
        } else if (t >= hi.time_s) {
            out.push_back(hi.watts);
        } else {
            const double frac = (t - lo.time_s) / span_t;
            out.push_back(lo.watts + frac * (hi.watts - lo.watts));
        }
    }
    return out;
}

// ─── rolling_average ──────────────────────────────────────────────────────────

std::vector<double>
NormalizedPower::rolling_average(std::span<const double> values,
                                 std::size_t window) {
    std::vector<double> out;
    if (window == 0 || values.size() < window) {
        return out;
    }
    out.reserve(values.size() - window + 1);

    const double w = static_cast<double>(window);
    double sum = std::accumulate(values.begin(), values.begin() +
                                 static_cast<std::ptrdiff_t>(window), 0.0);
    out.push_back(sum / w);
    for (std::size_t i = window; i < values.size(); ++i) {
        sum += values[i] - values[i - window];
        out.push_back(sum / w);
    }
    return out;
}

// ─── from_uniform ─────────────────────────────────────────────────────────────

std::optional<double>
NormalizedPower::from_uniform(std::span<const double> values,
                              std::size_t window) {
    if (window == 0 || values.size() <= window) {
        return std::nullopt;
    }

    const std::vector<double> rolling = rolling_average(values, window);
    if (rolling.empty()) {
        return std::nullopt;
    }

    const Eigen::Map<const Eigen::ArrayXd> r(
        rolling.data(), static_cast<Eigen::Index>(rolling.size()));
    const double mean_fourth = r.square().square().mean();
    if (!std::isfinite(mean_fourth) || mean_fourth < 0.0) {
        return std::nullopt;
    }
    return std::pow(mean_fourth, 0.25);
}

// ─── from_samples ─────────────────────────────────────────────────────────────

std::optional<double>
NormalizedPower::from_samples(std::span<const PowerSample> samples,
                              std::size_t window) noexcept {
    if (samples.size() <= window) {
        return std::nullopt;
    }
    const std::vector<double> uniform = resample_to_one_second(samples);
    return from_uniform(uniform, window);
}

// ─── average_power ────────────────────────────────────────────────────────────

std::optional<double>
NormalizedPower::average_power(std::span<const PowerSample> samples) noexcept {
    if (samples.empty()) {
        return std::nullopt;
    }
    double sum = 0.0;
    for (const auto& s : samples) {
        sum += s.watts;
    }
    return sum / static_cast<double>(samples.size());
}

double NormalizedPower::variability_index(double normalized_power,
                                          double average_power) noexcept {
    if (average_power <= 0.0) {
        return 1.0;
    }
    return normalized_power / average_power;
}

} // namespace loadcal::intensity
