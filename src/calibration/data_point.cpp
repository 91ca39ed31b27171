/// @file src/calibration/data_point.cpp
/// @brief CalibrationDataPoint derivations and the in-memory point store.

#include "loadcal/calibration.hpp"

#include <algorithm>
#include <cmath>
#include <iterator>

namespace loadcal::calibration {

std::string_view to_string(DerivationMethod m) noexcept {
    switch (m) {
        case DerivationMethod::Direct:         return "direct";
        case DerivationMethod::CtlDerived:     return "ctl-derived";
        case DerivationMethod::AtlDerived:     return "atl-derived";
        case DerivationMethod::CrossValidated: return "cross-validated";
    }
    return "direct";
}

// ─── Derived quantities ───────────────────────────────────────────────────────

std::optional<double> CalibrationDataPoint::scaling_ratio() const noexcept {
    if (!(calculated_value > 0.0)) {
        return std::nullopt;
    }
    return extracted_value / calculated_value;
}

int CalibrationDataPoint::age_days(Day today) const noexcept {
    return std::max(0, days_between(effective_date, today));
}

double CalibrationDataPoint::time_weight(Day today) const noexcept {
    return std::pow(0.5, static_cast<double>(age_days(today))
                         / constants::TIME_WEIGHT_HALF_LIFE_DAYS);
}

double CalibrationDataPoint::learning_weight(Day today) const noexcept {
    return time_weight(today) * source_confidence;
}

bool CalibrationDataPoint::usable_for_learning() const noexcept {
    return is_valid && scaling_ratio().has_value()
        && source_confidence >= constants::MIN_LEARNING_CONFIDENCE;
}

// ─── Factories ────────────────────────────────────────────────────────────────

CalibrationDataPoint CalibrationDataPoint::direct(Day date, double extracted,
                                                  double calculated,
                                                  double confidence) {
    CalibrationDataPoint p;
    p.effective_date    = date;
    p.extracted_value   = extracted;
    p.calculated_value  = calculated;
    p.source_confidence = std::clamp(confidence, 0.0, 1.0);
    p.method            = DerivationMethod::Direct;
    return p;
}

CalibrationDataPoint CalibrationDataPoint::from_ctl(Day date, double ctl_today,
                                                    double ctl_yesterday,
                                                    double calculated,
                                                    double confidence,
                                                    double ctl_time_constant) {
    // Inverse of CTL_t = CTL_{t−1} + (S − CTL_{t−1}) / τ.
    const double derived =
        ctl_time_constant * (ctl_today - ctl_yesterday) + ctl_yesterday;

    CalibrationDataPoint p = direct(date, std::max(0.0, derived), calculated,
                                    confidence * constants::DERIVED_CONFIDENCE_PENALTY);
    p.method = DerivationMethod::CtlDerived;
    return p;
}

CalibrationDataPoint CalibrationDataPoint::from_atl(Day date, double atl_today,
                                                    double atl_yesterday,
                                                    double calculated,
                                                    double confidence,
                                                    double atl_time_constant) {
    const double derived =
        atl_time_constant * (atl_today - atl_yesterday) + atl_yesterday;

    CalibrationDataPoint p = direct(date, std::max(0.0, derived), calculated,
                                    confidence * constants::DERIVED_CONFIDENCE_PENALTY);
    p.method = DerivationMethod::AtlDerived;
    return p;
}

std::optional<CalibrationDataPoint>
CalibrationDataPoint::cross_validated(Day date,
                                      load::LoadState today,
                                      load::LoadState yesterday,
                                      double calculated, double confidence,
                                      load::TimeConstants tau) {
    const double from_ctl_value =
        tau.ctl_days * (today.ctl - yesterday.ctl) + yesterday.ctl;
    const double from_atl_value =
        tau.atl_days * (today.atl - yesterday.atl) + yesterday.atl;
    if (from_ctl_value < 0.0 || from_atl_value < 0.0) {
        return std::nullopt;
    }

    const double mean = (from_ctl_value + from_atl_value) / 2.0;
    if (!(mean > 0.0)) {
        return std::nullopt;
    }
    const double agreement = 1.0 - std::abs(from_ctl_value - from_atl_value) / mean;
    if (agreement < constants::CROSS_VALIDATION_MIN_AGREEMENT) {
        return std::nullopt;
    }

    CalibrationDataPoint p = direct(date, mean, calculated,
                                    confidence * std::min(1.0, agreement));
    p.method = DerivationMethod::CrossValidated;
    return p;
}

// ─── CalibrationPointStore ────────────────────────────────────────────────────

std::uint64_t CalibrationPointStore::add(CalibrationDataPoint point) {
    point.id = next_id_++;
    points_.push_back(std::move(point));
    return points_.back().id;
}

bool CalibrationPointStore::invalidate(std::uint64_t id, std::string reason) {
    const auto it = std::find_if(points_.begin(), points_.end(),
                                 [id](const CalibrationDataPoint& p) {
                                     return p.id == id;
                                 });
    if (it == points_.end() || !it->is_valid) {
        return false;
    }
    it->is_valid       = false;
    it->invalid_reason = std::move(reason);
    return true;
}

std::vector<CalibrationDataPoint> CalibrationPointStore::valid() const {
    std::vector<CalibrationDataPoint> out;
    std::copy_if(points_.begin(), points_.end(), std::back_inserter(out),
                 [](const CalibrationDataPoint& p) { return p.is_valid; });
    return out;
}

void CalibrationPointStore::clear() noexcept {
    points_.clear();
}

} // namespace loadcal::calibration
