/// @file src/load/load_model.cpp
/// @brief LoadModel — CTL/ATL/TSB fold, projection and workload statistics.

#include "loadcal/load_model.hpp"

#include <cmath>
#include <numeric>
#include <stdexcept>
#include <string>

namespace loadcal::load {

// ─── DailyLoadPoint ───────────────────────────────────────────────────────────

std::optional<double> DailyLoadPoint::acwr() const noexcept {
    return LoadModel::acwr(state());
}

std::string_view to_string(AcwrStatus s) noexcept {
    switch (s) {
        case AcwrStatus::Unknown:       return "unknown";
        case AcwrStatus::VeryLow:       return "very low";
        case AcwrStatus::Undertraining: return "undertraining";
        case AcwrStatus::Optimal:       return "optimal";
        case AcwrStatus::Caution:       return "caution";
        case AcwrStatus::HighRisk:      return "high risk";
    }
    return "unknown";
}

std::string_view to_string(FormStatus s) noexcept {
    switch (s) {
        case FormStatus::VeryFresh: return "very fresh";
        case FormStatus::Fresh:     return "fresh";
        case FormStatus::Neutral:   return "neutral";
        case FormStatus::Tired:     return "tired";
        case FormStatus::VeryTired: return "very tired";
    }
    return "neutral";
}

// ─── validate ─────────────────────────────────────────────────────────────────

void LoadModel::validate(TimeConstants tau) {
    if (!std::isfinite(tau.ctl_days) || tau.ctl_days <= 0.0) {
        throw std::invalid_argument(
            "CTL time constant must be positive, got " +
            std::to_string(tau.ctl_days));
    }
    if (!std::isfinite(tau.atl_days) || tau.atl_days <= 0.0) {
        throw std::invalid_argument(
            "ATL time constant must be positive, got " +
            std::to_string(tau.atl_days));
    }
}

// ─── advance ──────────────────────────────────────────────────────────────────

LoadState LoadModel::advance(LoadState previous, double today_stress,
                             TimeConstants tau) {
    validate(tau);
    return LoadState{
        previous.ctl + (today_stress - previous.ctl) / tau.ctl_days,
        previous.atl + (today_stress - previous.atl) / tau.atl_days,
    };
}

// ─── compute_series ───────────────────────────────────────────────────────────

std::vector<DailyLoadPoint>
LoadModel::compute_series(const std::map<Day, double>& daily_stress,
                          Day start, Day end,
                          LoadState initial,
                          TimeConstants tau) {
    validate(tau);

    std::vector<DailyLoadPoint> series;
    if (end < start) {
        return series;
    }
    series.reserve(static_cast<std::size_t>(days_between(start, end)) + 1);

    LoadState state = initial;
    for (Day d = start; d <= end; d += std::chrono::days{1}) {
        const auto it     = daily_stress.find(d);
        const double load = (it != daily_stress.end()) ? it->second : 0.0;
        state = advance(state, load, tau);
        series.push_back(DailyLoadPoint{d, load, state.ctl, state.atl});
    }
    return series;
}

// ─── recompute_forward ────────────────────────────────────────────────────────

void LoadModel::recompute_forward(std::vector<DailyLoadPoint>& series,
                                  Day first_affected,
                                  const std::map<Day, double>& daily_stress,
                                  TimeConstants tau) {
    validate(tau);
    if (series.empty() || first_affected > series.back().date) {
        return;
    }

    // Series is date-ordered and gap-free, so the index is the day offset.
    const int offset = days_between(series.front().date, first_affected);
    const std::size_t first =
        offset <= 0 ? 0 : static_cast<std::size_t>(offset);

    LoadState state = first == 0 ? LoadState{} : series[first - 1].state();
    for (std::size_t i = first; i < series.size(); ++i) {
        const auto it     = daily_stress.find(series[i].date);
        const double load = (it != daily_stress.end()) ? it->second : 0.0;
        state = advance(state, load, tau);
        series[i].daily_stress = load;
        series[i].ctl          = state.ctl;
        series[i].atl          = state.atl;
    }
}

// ─── project ──────────────────────────────────────────────────────────────────

std::vector<DailyLoadPoint>
LoadModel::project(LoadState current,
                   std::span<const double> planned_stress,
                   Day first_day,
                   TimeConstants tau) {
    validate(tau);

    std::vector<DailyLoadPoint> out;
    out.reserve(planned_stress.size());

    LoadState state = current;
    Day d = first_day;
    for (double load : planned_stress) {
        state = advance(state, load, tau);
        out.push_back(DailyLoadPoint{d, load, state.ctl, state.atl});
        d += std::chrono::days{1};
    }
    return out;
}

// ─── days_to_target_tsb ───────────────────────────────────────────────────────

std::optional<int> LoadModel::days_to_target_tsb(LoadState current,
                                                 double target_tsb,
                                                 int max_days,
                                                 TimeConstants tau) {
    validate(tau);
    if (current.tsb() >= target_tsb) {
        return 0;
    }

    LoadState state = current;
    for (int day = 1; day <= max_days; ++day) {
        state = advance(state, 0.0, tau);
        if (state.tsb() >= target_tsb) {
            return day;
        }
    }
    return std::nullopt;
}

// ─── ACWR / form ──────────────────────────────────────────────────────────────

std::optional<double> LoadModel::acwr(LoadState state) noexcept {
    if (state.ctl <= 0.0) {
        return std::nullopt;
    }
    return state.atl / state.ctl;
}

AcwrStatus LoadModel::classify_acwr(std::optional<double> ratio) noexcept {
    if (!ratio) return AcwrStatus::Unknown;
    const double r = *ratio;
    if (r >= 1.5)  return AcwrStatus::HighRisk;
    if (r > 1.3)   return AcwrStatus::Caution;
    if (r >= 0.8)  return AcwrStatus::Optimal;
    if (r >= 0.5)  return AcwrStatus::Undertraining;
    return AcwrStatus::VeryLow;
}

FormAdvice LoadModel::classify_form(double tsb) noexcept {
    if (tsb >= 25.0)  return {FormStatus::VeryFresh, 80.0, 150.0};
    if (tsb >= 10.0)  return {FormStatus::Fresh, 60.0, 120.0};
    if (tsb >= -10.0) return {FormStatus::Neutral, 40.0, 80.0};
    if (tsb >= -25.0) return {FormStatus::Tired, 20.0, 50.0};
    return {FormStatus::VeryTired, 0.0, 30.0};
}

// ─── monotony / strain ────────────────────────────────────────────────────────

std::optional<double>
LoadModel::monotony(std::span<const double> daily_stress) noexcept {
    constexpr std::size_t n = constants::MONOTONY_WINDOW_DAYS;
    if (daily_stress.size() < n) {
        return std::nullopt;
    }
    const auto week = daily_stress.last(n);

    const double mean =
        std::accumulate(week.begin(), week.end(), 0.0) / static_cast<double>(n);
    if (mean <= 0.0) {
        return std::nullopt;
    }

    double sq = 0.0;
    for (double v : week) {
        sq += (v - mean) * (v - mean);
    }
    const double sd = std::sqrt(sq / static_cast<double>(n));
    if (sd <= constants::FLOAT_EPSILON) {
        return std::nullopt;
    }
    return mean / sd;
}

std::optional<double>
LoadModel::strain(std::span<const double> daily_stress) noexcept {
    const auto mono = monotony(daily_stress);
    if (!mono) {
        return std::nullopt;
    }
    const auto week = daily_stress.last(constants::MONOTONY_WINDOW_DAYS);
    return std::accumulate(week.begin(), week.end(), 0.0) * *mono;
}

} // namespace loadcal::load
