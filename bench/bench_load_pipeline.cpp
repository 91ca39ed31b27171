/**
 * @file  bench/bench_load_pipeline.cpp
 * @brief Google Benchmark suite for the scoring, load and calibration paths.
 *
 * Benchmarks
 * ----------
 *   BM_NormalizedPower_Uniform    1 Hz rides of 10 min .. 4 h
 *   BM_StressScore_PowerStream    full scorer on an irregular power stream
 *   BM_LoadSeries_Compute         PMC fold over 30 days .. 10 years
 *   BM_LoadSeries_RecomputeTail   back-dated edit 7 days before the end
 *   BM_Matcher_FindBest           candidate pools of 8 .. 512 workouts
 *   BM_Learning_Recompute         profile rebuild from 10 .. 1000 points
 *
 * Build (CMake):
 *   cmake --build build --target bench_load_pipeline
 *   ./build/bench_load_pipeline --benchmark_format=json
 *
 * Throughput units: items/second (samples, days, candidates or points).
 */

#include "benchmark/benchmark.h"

#include "loadcal/calibration.hpp"
#include "loadcal/intensity.hpp"
#include "loadcal/load_model.hpp"
#include "loadcal/matcher.hpp"
#include "loadcal/stress.hpp"

#include <chrono>
#include <cmath>
#include <cstddef>
#include <map>
#include <vector>

using namespace loadcal;
using namespace std::chrono;

// ── Fixture helpers ────────────────────────────────────────────────────────────

static const Day kStart = sys_days{year{2020} / January / 1};

/// Interval-style power: 4 min on at 300 W, 2 min off at 150 W, with ripple.
static std::vector<double> make_watts(std::size_t n) {
    std::vector<double> w(n);
    for (std::size_t i = 0; i < n; ++i) {
        const double base = (i % 360) < 240 ? 300.0 : 150.0;
        w[i] = base + 20.0 * std::sin(static_cast<double>(i) * 0.1);
    }
    return w;
}

static std::map<Day, double> make_daily(std::size_t n_days) {
    std::map<Day, double> daily;
    for (std::size_t i = 0; i < n_days; ++i) {
        if (i % 7 == 6) continue;  // rest day
        daily[kStart + days{static_cast<int>(i)}] = 40.0 + static_cast<double>(i % 5) * 20.0;
    }
    return daily;
}

// ── Intensity and stress ───────────────────────────────────────────────────────

static void BM_NormalizedPower_Uniform(benchmark::State& state) {
    const auto n = static_cast<std::size_t>(state.range(0));
    const auto watts = make_watts(n);
    for (auto _ : state) {
        auto np = intensity::NormalizedPower::from_uniform(watts);
        benchmark::DoNotOptimize(np);
    }
    state.SetItemsProcessed(static_cast<int64_t>(state.iterations()) * static_cast<int64_t>(n));
}
BENCHMARK(BM_NormalizedPower_Uniform)->Arg(600)->Arg(3600)->Arg(14400)->Unit(benchmark::kMicrosecond);

static void BM_StressScore_PowerStream(benchmark::State& state) {
    const auto n = static_cast<std::size_t>(state.range(0));
    const auto watts = make_watts(n);

    stress::WorkoutSignals ride;
    ride.category   = ActivityCategory::Bike;
    ride.duration_s = static_cast<double>(n);
    ride.power.reserve(n / 2);
    for (std::size_t i = 0; i < n; i += 2) {  // 0.5 Hz device recording
        ride.power.push_back({static_cast<double>(i), watts[i]});
    }
    stress::AthleteThresholds athlete;
    athlete.ftp_watts = 260.0;

    for (auto _ : state) {
        auto result = stress::StressScorer::score(ride, athlete);
        benchmark::DoNotOptimize(result.value);
    }
    state.SetItemsProcessed(static_cast<int64_t>(state.iterations())
                            * static_cast<int64_t>(ride.power.size()));
}
BENCHMARK(BM_StressScore_PowerStream)->Arg(3600)->Arg(14400)->Unit(benchmark::kMicrosecond);

// ── Load model ─────────────────────────────────────────────────────────────────

static void BM_LoadSeries_Compute(benchmark::State& state) {
    const auto n = static_cast<std::size_t>(state.range(0));
    const auto daily = make_daily(n);
    const Day end = kStart + days{static_cast<int>(n) - 1};
    for (auto _ : state) {
        auto series = load::LoadModel::compute_series(daily, kStart, end);
        benchmark::DoNotOptimize(series.data());
        benchmark::ClobberMemory();
    }
    state.SetItemsProcessed(static_cast<int64_t>(state.iterations()) * static_cast<int64_t>(n));
}
BENCHMARK(BM_LoadSeries_Compute)->Arg(30)->Arg(365)->Arg(3650)->Unit(benchmark::kMicrosecond);

static void BM_LoadSeries_RecomputeTail(benchmark::State& state) {
    const auto n = static_cast<std::size_t>(state.range(0));
    auto daily = make_daily(n);
    const Day end = kStart + days{static_cast<int>(n) - 1};
    auto series = load::LoadModel::compute_series(daily, kStart, end);
    const Day edited = end - days{7};
    daily[edited] = 150.0;
    for (auto _ : state) {
        load::LoadModel::recompute_forward(series, edited, daily);
        benchmark::DoNotOptimize(series.data());
        benchmark::ClobberMemory();
    }
}
BENCHMARK(BM_LoadSeries_RecomputeTail)->Arg(365)->Arg(3650)->Unit(benchmark::kMicrosecond);

// ── Matcher ────────────────────────────────────────────────────────────────────

static void BM_Matcher_FindBest(benchmark::State& state) {
    const auto n = static_cast<std::size_t>(state.range(0));
    const Timestamp t0 = sys_days{year{2024} / March / 4} + hours{7};

    std::vector<matcher::WorkoutObservation> pool(n);
    for (std::size_t i = 0; i < n; ++i) {
        auto& c = pool[i];
        c.source_id  = "pool";
        c.start_time = t0 + minutes{static_cast<int>(i) * 45};
        c.duration_s = 1800.0 + static_cast<double>(i % 11) * 300.0;
        c.distance_m = 8000.0 + static_cast<double>(i % 7) * 1000.0;
        c.category   = (i % 3 == 0) ? ActivityCategory::Run : ActivityCategory::Bike;
    }
    matcher::WorkoutObservation incoming = pool[n / 2];
    incoming.source_id  = "incoming";
    incoming.start_time += seconds{40};

    const matcher::WorkoutMatcher m;
    const Timestamp now = t0 + days{30};
    for (auto _ : state) {
        auto best = m.find_best(incoming, pool, now);
        benchmark::DoNotOptimize(best);
    }
    state.SetItemsProcessed(static_cast<int64_t>(state.iterations()) * static_cast<int64_t>(n));
}
BENCHMARK(BM_Matcher_FindBest)->RangeMultiplier(4)->Range(8, 512)->Unit(benchmark::kMicrosecond);

// ── Calibration ────────────────────────────────────────────────────────────────

static void BM_Learning_Recompute(benchmark::State& state) {
    const auto n = static_cast<std::size_t>(state.range(0));
    const Day today = kStart + days{400};
    const ActivityCategory cats[] = {ActivityCategory::Run, ActivityCategory::Bike,
                                     ActivityCategory::Swim};

    std::vector<calibration::CalibrationDataPoint> points;
    points.reserve(n);
    for (std::size_t i = 0; i < n; ++i) {
        const double calculated = 50.0 + static_cast<double>(i % 13) * 10.0;
        const double ratio = 1.1 + 0.05 * std::sin(static_cast<double>(i));
        auto p = calibration::CalibrationDataPoint::direct(
            today - days{static_cast<int>(i % 120)}, calculated * ratio, calculated, 0.9);
        p.category = cats[i % 3];
        p.intensity_band = intensity_band_for(0.6 + static_cast<double>(i % 6) * 0.1);
        points.push_back(std::move(p));
    }

    const calibration::ScalingProfile prior;
    for (auto _ : state) {
        auto profile = calibration::LearningEngine::recompute(prior, points, today);
        benchmark::DoNotOptimize(profile.global_factor);
    }
    state.SetItemsProcessed(static_cast<int64_t>(state.iterations()) * static_cast<int64_t>(n));
}
BENCHMARK(BM_Learning_Recompute)->Arg(10)->Arg(100)->Arg(1000)->Unit(benchmark::kMicrosecond);
