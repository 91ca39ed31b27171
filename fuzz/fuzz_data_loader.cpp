/**
 * @file  fuzz_data_loader.cpp
 * @brief libFuzzer target for the daily-stress and workout CSV parsers
 *
 * Build:
 *   cmake -DLOADCAL_FUZZ=ON -DCMAKE_CXX_COMPILER=clang++ ..
 *   cmake --build . --target fuzz_data_loader
 *
 * Run for 60 seconds:
 *   ./fuzz_data_loader -max_total_time=60
 *
 * Safety invariants verified on every input:
 *   1. No crash, no UB, no abort for any byte sequence.
 *   2. Every parsed daily stress is finite and ≥ 0.
 *   3. Every parsed workout has a finite positive duration, a non-empty
 *      source id, and optional fields that are finite when present.
 *   4. Empty input parses to empty collections.
 *
 * Fuzzer strategy:
 *   The same bytes are fed to both parsers. They must handle:
 *     • Binary garbage (null bytes, high bytes)
 *     • "NaN", "inf", "-inf" cells
 *     • Impossible dates ("2024-02-30", "0000-00-00")
 *     • Ragged rows, stray quotes, CR/LF mixes
 */

#include <cmath>
#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <string>

#include "loadcal/data_loader.hpp"
#include "loadcal/log.hpp"

using namespace loadcal;
using namespace loadcal::core;

namespace {

void require(bool condition) {
    if (!condition) std::abort();
}

bool finite_or_absent(const std::optional<double>& v) {
    return !v.has_value() || std::isfinite(*v);
}

} // anonymous namespace

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    static const bool quiet = [] {
        log::set_level(log::Level::Off);
        return true;
    }();
    (void)quiet;

    const std::string input{reinterpret_cast<const char*>(data), size};

    const auto daily = DataLoader::parse_daily_csv(input);
    for (const auto& [day, stress] : daily) {
        // Invariant 2
        require(std::isfinite(stress));
        require(stress >= 0.0);
    }

    const auto workouts = DataLoader::parse_workouts_csv(input);
    for (const auto& w : workouts) {
        // Invariant 3
        require(std::isfinite(w.duration_s));
        require(w.duration_s > 0.0);
        require(!w.source_id.empty());
        require(finite_or_absent(w.distance_m));
        require(finite_or_absent(w.average_hr_bpm));
        require(finite_or_absent(w.average_power_w));
        require(finite_or_absent(w.normalized_power_w));
    }

    // Invariant 4
    if (size == 0) {
        require(daily.empty());
        require(workouts.empty());
    }
    return 0;
}
