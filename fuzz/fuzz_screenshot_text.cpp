/**
 * @file  fuzz_screenshot_text.cpp
 * @brief libFuzzer target for the screenshot text and layout parsers
 *
 * Build:
 *   cmake -DLOADCAL_FUZZ=ON -DCMAKE_CXX_COMPILER=clang++ ..
 *   cmake --build . --target fuzz_screenshot_text
 *
 * Run for 60 seconds:
 *   ./fuzz_screenshot_text -max_total_time=60
 *
 * Safety invariants verified on every input:
 *   1. No crash, no UB, no abort for any byte sequence.
 *   2. If a reading is returned:
 *      a. every present value is finite
 *      b. confidence ∈ (0, 1]
 *      c. at least one load value or a daily stress is present
 *      d. to_observation() carries the same values
 *
 * Fuzzer strategy:
 *   The input is parsed once as raw text, then split into lines that
 *   become fragments stacked top to bottom for the layout parse. OCR
 *   output is noisy, so the parsers must handle:
 *     • Binary garbage and invalid UTF-8
 *     • Digits glued to labels ("CTL72"), stray signs ("--5", "+-3")
 *     • Very long lines and thousands of short ones
 */

#include <chrono>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "loadcal/log.hpp"
#include "loadcal/screenshot.hpp"

using namespace loadcal;
using namespace loadcal::calibration;

namespace {

void require(bool condition) {
    if (!condition) std::abort();
}

bool finite_or_absent(const std::optional<double>& v) {
    return !v.has_value() || std::isfinite(*v);
}

void check(const std::optional<ScreenshotReading>& r) {
    if (!r) return;
    // Invariant 2a
    require(finite_or_absent(r->ctl));
    require(finite_or_absent(r->atl));
    require(finite_or_absent(r->tsb));
    require(finite_or_absent(r->daily_stress));
    // Invariant 2b
    require(r->confidence > 0.0);
    require(r->confidence <= 1.0);
    // Invariant 2c
    require(r->load_fields() > 0 || r->daily_stress.has_value());
    // Invariant 2d
    const Day day = std::chrono::sys_days{std::chrono::year{2024} / 1 / 1};
    const auto obs = r->to_observation(day);
    require(obs.ctl == r->ctl);
    require(obs.atl == r->atl);
    require(obs.tsb == r->tsb);
    require(obs.daily_stress == r->daily_stress);
    require(obs.effective_date == day);
}

} // anonymous namespace

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    static const bool quiet = [] {
        log::set_level(log::Level::Off);
        return true;
    }();
    (void)quiet;

    const std::string_view input{reinterpret_cast<const char*>(data), size};
    check(ScreenshotParser::parse_text(input));

    std::vector<TextFragment> fragments;
    std::size_t begin = 0;
    while (begin <= input.size() && fragments.size() < 256) {
        const auto end = input.find('\n', begin);
        const auto stop = end == std::string_view::npos ? input.size() : end;
        TextFragment f;
        f.text = std::string(input.substr(begin, stop - begin));
        const double row = static_cast<double>(fragments.size());
        f.box = BoundingBox{0.1 + 0.3 * static_cast<double>(fragments.size() % 3),
                            1.0 - 0.01 * row, 0.2, 0.01};
        fragments.push_back(std::move(f));
        if (end == std::string_view::npos) break;
        begin = end + 1;
    }
    check(ScreenshotParser::parse(fragments));
    return 0;
}
