#pragma once

/// @file include/loadcal/screenshot.hpp
/// @brief Screenshot layout parser — CTL/ATL/TSB from recognized text.
///
/// # Module: Screenshot Parser
///
/// ## Responsibility
/// Recover the fitness (CTL), fatigue (ATL), form (TSB) and daily stress
/// values shown on a training platform's dashboard from OCR output. Two
/// inputs are supported:
///   - positioned fragments (text + normalized bounding box, origin at the
///     bottom-left so a number drawn above its label has the larger y)
///   - raw recognized text, one line per row, as a fallback
///
/// ## Guarantees
/// - Pure; never throws
/// - Confidence reflects how many of the three load values were found
///   (3 → 0.95, 2 → 0.75, 1 → 0.5)
///
/// ## NOT Responsible For
/// - Running OCR
/// - Deciding which day a screenshot describes

#include "loadcal/calibration.hpp"

#include <optional>
#include <span>
#include <string>
#include <string_view>

namespace loadcal::calibration {

/// Normalized [0, 1] box, origin bottom-left.
struct BoundingBox {
    double x      = 0.0;
    double y      = 0.0;
    double width  = 0.0;
    double height = 0.0;

    [[nodiscard]] double center_x() const noexcept { return x + width / 2.0; }
    [[nodiscard]] double center_y() const noexcept { return y + height / 2.0; }
};

struct TextFragment {
    std::string text;
    double      confidence = 1.0;
    BoundingBox box{};
};

struct ScreenshotReading {
    std::optional<double> ctl;
    std::optional<double> atl;
    std::optional<double> tsb;
    std::optional<double> daily_stress;
    double                confidence = 0.0;

    /// Number of CTL/ATL/TSB values present.
    [[nodiscard]] int load_fields() const noexcept;

    [[nodiscard]] GroundTruthObservation to_observation(Day effective_date) const;
};

class ScreenshotParser {
public:
    ScreenshotParser() = delete;

    /// Label-anchored spatial parse. Nullopt when no load value is found.
    [[nodiscard]] static std::optional<ScreenshotReading>
    parse_layout(std::span<const TextFragment> fragments);

    /// Line-oriented parse of raw text: number-beside-label lines, inline
    /// patterns ("CTL: 72", "Fitness 72", "72 CTL"), then a header + data
    /// row table. Nullopt when nothing is found.
    [[nodiscard]] static std::optional<ScreenshotReading>
    parse_text(std::string_view text);

    /// Layout parse, falling back to the text parse of the fragments joined
    /// top to bottom.
    [[nodiscard]] static std::optional<ScreenshotReading>
    parse(std::span<const TextFragment> fragments);

    /// Confidence for a given count of matched load values.
    [[nodiscard]] static double confidence_for(int matched) noexcept;
};

} // namespace loadcal::calibration
