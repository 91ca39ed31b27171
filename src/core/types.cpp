/// @file src/core/types.cpp
/// @brief Category parsing and intensity banding.

#include "loadcal/types.hpp"

#include <algorithm>
#include <cctype>
#include <string>

namespace loadcal {

std::optional<ActivityCategory> parse_category(std::string_view name) {
    std::string lower;
    lower.reserve(name.size());
    for (char ch : name) {
        if (std::isspace(static_cast<unsigned char>(ch))) continue;
        lower.push_back(static_cast<char>(
            std::tolower(static_cast<unsigned char>(ch))));
    }

    if (lower == "run" || lower == "running" || lower == "trailrun") {
        return ActivityCategory::Run;
    }
    if (lower == "bike" || lower == "ride" || lower == "cycling" ||
        lower == "virtualride") {
        return ActivityCategory::Bike;
    }
    if (lower == "swim" || lower == "swimming") {
        return ActivityCategory::Swim;
    }
    if (lower == "strength" || lower == "weighttraining") {
        return ActivityCategory::Strength;
    }
    if (lower == "other" || lower == "yoga" || lower == "hiit" ||
        lower == "walk" || lower == "hike") {
        return ActivityCategory::Other;
    }
    return std::nullopt;
}

IntensityBand intensity_band_for(double intensity_factor) noexcept {
    if (intensity_factor < 0.75) return IntensityBand::Recovery;
    if (intensity_factor < 0.90) return IntensityBand::Endurance;
    if (intensity_factor < 1.05) return IntensityBand::Tempo;
    return IntensityBand::HighIntensity;
}

} // namespace loadcal
