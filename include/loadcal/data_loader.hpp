#pragma once

/// @file include/loadcal/data_loader.hpp
/// @brief CSV loader for daily stress and workout history.
///
/// # Module: DataLoader
///
/// ## Responsibility
/// Parse two CSV layouts into engine inputs.
///
/// ## Expected CSV Formats
/// Daily stress:
/// ```
/// date,stress
/// 2024-03-01,85
/// 2024-03-02,0
/// ```
/// Workouts (empty cells are absent values):
/// ```
/// start_epoch_s,duration_s,distance_m,category,avg_hr,avg_power_w,np_w
/// 1709280000,3600,40000,bike,142,210,235
/// 1709366400,2700,8000,run,155,,
/// ```
/// The first line is treated as a header and skipped. Repeated dates in a
/// daily file are summed.
///
/// ## Guarantees
/// - Never throws; returns `nullopt` only when a file cannot be opened
/// - Allocation failure while building the result terminates (`noexcept`)
/// - Skips individual bad rows rather than failing the entire load

#include "loadcal/matcher.hpp"
#include "loadcal/types.hpp"

#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace loadcal::core {

class DataLoader {
public:
    [[nodiscard]] static std::map<Day, double>
    parse_daily_csv(const std::string& csv_content) noexcept;

    [[nodiscard]] static std::optional<std::map<Day, double>>
    load_daily_csv(const std::string& filepath) noexcept;

    [[nodiscard]] static std::vector<matcher::WorkoutObservation>
    parse_workouts_csv(const std::string& csv_content) noexcept;

    [[nodiscard]] static std::optional<std::vector<matcher::WorkoutObservation>>
    load_workouts_csv(const std::string& filepath) noexcept;

    /// Parse `YYYY-MM-DD`. Rejects impossible dates.
    [[nodiscard]] static std::optional<Day> parse_date(std::string_view text) noexcept;
};

} // namespace loadcal::core
