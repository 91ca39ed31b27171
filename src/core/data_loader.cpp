/// @file src/core/data_loader.cpp
/// @brief CSV DataLoader for daily stress and workout history.

#include "loadcal/data_loader.hpp"
#include "loadcal/log.hpp"

#include <cmath>
#include <cstdint>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace loadcal::core {

namespace {

constexpr std::string_view kTag = "loader";

[[nodiscard]] std::string trim(const std::string& token) {
    const auto first = token.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        return {};
    }
    const auto last = token.find_last_not_of(" \t\r\n");
    return token.substr(first, last - first + 1);
}

[[nodiscard]] std::vector<std::string> split_row(const std::string& line) {
    std::vector<std::string> cells;
    std::istringstream ss(line);
    std::string token;
    while (std::getline(ss, token, ',')) {
        cells.push_back(trim(token));
    }
    // A trailing comma leaves an empty final cell.
    if (!line.empty() && line.back() == ',') {
        cells.emplace_back();
    }
    return cells;
}

/// Finite number or nullopt. Partial parses are rejected.
[[nodiscard]] std::optional<double> parse_number(const std::string& cell) {
    if (cell.empty()) {
        return std::nullopt;
    }
    try {
        std::size_t pos = 0;
        const double v = std::stod(cell, &pos);
        if (pos != cell.size() || !std::isfinite(v)) {
            return std::nullopt;
        }
        return v;
    } catch (const std::invalid_argument&) {
        return std::nullopt;
    } catch (const std::out_of_range&) {
        return std::nullopt;
    }
}

/// Calls `on_row` for every data line after the header.
template <typename Fn>
void for_each_row(const std::string& csv_content, Fn&& on_row) {
    std::istringstream stream(csv_content);
    std::string line;
    bool header_skipped = false;

    while (std::getline(stream, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (line.empty() || line[0] == '#') {
            continue;
        }
        if (!header_skipped) {
            header_skipped = true;
            continue;
        }
        on_row(line);
    }
}

[[nodiscard]] std::optional<std::string> read_file(const std::string& filepath) {
    std::ifstream file(filepath);
    if (!file.is_open()) {
        return std::nullopt;
    }
    std::ostringstream contents;
    contents << file.rdbuf();
    return contents.str();
}

} // anonymous namespace

// ─── parse_date ───────────────────────────────────────────────────────────────

std::optional<Day> DataLoader::parse_date(std::string_view text) noexcept {
    if (text.size() != 10 || text[4] != '-' || text[7] != '-') {
        return std::nullopt;
    }
    int parts[3] = {0, 0, 0};
    const std::size_t starts[3] = {0, 5, 8};
    const std::size_t lengths[3] = {4, 2, 2};
    for (int p = 0; p < 3; ++p) {
        for (std::size_t i = 0; i < lengths[p]; ++i) {
            const char c = text[starts[p] + i];
            if (c < '0' || c > '9') {
                return std::nullopt;
            }
            parts[p] = parts[p] * 10 + (c - '0');
        }
    }

    const std::chrono::year_month_day ymd{
        std::chrono::year{parts[0]},
        std::chrono::month{static_cast<unsigned>(parts[1])},
        std::chrono::day{static_cast<unsigned>(parts[2])}};
    if (!ymd.ok()) {
        return std::nullopt;
    }
    return Day{ymd};
}

// ─── Daily stress ─────────────────────────────────────────────────────────────

std::map<Day, double>
DataLoader::parse_daily_csv(const std::string& csv_content) noexcept {
    std::map<Day, double> daily;
    std::size_t skipped = 0;

    for_each_row(csv_content, [&](const std::string& line) {
        const auto cells = split_row(line);
        if (cells.size() != 2) {
            ++skipped;
            return;
        }
        const auto date   = parse_date(cells[0]);
        const auto stress = parse_number(cells[1]);
        if (!date || !stress || *stress < 0.0) {
            ++skipped;
            return;
        }
        const double total = daily[*date] + *stress;
        if (!std::isfinite(total)) {
            ++skipped;
            return;
        }
        daily[*date] = total;
    });

    if (skipped > 0) {
        log::warn(kTag, "skipped {} malformed daily rows", skipped);
    }
    return daily;
}

std::optional<std::map<Day, double>>
DataLoader::load_daily_csv(const std::string& filepath) noexcept {
    const auto contents = read_file(filepath);
    if (!contents) {
        log::warn(kTag, "cannot open {}", filepath);
        return std::nullopt;
    }
    return parse_daily_csv(*contents);
}

// ─── Workouts ─────────────────────────────────────────────────────────────────

std::vector<matcher::WorkoutObservation>
DataLoader::parse_workouts_csv(const std::string& csv_content) noexcept {
    std::vector<matcher::WorkoutObservation> workouts;
    std::size_t skipped = 0;
    std::size_t row = 0;

    for_each_row(csv_content, [&](const std::string& line) {
        ++row;
        const auto cells = split_row(line);
        if (cells.size() != 7) {
            ++skipped;
            return;
        }
        const auto start    = parse_number(cells[0]);
        const auto duration = parse_number(cells[1]);
        const auto category = parse_category(cells[3]);
        // Epoch seconds beyond year ~5000 are rejected as garbage.
        if (!start || std::abs(*start) > 1e11 || !duration || *duration <= 0.0
            || !category) {
            ++skipped;
            return;
        }

        matcher::WorkoutObservation w;
        w.source_id  = "csv:" + std::to_string(row);
        w.start_time = Timestamp{std::chrono::seconds{
            static_cast<std::int64_t>(*start)}};
        w.duration_s         = *duration;
        w.distance_m         = parse_number(cells[2]);
        w.category           = *category;
        w.average_hr_bpm     = parse_number(cells[4]);
        w.average_power_w    = parse_number(cells[5]);
        w.normalized_power_w = parse_number(cells[6]);
        workouts.push_back(std::move(w));
    });

    if (skipped > 0) {
        log::warn(kTag, "skipped {} malformed workout rows", skipped);
    }
    return workouts;
}

std::optional<std::vector<matcher::WorkoutObservation>>
DataLoader::load_workouts_csv(const std::string& filepath) noexcept {
    const auto contents = read_file(filepath);
    if (!contents) {
        log::warn(kTag, "cannot open {}", filepath);
        return std::nullopt;
    }
    return parse_workouts_csv(*contents);
}

} // namespace loadcal::core
