/// @file src/calibration/screenshot_parser.cpp
/// @brief ScreenshotParser — label-anchored layout parse and text fallbacks.

#include "loadcal/screenshot.hpp"
#include "loadcal/log.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <cmath>
#include <numeric>
#include <regex>
#include <sstream>
#include <stdexcept>
#include <vector>

namespace loadcal::calibration {

namespace {

constexpr std::string_view kTag = "screenshot";

enum class Metric { Ctl, Tsb, Atl };

constexpr std::array<Metric, 3> kMetricOrder = {Metric::Ctl, Metric::Tsb, Metric::Atl};

/// Horizontal tolerance between a value and the label under it.
constexpr double kColumnTolerance = 0.08;
/// Numbers this far below the mean label height still count as the value row.
constexpr double kRowSlack = 0.05;
constexpr double kStressLabelDx = 0.25;
constexpr double kStressLabelDy = 0.15;
constexpr double kMaxDailyStress = 500.0;
constexpr double kMinLoadValue = -50.0;
constexpr double kMaxLoadValue = 200.0;
/// Longer lines are not dashboard text and are ignored.
constexpr std::size_t kMaxLineLength = 256;

[[nodiscard]] std::string lowercase(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return out;
}

[[nodiscard]] std::string trim(std::string_view s) {
    const auto first = s.find_first_not_of(" \t\r\n");
    if (first == std::string_view::npos) return {};
    const auto last = s.find_last_not_of(" \t\r\n");
    return std::string(s.substr(first, last - first + 1));
}

/// Lowercase alphanumeric words of `s`.
[[nodiscard]] std::vector<std::string> words(std::string_view s) {
    std::vector<std::string> out;
    std::string cur;
    for (unsigned char c : s) {
        if (std::isalnum(c)) {
            cur.push_back(static_cast<char>(std::tolower(c)));
        } else if (!cur.empty()) {
            out.push_back(std::move(cur));
            cur.clear();
        }
    }
    if (!cur.empty()) out.push_back(std::move(cur));
    return out;
}

[[nodiscard]] std::optional<Metric> label_metric(std::string_view text) {
    for (const auto& w : words(text)) {
        if (w == "fitness" || w == "ctl" || w == "chronic") return Metric::Ctl;
        if (w == "form" || w == "tsb" || w == "balance")    return Metric::Tsb;
        if (w == "fatigue" || w == "atl" || w == "acute")   return Metric::Atl;
    }
    return std::nullopt;
}

void assign(ScreenshotReading& r, Metric m, double value) {
    switch (m) {
        case Metric::Ctl: r.ctl = value; break;
        case Metric::Tsb: r.tsb = value; break;
        case Metric::Atl: r.atl = value; break;
    }
}

[[nodiscard]] bool has(const ScreenshotReading& r, Metric m) {
    switch (m) {
        case Metric::Ctl: return r.ctl.has_value();
        case Metric::Tsb: return r.tsb.has_value();
        case Metric::Atl: return r.atl.has_value();
    }
    return false;
}

[[nodiscard]] std::optional<double> to_double(const std::string& s) {
    try {
        std::size_t pos = 0;
        const double v = std::stod(s, &pos);
        if (pos != s.size() || !std::isfinite(v)) return std::nullopt;
        return v;
    } catch (const std::invalid_argument&) {
        return std::nullopt;
    } catch (const std::out_of_range&) {
        return std::nullopt;
    }
}

/// Remove trend arrows and bullets; normalize the Unicode minus sign.
[[nodiscard]] std::string strip_decorations(std::string_view text) {
    static const std::array<std::string_view, 12> kDecorations = {
        "↓", "↑", "→", "←", "↗", "↘",
        "⬇", "⬆", "▼", "▲", "•", "️",
    };
    std::string s(text);
    for (auto deco : kDecorations) {
        for (auto pos = s.find(deco); pos != std::string::npos; pos = s.find(deco)) {
            s.erase(pos, deco.size());
        }
    }
    for (auto pos = s.find("−"); pos != std::string::npos; pos = s.find("−")) {
        s.replace(pos, std::string_view("−").size(), "-");
    }
    s = trim(s);
    // A dash followed by a space is a list bullet, not a sign.
    if (s.size() > 1 && s[0] == '-' && std::isspace(static_cast<unsigned char>(s[1]))) {
        s = trim(std::string_view(s).substr(1));
    }
    return s;
}

/// Value of a fragment that is only an integer.
[[nodiscard]] std::optional<double> bare_integer(std::string_view text) {
    static const std::regex kInteger(R"(^([+-]?\d+)$)");
    const std::string cleaned = strip_decorations(text);
    if (cleaned.size() > 16) {
        return std::nullopt;
    }
    std::smatch m;
    if (!std::regex_match(cleaned, m, kInteger)) {
        return std::nullopt;
    }
    return to_double(m[1].str());
}

/// Bare integer within the plausible CTL/ATL/TSB range.
[[nodiscard]] std::optional<double> fragment_number(std::string_view text) {
    const auto v = bare_integer(text);
    if (!v || *v < kMinLoadValue || *v > kMaxLoadValue) {
        return std::nullopt;
    }
    return v;
}

struct PositionedNumber {
    double cx;
    double cy;
    double value;
};

[[nodiscard]] std::optional<double>
first_capture(const std::string& line, std::span<const std::regex> patterns) {
    for (const auto& re : patterns) {
        std::smatch m;
        if (std::regex_search(line, m, re)) {
            if (auto v = to_double(m[1].str())) return v;
        }
    }
    return std::nullopt;
}

[[nodiscard]] std::optional<double> daily_stress_in(const std::string& line) {
    static const std::array<std::regex, 5> kPatterns = {
        std::regex(R"(daily\s*tss[:\s]+(\d+(?:\.\d+)?))", std::regex::icase),
        std::regex(R"(today'?s?\s*tss[:\s]+(\d+(?:\.\d+)?))", std::regex::icase),
        std::regex(R"(today[:\s]+(\d+(?:\.\d+)?)\s*tss)", std::regex::icase),
        std::regex(R"((\d+(?:\.\d+)?)\s*tss\s*today)", std::regex::icase),
        std::regex(R"(\btss[:\s]+(\d+(?:\.\d+)?))", std::regex::icase),
    };
    if (lowercase(line).find("week") != std::string::npos) {
        return std::nullopt;
    }
    return first_capture(line, kPatterns);
}

[[nodiscard]] std::optional<double> inline_value(const std::string& line, Metric m) {
    static const std::array<std::regex, 2> kCtl = {
        std::regex(R"(\b(?:ctl|fitness|chronic)\b[:\s]+([+-]?\d+(?:\.\d+)?))", std::regex::icase),
        std::regex(R"(([+-]?\d+(?:\.\d+)?)\s*(?:ctl|fitness)\b)", std::regex::icase),
    };
    static const std::array<std::regex, 2> kAtl = {
        std::regex(R"(\b(?:atl|fatigue|acute)\b[:\s]+([+-]?\d+(?:\.\d+)?))", std::regex::icase),
        std::regex(R"(([+-]?\d+(?:\.\d+)?)\s*(?:atl|fatigue)\b)", std::regex::icase),
    };
    static const std::array<std::regex, 2> kTsb = {
        std::regex(R"(\b(?:tsb|form|balance)\b[:\s]+([+-]?\d+(?:\.\d+)?))", std::regex::icase),
        std::regex(R"(([+-]?\d+(?:\.\d+)?)\s*(?:tsb|form)\b)", std::regex::icase),
    };
    switch (m) {
        case Metric::Ctl: return first_capture(line, kCtl);
        case Metric::Atl: return first_capture(line, kAtl);
        case Metric::Tsb: return first_capture(line, kTsb);
    }
    return std::nullopt;
}

/// A bare "TSS" label line with its value on one of the three lines above.
[[nodiscard]] std::optional<double>
stress_above_label(const std::vector<std::string>& lines,
                   const std::vector<bool>& used) {
    for (std::size_t i = 0; i < lines.size(); ++i) {
        const auto w = words(lines[i]);
        if (w.empty() || (w.front() != "tss" && w.back() != "tss")
            || lowercase(lines[i]).find("week") != std::string::npos) {
            continue;
        }
        for (std::size_t back = 1; back <= 3 && back <= i; ++back) {
            const std::size_t j = i - back;
            if (used[j]) continue;
            if (auto v = bare_integer(lines[j]);
                v && *v > 0.0 && *v <= kMaxDailyStress) {
                return v;
            }
        }
    }
    return std::nullopt;
}

/// "CTL ATL TSB" header followed by a row of numbers, in header order.
[[nodiscard]] std::optional<ScreenshotReading>
parse_table(const std::vector<std::string>& lines) {
    for (std::size_t i = 0; i + 1 < lines.size(); ++i) {
        const auto header = words(lines[i]);
        const auto find = [&](std::string_view w) {
            return std::find(header.begin(), header.end(), w) - header.begin();
        };
        const auto ctl_pos = find("ctl");
        const auto atl_pos = find("atl");
        const auto tsb_pos = find("tsb");
        const auto end = static_cast<std::ptrdiff_t>(header.size());
        if (ctl_pos == end || atl_pos == end) {
            continue;
        }

        std::vector<double> numbers;
        std::istringstream row(lines[i + 1]);
        std::string token;
        while (row >> token) {
            token.erase(std::remove(token.begin(), token.end(), ','), token.end());
            if (auto v = to_double(strip_decorations(token))) numbers.push_back(*v);
        }
        if (numbers.size() < 2) {
            return std::nullopt;
        }

        std::vector<std::pair<std::ptrdiff_t, Metric>> columns = {
            {ctl_pos, Metric::Ctl}, {atl_pos, Metric::Atl}};
        if (tsb_pos != end) columns.emplace_back(tsb_pos, Metric::Tsb);
        std::sort(columns.begin(), columns.end(),
                  [](const auto& a, const auto& b) { return a.first < b.first; });

        ScreenshotReading r;
        for (std::size_t c = 0; c < columns.size() && c < numbers.size(); ++c) {
            assign(r, columns[c].second, numbers[c]);
        }
        r.confidence = numbers.size() >= 3 ? 0.8 : 0.6;
        return r;
    }
    return std::nullopt;
}

} // anonymous namespace

// ─── ScreenshotReading ────────────────────────────────────────────────────────

int ScreenshotReading::load_fields() const noexcept {
    return static_cast<int>(ctl.has_value()) + static_cast<int>(atl.has_value())
         + static_cast<int>(tsb.has_value());
}

GroundTruthObservation ScreenshotReading::to_observation(Day effective_date) const {
    GroundTruthObservation obs;
    obs.effective_date = effective_date;
    obs.daily_stress   = daily_stress;
    obs.ctl            = ctl;
    obs.atl            = atl;
    obs.tsb            = tsb;
    obs.confidence     = confidence;
    return obs;
}

double ScreenshotParser::confidence_for(int matched) noexcept {
    if (matched >= 3) return 0.95;
    if (matched == 2) return 0.75;
    if (matched == 1) return 0.5;
    return 0.0;
}

// ─── parse_layout ─────────────────────────────────────────────────────────────

std::optional<ScreenshotReading>
ScreenshotParser::parse_layout(std::span<const TextFragment> fragments) {
    std::vector<PositionedNumber> numbers;
    std::array<std::vector<const TextFragment*>, 3> labels;
    std::vector<const TextFragment*> stress_labels;

    for (const auto& f : fragments) {
        if (auto v = bare_integer(f.text);
            v && *v >= kMinLoadValue && *v <= kMaxDailyStress) {
            numbers.push_back({f.box.center_x(), f.box.center_y(), *v});
            continue;
        }
        if (auto m = label_metric(f.text)) {
            labels[static_cast<std::size_t>(*m)].push_back(&f);
        }
        if (lowercase(f.text).find("tss") != std::string::npos) {
            stress_labels.push_back(&f);
        }
    }
    if (numbers.empty()) {
        return std::nullopt;
    }

    ScreenshotReading r;
    std::vector<bool> used(numbers.size(), false);

    const auto load_value = [&](std::size_t i) {
        return numbers[i].value <= kMaxLoadValue;
    };

    // Primary: the value is drawn directly above its label.
    const auto above = [&](const TextFragment& label) -> std::optional<std::size_t> {
        std::optional<std::size_t> best;
        double best_dy = 0.0;
        for (std::size_t i = 0; i < numbers.size(); ++i) {
            const double dx = std::abs(numbers[i].cx - label.box.center_x());
            const double dy = numbers[i].cy - label.box.center_y();
            if (!used[i] && load_value(i) && dx < kColumnTolerance && dy > 0.0
                && (!best || dy < best_dy)) {
                best    = i;
                best_dy = dy;
            }
        }
        return best;
    };

    int matched = 0;
    for (Metric m : kMetricOrder) {
        for (const TextFragment* label : labels[static_cast<std::size_t>(m)]) {
            if (auto idx = above(*label)) {
                assign(r, m, numbers[*idx].value);
                used[*idx] = true;
                ++matched;
                break;
            }
        }
    }

    // Fallback: labels sit on one row and values on the row above; pair each
    // unmatched label with the nearest unused value by column.
    const std::size_t label_count =
        labels[0].size() + labels[1].size() + labels[2].size();
    if (matched < 3 && label_count >= 2) {
        double label_y = 0.0;
        for (const auto& group : labels) {
            for (const TextFragment* l : group) label_y += l->box.center_y();
        }
        label_y /= static_cast<double>(label_count);

        std::vector<std::size_t> row;
        for (std::size_t i = 0; i < numbers.size(); ++i) {
            if (load_value(i) && numbers[i].cy >= label_y - kRowSlack) {
                row.push_back(i);
            }
        }

        if (row.size() >= 3) {
            for (Metric m : kMetricOrder) {
                const auto& group = labels[static_cast<std::size_t>(m)];
                if (has(r, m) || group.empty()) continue;

                const double lx = group.front()->box.center_x();
                std::optional<std::size_t> best;
                for (std::size_t i : row) {
                    if (used[i]) continue;
                    if (!best || std::abs(numbers[i].cx - lx)
                                     < std::abs(numbers[*best].cx - lx)) {
                        best = i;
                    }
                }
                if (best) {
                    assign(r, m, numbers[*best].value);
                    used[*best] = true;
                    ++matched;
                }
            }
        }
    }

    if (matched == 0) {
        return std::nullopt;
    }

    for (const TextFragment* label : stress_labels) {
        for (std::size_t i = 0; i < numbers.size() && !r.daily_stress; ++i) {
            if (used[i]) continue;
            const double dx = std::abs(numbers[i].cx - label->box.center_x());
            const double dy = std::abs(numbers[i].cy - label->box.center_y());
            if (dx < kStressLabelDx && dy < kStressLabelDy
                && numbers[i].value >= 0.0 && numbers[i].value <= kMaxDailyStress) {
                r.daily_stress = numbers[i].value;
            }
        }
        if (r.daily_stress) break;
    }

    r.confidence = confidence_for(matched);
    log::debug(kTag, "layout parse: {} load values, confidence {:.2f}",
               matched, r.confidence);
    return r;
}

// ─── parse_text ───────────────────────────────────────────────────────────────

std::optional<ScreenshotReading> ScreenshotParser::parse_text(std::string_view text) {
    std::vector<std::string> lines;
    {
        std::istringstream in{std::string(text)};
        std::string line;
        while (std::getline(in, line)) {
            lines.push_back(line.size() > kMaxLineLength ? std::string() : trim(line));
        }
    }

    ScreenshotReading r;
    int matched = 0;
    std::vector<bool> used(lines.size(), false);

    // Mobile dashboards print the value on its own line next to the label.
    for (std::size_t i = 0; i < lines.size(); ++i) {
        const auto value = fragment_number(lines[i]);
        if (!value) continue;

        for (std::ptrdiff_t dist = 1; dist <= 3; ++dist) {
            bool assigned = false;
            for (std::ptrdiff_t dir : {1, -1}) {
                const auto j = static_cast<std::ptrdiff_t>(i) + dir * dist;
                if (j < 0 || j >= static_cast<std::ptrdiff_t>(lines.size())) continue;
                const auto& neighbour = lines[static_cast<std::size_t>(j)];
                if (fragment_number(neighbour)) continue;
                const auto m = label_metric(neighbour);
                if (m && !has(r, *m)) {
                    assign(r, *m, *value);
                    used[i] = true;
                    ++matched;
                    assigned = true;
                    break;
                }
            }
            if (assigned) break;
        }
    }

    if (matched == 0) {
        for (const auto& line : lines) {
            for (Metric m : kMetricOrder) {
                if (has(r, m)) continue;
                if (auto v = inline_value(line, m)) {
                    assign(r, m, *v);
                    ++matched;
                }
            }
        }
    }

    for (const auto& line : lines) {
        if (auto v = daily_stress_in(line); v && *v <= kMaxDailyStress) {
            r.daily_stress = v;
            break;
        }
    }
    if (!r.daily_stress) {
        r.daily_stress = stress_above_label(lines, used);
    }

    if (matched == 0) {
        if (auto table = parse_table(lines)) {
            table->daily_stress = r.daily_stress;
            return table;
        }
        if (!r.daily_stress) {
            return std::nullopt;
        }
        r.confidence = confidence_for(1);
        return r;
    }

    r.confidence = confidence_for(matched);
    return r;
}

// ─── parse ────────────────────────────────────────────────────────────────────

std::optional<ScreenshotReading>
ScreenshotParser::parse(std::span<const TextFragment> fragments) {
    if (auto r = parse_layout(fragments)) {
        return r;
    }

    // Reading order: top to bottom (larger y first), then left to right.
    std::vector<const TextFragment*> ordered;
    ordered.reserve(fragments.size());
    for (const auto& f : fragments) ordered.push_back(&f);
    std::stable_sort(ordered.begin(), ordered.end(),
                     [](const TextFragment* a, const TextFragment* b) {
                         if (a->box.center_y() != b->box.center_y()) {
                             return a->box.center_y() > b->box.center_y();
                         }
                         return a->box.center_x() < b->box.center_x();
                     });

    std::string joined;
    for (const TextFragment* f : ordered) {
        joined += f->text;
        joined += '\n';
    }

    auto r = parse_text(joined);
    if (!r) {
        log::info(kTag, "no load values found in {} fragments", fragments.size());
    }
    return r;
}

} // namespace loadcal::calibration
