/// @file src/main.cpp
/// @brief loadcal CLI entry point.
///
/// Usage:
///   loadcal --pmc <daily_csv>                    PMC series from daily stress
///   loadcal --workouts <csv> [ftp_w] [lthr_bpm]  Score workouts, print PMC
///   loadcal --taper <ctl> <atl> <target_tsb>     Rest days to reach a form
///   loadcal --help                               Print usage
///
/// `-v` / `--verbose` anywhere on the command line enables debug logging.

#include "loadcal/data_loader.hpp"
#include "loadcal/engine.hpp"
#include "loadcal/load_model.hpp"
#include "loadcal/log.hpp"

#include <fmt/core.h>

#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

using loadcal::Day;
using loadcal::load::DailyLoadPoint;
using loadcal::load::LoadModel;

void print_usage() {
    fmt::print(
        "Usage:\n"
        "  loadcal --pmc <daily_csv>                    PMC from daily stress\n"
        "  loadcal --workouts <csv> [ftp_w] [lthr_bpm]  Score workouts, print PMC\n"
        "  loadcal --taper <ctl> <atl> <target_tsb>     Rest days to target form\n"
        "  loadcal --help                               Show this help\n"
        "  Add -v or --verbose for debug logging.\n"
        "\n"
        "Daily CSV (header required):    date,stress\n"
        "Workout CSV (header required):  "
        "start_epoch_s,duration_s,distance_m,category,avg_hr,avg_power_w,np_w\n"
    );
}

[[nodiscard]] std::string format_day(Day d) {
    const std::chrono::year_month_day ymd{d};
    return fmt::format("{:04d}-{:02d}-{:02d}", static_cast<int>(ymd.year()),
                       static_cast<unsigned>(ymd.month()),
                       static_cast<unsigned>(ymd.day()));
}

[[nodiscard]] std::optional<double> parse_arg(const std::string& s) {
    try {
        std::size_t pos = 0;
        const double v = std::stod(s, &pos);
        if (pos != s.size()) return std::nullopt;
        return v;
    } catch (const std::invalid_argument&) {
        return std::nullopt;
    } catch (const std::out_of_range&) {
        return std::nullopt;
    }
}

void print_series(const std::vector<DailyLoadPoint>& series) {
    fmt::print("{:<10}  {:>7}  {:>7}  {:>7}  {:>7}  {:<13}  {}\n",
               "date", "stress", "CTL", "ATL", "TSB", "ACWR", "form");
    for (const auto& p : series) {
        const auto ratio  = p.acwr();
        const auto status = LoadModel::classify_acwr(ratio);
        const auto form   = LoadModel::classify_form(p.tsb());
        fmt::print("{:<10}  {:7.1f}  {:7.1f}  {:7.1f}  {:7.1f}  {:<13}  {}\n",
                   format_day(p.date), p.daily_stress, p.ctl, p.atl, p.tsb(),
                   ratio ? fmt::format("{:.2f} {}", *ratio,
                                       loadcal::load::to_string(status))
                         : std::string("-"),
                   loadcal::load::to_string(form.status));
    }
}

int run_pmc(const std::string& filepath) {
    const auto daily = loadcal::core::DataLoader::load_daily_csv(filepath);
    if (!daily) {
        fmt::print(stderr, "Error: cannot open file '{}'\n", filepath);
        return 1;
    }
    if (daily->empty()) {
        fmt::print(stderr, "Error: no valid rows loaded from '{}'\n", filepath);
        return 1;
    }

    const auto series = LoadModel::compute_series(*daily, daily->begin()->first,
                                                  daily->rbegin()->first);
    print_series(series);
    return 0;
}

int run_workouts(const std::string& filepath, std::optional<double> ftp,
                 std::optional<double> lthr) {
    const auto workouts = loadcal::core::DataLoader::load_workouts_csv(filepath);
    if (!workouts) {
        fmt::print(stderr, "Error: cannot open file '{}'\n", filepath);
        return 1;
    }
    if (workouts->empty()) {
        fmt::print(stderr, "Error: no valid workouts loaded from '{}'\n", filepath);
        return 1;
    }

    loadcal::core::EngineConfig cfg;
    cfg.thresholds.ftp_watts        = ftp;
    cfg.thresholds.threshold_hr_bpm = lthr;
    loadcal::core::Engine engine(cfg);

    std::vector<loadcal::core::ScoredWorkout> scored;
    scored.reserve(workouts->size());
    for (const auto& obs : *workouts) {
        loadcal::stress::WorkoutSignals signals;
        signals.category           = obs.category;
        signals.duration_s         = obs.duration_s;
        signals.distance_m         = obs.distance_m;
        signals.average_hr_bpm     = obs.average_hr_bpm;
        signals.average_power_w    = obs.average_power_w;
        signals.normalized_power_w = obs.normalized_power_w;
        scored.push_back(engine.score(obs, signals));

        const auto& s = scored.back().stress;
        fmt::print("{}  {:<8}  {:6.1f} TSS  IF {:.2f}  ({}, {})\n",
                   format_day(loadcal::local_day(obs.start_time, cfg.utc_offset)),
                   loadcal::to_string(obs.category), s.value, s.intensity_factor,
                   loadcal::stress::to_string(s.method),
                   loadcal::stress::describe_intensity(s.intensity_factor));
    }

    const auto days = engine.summarize_days(scored);
    fmt::print("\n");
    print_series(engine.pmc_series(scored, days.front().date, days.back().date));
    return 0;
}

int run_taper(double ctl, double atl, double target) {
    const auto days = LoadModel::days_to_target_tsb({ctl, atl}, target);
    if (!days) {
        fmt::print("TSB {:.1f} not reached within {} rest days\n", target,
                   loadcal::constants::DEFAULT_TAPER_HORIZON_DAYS);
        return 0;
    }
    fmt::print("TSB {:.1f} reached after {} rest day(s)\n", target, *days);
    return 0;
}

}  // anonymous namespace

int main(int argc, char* argv[]) {
    // -v / --verbose may appear anywhere; the rest are positional.
    std::vector<std::string> args;
    for (int i = 1; i < argc; ++i) {
        const std::string a(argv[i]);
        if (a == "-v" || a == "--verbose") {
            loadcal::log::set_level(loadcal::log::Level::Debug);
        } else {
            args.push_back(a);
        }
    }

    if (args.empty()) {
        print_usage();
        return 1;
    }

    const std::string& mode = args[0];

    if (mode == "--help" || mode == "-h") {
        print_usage();
        return 0;
    }

    if (mode == "--pmc") {
        if (args.size() < 2) {
            fmt::print(stderr, "Error: --pmc requires a CSV file path\n");
            print_usage();
            return 1;
        }
        return run_pmc(args[1]);
    }

    if (mode == "--workouts") {
        if (args.size() < 2) {
            fmt::print(stderr, "Error: --workouts requires a CSV file path\n");
            print_usage();
            return 1;
        }
        const auto ftp  = args.size() > 2 ? parse_arg(args[2]) : std::nullopt;
        const auto lthr = args.size() > 3 ? parse_arg(args[3]) : std::nullopt;
        return run_workouts(args[1], ftp, lthr);
    }

    if (mode == "--taper") {
        if (args.size() < 4) {
            fmt::print(stderr, "Error: --taper requires <ctl> <atl> <target_tsb>\n");
            print_usage();
            return 1;
        }
        const auto ctl    = parse_arg(args[1]);
        const auto atl    = parse_arg(args[2]);
        const auto target = parse_arg(args[3]);
        if (!ctl || !atl || !target) {
            fmt::print(stderr, "Error: --taper arguments must be numbers\n");
            return 1;
        }
        return run_taper(*ctl, *atl, *target);
    }

    fmt::print(stderr, "Unknown option: {}\n", mode);
    print_usage();
    return 1;
}
