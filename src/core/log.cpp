/// @file src/core/log.cpp
/// @brief stderr sink and level state for loadcal::log.

#include "loadcal/log.hpp"

#include <fmt/core.h>

#include <atomic>
#include <cstdio>
#include <mutex>

namespace loadcal::log {

namespace {

std::atomic<Level> g_level{Level::Info};

std::mutex& sink_mutex() {
    static std::mutex m;
    return m;
}

Sink& sink_slot() {
    static Sink s;
    return s;
}

[[nodiscard]] std::string_view level_name(Level lvl) noexcept {
    switch (lvl) {
        case Level::Debug: return "debug";
        case Level::Info:  return "info";
        case Level::Warn:  return "warn";
        case Level::Off:   return "off";
    }
    return "info";
}

} // anonymous namespace

void set_level(Level lvl) noexcept { g_level.store(lvl); }

Level level() noexcept { return g_level.load(); }

void set_sink(Sink sink) {
    std::lock_guard<std::mutex> lock(sink_mutex());
    sink_slot() = std::move(sink);
}

void write(Level lvl, std::string_view tag, std::string_view message) {
    std::lock_guard<std::mutex> lock(sink_mutex());
    if (sink_slot()) {
        sink_slot()(lvl, tag, message);
        return;
    }
    fmt::print(stderr, "[{}] {}: {}\n", tag, level_name(lvl), message);
}

} // namespace loadcal::log
