#pragma once

/// @file include/loadcal/log.hpp
/// @brief Leveled diagnostic output for loadcal, formatted with {fmt}.
///
/// # Module: Logging
///
/// ## Responsibility
/// Route `[tag] message` lines from the engine modules to stderr, or to a
/// replacement sink installed by tests and embedding applications.
///
/// ## Guarantees
/// - Formatting happens only when the level passes the threshold
/// - Sink replacement is thread-safe
///
/// ## NOT Responsible For
/// - Persistence, rotation or structured export of log lines

#include <fmt/format.h>

#include <functional>
#include <string>
#include <string_view>
#include <utility>

namespace loadcal::log {

enum class Level { Debug, Info, Warn, Off };

/// Receives every emitted line.
using Sink = std::function<void(Level, std::string_view tag,
                                std::string_view message)>;

/// Set the minimum level that is emitted (default `Info`).
void set_level(Level level) noexcept;

[[nodiscard]] Level level() noexcept;

/// Install a sink. An empty function restores the stderr sink.
void set_sink(Sink sink);

/// Emit a preformatted line. Prefer the typed helpers below.
void write(Level level, std::string_view tag, std::string_view message);

[[nodiscard]] inline bool enabled(Level lvl) noexcept {
    return lvl != Level::Off && static_cast<int>(lvl) >= static_cast<int>(level());
}

template <typename... Args>
void debug(std::string_view tag, fmt::format_string<Args...> fmt_str,
           Args&&... args) {
    if (!enabled(Level::Debug)) return;
    write(Level::Debug, tag, fmt::format(fmt_str, std::forward<Args>(args)...));
}

template <typename... Args>
void info(std::string_view tag, fmt::format_string<Args...> fmt_str,
          Args&&... args) {
    if (!enabled(Level::Info)) return;
    write(Level::Info, tag, fmt::format(fmt_str, std::forward<Args>(args)...));
}

template <typename... Args>
void warn(std::string_view tag, fmt::format_string<Args...> fmt_str,
          Args&&... args) {
    if (!enabled(Level::Warn)) return;
    write(Level::Warn, tag, fmt::format(fmt_str, std::forward<Args>(args)...));
}

} // namespace loadcal::log
