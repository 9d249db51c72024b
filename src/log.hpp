#pragma once

#include <chrono>
#include <format>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace cmdrun::log {

enum class Level { Off, Error, Warn, Info, Debug, Trace };

// Retained copy of an error record for diagnostics
struct Record {
    std::chrono::steady_clock::time_point timestamp;
    Level level = Level::Error;
    std::string message;
};

inline constexpr const char* kLevelEnvVar = "CMDRUN_LOG";
inline constexpr Level kDefaultLevel = Level::Debug;

void set_level(Level level);
[[nodiscard]] Level level();
[[nodiscard]] bool enabled(Level level);
[[nodiscard]] std::optional<Level> parse_level(std::string_view name);
[[nodiscard]] const char* level_name(Level level);

// Reads CMDRUN_LOG; unknown values keep the default and emit a warning.
void init_from_env();

// Redirect output (nullptr restores stderr).
void set_stream(std::ostream* stream);

void write(Level level, std::string_view message);

[[nodiscard]] std::vector<Record> recent_errors();
void clear_errors();

template <typename... Args>
void error(std::format_string<Args...> fmt, Args&&... args) {
    if (enabled(Level::Error)) write(Level::Error, std::format(fmt, std::forward<Args>(args)...));
}

template <typename... Args>
void warn(std::format_string<Args...> fmt, Args&&... args) {
    if (enabled(Level::Warn)) write(Level::Warn, std::format(fmt, std::forward<Args>(args)...));
}

template <typename... Args>
void info(std::format_string<Args...> fmt, Args&&... args) {
    if (enabled(Level::Info)) write(Level::Info, std::format(fmt, std::forward<Args>(args)...));
}

template <typename... Args>
void debug(std::format_string<Args...> fmt, Args&&... args) {
    if (enabled(Level::Debug)) write(Level::Debug, std::format(fmt, std::forward<Args>(args)...));
}

template <typename... Args>
void trace(std::format_string<Args...> fmt, Args&&... args) {
    if (enabled(Level::Trace)) write(Level::Trace, std::format(fmt, std::forward<Args>(args)...));
}

} // namespace cmdrun::log
