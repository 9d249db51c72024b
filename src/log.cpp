#include "log.hpp"
#include <algorithm>
#include <atomic>
#include <cctype>
#include <cstdlib>
#include <iostream>
#include <mutex>

namespace cmdrun::log {

namespace {

std::atomic<Level> g_level{kDefaultLevel};

std::mutex g_mutex;
std::ostream* g_stream = nullptr;
std::vector<Record> g_recent_errors;
constexpr size_t kMaxErrors = 10;

const auto g_start = std::chrono::steady_clock::now();

} // namespace

void set_level(const Level level) {
    g_level = level;
}

Level level() {
    return g_level;
}

bool enabled(const Level level) {
    return level != Level::Off && level <= g_level.load();
}

std::optional<Level> parse_level(std::string_view name) {
    std::string lower(name);
    std::ranges::transform(lower, lower.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "off") return Level::Off;
    if (lower == "error") return Level::Error;
    if (lower == "warn" || lower == "warning") return Level::Warn;
    if (lower == "info") return Level::Info;
    if (lower == "debug") return Level::Debug;
    if (lower == "trace") return Level::Trace;
    return std::nullopt;
}

const char* level_name(const Level level) {
    switch (level) {
        case Level::Off: return "OFF";
        case Level::Error: return "ERROR";
        case Level::Warn: return "WARN";
        case Level::Info: return "INFO";
        case Level::Debug: return "DEBUG";
        case Level::Trace: return "TRACE";
    }
    return "?";
}

void init_from_env() {
    const char* value = std::getenv(kLevelEnvVar);
    if (!value || *value == '\0') return;

    if (const auto parsed = parse_level(value)) {
        set_level(*parsed);
    } else {
        warn("ignoring unknown {} value '{}'", kLevelEnvVar, value);
    }
}

void set_stream(std::ostream* stream) {
    std::lock_guard lock(g_mutex);
    g_stream = stream;
}

void write(const Level level, std::string_view message) {
    const auto now = std::chrono::steady_clock::now();
    const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(now - g_start);

    std::lock_guard lock(g_mutex);
    std::ostream& out = g_stream ? *g_stream : std::cerr;
    out << std::format("[{:>8}.{:03}s {:<5} cmdrun] {}\n",
                       elapsed.count() / 1000, elapsed.count() % 1000,
                       level_name(level), message);
    out.flush();

    if (level == Level::Error) {
        g_recent_errors.push_back({now, level, std::string(message)});
        if (g_recent_errors.size() > kMaxErrors) {
            g_recent_errors.erase(g_recent_errors.begin());
        }
    }
}

std::vector<Record> recent_errors() {
    std::lock_guard lock(g_mutex);
    return g_recent_errors;
}

void clear_errors() {
    std::lock_guard lock(g_mutex);
    g_recent_errors.clear();
}

} // namespace cmdrun::log
