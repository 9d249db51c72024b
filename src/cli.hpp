#pragma once

#include "config.hpp"
#include "messages.hpp"
#include <filesystem>
#include <optional>
#include <stdexcept>
#include <string>

namespace cmdrun {

inline constexpr const char* kProgramName = "cmdrun";
inline constexpr const char* kProgramVersion = "0.1.0";

// Command line usage error; main prints it with the usage text and exits with 2
class CliError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

struct CliOptions {
    Theme theme = Theme::Dark;
    bool theme_given = false;
    std::optional<std::filesystem::path> config_path;
    bool skip = false;

    // Initial configuration from --exe and positional arguments
    Config config;

    bool show_help = false;
    bool show_version = false;
};

// Throws CliError
[[nodiscard]] CliOptions parse_cli(int argc, const char* const argv[]);

[[nodiscard]] std::string usage_text();

} // namespace cmdrun
