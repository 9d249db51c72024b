#include "cli.hpp"
#include <format>
#include <string_view>
#include <vector>

namespace cmdrun {

namespace {

Theme parse_theme(const std::string_view value) {
    if (value == "light") return Theme::Light;
    if (value == "dark") return Theme::Dark;
    throw CliError(std::format("invalid value '{}' for '--theme': expected one of light, dark", value));
}

// Splits "--name=value" into name and value; short options never carry '='
struct OptionToken {
    std::string name;
    std::optional<std::string> inline_value;
};

OptionToken split_option(const std::string_view arg) {
    if (arg.starts_with("--")) {
        if (const auto eq = arg.find('='); eq != std::string_view::npos) {
            return {std::string(arg.substr(0, eq)), std::string(arg.substr(eq + 1))};
        }
    }
    return {std::string(arg), std::nullopt};
}

} // namespace

CliOptions parse_cli(const int argc, const char* const argv[]) {
    CliOptions options;
    bool exe_given = false;
    bool options_done = false;

    std::vector<std::string_view> args;
    for (int i = 1; i < argc; ++i) {
        args.emplace_back(argv[i]);
    }

    for (size_t i = 0; i < args.size(); ++i) {
        const std::string_view arg = args[i];

        if (options_done || arg == "-" || !arg.starts_with("-")) {
            options.config.arg.emplace_back(arg);
            continue;
        }
        if (arg == "--") {
            options_done = true;
            continue;
        }

        auto [name, inline_value] = split_option(arg);

        auto take_value = [&]() -> std::string {
            if (inline_value) return *inline_value;
            if (i + 1 >= args.size()) {
                throw CliError(std::format("option '{}' requires a value", name));
            }
            return std::string(args[++i]);
        };
        auto no_value = [&]() {
            if (inline_value) {
                throw CliError(std::format("option '{}' does not take a value", name));
            }
        };

        if (name == "-h" || name == "--help") {
            no_value();
            options.show_help = true;
        } else if (name == "-V" || name == "--version") {
            no_value();
            options.show_version = true;
        } else if (name == "-t" || name == "--theme") {
            options.theme = parse_theme(take_value());
            options.theme_given = true;
        } else if (name == "-c" || name == "--config") {
            const std::string value = take_value();
            if (value.empty()) {
                throw CliError("option '--config' requires a non-empty path");
            }
            options.config_path = std::filesystem::path(value);
        } else if (name == "-e" || name == "--exe") {
            options.config.exe = take_value();
            exe_given = true;
        } else if (name == "--skip") {
            no_value();
            options.skip = true;
        } else {
            throw CliError(std::format("unexpected argument '{}' found", arg));
        }
    }

    if (options.show_help || options.show_version) {
        return options;
    }

    if (options.skip) {
        if (!options.config_path) {
            throw CliError("'--skip' requires '--config <PATH>'");
        }
        if (exe_given) {
            throw CliError("'--skip' cannot be used with '--exe'");
        }
        if (!options.config.arg.empty()) {
            throw CliError("'--skip' cannot be used with positional arguments");
        }
        if (options.theme_given) {
            throw CliError("'--skip' cannot be used with '--theme'");
        }
    }

    return options;
}

std::string usage_text() {
    return std::format(
        "Usage: {0} [OPTIONS] [--] [ARG]...\n"
        "\n"
        "Configure, save and run a command.\n"
        "\n"
        "Arguments:\n"
        "  [ARG]...              Initial argument list\n"
        "\n"
        "Options:\n"
        "  -t, --theme <THEME>   Color theme: light, dark [default: dark]\n"
        "  -c, --config <PATH>   Config file to load at startup\n"
        "      --skip            Run the config without showing a window (requires --config)\n"
        "  -e, --exe <PATH>      Initial executable\n"
        "  -h, --help            Print help\n"
        "  -V, --version         Print version\n"
        "\n"
        "Environment:\n"
        "  CMDRUN_LOG            Log level: off, error, warn, info, debug, trace [default: debug]\n",
        kProgramName);
}

} // namespace cmdrun
