#include "config.hpp"
#include "config_format.hpp"
#include "errors.hpp"
#include "log.hpp"
#include "utf8.hpp"
#include <cerrno>
#include <cstring>
#include <format>
#include <fstream>
#include <ranges>
#include <sstream>

namespace fs = std::filesystem;

namespace cmdrun {

namespace {

Error read_error(const fs::path& path, const std::string& reason) {
    return Error(ErrorKind::Read, std::format("could not read {}", display_path(path)),
                 std::format("could not read {} to string\n{}", display_path(path), reason));
}

Error write_error(const fs::path& path, const std::string& reason) {
    return Error(ErrorKind::Write, std::format("could not write {}", display_path(path)),
                 std::format("could not write config to {}\n{}", display_path(path), reason));
}

Error parse_error(const fs::path& origin, const std::string& reason) {
    return Error(ErrorKind::Parse, std::format("could not parse {}", display_path(origin)),
                 std::format("could not parse {} as toml\n{}", display_path(origin), reason));
}

FileDialogOptions config_dialog_options(const FileDialogOptions::Mode mode, std::string title) {
    FileDialogOptions options;
    options.mode = mode;
    options.title = std::move(title);
    options.filter = FileFilter{kConfigFilterName, {kConfigExtension}};
    return options;
}

} // namespace

void Config::merge(const Config& other) {
    if (!other.exe.empty()) {
        exe = other.exe;
    }
    if (!other.arg.empty()) {
        arg = other.arg;
    }
}

std::string display_path(const fs::path& path) {
    return "'" + path.string() + "'";
}

std::string serialize_config(const Config& config) {
    if (!is_valid_utf8(config.exe)) {
        throw Error(ErrorKind::Serialize, "could not serialize config",
                    "could not serialize config\nexecutable path is not valid UTF-8");
    }
    for (size_t i = 0; i < config.arg.size(); ++i) {
        if (!is_valid_utf8(config.arg[i])) {
            throw Error(ErrorKind::Serialize, "could not serialize config",
                        std::format("could not serialize config\nargument {} is not valid UTF-8", i));
        }
    }

    std::string out;
    if (!config.exe.empty()) {
        out += "exe = " + config_format::quote_string(config.exe) + "\n";
    }
    if (!config.arg.empty()) {
        out += "arg = [\n";
        for (const auto& arg : config.arg) {
            out += "    " + config_format::quote_string(arg) + ",\n";
        }
        out += "]\n";
    }
    return out;
}

Config deserialize_config(std::string_view text, const fs::path& origin) {
    config_format::Table document;
    try {
        document = config_format::parse(text);
    } catch (const config_format::FormatError& e) {
        throw parse_error(origin, e.what());
    }

    using Type = config_format::Value::Type;
    Config config;

    if (const auto* exe = document.find("exe")) {
        if (exe->type != Type::String) {
            throw parse_error(origin, std::format("invalid type for 'exe': expected string, found {}",
                                                  config_format::type_name(exe->type)));
        }
        config.exe = exe->text;
    }

    if (const auto* arg = document.find("arg")) {
        if (arg->type != Type::Array) {
            throw parse_error(origin, std::format("invalid type for 'arg': expected array, found {}",
                                                  config_format::type_name(arg->type)));
        }
        config.arg.reserve(arg->array.size());
        for (size_t i = 0; i < arg->array.size(); ++i) {
            const auto& item = arg->array[i];
            if (item.type != Type::String) {
                throw parse_error(origin, std::format("invalid type for 'arg[{}]': expected string, found {}",
                                                      i, config_format::type_name(item.type)));
            }
            config.arg.push_back(item.text);
        }
    }

    for (const auto& key : document.entries | std::views::keys) {
        if (key != "exe" && key != "arg") {
            log::debug("ignoring unknown key '{}' in {}", key, display_path(origin));
        }
    }

    return config;
}

Config load_config(const fs::path& path) {
    std::error_code ec;
    if (fs::is_directory(path, ec)) {
        throw read_error(path, std::strerror(EISDIR));
    }

    std::ifstream file(path, std::ios::binary);
    if (!file) {
        throw read_error(path, std::strerror(errno));
    }

    std::ostringstream content;
    content << file.rdbuf();
    if (file.bad()) {
        throw read_error(path, std::strerror(errno));
    }

    return deserialize_config(content.str(), path);
}

void save_config(const Config& config, const fs::path& path) {
    const std::string content = serialize_config(config);

    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    if (!file) {
        throw write_error(path, std::strerror(errno));
    }

    file << content;
    file.close();
    if (file.fail()) {
        throw write_error(path, std::strerror(errno));
    }
}

fs::path pick_load_path(IFileDialog& dialog) {
    const auto selected = dialog.pick(config_dialog_options(FileDialogOptions::Mode::Open, "Open Config"));
    if (!selected) {
        throw Error(ErrorKind::NoSelection, "no file selected", "no file selected using dialog");
    }
    return *selected;
}

fs::path pick_save_path(IFileDialog& dialog) {
    const auto selected = dialog.pick(config_dialog_options(FileDialogOptions::Mode::Save, "Save Config"));
    if (!selected) {
        throw Error(ErrorKind::NoSelection, "no path entered", "no file selected using dialog");
    }
    return *selected;
}

ExitStatus run_config(const Config& config, IProcessRunner& runner) {
    log::info("running {} with {} argument(s)", display_path(config.exe), config.arg.size());
    return runner.run(config.exe, config.arg);
}

} // namespace cmdrun
