#pragma once

#include "interfaces/i_file_dialog.hpp"
#include "interfaces/i_process_runner.hpp"
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace cmdrun {

inline constexpr const char* kConfigExtension = "toml";
inline constexpr const char* kConfigFilterName = "TOML";

// Persisted executable + argument list
struct Config {
    std::string exe;
    std::vector<std::string> arg;

    bool operator==(const Config&) const = default;

    // Fields of other that are non-empty replace ours; empty ones leave ours untouched.
    void merge(const Config& other);
};

// Serialize to TOML; empty fields are omitted.
// Throws Error(ErrorKind::Serialize) if a field is not valid UTF-8.
[[nodiscard]] std::string serialize_config(const Config& config);

// Parse TOML text; unknown keys are ignored, missing keys stay empty.
// Throws Error(ErrorKind::Parse); origin is only used in messages.
[[nodiscard]] Config deserialize_config(std::string_view text, const std::filesystem::path& origin);

// Throws Error(ErrorKind::Read) or Error(ErrorKind::Parse)
[[nodiscard]] Config load_config(const std::filesystem::path& path);

// Throws Error(ErrorKind::Serialize) or Error(ErrorKind::Write)
void save_config(const Config& config, const std::filesystem::path& path);

// File pickers restricted to the config extension.
// Throw Error(ErrorKind::NoSelection) when cancelled.
[[nodiscard]] std::filesystem::path pick_load_path(IFileDialog& dialog);
[[nodiscard]] std::filesystem::path pick_save_path(IFileDialog& dialog);

// Run the configured executable and wait for it.
// Throws Error(ErrorKind::ProcessSpawn)
ExitStatus run_config(const Config& config, IProcessRunner& runner);

// Quoted path for status lines and messages
[[nodiscard]] std::string display_path(const std::filesystem::path& path);

} // namespace cmdrun
