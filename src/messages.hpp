#pragma once

#include "config.hpp"
#include "text_buffer.hpp"
#include <filesystem>
#include <string>
#include <variant>

namespace cmdrun {

enum class Theme { Light, Dark };

[[nodiscard]] const char* to_string(Theme theme);

namespace msg {

struct SetTheme { Theme theme = Theme::Dark; };
struct SetExecutable { std::string path; };
struct EditArguments { EditAction action; };
struct SetStatus { std::string text; };
struct Run {};
struct OpenExecutableDialog {};
struct LoadConfig { std::filesystem::path path; };
struct UpdateConfig { Config config; std::filesystem::path path; };
struct SaveConfig { Config config; std::filesystem::path path; };
struct LoadConfigDialog {};
struct SaveConfigDialog {};
struct Reload {};
struct Exit {};

} // namespace msg

// Every event the update function accepts
using Message = std::variant<
    msg::SetTheme,
    msg::SetExecutable,
    msg::EditArguments,
    msg::SetStatus,
    msg::Run,
    msg::OpenExecutableDialog,
    msg::LoadConfig,
    msg::UpdateConfig,
    msg::SaveConfig,
    msg::LoadConfigDialog,
    msg::SaveConfigDialog,
    msg::Reload,
    msg::Exit>;

[[nodiscard]] const char* message_name(const Message& message);

// Shorthand for a status line update
[[nodiscard]] inline Message status(std::string text) {
    return msg::SetStatus{std::move(text)};
}

} // namespace cmdrun
