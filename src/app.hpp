#pragma once

#include "config.hpp"
#include "interfaces/i_file_dialog.hpp"
#include "interfaces/i_process_runner.hpp"
#include "messages.hpp"
#include "task.hpp"
#include "viewmodels/view_state.hpp"
#include <filesystem>
#include <memory>
#include <optional>

namespace cmdrun {

// Platform services used by deferred work. Shared ownership: work items
// keep them alive while running on worker threads.
struct Services {
    std::shared_ptr<IFileDialog> file_dialog;
    std::shared_ptr<IProcessRunner> process_runner;
};

// Application state. Only update() mutates it, one message at a time.
class Application {
public:
    // Precondition: both services != nullptr
    Application(Theme theme,
                std::optional<std::filesystem::path> config_path,
                bool headless,
                Config config,
                Services services);

    // Load the startup config if one was given, otherwise reload the view
    [[nodiscard]] Message initial_message() const;

    Task update(Message message);

    [[nodiscard]] Theme theme() const { return theme_; }
    [[nodiscard]] const std::optional<std::filesystem::path>& config_path() const { return config_path_; }
    [[nodiscard]] bool headless() const { return headless_; }
    [[nodiscard]] const Config& config() const { return config_; }
    [[nodiscard]] const ViewState& view_state() const { return view_state_; }

private:
    Task handle(msg::SetTheme& message);
    Task handle(msg::SetExecutable& message);
    Task handle(msg::EditArguments& message);
    Task handle(msg::SetStatus& message);
    Task handle(msg::Run& message);
    Task handle(msg::OpenExecutableDialog& message);
    Task handle(msg::LoadConfig& message);
    Task handle(msg::UpdateConfig& message);
    Task handle(msg::SaveConfig& message);
    Task handle(msg::LoadConfigDialog& message);
    Task handle(msg::SaveConfigDialog& message);
    Task handle(msg::Reload& message);
    Task handle(msg::Exit& message);

    // view_state_ -> Config, or the status message to show instead
    [[nodiscard]] std::optional<Config> config_from_view(Task& failure) const;

    Theme theme_;
    std::optional<std::filesystem::path> config_path_;
    bool headless_;
    Config config_;
    ViewState view_state_;
    Services services_;
};

} // namespace cmdrun
