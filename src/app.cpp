#include "app.hpp"
#include "errors.hpp"
#include "log.hpp"
#include "utf8.hpp"
#include <cassert>
#include <format>

namespace fs = std::filesystem;

namespace cmdrun {

namespace {

// Log an operation failure and turn it into the status line it maps to.
// A cancelled dialog is routine and only logged at debug level.
std::vector<Message> report(const Error& error) {
    if (error.kind() == ErrorKind::NoSelection) {
        log::debug("{}", error.what());
    } else {
        log::error("{}", error.what());
    }
    return {status(error.status())};
}

} // namespace

Application::Application(const Theme theme,
                         std::optional<fs::path> config_path,
                         const bool headless,
                         Config config,
                         Services services)
    : theme_(theme)
    , config_path_(std::move(config_path))
    , headless_(headless)
    , config_(std::move(config))
    , services_(std::move(services)) {

    assert(services_.file_dialog && "IFileDialog must not be null");
    assert(services_.process_runner && "IProcessRunner must not be null");
}

Message Application::initial_message() const {
    if (config_path_) {
        return msg::LoadConfig{*config_path_};
    }
    return msg::Reload{};
}

Task Application::update(Message message) {
    log::trace("update: {}", message_name(message));
    return std::visit([this](auto& m) { return handle(m); }, message);
}

std::optional<Config> Application::config_from_view(Task& failure) const {
    try {
        return view_state_.to_config();
    } catch (const Error& e) {
        failure = Task::batch(report(e));
        return std::nullopt;
    }
}

Task Application::handle(msg::SetTheme& message) {
    theme_ = message.theme;
    return Task::done(status(std::format("set theme to {}", to_string(theme_))));
}

Task Application::handle(msg::SetExecutable& message) {
    view_state_.executable = std::move(message.path);
    return Task::done(status(std::format("selected {}", view_state_.executable)));
}

Task Application::handle(msg::EditArguments& message) {
    view_state_.raw_arguments.perform(message.action);
    return Task::none();
}

Task Application::handle(msg::SetStatus& message) {
    view_state_.status = std::move(message.text);
    return Task::none();
}

Task Application::handle(msg::Run&) {
    Task failure;
    auto config = config_from_view(failure);
    if (!config) return failure;

    return Task::perform([config = std::move(*config), runner = services_.process_runner]() -> std::vector<Message> {
        try {
            const ExitStatus exit_status = run_config(config, *runner);
            log::info("{} finished with {}", display_path(config.exe), exit_status.to_string());
            return {status(std::format("process finished with {}", exit_status.to_string()))};
        } catch (const Error& e) {
            log::error("failed to run process\n{}", e.what());
            return {status(e.status())};
        }
    });
}

Task Application::handle(msg::OpenExecutableDialog&) {
    FileDialogOptions options;
    options.mode = FileDialogOptions::Mode::Open;
    options.title = "Select Executable";
    options.file_name = view_state_.executable;

    return Task::perform([options = std::move(options), dialog = services_.file_dialog]() -> std::vector<Message> {
        std::optional<fs::path> selected;
        try {
            selected = dialog->pick(options);
        } catch (const Error& e) {
            return report(e);
        }

        if (!selected) {
            return {status("no executable selected")};
        }

        std::string path = selected->string();
        if (!is_valid_utf8(path)) {
            log::warn("selected executable path is not valid UTF-8");
            return {status("selected path is not valid text")};
        }
        return {msg::SetExecutable{std::move(path)}};
    });
}

Task Application::handle(msg::LoadConfig& message) {
    return Task::perform([path = std::move(message.path)]() -> std::vector<Message> {
        try {
            Config loaded = load_config(path);
            return {msg::UpdateConfig{std::move(loaded), path}};
        } catch (const Error& e) {
            // Resync the view so it still shows the config in memory
            auto messages = report(e);
            messages.emplace_back(msg::Reload{});
            return messages;
        }
    });
}

Task Application::handle(msg::UpdateConfig& message) {
    config_.merge(message.config);
    return Task::batch({
        status(std::format("loaded config {}", display_path(message.path))),
        msg::Reload{},
    });
}

Task Application::handle(msg::SaveConfig& message) {
    return Task::perform([config = std::move(message.config), path = std::move(message.path)]() -> std::vector<Message> {
        try {
            save_config(config, path);
            return {status(std::format("saved to {}", display_path(path)))};
        } catch (const Error& e) {
            return report(e);
        }
    });
}

Task Application::handle(msg::LoadConfigDialog&) {
    return Task::perform([dialog = services_.file_dialog]() -> std::vector<Message> {
        try {
            return {msg::LoadConfig{pick_load_path(*dialog)}};
        } catch (const Error& e) {
            return report(e);
        }
    });
}

Task Application::handle(msg::SaveConfigDialog&) {
    Task failure;
    auto config = config_from_view(failure);
    if (!config) return failure;

    return Task::perform([config = std::move(*config), dialog = services_.file_dialog]() -> std::vector<Message> {
        try {
            return {msg::SaveConfig{config, pick_save_path(*dialog)}};
        } catch (const Error& e) {
            return report(e);
        }
    });
}

Task Application::handle(msg::Reload&) {
    view_state_.reload(config_);
    return Task::none();
}

Task Application::handle(msg::Exit&) {
    return Task::exit();
}

} // namespace cmdrun
