#include "app.hpp"
#include "errors.hpp"
#include "log.hpp"

#include "fakes.hpp"
#include "test_support.hpp"

#include <deque>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

using namespace cmdrun;
using cmdrun_test::FakeFileDialog;
using cmdrun_test::FakeProcessRunner;

namespace {

struct Fixture {
    std::shared_ptr<FakeFileDialog> dialog = std::make_shared<FakeFileDialog>();
    std::shared_ptr<FakeProcessRunner> runner = std::make_shared<FakeProcessRunner>();
    Application app;

    explicit Fixture(Config config = {}, std::optional<std::filesystem::path> path = std::nullopt,
                     std::shared_ptr<FakeProcessRunner> process_runner = std::make_shared<FakeProcessRunner>())
        : runner(std::move(process_runner))
        , app(Theme::Dark, std::move(path), false, std::move(config), Services{dialog, runner}) {}

    // Feeds message and every follow-up through update, running deferred
    // work inline. Returns the names of the handled messages.
    std::vector<std::string> send(Message message) {
        std::vector<std::string> handled;
        std::deque<Message> queue;
        queue.push_back(std::move(message));
        while (!queue.empty()) {
            Message next = std::move(queue.front());
            queue.pop_front();
            handled.emplace_back(message_name(next));

            Task task = app.update(std::move(next));
            for (auto& m : task.take_immediate()) queue.push_back(std::move(m));
            for (auto& work : task.take_deferred()) {
                for (auto& m : work()) queue.push_back(std::move(m));
            }
            if (task.exit_requested()) handled.emplace_back("<exit>");
        }
        return handled;
    }

    [[nodiscard]] const std::string& status() const { return app.view_state().status; }
};

void set_arguments(Fixture& f, const std::string& text) {
    f.send(msg::EditArguments{EditAction::replace_all(text)});
}

} // namespace

int main() {
    log::set_level(log::Level::Off);

    cmdrun_test::TempDir dir("cmdrun_test_update");

    {
        // Initial message depends on the startup config path
        Fixture plain;
        assert(std::holds_alternative<msg::Reload>(plain.app.initial_message()));

        Fixture with_path(Config{}, std::filesystem::path("start.toml"));
        const Message initial = with_path.app.initial_message();
        assert(std::holds_alternative<msg::LoadConfig>(initial));
        assert(std::get<msg::LoadConfig>(initial).path == "start.toml");
    }

    {
        // Initial config is shown after Reload
        Fixture f(Config{"run.exe", {"--flag", "value with spaces"}});
        f.send(msg::Reload{});
        assert(f.app.view_state().executable == "run.exe");
        assert(f.app.view_state().raw_arguments.text() == "--flag \"value with spaces\"");
    }

    {
        Fixture f;
        const auto handled = f.send(msg::SetTheme{Theme::Light});
        assert(f.app.theme() == Theme::Light);
        assert(f.status() == "set theme to Light");
        assert(handled == (std::vector<std::string>{"SetTheme", "SetStatus"}));
    }

    {
        Fixture f;
        f.send(msg::SetExecutable{"/usr/bin/env"});
        assert(f.app.view_state().executable == "/usr/bin/env");
        assert(f.status() == "selected /usr/bin/env");

        // The persisted config only changes through UpdateConfig
        assert(f.app.config().exe.empty());
    }

    {
        Fixture f;
        f.send(msg::EditArguments{EditAction::insert(0, "a")});
        f.send(msg::EditArguments{EditAction::insert(1, " b")});
        assert(f.app.view_state().raw_arguments.text() == "a b");

        const auto handled = f.send(msg::SetStatus{"hello"});
        assert(f.status() == "hello");
        assert(handled.size() == 1);
    }

    {
        // UpdateConfig merges: empty incoming fields do not overwrite
        Fixture f(Config{"a", {"x"}});
        const auto handled = f.send(msg::UpdateConfig{Config{"", {"y"}}, "in.toml"});
        assert(f.app.config() == (Config{"a", {"y"}}));
        assert(handled == (std::vector<std::string>{"UpdateConfig", "SetStatus", "Reload"}));
        assert(f.status() == "loaded config 'in.toml'");
        assert(f.app.view_state().executable == "a");
        assert(f.app.view_state().raw_arguments.text() == "y");
    }

    {
        // LoadConfig from disk goes through UpdateConfig and Reload
        const auto path = dir.path() / "load.toml";
        cmdrun_test::write_file(path, "exe = \"/bin/echo\"\narg = [\"hi there\"]\n");

        Fixture f(Config{}, path);
        const auto handled = f.send(f.app.initial_message());
        assert(handled == (std::vector<std::string>{"LoadConfig", "UpdateConfig", "SetStatus", "Reload"}));
        assert(f.app.config() == (Config{"/bin/echo", {"hi there"}}));
        assert(f.app.view_state().raw_arguments.text() == "\"hi there\"");
        assert(f.status() == "loaded config " + display_path(path));
    }

    {
        // Load failures become a status line, keep the config and resync the view
        Fixture f(Config{"keep", {"me"}});
        f.send(msg::Reload{});
        f.send(msg::SetExecutable{"edited"});
        const auto missing = dir.path() / "missing.toml";
        const auto handled = f.send(msg::LoadConfig{missing});
        assert(handled == (std::vector<std::string>{"LoadConfig", "SetStatus", "Reload"}));
        assert(f.status() == "could not read " + display_path(missing));
        assert(f.app.config() == (Config{"keep", {"me"}}));
        assert(f.app.view_state().executable == "keep");

        const auto broken = dir.path() / "broken.toml";
        cmdrun_test::write_file(broken, "exe = [\n");
        f.send(msg::LoadConfig{broken});
        assert(f.status() == "could not parse " + display_path(broken));
    }

    {
        // Startup with a command line config and an unreadable config file:
        // the view still shows the command line config, and Run uses it
        const auto missing = dir.path() / "startup-missing.toml";
        Fixture f(Config{"/bin/ls", {"-l"}}, missing);
        const auto handled = f.send(f.app.initial_message());
        assert(handled == (std::vector<std::string>{"LoadConfig", "SetStatus", "Reload"}));
        assert(f.status() == "could not read " + display_path(missing));
        assert(f.app.view_state().executable == "/bin/ls");
        assert(f.app.view_state().raw_arguments.text() == "-l");

        f.send(msg::Run{});
        const auto calls = f.runner->calls();
        assert(calls.size() == 1);
        assert(calls[0].program == "/bin/ls");
        assert(calls[0].args == std::vector<std::string>{"-l"});
    }

    {
        Fixture f;
        const auto path = dir.path() / "save.toml";
        f.send(msg::SaveConfig{Config{"/bin/true", {"a"}}, path});
        assert(f.status() == "saved to " + display_path(path));
        assert(load_config(path) == (Config{"/bin/true", {"a"}}));

        const auto bad = dir.path() / "no-dir" / "save.toml";
        f.send(msg::SaveConfig{Config{"x", {}}, bad});
        assert(f.status() == "could not write " + display_path(bad));
    }

    {
        // Run converts the view and hands exe + args to the runner
        Fixture f(Config{}, std::nullopt, std::make_shared<FakeProcessRunner>(ExitStatus{true, 3, 0, false}));
        f.send(msg::SetExecutable{"/bin/prog"});
        set_arguments(f, "--flag \"value with spaces\"");
        f.send(msg::Run{});

        const auto calls = f.runner->calls();
        assert(calls.size() == 1);
        assert(calls[0].program == "/bin/prog");
        assert(calls[0].args == (std::vector<std::string>{"--flag", "value with spaces"}));
        assert(f.status() == "process finished with exit status: 3");
    }

    {
        Fixture f(Config{}, std::nullopt, std::make_shared<FakeProcessRunner>(ExitStatus{false, 0, 9, false}));
        f.send(msg::SetExecutable{"/bin/prog"});
        f.send(msg::Run{});
        assert(f.status() == "process finished with signal: 9 (SIGKILL)");
    }

    {
        // Spawn failure is a status message, not a crash
        Fixture f;
        f.send(msg::SetExecutable{"missing"});
        f.send(msg::Run{});
        assert(f.status() == "could not run 'missing': No such file or directory");
    }

    {
        // Malformed arguments stop Run and SaveConfigDialog before any work
        Fixture f;
        f.send(msg::SetExecutable{"/bin/prog"});
        set_arguments(f, "'unterminated");

        const auto run = f.send(msg::Run{});
        assert(run == (std::vector<std::string>{"Run", "SetStatus"}));
        assert(f.status() == "could not parse arguments");
        assert(f.runner->calls().empty());

        f.send(msg::SetStatus{""});
        const auto save = f.send(msg::SaveConfigDialog{});
        assert(save == (std::vector<std::string>{"SaveConfigDialog", "SetStatus"}));
        assert(f.status() == "could not parse arguments");
        assert(f.dialog->requests().empty());
        assert(f.app.view_state().raw_arguments.text() == "'unterminated");
    }

    {
        // Executable picker
        Fixture f;
        f.send(msg::SetExecutable{"current"});
        f.dialog->push_answer(std::optional<std::filesystem::path>("/opt/tool"));
        const auto handled = f.send(msg::OpenExecutableDialog{});
        assert(handled == (std::vector<std::string>{"OpenExecutableDialog", "SetExecutable", "SetStatus"}));
        assert(f.app.view_state().executable == "/opt/tool");
        assert(f.status() == "selected /opt/tool");

        const auto requests = f.dialog->requests();
        assert(requests.size() == 1);
        assert(requests[0].mode == FileDialogOptions::Mode::Open);
        assert(requests[0].file_name == "current");
        assert(!requests[0].filter);

        f.dialog->push_answer(std::optional<std::filesystem::path>());
        f.send(msg::OpenExecutableDialog{});
        assert(f.status() == "no executable selected");
        assert(f.app.view_state().executable == "/opt/tool");

        f.dialog->push_answer(std::optional<std::filesystem::path>("/opt/bad\xFF"));
        f.send(msg::OpenExecutableDialog{});
        assert(f.status() == "selected path is not valid text");

        f.dialog->push_answer(Error(ErrorKind::Dialog, "could not open file dialog", "no helper"));
        f.send(msg::OpenExecutableDialog{});
        assert(f.status() == "could not open file dialog");
    }

    {
        // Load dialog
        const auto path = dir.path() / "picked.toml";
        cmdrun_test::write_file(path, "exe = \"picked\"\n");

        Fixture f(Config{"old", {"kept"}});
        f.dialog->push_answer(std::optional<std::filesystem::path>(path));
        const auto handled = f.send(msg::LoadConfigDialog{});
        assert(handled == (std::vector<std::string>{
            "LoadConfigDialog", "LoadConfig", "UpdateConfig", "SetStatus", "Reload"}));
        assert(f.app.config() == (Config{"picked", {"kept"}}));

        const auto requests = f.dialog->requests();
        assert(requests[0].mode == FileDialogOptions::Mode::Open);
        assert(requests[0].filter && requests[0].filter->extensions == std::vector<std::string>{"toml"});

        f.dialog->push_answer(std::optional<std::filesystem::path>());
        f.send(msg::LoadConfigDialog{});
        assert(f.status() == "no file selected");
    }

    {
        // Save dialog saves the converted view, not the stored config
        const auto path = dir.path() / "dialog-save.toml";
        Fixture f(Config{"stored", {}});
        f.send(msg::SetExecutable{"edited"});
        set_arguments(f, "one 'two three'");

        f.dialog->push_answer(std::optional<std::filesystem::path>(path));
        const auto handled = f.send(msg::SaveConfigDialog{});
        assert(handled == (std::vector<std::string>{"SaveConfigDialog", "SaveConfig", "SetStatus"}));
        assert(load_config(path) == (Config{"edited", {"one", "two three"}}));
        assert(f.status() == "saved to " + display_path(path));
        assert(f.dialog->requests()[0].mode == FileDialogOptions::Mode::Save);

        f.dialog->push_answer(std::optional<std::filesystem::path>());
        f.send(msg::SaveConfigDialog{});
        assert(f.status() == "no path entered");
    }

    {
        Fixture f;
        const auto handled = f.send(msg::Exit{});
        assert(handled == (std::vector<std::string>{"Exit", "<exit>"}));
    }

    std::cout << "ok\n";
    return 0;
}
