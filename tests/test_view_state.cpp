#include "viewmodels/view_state.hpp"
#include "errors.hpp"
#include "shell_words.hpp"

#include "test_support.hpp"

#include <iostream>
#include <string>
#include <vector>

using cmdrun::Config;
using cmdrun::EditAction;
using cmdrun::ViewState;

int main() {
    {
        ViewState view;
        view.reload(Config{"run.exe", {"--flag", "value with spaces"}});
        assert(view.executable == "run.exe");
        assert(view.raw_arguments.text() == "--flag \"value with spaces\"");

        const Config config = view.to_config();
        assert(config.exe == "run.exe");
        assert(config.arg == (std::vector<std::string>{"--flag", "value with spaces"}));
    }

    {
        // join then split is identity
        const std::vector<std::string> args = {"", "a b", "it's", "\"q\"", "back\\slash", "$VAR", "x=1,y=2"};
        ViewState view;
        view.reload(Config{"/bin/prog", args});
        assert(view.to_config() == (Config{"/bin/prog", args}));
    }

    {
        // User edits are tokenized like a shell line
        ViewState view;
        view.executable = "/bin/echo";
        view.raw_arguments.perform(EditAction::replace_all("one 'two three'\n  four\\ five # note\nsix"));
        const Config config = view.to_config();
        assert(config.arg == (std::vector<std::string>{"one", "two three", "four five", "six"}));
    }

    {
        // Unterminated quote fails and leaves the view untouched
        ViewState view;
        view.executable = "x";
        view.status = "before";
        view.raw_arguments.perform(EditAction::replace_all("--name \"unterminated"));

        bool threw = false;
        try {
            (void)view.to_config();
        } catch (const cmdrun::Error& e) {
            threw = true;
            assert(e.kind() == cmdrun::ErrorKind::ArgumentParse);
            assert(e.status() == "could not parse arguments");
        }
        assert(threw);
        assert(view.executable == "x");
        assert(view.status == "before");
        assert(view.raw_arguments.text() == "--name \"unterminated");
    }

    {
        // Reload discards edits and the empty config clears the view
        ViewState view;
        view.executable = "edited";
        view.raw_arguments.perform(EditAction::replace_all("edited args"));
        view.reload(Config{});
        assert(view.executable.empty());
        assert(view.raw_arguments.empty());
        assert(view.to_config() == Config{});
    }

    std::cout << "ok\n";
    return 0;
}
