#include "cli.hpp"

#include "test_support.hpp"

#include <initializer_list>
#include <iostream>
#include <string>
#include <vector>

using namespace cmdrun;

namespace {

CliOptions parse(std::initializer_list<const char*> args) {
    std::vector<const char*> argv = {"cmdrun"};
    argv.insert(argv.end(), args.begin(), args.end());
    return parse_cli(static_cast<int>(argv.size()), argv.data());
}

// Error message, or empty when the arguments are accepted
std::string usage_error(std::initializer_list<const char*> args) {
    try {
        (void)parse(args);
    } catch (const CliError& e) {
        return e.what();
    }
    return {};
}

bool contains(const std::string& haystack, const std::string& needle) {
    return haystack.find(needle) != std::string::npos;
}

} // namespace

int main() {
    {
        const CliOptions o = parse({});
        assert(o.theme == Theme::Dark);
        assert(!o.theme_given);
        assert(!o.config_path);
        assert(!o.skip);
        assert(o.config == Config{});
    }

    {
        const CliOptions o = parse({"-t", "light", "--config", "a.toml", "-e", "/bin/echo", "x", "y z"});
        assert(o.theme == Theme::Light);
        assert(o.config_path && *o.config_path == "a.toml");
        assert(o.config == (Config{"/bin/echo", {"x", "y z"}}));
    }

    {
        const CliOptions o = parse({"--theme=dark", "--exe=/bin/ls", "--config=c.toml"});
        assert(o.theme == Theme::Dark && o.theme_given);
        assert(o.config.exe == "/bin/ls");
        assert(*o.config_path == "c.toml");
    }

    {
        // Everything after -- is positional
        const CliOptions o = parse({"-e", "prog", "--", "--skip", "-t", "-"});
        assert(!o.skip);
        assert(o.config.arg == (std::vector<std::string>{"--skip", "-t", "-"}));
    }

    {
        const CliOptions o = parse({"--skip", "-c", "run.toml"});
        assert(o.skip);
        assert(*o.config_path == "run.toml");
    }

    assert(parse({"-h"}).show_help);
    assert(parse({"--version"}).show_version);
    // Help wins over otherwise invalid combinations
    assert(parse({"--skip", "--help"}).show_help);

    assert(contains(usage_error({"--skip"}), "requires '--config"));
    assert(contains(usage_error({"--skip", "-c", "a", "-e", "x"}), "cannot be used with '--exe'"));
    assert(contains(usage_error({"--skip", "-c", "a", "arg"}), "positional arguments"));
    assert(contains(usage_error({"--skip", "-c", "a", "-t", "dark"}), "cannot be used with '--theme'"));
    assert(contains(usage_error({"-t", "blue"}), "invalid value 'blue'"));
    assert(contains(usage_error({"--config"}), "requires a value"));
    assert(contains(usage_error({"--config="}), "non-empty path"));
    assert(contains(usage_error({"--bogus"}), "unexpected argument '--bogus'"));
    assert(contains(usage_error({"--skip=yes", "-c", "a"}), "does not take a value"));

    assert(contains(usage_text(), "--skip"));
    assert(contains(usage_text(), "CMDRUN_LOG"));

    std::cout << "ok\n";
    return 0;
}
