#include "view_state.hpp"
#include "../shell_words.hpp"

namespace cmdrun {

Config ViewState::to_config() const {
    Config config;
    config.arg = shell_words::split(raw_arguments.text());
    config.exe = executable;
    return config;
}

void ViewState::reload(const Config& config) {
    raw_arguments = TextBuffer(shell_words::join(config.arg));
    executable = config.exe;
}

} // namespace cmdrun
