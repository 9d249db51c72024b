#pragma once

#include "../config.hpp"
#include "../text_buffer.hpp"
#include <string>

namespace cmdrun {

// Editable mirror of a Config shown by the main window.
// raw_arguments only resyncs with the Config on reload().
struct ViewState {
    std::string executable;
    TextBuffer raw_arguments;
    std::string status;

    // Tokenize raw_arguments and combine with executable.
    // Throws Error(ErrorKind::ArgumentParse) on malformed quoting.
    [[nodiscard]] Config to_config() const;

    void reload(const Config& config);
};

} // namespace cmdrun
