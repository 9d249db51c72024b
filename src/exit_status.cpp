#include "interfaces/i_process_runner.hpp"
#include <cstring>
#include <format>

namespace cmdrun {

std::string ExitStatus::to_string() const {
    if (exited) {
        return std::format("exit status: {}", code);
    }

    std::string text = std::format("signal: {}", signal);
    if (const char* abbrev = sigabbrev_np(signal)) {
        text += std::format(" (SIG{})", abbrev);
    }
    if (core_dumped) {
        text += " (core dumped)";
    }
    return text;
}

} // namespace cmdrun
