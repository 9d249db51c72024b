#pragma once

#include "interfaces/i_process_runner.hpp"
#include <filesystem>

namespace cmdrun {

// Load the config at path and run it synchronously, without a window.
// Returns the exit code for this process (child's code, or 128 + signal).
// Throws Error on read, parse or spawn failure.
int run_headless(const std::filesystem::path& path, IProcessRunner& runner);

} // namespace cmdrun
