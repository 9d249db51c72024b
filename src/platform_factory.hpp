#pragma once

#include "interfaces/i_file_dialog.hpp"
#include "interfaces/i_process_runner.hpp"
#include <memory>

namespace cmdrun {

// Factory functions to create platform-specific services.
// Implemented per-platform; current build provides Linux implementations.
// Shared ownership: background work keeps them alive while it runs.
std::shared_ptr<IProcessRunner> make_process_runner();
std::shared_ptr<IFileDialog> make_file_dialog();

} // namespace cmdrun
