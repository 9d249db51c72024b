#include "../platform_factory.hpp"

#include "linux_file_dialog.hpp"
#include "linux_process_runner.hpp"

namespace cmdrun {

std::shared_ptr<IProcessRunner> make_process_runner() {
    return std::make_shared<LinuxProcessRunner>();
}

std::shared_ptr<IFileDialog> make_file_dialog() {
    return std::make_shared<LinuxFileDialog>();
}

} // namespace cmdrun
