#include "headless.hpp"
#include "config.hpp"
#include "log.hpp"

namespace cmdrun {

int run_headless(const std::filesystem::path& path, IProcessRunner& runner) {
    log::debug("running {} headless", display_path(path));

    const Config config = load_config(path);
    const ExitStatus status = run_config(config, runner);

    log::info("process finished with {}", status.to_string());
    return status.process_exit_code();
}

} // namespace cmdrun
