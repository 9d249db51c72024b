#include "linux_process_runner.hpp"
#include "subprocess.hpp"

namespace cmdrun {

ExitStatus LinuxProcessRunner::run(const std::string& program, const std::vector<std::string>& args) {
    std::vector<std::string> argv;
    argv.reserve(args.size() + 1);
    argv.push_back(program);
    argv.insert(argv.end(), args.begin(), args.end());
    return run_subprocess(argv);
}

} // namespace cmdrun
