#pragma once

#include "../interfaces/i_process_runner.hpp"

namespace cmdrun {

class LinuxProcessRunner : public IProcessRunner {
public:
    LinuxProcessRunner() = default;
    ~LinuxProcessRunner() override = default;

    ExitStatus run(const std::string& program, const std::vector<std::string>& args) override;
};

} // namespace cmdrun
