#pragma once

#include <string>
#include <vector>

namespace cmdrun {

// How a child process ended
struct ExitStatus {
    bool exited = true;   // false: terminated by a signal
    int code = 0;         // exit code when exited
    int signal = 0;       // terminating signal otherwise
    bool core_dumped = false;

    [[nodiscard]] bool success() const { return exited && code == 0; }

    // Exit code to hand on when this process mirrors the child (128+signal for signals)
    [[nodiscard]] int process_exit_code() const { return exited ? code : 128 + signal; }

    // "exit status: 3" or "signal: 9 (SIGKILL)"
    [[nodiscard]] std::string to_string() const;
};

class IProcessRunner {
public:
    virtual ~IProcessRunner() = default;

    // Spawn program with args (PATH lookup when program has no '/'), inheriting
    // environment, working directory and stdio, and wait for it to finish.
    // Throws Error(ErrorKind::ProcessSpawn) when the program cannot be started.
    virtual ExitStatus run(const std::string& program, const std::vector<std::string>& args) = 0;
};

} // namespace cmdrun
