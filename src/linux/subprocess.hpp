#pragma once

#include "../errors.hpp"
#include "../interfaces/i_process_runner.hpp"
#include <string>
#include <vector>

namespace cmdrun {

// Synchronous fork/exec helpers shared by the process runner and the file dialog.
//
// argv[0] is the program, looked up on PATH when it has no '/'.
// The child inherits environment, working directory and stderr.
// Exec failures come back through a close-on-exec pipe, so a missing
// program is an error here and never a child exit code.

// Error(ErrorKind::ProcessSpawn) with the errno that caused it
class SpawnError : public Error {
public:
    SpawnError(const std::string& program, int os_error);

    [[nodiscard]] int os_error() const noexcept { return os_error_; }

private:
    int os_error_;
};

struct CapturedOutput {
    ExitStatus status;
    std::string out;
};

// Child inherits stdin/stdout/stderr
ExitStatus run_subprocess(const std::vector<std::string>& argv);

// Child stdout is captured, stdin is /dev/null
CapturedOutput run_subprocess_capture(const std::vector<std::string>& argv);

} // namespace cmdrun
