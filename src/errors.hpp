#pragma once

#include <stdexcept>
#include <string>

namespace cmdrun {

enum class ErrorKind {
    Read,
    Parse,
    Serialize,
    Write,
    NoSelection,
    ArgumentParse,
    ProcessSpawn,
    Dialog
};

[[nodiscard]] const char* to_string(ErrorKind kind);

// Error raised by config, dialog, tokenizer and process operations.
// what() carries the full diagnostic including the root cause,
// status() the short line shown in the status bar.
class Error : public std::runtime_error {
public:
    Error(ErrorKind kind, std::string status, const std::string& diagnostic);

    [[nodiscard]] ErrorKind kind() const noexcept { return kind_; }
    [[nodiscard]] const std::string& status() const noexcept { return status_; }

private:
    ErrorKind kind_;
    std::string status_;
};

} // namespace cmdrun
