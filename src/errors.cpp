#include "errors.hpp"

namespace cmdrun {

const char* to_string(const ErrorKind kind) {
    switch (kind) {
        case ErrorKind::Read: return "read";
        case ErrorKind::Parse: return "parse";
        case ErrorKind::Serialize: return "serialize";
        case ErrorKind::Write: return "write";
        case ErrorKind::NoSelection: return "no selection";
        case ErrorKind::ArgumentParse: return "argument parse";
        case ErrorKind::ProcessSpawn: return "process spawn";
        case ErrorKind::Dialog: return "dialog";
    }
    return "unknown";
}

Error::Error(const ErrorKind kind, std::string status, const std::string& diagnostic)
    : std::runtime_error(diagnostic)
    , kind_(kind)
    , status_(std::move(status)) {}

} // namespace cmdrun
