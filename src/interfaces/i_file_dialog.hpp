#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace cmdrun {

struct FileFilter {
    std::string name;                     // e.g. "TOML"
    std::vector<std::string> extensions;  // without dot, e.g. {"toml"}
};

struct FileDialogOptions {
    enum class Mode { Open, Save };

    Mode mode = Mode::Open;
    std::string title;
    std::string file_name;                // initial selection
    std::optional<FileFilter> filter;     // nullopt: any file
};

class IFileDialog {
public:
    virtual ~IFileDialog() = default;

    // Blocks until the user picks a path or cancels (nullopt).
    // Throws Error(ErrorKind::Dialog) when no picker can be shown.
    virtual std::optional<std::filesystem::path> pick(const FileDialogOptions& options) = 0;
};

} // namespace cmdrun
