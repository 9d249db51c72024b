#pragma once

#include "../interfaces/i_file_dialog.hpp"
#include <string>
#include <vector>

namespace cmdrun {

// Native file picker driven through a helper program (zenity, then kdialog).
// A helper that is not installed is skipped; a helper that starts but fails
// is reported as Error(ErrorKind::Dialog).
class LinuxFileDialog : public IFileDialog {
public:
    struct Backend {
        enum class Kind { Zenity, KDialog };
        Kind kind = Kind::Zenity;
        std::string program;
    };

    LinuxFileDialog();
    explicit LinuxFileDialog(std::vector<Backend> backends);
    ~LinuxFileDialog() override = default;

    std::optional<std::filesystem::path> pick(const FileDialogOptions& options) override;

    [[nodiscard]] static std::vector<Backend> default_backends();

    // Command lines, exposed for tests
    [[nodiscard]] static std::vector<std::string> zenity_command(const std::string& program,
                                                                 const FileDialogOptions& options);
    [[nodiscard]] static std::vector<std::string> kdialog_command(const std::string& program,
                                                                  const FileDialogOptions& options);

private:
    std::vector<Backend> backends_;
};

} // namespace cmdrun
