#include "linux_file_dialog.hpp"
#include "subprocess.hpp"
#include "../log.hpp"
#include <cerrno>
#include <format>

namespace cmdrun {

namespace {

// Helpers exit with 1 when the user cancels
constexpr int kCancelled = 1;

std::string patterns(const FileFilter& filter) {
    std::string out;
    for (const auto& ext : filter.extensions) {
        if (!out.empty()) out.push_back(' ');
        out += "*." + ext;
    }
    return out;
}

std::string strip_trailing_newlines(std::string text) {
    while (!text.empty() && (text.back() == '\n' || text.back() == '\r')) {
        text.pop_back();
    }
    return text;
}

} // namespace

LinuxFileDialog::LinuxFileDialog()
    : backends_(default_backends()) {}

LinuxFileDialog::LinuxFileDialog(std::vector<Backend> backends)
    : backends_(std::move(backends)) {}

std::vector<LinuxFileDialog::Backend> LinuxFileDialog::default_backends() {
    return {
        {Backend::Kind::Zenity, "zenity"},
        {Backend::Kind::KDialog, "kdialog"},
    };
}

std::vector<std::string> LinuxFileDialog::zenity_command(const std::string& program,
                                                         const FileDialogOptions& options) {
    std::vector<std::string> argv = {program, "--file-selection"};
    if (options.mode == FileDialogOptions::Mode::Save) {
        argv.emplace_back("--save");
    }
    if (!options.title.empty()) {
        argv.push_back("--title=" + options.title);
    }
    if (!options.file_name.empty()) {
        argv.push_back("--filename=" + options.file_name);
    }
    if (options.filter) {
        argv.push_back(std::format("--file-filter={} | {}", options.filter->name, patterns(*options.filter)));
    }
    return argv;
}

std::vector<std::string> LinuxFileDialog::kdialog_command(const std::string& program,
                                                          const FileDialogOptions& options) {
    std::vector<std::string> argv = {program};
    if (!options.title.empty()) {
        argv.emplace_back("--title");
        argv.push_back(options.title);
    }
    argv.emplace_back(options.mode == FileDialogOptions::Mode::Save ? "--getsavefilename" : "--getopenfilename");
    argv.push_back(options.file_name.empty() ? std::string(".") : options.file_name);
    if (options.filter) {
        argv.push_back(std::format("{} ({})", options.filter->name, patterns(*options.filter)));
    }
    return argv;
}

std::optional<std::filesystem::path> LinuxFileDialog::pick(const FileDialogOptions& options) {
    for (const auto& backend : backends_) {
        const auto argv = backend.kind == Backend::Kind::Zenity
            ? zenity_command(backend.program, options)
            : kdialog_command(backend.program, options);

        CapturedOutput result;
        try {
            result = run_subprocess_capture(argv);
        } catch (const SpawnError& e) {
            if (e.os_error() == ENOENT || e.os_error() == EACCES) {
                log::debug("file dialog helper '{}' not available", backend.program);
                continue;
            }
            throw Error(ErrorKind::Dialog, "could not open file dialog",
                        std::format("could not open file dialog\n{}", e.what()));
        }

        if (result.status.exited && result.status.code == kCancelled) {
            return std::nullopt;
        }
        if (!result.status.success()) {
            throw Error(ErrorKind::Dialog, "could not open file dialog",
                        std::format("could not open file dialog\n'{}' finished with {}",
                                    backend.program, result.status.to_string()));
        }

        std::string selected = strip_trailing_newlines(std::move(result.out));
        if (selected.empty()) {
            return std::nullopt;
        }
        return std::filesystem::path(selected);
    }

    throw Error(ErrorKind::Dialog, "could not open file dialog",
                "could not open file dialog\nno file dialog helper found (install zenity or kdialog)");
}

} // namespace cmdrun
