#include "errors.hpp"
#include "log.hpp"
#include "linux/linux_file_dialog.hpp"

#include "test_support.hpp"

#include <filesystem>
#include <iostream>
#include <string>
#include <vector>

using namespace cmdrun;
namespace fs = std::filesystem;

namespace {

// Shell script standing in for a dialog helper: logs its arguments one per
// line, prints the given selection and exits with the given code.
fs::path make_helper(const fs::path& dir, const std::string& name, const std::string& selection, int code) {
    const fs::path script = dir / name;
    const fs::path log = dir / (name + ".args");
    cmdrun_test::write_file(script,
        "#!/bin/sh\n"
        "for a in \"$@\"; do printf '%s\\n' \"$a\"; done > '" + log.string() + "'\n"
        "printf '%s\\n' '" + selection + "'\n"
        "exit " + std::to_string(code) + "\n");
    fs::permissions(script, fs::perms::owner_all);
    return script;
}

std::string logged_args(const fs::path& dir, const std::string& name) {
    return cmdrun_test::read_file(dir / (name + ".args"));
}

FileDialogOptions save_toml() {
    FileDialogOptions options;
    options.mode = FileDialogOptions::Mode::Save;
    options.title = "Save Config";
    options.filter = FileFilter{"TOML", {"toml"}};
    return options;
}

} // namespace

int main() {
    log::set_level(log::Level::Off);
    cmdrun_test::TempDir dir("cmdrun_test_file_dialog");

    using Backend = LinuxFileDialog::Backend;

    {
        const auto argv = LinuxFileDialog::zenity_command("zenity", save_toml());
        assert(argv == (std::vector<std::string>{
            "zenity", "--file-selection", "--save", "--title=Save Config", "--file-filter=TOML | *.toml"}));

        FileDialogOptions open;
        open.title = "Select Executable";
        open.file_name = "/usr/bin/env";
        assert(LinuxFileDialog::zenity_command("zenity", open) == (std::vector<std::string>{
            "zenity", "--file-selection", "--title=Select Executable", "--filename=/usr/bin/env"}));
    }

    {
        assert(LinuxFileDialog::kdialog_command("kdialog", save_toml()) == (std::vector<std::string>{
            "kdialog", "--title", "Save Config", "--getsavefilename", ".", "TOML (*.toml)"}));

        FileDialogOptions open;
        open.file_name = "/usr/bin/env";
        assert(LinuxFileDialog::kdialog_command("kdialog", open) == (std::vector<std::string>{
            "kdialog", "--getopenfilename", "/usr/bin/env"}));
    }

    {
        // Selection is returned without the trailing newline
        const auto zenity = make_helper(dir.path(), "zenity-ok", "/tmp/picked file.toml", 0);
        LinuxFileDialog dialog(std::vector<Backend>{{Backend::Kind::Zenity, zenity.string()}});
        const auto picked = dialog.pick(save_toml());
        assert(picked && *picked == "/tmp/picked file.toml");
        assert(logged_args(dir.path(), "zenity-ok") ==
               "--file-selection\n--save\n--title=Save Config\n--file-filter=TOML | *.toml\n");
    }

    {
        // Exit code 1 means cancelled
        const auto zenity = make_helper(dir.path(), "zenity-cancel", "", 1);
        LinuxFileDialog dialog(std::vector<Backend>{{Backend::Kind::Zenity, zenity.string()}});
        assert(!dialog.pick(save_toml()));
    }

    {
        // Missing helpers are skipped
        const auto kdialog = make_helper(dir.path(), "kdialog-ok", "/home/me/conf.toml", 0);
        LinuxFileDialog dialog(std::vector<Backend>{
            {Backend::Kind::Zenity, (dir.path() / "not-installed").string()},
            {Backend::Kind::KDialog, kdialog.string()},
        });
        const auto picked = dialog.pick(save_toml());
        assert(picked && *picked == "/home/me/conf.toml");
        assert(logged_args(dir.path(), "kdialog-ok") ==
               "--title\nSave Config\n--getsavefilename\n.\nTOML (*.toml)\n");
    }

    {
        // No helper at all
        LinuxFileDialog dialog(std::vector<Backend>{{Backend::Kind::Zenity, (dir.path() / "not-installed").string()}});
        bool threw = false;
        try {
            (void)dialog.pick(save_toml());
        } catch (const Error& e) {
            threw = true;
            assert(e.kind() == ErrorKind::Dialog);
            assert(e.status() == "could not open file dialog");
        }
        assert(threw);
    }

    {
        // Helper that fails some other way
        const auto zenity = make_helper(dir.path(), "zenity-broken", "", 5);
        LinuxFileDialog dialog(std::vector<Backend>{{Backend::Kind::Zenity, zenity.string()}});
        bool threw = false;
        try {
            (void)dialog.pick(save_toml());
        } catch (const Error& e) {
            threw = true;
            assert(e.kind() == ErrorKind::Dialog);
            assert(std::string(e.what()).find("exit status: 5") != std::string::npos);
        }
        assert(threw);
    }

    assert(LinuxFileDialog::default_backends().size() == 2);
    assert(LinuxFileDialog::default_backends()[0].program == "zenity");

    std::cout << "ok\n";
    return 0;
}
