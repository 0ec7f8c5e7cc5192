#pragma once

#include "process.hpp"

#include <string>
#include <vector>

namespace dastore {

struct InstallerOptions {
    std::string marker_file = "/etc/arch-release";

    std::string install_dir = "/opt/dastore";
    std::string applications_dir = "/usr/share/applications";
    std::string desktop_file_name = "dastore.desktop";
    std::string bin_dir = "/usr/local/bin";
    std::string link_name = "dastore";

    // Every non-hidden entry of source_dir is copied into install_dir.
    std::string source_dir = "stage";
    std::string icon_path = "assets/dastore.png";
    std::string entry_point = "dastore";

    std::vector<std::string> dependencies = {"gtk3", "polkit"};

    std::string helper = "yay";
    std::string helper_repo = "https://aur.archlinux.org/yay.git";
    std::vector<std::string> helper_build_dependencies = {"base-devel", "git"};

    // Where the helper is cloned and built. Empty: a temporary directory
    // that is removed when the installer is done.
    std::string work_dir;

    // Prefix for commands that need root; empty when already root.
    std::vector<std::string> privilege_command = {"sudo"};
    bool running_as_root = false;
};

// Options for this process: sudo unless we are root.
InstallerOptions default_installer_options();

struct InstallResult {
    int exit_code = 0;
    std::string error;

    bool ok() const { return exit_code == 0; }
};

// The installation procedure: check the host is Arch, provision
// dependencies (bootstrapping the AUR helper if needed), place the
// application, write the desktop entry and the PATH symlink. Stops at the
// first failing step; nothing is rolled back.
class Installer {
public:
    Installer(InstallerOptions options, CommandRunner &runner);
    ~Installer();

    Installer(const Installer &) = delete;
    Installer &operator=(const Installer &) = delete;

    InstallResult run();

    InstallResult check_environment();
    InstallResult install_dependencies();
    InstallResult bootstrap_helper();
    InstallResult place_artifacts();
    InstallResult write_desktop_entry();
    InstallResult link_executable();

    std::string desktop_file_path() const;
    std::string link_path() const;
    std::string entry_point_path() const;

private:
    InstallResult run_step(const Argv &argv, const std::string &cwd = "");
    InstallResult run_privileged(const Argv &argv);
    InstallResult ensure_work_dir();

    InstallerOptions options_;
    CommandRunner &runner_;
    std::string work_dir_;
    bool owns_work_dir_ = false;
};

} // namespace dastore
