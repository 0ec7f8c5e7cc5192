#include "installer.hpp"
#include "desktop_entry.hpp"

#include <glib.h>
#include <glib/gstdio.h>
#include <unistd.h>

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <filesystem>
#include <system_error>
#include <utility>

namespace fs = std::filesystem;

namespace dastore {

namespace {

std::string join_path(const std::string &dir, const std::string &name) {
    char *path = g_build_filename(dir.c_str(), name.c_str(), nullptr);
    std::string out = path;
    g_free(path);
    return out;
}

std::string display_name(const std::string &tool) {
    std::string out = tool;
    if (!out.empty()) {
        out[0] = static_cast<char>(std::toupper(static_cast<unsigned char>(out[0])));
    }
    return out;
}

InstallResult failure(int exit_code, const std::string &message) {
    InstallResult result;
    result.exit_code = exit_code;
    result.error = message;
    return result;
}

} // anonymous namespace

InstallerOptions default_installer_options() {
    InstallerOptions options;
    options.running_as_root = (geteuid() == 0);
    if (options.running_as_root) {
        options.privilege_command.clear();
    }
    return options;
}

Installer::Installer(InstallerOptions options, CommandRunner &runner)
    : options_(std::move(options)), runner_(runner), work_dir_(options_.work_dir) {
}

Installer::~Installer() {
    if (owns_work_dir_ && !work_dir_.empty()) {
        std::error_code ec;
        fs::remove_all(work_dir_, ec);
        if (ec) {
            g_warning("could not remove %s: %s", work_dir_.c_str(), ec.message().c_str());
        }
    }
}

std::string Installer::desktop_file_path() const {
    return join_path(options_.applications_dir, options_.desktop_file_name);
}

std::string Installer::link_path() const {
    return join_path(options_.bin_dir, options_.link_name);
}

std::string Installer::entry_point_path() const {
    return join_path(options_.install_dir, options_.entry_point);
}

InstallResult Installer::run() {
    g_print("==> Dastore Installer\n");

    InstallResult result = check_environment();
    if (!result.ok()) return result;

    result = install_dependencies();
    if (!result.ok()) return result;

    result = place_artifacts();
    if (!result.ok()) return result;

    result = write_desktop_entry();
    if (!result.ok()) return result;

    result = link_executable();
    if (!result.ok()) return result;

    g_print("==> Installation complete! You can now run '%s' from your terminal "
            "or find it in your app menu.\n", options_.link_name.c_str());
    return result;
}

// ───────────────────────────────────────────────
//  Steps
// ───────────────────────────────────────────────

InstallResult Installer::check_environment() {
    g_print("==> Checking for Arch Linux...\n");

    if (!g_file_test(options_.marker_file.c_str(), G_FILE_TEST_EXISTS)) {
        return failure(1, "This script is intended for Arch Linux based distributions only.");
    }

    g_print("==> Arch Linux detected.\n");
    return {};
}

InstallResult Installer::install_dependencies() {
    g_print("==> Installing dependencies...\n");

    if (!options_.dependencies.empty()) {
        Argv argv = {"pacman", "-S", "--needed", "--noconfirm"};
        argv.insert(argv.end(), options_.dependencies.begin(), options_.dependencies.end());
        InstallResult result = run_privileged(argv);
        if (!result.ok()) return result;
    }

    if (runner_.find_program(options_.helper).empty()) {
        InstallResult result = bootstrap_helper();
        if (!result.ok()) return result;
    } else {
        g_debug("%s already installed", options_.helper.c_str());
    }

    g_print("==> Dependencies installed.\n");
    return {};
}

InstallResult Installer::bootstrap_helper() {
    std::string name = display_name(options_.helper);
    g_print("==> %s not found. Installing %s...\n", name.c_str(), name.c_str());

    // makepkg refuses to build as root; say so before cloning anything.
    if (options_.running_as_root) {
        return failure(1, "Cannot build " + options_.helper +
                          " as root. Run the installer as a regular user with sudo rights.");
    }

    Argv deps = {"pacman", "-S", "--needed", "--noconfirm"};
    deps.insert(deps.end(), options_.helper_build_dependencies.begin(),
                options_.helper_build_dependencies.end());
    InstallResult result = run_privileged(deps);
    if (!result.ok()) return result;

    result = ensure_work_dir();
    if (!result.ok()) return result;

    std::string build_dir = join_path(work_dir_, options_.helper);

    result = run_step({"git", "clone", options_.helper_repo, build_dir});
    if (!result.ok()) return result;

    result = run_step({"makepkg", "-si", "--noconfirm", "--asdeps"}, build_dir);
    if (!result.ok()) return result;

    std::error_code ec;
    fs::remove_all(build_dir, ec);
    if (ec) {
        return failure(1, "cannot remove " + build_dir + ": " + ec.message());
    }
    return {};
}

InstallResult Installer::place_artifacts() {
    g_print("==> Installing Dastore to %s...\n", options_.install_dir.c_str());

    GError *error = nullptr;
    GDir *dir = g_dir_open(options_.source_dir.c_str(), 0, &error);
    if (!dir) {
        std::string message = error->message;
        g_clear_error(&error);
        return failure(1, "cannot read application files: " + message);
    }

    std::vector<std::string> entries;
    const char *entry;
    while ((entry = g_dir_read_name(dir)) != nullptr) {
        if (entry[0] == '.') continue;
        entries.push_back(join_path(options_.source_dir, entry));
    }
    g_dir_close(dir);

    if (entries.empty()) {
        return failure(1, "no application files in " + options_.source_dir);
    }
    std::sort(entries.begin(), entries.end());

    InstallResult result = run_privileged({"mkdir", "-p", options_.install_dir});
    if (!result.ok()) return result;

    Argv copy = {"cp", "-r"};
    copy.insert(copy.end(), entries.begin(), entries.end());
    copy.push_back(options_.install_dir + "/");
    result = run_privileged(copy);
    if (!result.ok()) return result;

    return run_privileged({"cp", options_.icon_path, options_.install_dir + "/"});
}

InstallResult Installer::write_desktop_entry() {
    g_print("==> Creating desktop entry...\n");

    DesktopEntry entry;
    entry.exec = entry_point_path();
    entry.icon = join_path(options_.install_dir, fs::path(options_.icon_path).filename().string());

    InstallResult result = ensure_work_dir();
    if (!result.ok()) return result;

    // Rendered as the user, then put in place with the privileged install(1).
    std::string staged = join_path(work_dir_, options_.desktop_file_name);
    std::string content = render_desktop_entry(entry);

    GError *error = nullptr;
    if (!g_file_set_contents(staged.c_str(), content.c_str(),
                             static_cast<gssize>(content.size()), &error)) {
        std::string message = error->message;
        g_clear_error(&error);
        return failure(1, "cannot write desktop entry: " + message);
    }

    result = run_privileged({"install", "-D", "-m", "644", staged, desktop_file_path()});

    if (g_remove(staged.c_str()) != 0) {
        g_debug("could not remove staged %s", staged.c_str());
    }
    return result;
}

InstallResult Installer::link_executable() {
    g_print("==> Creating executable link in %s...\n", options_.bin_dir.c_str());
    return run_privileged({"ln", "-sf", entry_point_path(), link_path()});
}

// ───────────────────────────────────────────────
//  Helpers
// ───────────────────────────────────────────────

InstallResult Installer::run_step(const Argv &argv, const std::string &cwd) {
    CommandResult r = runner_.run(argv, cwd);

    if (!r.error.empty()) {
        return failure(1, argv.front() + ": " + r.error);
    }
    if (r.exit_code != 0) {
        // Killed by a signal: no status to pass on.
        int code = r.exit_code > 0 ? r.exit_code : 1;
        return failure(code, "command failed (exit " + std::to_string(r.exit_code) + "): " +
                             format_command(argv));
    }
    return {};
}

InstallResult Installer::run_privileged(const Argv &argv) {
    Argv full = options_.privilege_command;
    full.insert(full.end(), argv.begin(), argv.end());
    return run_step(full);
}

InstallResult Installer::ensure_work_dir() {
    if (!work_dir_.empty()) {
        if (g_mkdir_with_parents(work_dir_.c_str(), 0755) != 0) {
            return failure(1, "cannot create " + work_dir_ + ": " + g_strerror(errno));
        }
        return {};
    }

    GError *error = nullptr;
    char *tmp = g_dir_make_tmp("dastore-install-XXXXXX", &error);
    if (!tmp) {
        std::string message = error->message;
        g_clear_error(&error);
        return failure(1, "cannot create a work directory: " + message);
    }
    work_dir_ = tmp;
    owns_work_dir_ = true;
    g_free(tmp);
    return {};
}

} // namespace dastore
