// dastore-install: put Dastore on an Arch Linux host.
//
// Run from the build directory as a regular user with sudo rights:
//   ./dastore-install
//
// Installs gtk3 and polkit, bootstraps yay from the AUR if missing, copies
// stage/ and assets/dastore.png to /opt/dastore, writes the desktop entry
// and links /usr/local/bin/dastore.

#include "installer.hpp"
#include "process.hpp"

#include <glib.h>

#include <string>

namespace {

gchar *opt_source_dir = nullptr;
gchar *opt_icon = nullptr;
gchar *opt_install_dir = nullptr;
gchar *opt_applications_dir = nullptr;
gchar *opt_bin_dir = nullptr;
gchar *opt_work_dir = nullptr;
gboolean opt_verbose = FALSE;
gboolean opt_version = FALSE;

GOptionEntry entries[] = {
    {"source-dir", 0, 0, G_OPTION_ARG_FILENAME, &opt_source_dir,
     "Directory whose contents are installed (default: stage)", "DIR"},
    {"icon", 0, 0, G_OPTION_ARG_FILENAME, &opt_icon,
     "Application icon (default: assets/dastore.png)", "FILE"},
    {"install-dir", 0, 0, G_OPTION_ARG_FILENAME, &opt_install_dir,
     "Installation directory (default: /opt/dastore)", "DIR"},
    {"applications-dir", 0, 0, G_OPTION_ARG_FILENAME, &opt_applications_dir,
     "Desktop entry directory (default: /usr/share/applications)", "DIR"},
    {"bin-dir", 0, 0, G_OPTION_ARG_FILENAME, &opt_bin_dir,
     "Directory for the dastore link (default: /usr/local/bin)", "DIR"},
    {"work-dir", 0, 0, G_OPTION_ARG_FILENAME, &opt_work_dir,
     "Where the AUR helper is built (default: a temporary directory)", "DIR"},
    {"verbose", 'v', 0, G_OPTION_ARG_NONE, &opt_verbose,
     "Log every command", nullptr},
    {"version", 0, 0, G_OPTION_ARG_NONE, &opt_version,
     "Show version", nullptr},
    {nullptr, 0, 0, G_OPTION_ARG_NONE, nullptr, nullptr, nullptr},
};

void apply(gchar *value, std::string &target) {
    if (value) target = value;
}

} // anonymous namespace

int main(int argc, char **argv) {
    GOptionContext *context = g_option_context_new(nullptr);
    g_option_context_set_summary(context, "Install Dastore, a graphical package manager for Arch Linux.");
    g_option_context_add_main_entries(context, entries, nullptr);

    GError *error = nullptr;
    if (!g_option_context_parse(context, &argc, &argv, &error)) {
        g_printerr("%s\n", error->message);
        g_clear_error(&error);
        g_option_context_free(context);
        return 2;
    }
    g_option_context_free(context);

    if (opt_version) {
        g_print("dastore-install %s\n", DASTORE_VERSION);
        return 0;
    }

    if (opt_verbose) {
        g_setenv("G_MESSAGES_DEBUG", "dastore", TRUE);
    }

    dastore::InstallerOptions options = dastore::default_installer_options();
    apply(opt_source_dir, options.source_dir);
    apply(opt_icon, options.icon_path);
    apply(opt_install_dir, options.install_dir);
    apply(opt_applications_dir, options.applications_dir);
    apply(opt_bin_dir, options.bin_dir);
    apply(opt_work_dir, options.work_dir);

    dastore::SpawnRunner runner;
    dastore::InstallResult result;
    {
        dastore::Installer installer(options, runner);
        result = installer.run();
    }

    if (!result.ok()) {
        g_printerr("%s\n", result.error.c_str());
    }

    g_free(opt_source_dir);
    g_free(opt_icon);
    g_free(opt_install_dir);
    g_free(opt_applications_dir);
    g_free(opt_bin_dir);
    g_free(opt_work_dir);

    return result.exit_code;
}
