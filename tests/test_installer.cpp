#include "installer.hpp"

#include "fake_runner.hpp"

#include <glib.h>
#include <gtest/gtest.h>

#include <algorithm>
#include <filesystem>
#include <string>

using namespace dastore;

namespace fs = std::filesystem;

namespace {

// Pretends to clone by creating the target directory.
class InstallRunner : public FakeRunner {
protected:
    CommandResult respond(const Argv &argv, const std::string &cwd) override {
        if (argv.size() == 4 && argv[0] == "git" && argv[1] == "clone") {
            g_mkdir_with_parents(argv[3].c_str(), 0755);
        }
        return FakeRunner::respond(argv, cwd);
    }
};

class InstallerTest : public ::testing::Test {
protected:
    void SetUp() override {
        char *tmp = g_dir_make_tmp("dastore-installer-XXXXXX", nullptr);
        ASSERT_NE(tmp, nullptr);
        root = tmp;
        g_free(tmp);

        write(root + "/arch-release", "");
        g_mkdir_with_parents((root + "/stage").c_str(), 0755);
        write(root + "/stage/dastore", "#!/bin/sh\n");
        write(root + "/stage/.hidden", "");
        g_mkdir_with_parents((root + "/assets").c_str(), 0755);
        write(root + "/assets/dastore.png", "png");
        g_mkdir_with_parents((root + "/bin").c_str(), 0755);

        options.marker_file = root + "/arch-release";
        options.source_dir = root + "/stage";
        options.icon_path = root + "/assets/dastore.png";
        options.install_dir = root + "/opt/dastore";
        options.applications_dir = root + "/applications";
        options.bin_dir = root + "/bin";
        options.work_dir = root + "/work";
        options.privilege_command.clear();
        options.running_as_root = false;

        runner.programs = {"yay"};
        runner.passthrough = {"mkdir", "cp", "install", "ln"};
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(root, ec);
    }

    void write(const std::string &path, const std::string &content) {
        ASSERT_TRUE(g_file_set_contents(path.c_str(), content.c_str(), -1, nullptr));
    }

    bool ran(const std::string &command) const {
        auto commands = runner.commands();
        return std::find(commands.begin(), commands.end(), command) != commands.end();
    }

    std::string root;
    InstallerOptions options;
    InstallRunner runner;
};

} // anonymous namespace

TEST_F(InstallerTest, RefusesNonArchHost) {
    options.marker_file = root + "/no-such-release";
    Installer installer(options, runner);

    InstallResult result = installer.run();
    EXPECT_EQ(result.exit_code, 1);
    EXPECT_EQ(result.error, "This script is intended for Arch Linux based distributions only.");
    EXPECT_TRUE(runner.calls.empty());
}

TEST_F(InstallerTest, InstallsEverything) {
    Installer installer(options, runner);

    InstallResult result = installer.run();
    ASSERT_TRUE(result.ok()) << result.error;

    auto commands = runner.commands();
    ASSERT_FALSE(commands.empty());
    EXPECT_EQ(commands.front(), "pacman -S --needed --noconfirm gtk3 polkit");
    EXPECT_FALSE(ran("git clone https://aur.archlinux.org/yay.git " + root + "/work/yay"));

    std::string install_dir = root + "/opt/dastore";
    EXPECT_TRUE(ran("cp -r " + root + "/stage/dastore " + install_dir + "/"));
    EXPECT_TRUE(g_file_test((install_dir + "/dastore").c_str(), G_FILE_TEST_IS_REGULAR));
    EXPECT_TRUE(g_file_test((install_dir + "/dastore.png").c_str(), G_FILE_TEST_IS_REGULAR));
    EXPECT_FALSE(g_file_test((install_dir + "/.hidden").c_str(), G_FILE_TEST_EXISTS));

    std::string desktop = root + "/applications/dastore.desktop";
    EXPECT_EQ(installer.desktop_file_path(), desktop);
    char *contents = nullptr;
    ASSERT_TRUE(g_file_get_contents(desktop.c_str(), &contents, nullptr, nullptr));
    std::string text = contents;
    g_free(contents);
    EXPECT_NE(text.find("Exec=" + install_dir + "/dastore\n"), std::string::npos);
    EXPECT_NE(text.find("Icon=" + install_dir + "/dastore.png\n"), std::string::npos);
    // The staged copy is gone.
    EXPECT_FALSE(g_file_test((root + "/work/dastore.desktop").c_str(), G_FILE_TEST_EXISTS));

    std::string link = root + "/bin/dastore";
    EXPECT_EQ(installer.link_path(), link);
    ASSERT_TRUE(g_file_test(link.c_str(), G_FILE_TEST_IS_SYMLINK));
    EXPECT_EQ(fs::read_symlink(link).string(), install_dir + "/dastore");
}

TEST_F(InstallerTest, PrivilegedCommandsArePrefixed) {
    options.privilege_command = {"sudo"};
    runner.passthrough.clear();
    Installer installer(options, runner);

    ASSERT_TRUE(installer.install_dependencies().ok());
    ASSERT_TRUE(installer.link_executable().ok());

    EXPECT_TRUE(ran("sudo pacman -S --needed --noconfirm gtk3 polkit"));
    EXPECT_TRUE(ran("sudo ln -sf " + root + "/opt/dastore/dastore " + root + "/bin/dastore"));
}

TEST_F(InstallerTest, BootstrapsMissingHelper) {
    runner.programs.clear();
    Installer installer(options, runner);

    ASSERT_TRUE(installer.install_dependencies().ok());

    std::string build_dir = root + "/work/yay";
    auto commands = runner.commands();
    ASSERT_EQ(commands.size(), 4u);
    EXPECT_EQ(commands[0], "pacman -S --needed --noconfirm gtk3 polkit");
    EXPECT_EQ(commands[1], "pacman -S --needed --noconfirm base-devel git");
    EXPECT_EQ(commands[2], "git clone https://aur.archlinux.org/yay.git " + build_dir);
    EXPECT_EQ(commands[3], "makepkg -si --noconfirm --asdeps");
    EXPECT_EQ(runner.calls[3].cwd, build_dir);
    EXPECT_FALSE(runner.calls[3].captured);

    EXPECT_FALSE(g_file_test(build_dir.c_str(), G_FILE_TEST_EXISTS));
    // A caller-provided work directory is left in place.
    EXPECT_TRUE(g_file_test((root + "/work").c_str(), G_FILE_TEST_IS_DIR));
}

TEST_F(InstallerTest, TemporaryWorkDirIsRemoved) {
    runner.programs.clear();
    options.work_dir.clear();
    std::string clone_target;
    {
        Installer installer(options, runner);
        ASSERT_TRUE(installer.bootstrap_helper().ok());
        for (const auto &call : runner.calls) {
            if (call.argv.front() == "git") clone_target = call.argv.back();
        }
        ASSERT_FALSE(clone_target.empty());
    }
    std::string work_dir = fs::path(clone_target).parent_path().string();
    EXPECT_FALSE(g_file_test(work_dir.c_str(), G_FILE_TEST_EXISTS));
}

TEST_F(InstallerTest, HelperBuildRefusesRoot) {
    runner.programs.clear();
    options.running_as_root = true;
    Installer installer(options, runner);

    InstallResult result = installer.install_dependencies();
    EXPECT_EQ(result.exit_code, 1);
    EXPECT_NE(result.error.find("as root"), std::string::npos);
    EXPECT_FALSE(ran("pacman -S --needed --noconfirm base-devel git"));
}

TEST_F(InstallerTest, StopsAtFailingStepWithItsExitCode) {
    runner.script("pacman -S --needed --noconfirm gtk3 polkit", 8);
    Installer installer(options, runner);

    InstallResult result = installer.run();
    EXPECT_EQ(result.exit_code, 8);
    EXPECT_NE(result.error.find("pacman -S --needed --noconfirm gtk3 polkit"), std::string::npos);
    EXPECT_EQ(runner.calls.size(), 1u);
    EXPECT_FALSE(g_file_test((root + "/opt/dastore").c_str(), G_FILE_TEST_EXISTS));
}

TEST_F(InstallerTest, FailedCloneStopsBootstrap) {
    runner.programs.clear();
    runner.script("git clone https://aur.archlinux.org/yay.git " + root + "/work/yay", 128);
    Installer installer(options, runner);

    InstallResult result = installer.install_dependencies();
    EXPECT_EQ(result.exit_code, 128);
    EXPECT_FALSE(ran("makepkg -si --noconfirm --asdeps"));
}

TEST_F(InstallerTest, SignalledCommandExitsWithOne) {
    runner.script("pacman -S --needed --noconfirm gtk3 polkit", -1);
    Installer installer(options, runner);
    EXPECT_EQ(installer.install_dependencies().exit_code, 1);
}

TEST_F(InstallerTest, CommandThatCannotStart) {
    runner.fail_to_start("pacman -S --needed --noconfirm gtk3 polkit", "No such file or directory");
    Installer installer(options, runner);

    InstallResult result = installer.install_dependencies();
    EXPECT_EQ(result.exit_code, 1);
    EXPECT_EQ(result.error, "pacman: No such file or directory");
}

TEST_F(InstallerTest, EmptySourceDirectory) {
    fs::remove(root + "/stage/dastore");
    Installer installer(options, runner);

    InstallResult result = installer.place_artifacts();
    EXPECT_EQ(result.exit_code, 1);
    EXPECT_NE(result.error.find("no application files"), std::string::npos);
    EXPECT_TRUE(runner.calls.empty());
}

TEST_F(InstallerTest, MissingSourceDirectory) {
    options.source_dir = root + "/nowhere";
    Installer installer(options, runner);

    InstallResult result = installer.place_artifacts();
    EXPECT_EQ(result.exit_code, 1);
    EXPECT_NE(result.error.find("cannot read application files"), std::string::npos);
}

TEST(InstallerDefaults, Paths) {
    InstallerOptions options;
    EXPECT_EQ(options.marker_file, "/etc/arch-release");
    EXPECT_EQ(options.install_dir, "/opt/dastore");

    SpawnRunner runner;
    Installer installer(options, runner);
    EXPECT_EQ(installer.desktop_file_path(), "/usr/share/applications/dastore.desktop");
    EXPECT_EQ(installer.link_path(), "/usr/local/bin/dastore");
    EXPECT_EQ(installer.entry_point_path(), "/opt/dastore/dastore");
}
