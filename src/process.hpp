#pragma once

#include <string>
#include <vector>

namespace dastore {

using Argv = std::vector<std::string>;

struct CommandResult {
    int exit_code = -1;
    std::string out;
    std::string err;
    std::string error;  // Set when the command could not be started

    bool ok() const { return error.empty() && exit_code == 0; }
};

// Everything that touches an external program goes through a runner, so the
// installer and the package manager can be driven by a scripted fake.
class CommandRunner {
public:
    virtual ~CommandRunner() = default;

    // Run with the terminal inherited (the user sees the child's output).
    virtual CommandResult run(const Argv &argv, const std::string &cwd = "") = 0;

    // Run and collect stdout/stderr. Children get LC_ALL=C.
    virtual CommandResult capture(const Argv &argv, const std::string &cwd = "") = 0;

    // Full path of a program on PATH, empty if missing.
    virtual std::string find_program(const std::string &name) const = 0;
};

class SpawnRunner : public CommandRunner {
public:
    CommandResult run(const Argv &argv, const std::string &cwd = "") override;
    CommandResult capture(const Argv &argv, const std::string &cwd = "") override;
    std::string find_program(const std::string &name) const override;
};

// Strip ANSI color (CSI) and OSC hyperlink sequences from helper output.
std::string strip_ansi_and_osc(const std::string &input);

// Shell-quoted rendering of an argv, for logs.
std::string format_command(const Argv &argv);

// Environment of this process with LC_ALL=C, as a GLib envp.
// Free with g_strfreev().
char **make_c_locale_env();

} // namespace dastore
