#include "process.hpp"

#include <glib.h>
#include <sys/wait.h>

namespace dastore {

namespace {

std::vector<char *> to_c_argv(const Argv &argv) {
    std::vector<char *> out;
    out.reserve(argv.size() + 1);
    for (const auto &arg : argv) {
        out.push_back(const_cast<char *>(arg.c_str()));
    }
    out.push_back(nullptr);
    return out;
}

int decode_wait_status(int status) {
    if (WIFEXITED(status)) {
        return WEXITSTATUS(status);
    }
    return -1;
}

} // anonymous namespace

CommandResult SpawnRunner::run(const Argv &argv, const std::string &cwd) {
    CommandResult result;
    if (argv.empty()) {
        result.error = "empty command";
        return result;
    }

    g_debug("run: %s", format_command(argv).c_str());

    auto c_argv = to_c_argv(argv);
    GError *error = nullptr;
    int status = 0;

    // Null output pointers: the child writes straight to our terminal.
    gboolean spawned = g_spawn_sync(
        cwd.empty() ? nullptr : cwd.c_str(),
        c_argv.data(),
        nullptr,
        static_cast<GSpawnFlags>(G_SPAWN_SEARCH_PATH | G_SPAWN_CHILD_INHERITS_STDIN),
        nullptr, nullptr,
        nullptr, nullptr,
        &status,
        &error);

    if (!spawned) {
        result.error = error ? error->message : "spawn failed";
        g_clear_error(&error);
        return result;
    }

    result.exit_code = decode_wait_status(status);
    return result;
}

CommandResult SpawnRunner::capture(const Argv &argv, const std::string &cwd) {
    CommandResult result;
    if (argv.empty()) {
        result.error = "empty command";
        return result;
    }

    g_debug("capture: %s", format_command(argv).c_str());

    auto c_argv = to_c_argv(argv);
    char **envp = make_c_locale_env();
    char *out = nullptr;
    char *err = nullptr;
    GError *error = nullptr;
    int status = 0;

    gboolean spawned = g_spawn_sync(
        cwd.empty() ? nullptr : cwd.c_str(),
        c_argv.data(),
        envp,
        G_SPAWN_SEARCH_PATH,
        nullptr, nullptr,
        &out, &err,
        &status,
        &error);

    g_strfreev(envp);

    if (!spawned) {
        result.error = error ? error->message : "spawn failed";
        g_clear_error(&error);
        return result;
    }

    if (out) result.out = out;
    if (err) result.err = err;
    g_free(out);
    g_free(err);

    result.exit_code = decode_wait_status(status);
    return result;
}

std::string SpawnRunner::find_program(const std::string &name) const {
    char *path = g_find_program_in_path(name.c_str());
    if (!path) return "";
    std::string found(path);
    g_free(path);
    return found;
}

std::string strip_ansi_and_osc(const std::string &input) {
    std::string out;
    out.reserve(input.size());

    size_t i = 0;
    while (i < input.size()) {
        unsigned char c = static_cast<unsigned char>(input[i]);

        if (c == 0x1B) { // ESC
            if (i + 1 >= input.size()) {
                i++;
                continue;
            }

            unsigned char next = static_cast<unsigned char>(input[i + 1]);

            // CSI: final byte is between '@' and '~'
            if (next == '[') {
                size_t j = i + 2;
                while (j < input.size()) {
                    unsigned char d = static_cast<unsigned char>(input[j]);
                    j++;
                    if (d >= '@' && d <= '~') break;
                }
                i = j;
                continue;
            }

            // OSC: terminated by BEL or ESC '\'
            if (next == ']') {
                size_t j = i + 2;
                while (j < input.size()) {
                    unsigned char d = static_cast<unsigned char>(input[j]);
                    if (d == 0x07) {
                        j++;
                        break;
                    }
                    if (d == 0x1B && j + 1 < input.size() &&
                        static_cast<unsigned char>(input[j + 1]) == '\\') {
                        j += 2;
                        break;
                    }
                    j++;
                }
                i = j;
                continue;
            }

            i++;
            continue;
        }

        out.push_back(input[i]);
        i++;
    }

    return out;
}

std::string format_command(const Argv &argv) {
    std::string line;
    for (const auto &arg : argv) {
        if (!line.empty()) line += ' ';
        bool plain = !arg.empty() &&
            arg.find_first_of(" \t\n'\"\\$`*?;&|<>()") == std::string::npos;
        if (plain) {
            line += arg;
        } else {
            char *quoted = g_shell_quote(arg.c_str());
            line += quoted;
            g_free(quoted);
        }
    }
    return line;
}

char **make_c_locale_env() {
    char **envp = g_get_environ();
    return g_environ_setenv(envp, "LC_ALL", "C", TRUE);
}

} // namespace dastore
