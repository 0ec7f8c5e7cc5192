#pragma once

#include "process.hpp"

#include <map>
#include <set>
#include <string>
#include <vector>

// Scripted CommandRunner. Responses are keyed by the command line with the
// arguments joined by spaces; anything unscripted succeeds with no output.
class FakeRunner : public dastore::CommandRunner {
public:
    struct Call {
        dastore::Argv argv;
        std::string cwd;
        bool captured = false;
    };

    dastore::CommandResult run(const dastore::Argv &argv, const std::string &cwd = "") override {
        calls.push_back({argv, cwd, false});
        return respond(argv, cwd);
    }

    dastore::CommandResult capture(const dastore::Argv &argv, const std::string &cwd = "") override {
        calls.push_back({argv, cwd, true});
        return respond(argv, cwd);
    }

    std::string find_program(const std::string &name) const override {
        return programs.count(name) ? "/usr/bin/" + name : "";
    }

    void script(const std::string &command, int exit_code,
                const std::string &out = "", const std::string &err = "") {
        dastore::CommandResult r;
        r.exit_code = exit_code;
        r.out = out;
        r.err = err;
        responses[command] = r;
    }

    void fail_to_start(const std::string &command, const std::string &error) {
        dastore::CommandResult r;
        r.error = error;
        responses[command] = r;
    }

    std::vector<std::string> commands() const {
        std::vector<std::string> out;
        for (const auto &call : calls) out.push_back(join(call.argv));
        return out;
    }

    static std::string join(const dastore::Argv &argv) {
        std::string line;
        for (const auto &arg : argv) {
            if (!line.empty()) line += ' ';
            line += arg;
        }
        return line;
    }

    std::vector<Call> calls;
    std::set<std::string> programs;
    // Programs handed to a real SpawnRunner (file operations on temp dirs).
    std::set<std::string> passthrough;

protected:
    virtual dastore::CommandResult respond(const dastore::Argv &argv, const std::string &cwd) {
        auto it = responses.find(join(argv));
        if (it != responses.end()) return it->second;

        if (!argv.empty() && passthrough.count(argv.front())) {
            return real_.capture(argv, cwd);
        }

        dastore::CommandResult ok;
        ok.exit_code = 0;
        return ok;
    }

private:
    std::map<std::string, dastore::CommandResult> responses;
    dastore::SpawnRunner real_;
};
