#pragma once

#include "process.hpp"

#include <glib.h>

#include <functional>
#include <string>

namespace dastore {

// One package transaction running as a child process, watched from the
// GLib main loop. Output is streamed line by line; pacman's proceed prompts
// are answered with "Y".
class Transaction {
public:
    enum class Outcome { Succeeded, Failed, Cancelled };

    struct Callbacks {
        std::function<void(const std::string &text)> on_output;
        std::function<void(double fraction, const std::string &status)> on_progress;
        std::function<void(Outcome outcome, int exit_code)> on_finished;
    };

    Transaction(Argv argv, Callbacks callbacks);
    ~Transaction();

    Transaction(const Transaction &) = delete;
    Transaction &operator=(const Transaction &) = delete;

    // Spawn the child. On failure the callbacks have already been told.
    bool start();

    // SIGTERM the child's process group.
    void cancel();

    bool running() const { return pid_ != 0 && !child_exited_; }
    bool finished() const { return finished_; }
    GPid pid() const { return pid_; }

private:
    struct Stream {
        GIOChannel *channel = nullptr;
        guint watch_id = 0;
        std::string pending;
        bool prompt_answered = false;
        bool open = false;
    };

    static gboolean on_stream_ready(GIOChannel *channel, GIOCondition condition, gpointer data);
    static void on_child_exit(GPid pid, gint status, gpointer data);

    void open_stream(Stream &stream, int fd);
    void close_stream(Stream &stream);
    bool read_stream(Stream &stream);
    void handle_line(const std::string &line);
    void answer_prompt();
    void progress(double fraction, const std::string &status);
    void output(const std::string &text);
    void maybe_finish();

    Argv argv_;
    Callbacks callbacks_;

    GPid pid_ = 0;
    int stdin_fd_ = -1;
    guint child_watch_id_ = 0;
    Stream out_;
    Stream err_;

    int exit_code_ = -1;
    bool child_exited_ = false;
    bool cancelled_ = false;
    bool finished_ = false;
};

} // namespace dastore
