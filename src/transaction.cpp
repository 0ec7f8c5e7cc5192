#include "transaction.hpp"
#include "progress.hpp"

#include <csignal>
#include <sys/wait.h>
#include <unistd.h>

#include <utility>
#include <vector>

namespace dastore {

namespace {

// Runs in the child between fork and exec: own process group, so cancel()
// reaches everything the transaction started.
void child_setup(gpointer) {
    setsid();
}

void reap_orphan(GPid pid, gint status, gpointer) {
    g_debug("reaped abandoned child %d (status %d)", static_cast<int>(pid), status);
    g_spawn_close_pid(pid);
}

} // anonymous namespace

Transaction::Transaction(Argv argv, Callbacks callbacks)
    : argv_(std::move(argv)), callbacks_(std::move(callbacks)) {
}

Transaction::~Transaction() {
    if (child_watch_id_) {
        g_source_remove(child_watch_id_);
        child_watch_id_ = 0;
    }
    close_stream(out_);
    close_stream(err_);
    if (stdin_fd_ >= 0) {
        close(stdin_fd_);
    }
    if (running()) {
        if (kill(-pid_, SIGTERM) != 0) {
            kill(pid_, SIGTERM);
        }
        // Nobody is left to collect the exit status; let GLib reap it.
        g_child_watch_add(pid_, reap_orphan, nullptr);
    } else if (pid_) {
        g_spawn_close_pid(pid_);
    }
}

bool Transaction::start() {
    progress(0.05, "Starting...");
    output("Running: " + format_command(argv_) + "\n\n");

    // A child that exits early must not take us down when we answer it.
    std::signal(SIGPIPE, SIG_IGN);

    std::vector<char *> c_argv;
    for (auto &arg : argv_) {
        c_argv.push_back(const_cast<char *>(arg.c_str()));
    }
    c_argv.push_back(nullptr);

    char **envp = make_c_locale_env();
    int out_fd = -1;
    int err_fd = -1;
    GError *error = nullptr;

    gboolean spawned = g_spawn_async_with_pipes(
        nullptr,
        c_argv.data(),
        envp,
        static_cast<GSpawnFlags>(G_SPAWN_SEARCH_PATH | G_SPAWN_DO_NOT_REAP_CHILD),
        child_setup, nullptr,
        &pid_,
        &stdin_fd_, &out_fd, &err_fd,
        &error);

    g_strfreev(envp);

    if (!spawned) {
        std::string message = error ? error->message : "spawn failed";
        g_clear_error(&error);
        pid_ = 0;
        g_warning("transaction failed to start: %s", message.c_str());
        progress(1.0, "Error: " + message);
        output("\n✗ Error: " + message + "\n");
        finished_ = true;
        if (callbacks_.on_finished) callbacks_.on_finished(Outcome::Failed, -1);
        return false;
    }

    g_message("started %s (pid %d)", format_command(argv_).c_str(), static_cast<int>(pid_));

    open_stream(out_, out_fd);
    open_stream(err_, err_fd);
    child_watch_id_ = g_child_watch_add(pid_, on_child_exit, this);

    answer_prompt();
    return true;
}

void Transaction::cancel() {
    if (!running() || cancelled_) return;

    cancelled_ = true;
    g_message("cancelling pid %d", static_cast<int>(pid_));
    if (kill(-pid_, SIGTERM) != 0) {
        kill(pid_, SIGTERM);
    }
    progress(1.0, "Cancelled");
}

// ───────────────────────────────────────────────
//  Output streams
// ───────────────────────────────────────────────

void Transaction::open_stream(Stream &stream, int fd) {
    stream.channel = g_io_channel_unix_new(fd);
    g_io_channel_set_close_on_unref(stream.channel, TRUE);
    g_io_channel_set_encoding(stream.channel, nullptr, nullptr);
    g_io_channel_set_buffered(stream.channel, FALSE);
    g_io_channel_set_flags(stream.channel, G_IO_FLAG_NONBLOCK, nullptr);
    stream.watch_id = g_io_add_watch(stream.channel,
                                     static_cast<GIOCondition>(G_IO_IN | G_IO_HUP | G_IO_ERR),
                                     on_stream_ready, this);
    stream.open = true;
}

void Transaction::close_stream(Stream &stream) {
    if (stream.watch_id) {
        g_source_remove(stream.watch_id);
        stream.watch_id = 0;
    }
    if (stream.channel) {
        g_io_channel_unref(stream.channel);
        stream.channel = nullptr;
    }
    stream.open = false;
}

gboolean Transaction::on_stream_ready(GIOChannel *channel, GIOCondition condition, gpointer data) {
    auto *self = static_cast<Transaction *>(data);
    Stream &stream = (channel == self->out_.channel) ? self->out_ : self->err_;

    bool keep = self->read_stream(stream);
    if (!(condition & G_IO_IN) && (condition & (G_IO_HUP | G_IO_ERR))) {
        keep = false;
    }

    if (!keep) {
        if (!stream.pending.empty()) {
            self->handle_line(stream.pending);
            stream.pending.clear();
        }
        // Returning FALSE removes the watch; don't remove it twice.
        stream.watch_id = 0;
        self->close_stream(stream);
        self->maybe_finish();
        return FALSE;
    }
    return TRUE;
}

// Drain what is available. Returns false at end of stream.
bool Transaction::read_stream(Stream &stream) {
    char buffer[4096];

    for (;;) {
        gsize n = 0;
        GError *error = nullptr;
        GIOStatus status = g_io_channel_read_chars(stream.channel, buffer, sizeof(buffer), &n, &error);

        if (status == G_IO_STATUS_ERROR) {
            g_warning("reading transaction output: %s", error ? error->message : "unknown error");
            g_clear_error(&error);
            return false;
        }
        if (status == G_IO_STATUS_EOF) {
            return false;
        }
        if (status == G_IO_STATUS_AGAIN || n == 0) {
            break;
        }

        stream.pending.append(buffer, n);

        size_t newline;
        while ((newline = stream.pending.find('\n')) != std::string::npos) {
            std::string line = stream.pending.substr(0, newline);
            stream.pending.erase(0, newline + 1);

            // A prompt answered while it was still unterminated gets no
            // second answer when its newline arrives.
            bool answered = stream.prompt_answered;
            stream.prompt_answered = false;
            if (!answered && needs_confirmation(strip_ansi_and_osc(line))) {
                answer_prompt();
            }
            handle_line(line);
        }
    }

    // Prompts wait on the same line: "[Y/n] " has no newline yet.
    if (!stream.prompt_answered && needs_confirmation(strip_ansi_and_osc(stream.pending))) {
        stream.prompt_answered = true;
        answer_prompt();
    }
    return true;
}

void Transaction::handle_line(const std::string &raw) {
    std::string line = strip_ansi_and_osc(raw);
    if (!line.empty() && line.back() == '\r') line.pop_back();

    output(line + "\n");

    ProgressUpdate update = parse_progress_line(line);
    if (update.matched) {
        progress(update.fraction, update.status);
    }
}

void Transaction::answer_prompt() {
    if (stdin_fd_ < 0) return;

    static const char answer[] = "Y\n";
    if (write(stdin_fd_, answer, sizeof(answer) - 1) < 0) {
        g_debug("child stdin closed, no longer answering prompts");
        close(stdin_fd_);
        stdin_fd_ = -1;
    }
}

// ───────────────────────────────────────────────
//  Completion
// ───────────────────────────────────────────────

void Transaction::on_child_exit(GPid pid, gint status, gpointer data) {
    auto *self = static_cast<Transaction *>(data);
    (void)pid;

    self->child_watch_id_ = 0;
    self->child_exited_ = true;
    self->exit_code_ = WIFEXITED(status) ? WEXITSTATUS(status) : -1;
    self->maybe_finish();
}

void Transaction::maybe_finish() {
    if (finished_ || !child_exited_ || out_.open || err_.open) {
        return;
    }
    finished_ = true;

    Outcome outcome;
    if (cancelled_) {
        outcome = Outcome::Cancelled;
        output("\nCancelled\n");
    } else if (exit_code_ == 0) {
        outcome = Outcome::Succeeded;
        progress(1.0, "✓ Completed successfully!");
        output("\n✓ Operation completed successfully!\n");
    } else {
        outcome = Outcome::Failed;
        progress(1.0, "✗ Operation failed");
        output("\n✗ Operation failed\n");
    }

    g_message("transaction finished: exit %d", exit_code_);
    if (callbacks_.on_finished) callbacks_.on_finished(outcome, exit_code_);
}

void Transaction::progress(double fraction, const std::string &status) {
    if (callbacks_.on_progress) callbacks_.on_progress(fraction, status);
}

void Transaction::output(const std::string &text) {
    if (callbacks_.on_output) callbacks_.on_output(text);
}

} // namespace dastore
