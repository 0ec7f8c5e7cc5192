#include "transaction.hpp"

#include <glib.h>
#include <gtest/gtest.h>

#include <cerrno>
#include <csignal>

#include <string>
#include <vector>

using namespace dastore;

namespace {

// Drives one Transaction on a private main loop and records what it reports.
struct Recorder {
    GMainLoop *loop = nullptr;
    std::string output;
    std::vector<std::pair<double, std::string>> progress;
    bool finished = false;
    Transaction::Outcome outcome = Transaction::Outcome::Failed;
    int exit_code = -2;

    Recorder() { loop = g_main_loop_new(nullptr, FALSE); }
    ~Recorder() { g_main_loop_unref(loop); }

    Transaction::Callbacks callbacks() {
        Transaction::Callbacks cb;
        cb.on_output = [this](const std::string &text) { output += text; };
        cb.on_progress = [this](double fraction, const std::string &status) {
            progress.emplace_back(fraction, status);
        };
        cb.on_finished = [this](Transaction::Outcome o, int code) {
            finished = true;
            outcome = o;
            exit_code = code;
            g_main_loop_quit(loop);
        };
        return cb;
    }

    void run_until_finished() {
        if (finished) return;
        guint guard = g_timeout_add_seconds(20, on_guard, loop);
        g_main_loop_run(loop);
        if (!finished) return;
        g_source_remove(guard);
    }

    static gboolean on_guard(gpointer data) {
        g_main_loop_quit(static_cast<GMainLoop *>(data));
        return G_SOURCE_REMOVE;
    }
};

} // anonymous namespace

TEST(Transaction, StreamsOutputAndProgress) {
    Recorder rec;
    Transaction tx({"/bin/sh", "-c",
                    "echo 'resolving dependencies...'; "
                    "echo ' vim downloading... (50%)'; "
                    "echo '(1/1) installing vim (100%)'"},
                   rec.callbacks());

    ASSERT_TRUE(tx.start());
    rec.run_until_finished();

    ASSERT_TRUE(rec.finished);
    EXPECT_TRUE(tx.finished());
    EXPECT_EQ(rec.outcome, Transaction::Outcome::Succeeded);
    EXPECT_EQ(rec.exit_code, 0);

    EXPECT_NE(rec.output.find("Running: /bin/sh -c"), std::string::npos);
    EXPECT_NE(rec.output.find("resolving dependencies...\n"), std::string::npos);
    EXPECT_NE(rec.output.find("Operation completed successfully!"), std::string::npos);

    ASSERT_GE(rec.progress.size(), 4u);
    EXPECT_EQ(rec.progress.front().second, "Starting...");
    EXPECT_DOUBLE_EQ(rec.progress[1].first, 0.1 + 0.5 * 0.3);
    EXPECT_EQ(rec.progress[1].second, "Downloading...");
    EXPECT_EQ(rec.progress[2].second, "Installing...");
    EXPECT_DOUBLE_EQ(rec.progress.back().first, 1.0);
    EXPECT_EQ(rec.progress.back().second, "✓ Completed successfully!");
}

TEST(Transaction, StripsColorFromOutput) {
    Recorder rec;
    Transaction tx({"/bin/sh", "-c", "printf '\\033[1;32mgreen\\033[0m\\n'"}, rec.callbacks());

    ASSERT_TRUE(tx.start());
    rec.run_until_finished();

    EXPECT_NE(rec.output.find("green\n"), std::string::npos);
    EXPECT_EQ(rec.output.find('\x1b'), std::string::npos);
}

TEST(Transaction, ReportsFailure) {
    Recorder rec;
    Transaction tx({"/bin/sh", "-c", "echo 'error: target not found: nope' >&2; exit 3"},
                   rec.callbacks());

    ASSERT_TRUE(tx.start());
    rec.run_until_finished();

    ASSERT_TRUE(rec.finished);
    EXPECT_EQ(rec.outcome, Transaction::Outcome::Failed);
    EXPECT_EQ(rec.exit_code, 3);
    EXPECT_NE(rec.output.find("error: target not found: nope"), std::string::npos);
    EXPECT_EQ(rec.progress.back().second, "✗ Operation failed");
}

// start() already feeds one "Y", so each script consumes that first and only
// then prompts.
TEST(Transaction, AnswersPromptWaitingOnTheSameLine) {
    Recorder rec;
    Transaction tx({"/bin/sh", "-c",
                    "read first; "
                    "printf ':: Proceed with installation? [Y/n] '; "
                    "read answer; echo \"got $answer\""},
                   rec.callbacks());

    ASSERT_TRUE(tx.start());
    rec.run_until_finished();

    ASSERT_TRUE(rec.finished);
    EXPECT_EQ(rec.outcome, Transaction::Outcome::Succeeded);
    EXPECT_NE(rec.output.find("got Y"), std::string::npos);
}

TEST(Transaction, AnswersPromptEndingInNewline) {
    Recorder rec;
    Transaction tx({"/bin/sh", "-c",
                    "read first; "
                    "echo ':: Proceed with installation? [Y/n]'; "
                    "read answer; echo \"got $answer\""},
                   rec.callbacks());

    ASSERT_TRUE(tx.start());
    rec.run_until_finished();

    ASSERT_TRUE(rec.finished);
    EXPECT_EQ(rec.outcome, Transaction::Outcome::Succeeded);
    EXPECT_NE(rec.output.find("got Y"), std::string::npos);
}

TEST(Transaction, SpawnFailureFinishesImmediately) {
    Recorder rec;
    Transaction tx({"dastore-no-such-program-xyz"}, rec.callbacks());

    EXPECT_FALSE(tx.start());
    EXPECT_TRUE(rec.finished);
    EXPECT_EQ(rec.outcome, Transaction::Outcome::Failed);
    EXPECT_EQ(rec.exit_code, -1);
    EXPECT_EQ(rec.progress.back().second.compare(0, 7, "Error: "), 0);
    EXPECT_FALSE(tx.running());
}

TEST(Transaction, CancelStopsTheChild) {
    Recorder rec;
    Transaction tx({"/bin/sh", "-c", "echo started; sleep 30"}, rec.callbacks());

    ASSERT_TRUE(tx.start());
    EXPECT_TRUE(tx.running());
    tx.cancel();
    rec.run_until_finished();

    ASSERT_TRUE(rec.finished);
    EXPECT_EQ(rec.outcome, Transaction::Outcome::Cancelled);
    EXPECT_NE(rec.output.find("Cancelled"), std::string::npos);
}

TEST(Transaction, DestroyedWhileRunningReapsTheChild) {
    Recorder rec;
    GPid pid = 0;
    {
        Transaction tx({"/bin/sh", "-c", "sleep 30"}, rec.callbacks());
        ASSERT_TRUE(tx.start());
        pid = tx.pid();
    }

    // A zombie still answers kill(pid, 0); a reaped child does not.
    gint64 deadline = g_get_monotonic_time() + 10 * G_USEC_PER_SEC;
    while (kill(pid, 0) == 0 && g_get_monotonic_time() < deadline) {
        g_main_context_iteration(nullptr, FALSE);
        g_usleep(10000);
    }

    EXPECT_EQ(kill(pid, 0), -1);
    EXPECT_EQ(errno, ESRCH);
    EXPECT_FALSE(rec.finished);
}
