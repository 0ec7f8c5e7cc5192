#include "async_runner.hpp"

#include <glib.h>
#include <gtest/gtest.h>

#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

using namespace dastore;

namespace {

gboolean quit_loop(gpointer data) {
    g_main_loop_quit(static_cast<GMainLoop *>(data));
    return G_SOURCE_REMOVE;
}

} // anonymous namespace

TEST(AsyncRunner, DeliversResultOnMainLoop) {
    GMainLoop *loop = g_main_loop_new(nullptr, FALSE);
    GThread *main_thread = g_thread_self();

    AsyncRunner runner(2);
    GThread *work_thread = nullptr;
    GThread *done_thread = nullptr;
    int value = 0;

    runner.run<int>(
        [&work_thread]() {
            work_thread = g_thread_self();
            return 42;
        },
        [&](int result, const std::string &error) {
            EXPECT_TRUE(error.empty());
            value = result;
            done_thread = g_thread_self();
            g_main_loop_quit(loop);
        });

    guint guard = g_timeout_add_seconds(10, quit_loop, loop);
    g_main_loop_run(loop);
    g_source_remove(guard);

    EXPECT_EQ(value, 42);
    EXPECT_NE(work_thread, main_thread);
    EXPECT_EQ(done_thread, main_thread);

    runner.shutdown();
    g_main_loop_unref(loop);
}

TEST(AsyncRunner, ExceptionBecomesError) {
    GMainLoop *loop = g_main_loop_new(nullptr, FALSE);
    AsyncRunner runner;
    std::string message;

    runner.run<std::vector<std::string>>(
        []() -> std::vector<std::string> { throw std::runtime_error("database locked"); },
        [&](std::vector<std::string> result, const std::string &error) {
            EXPECT_TRUE(result.empty());
            message = error;
            g_main_loop_quit(loop);
        });

    guint guard = g_timeout_add_seconds(10, quit_loop, loop);
    g_main_loop_run(loop);
    g_source_remove(guard);

    EXPECT_EQ(message, "database locked");
    g_main_loop_unref(loop);
}

TEST(AsyncRunner, RunsEveryJob) {
    GMainLoop *loop = g_main_loop_new(nullptr, FALSE);
    AsyncRunner runner(4);
    const int jobs = 16;
    int delivered = 0;
    int sum = 0;

    for (int i = 1; i <= jobs; i++) {
        runner.run<int>(
            [i]() { return i; },
            [&](int result, const std::string &) {
                sum += result;
                if (++delivered == jobs) g_main_loop_quit(loop);
            });
    }

    guint guard = g_timeout_add_seconds(10, quit_loop, loop);
    g_main_loop_run(loop);
    g_source_remove(guard);

    EXPECT_EQ(delivered, jobs);
    EXPECT_EQ(sum, jobs * (jobs + 1) / 2);
    g_main_loop_unref(loop);
}

TEST(AsyncRunner, DropsJobsAfterShutdown) {
    AsyncRunner runner;
    runner.shutdown();

    bool ran = false;
    runner.run<int>([&ran]() { ran = true; return 1; }, [](int, const std::string &) {});

    // Nothing is left to run it.
    while (g_main_context_iteration(nullptr, FALSE)) {}
    EXPECT_FALSE(ran);
}

TEST(AsyncRunner, ShutdownReleasesQueuedJobsAndUndeliveredResults) {
    auto token = std::make_shared<int>(0);
    std::weak_ptr<int> watch = token;
    bool delivered = false;

    {
        AsyncRunner runner(1);
        runner.run<int>(
            [token]() { g_usleep(100 * 1000); return 1; },
            [token, &delivered](int, const std::string &) { delivered = true; });
        for (int i = 0; i < 8; i++) {
            runner.run<int>(
                [token]() { return 2; },
                [token, &delivered](int, const std::string &) { delivered = true; });
        }
        token.reset();

        // The main loop never ran, so nothing has been delivered.
        runner.shutdown();
        EXPECT_TRUE(watch.expired());
    }

    while (g_main_context_iteration(nullptr, FALSE)) {}
    EXPECT_FALSE(delivered);
}
