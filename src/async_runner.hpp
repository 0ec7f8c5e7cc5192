#pragma once

#include <glib.h>

#include <exception>
#include <functional>
#include <memory>
#include <set>
#include <string>
#include <utility>

namespace dastore {

// Runs blocking work (package searches, detail lookups) on a GThreadPool and
// hands the result back on the main loop.
class AsyncRunner {
public:
    explicit AsyncRunner(int max_workers = 4);
    ~AsyncRunner();

    AsyncRunner(const AsyncRunner &) = delete;
    AsyncRunner &operator=(const AsyncRunner &) = delete;

    // `work` runs on a worker thread; `done` runs on the default main
    // context with its result, or with the error message when `work`
    // threw. T must be movable.
    template <typename T>
    void run(std::function<T()> work,
             std::function<void(T result, const std::string &error)> done);

    // Skip queued jobs, wait for running ones, and discard results that
    // have not been delivered yet.
    void shutdown();

private:
    struct Job {
        std::function<void()> body;
    };

    // A result waiting in an idle source for the main loop.
    struct Pending {
        virtual ~Pending() = default;
        AsyncRunner *runner = nullptr;
        guint source_id = 0;
    };

    template <typename T>
    struct Result : Pending {
        T value{};
        std::string error;
        std::function<void(T, const std::string &)> done;
    };

    template <typename T>
    static gboolean deliver(gpointer data);
    static void free_pending(gpointer data);

    void push(std::unique_ptr<Job> job);
    void post(std::unique_ptr<Pending> pending, GSourceFunc deliver_fn);
    void delivered(Pending *pending);
    static void worker(gpointer data, gpointer user_data);

    GThreadPool *pool_ = nullptr;
    gint stopping_ = 0;

    GMutex lock_;
    std::set<guint> pending_;
};

template <typename T>
gboolean AsyncRunner::deliver(gpointer data) {
    auto *result = static_cast<Result<T> *>(data);
    result->runner->delivered(result);
    if (result->done) {
        result->done(std::move(result->value), result->error);
    }
    // The source's destroy notify frees the result.
    return G_SOURCE_REMOVE;
}

template <typename T>
void AsyncRunner::run(std::function<T()> work,
                      std::function<void(T result, const std::string &error)> done) {
    auto job = std::make_unique<Job>();
    job->body = [this, work = std::move(work), done = std::move(done)]() {
        auto result = std::make_unique<Result<T>>();
        result->done = done;
        try {
            result->value = work();
        } catch (const std::exception &e) {
            result->error = e.what();
        }
        post(std::move(result), deliver<T>);
    };
    push(std::move(job));
}

} // namespace dastore
