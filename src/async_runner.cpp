#include "async_runner.hpp"

#include <vector>

namespace dastore {

AsyncRunner::AsyncRunner(int max_workers) {
    g_mutex_init(&lock_);

    GError *error = nullptr;
    pool_ = g_thread_pool_new(worker, this, max_workers, FALSE, &error);
    if (!pool_) {
        // Non-exclusive pools never fail to create; keep the message anyway.
        g_critical("cannot create worker pool: %s", error ? error->message : "unknown error");
        g_clear_error(&error);
    }
}

AsyncRunner::~AsyncRunner() {
    shutdown();
    g_mutex_clear(&lock_);
}

void AsyncRunner::shutdown() {
    if (pool_) {
        // Workers skip what is still queued; running jobs finish.
        g_atomic_int_set(&stopping_, 1);
        g_thread_pool_free(pool_, FALSE, TRUE);
        pool_ = nullptr;
    }

    g_mutex_lock(&lock_);
    std::vector<guint> ids(pending_.begin(), pending_.end());
    pending_.clear();
    g_mutex_unlock(&lock_);

    if (!ids.empty()) {
        g_debug("discarding %u undelivered results", static_cast<unsigned>(ids.size()));
    }
    for (guint id : ids) {
        g_source_remove(id);
    }
}

void AsyncRunner::push(std::unique_ptr<Job> job) {
    if (!pool_) {
        g_warning("worker pool is shut down, dropping job");
        return;
    }

    GError *error = nullptr;
    Job *raw = job.release();
    if (!g_thread_pool_push(pool_, raw, &error)) {
        g_warning("cannot queue job: %s", error ? error->message : "unknown error");
        g_clear_error(&error);
        job.reset(raw);
    }
}

void AsyncRunner::post(std::unique_ptr<Pending> pending, GSourceFunc deliver_fn) {
    pending->runner = this;

    // Held across the attach so deliver() never sees a missing id.
    g_mutex_lock(&lock_);
    Pending *raw = pending.release();
    raw->source_id = g_idle_add_full(G_PRIORITY_DEFAULT_IDLE, deliver_fn, raw, free_pending);
    pending_.insert(raw->source_id);
    g_mutex_unlock(&lock_);
}

void AsyncRunner::delivered(Pending *pending) {
    g_mutex_lock(&lock_);
    pending_.erase(pending->source_id);
    g_mutex_unlock(&lock_);
}

void AsyncRunner::free_pending(gpointer data) {
    std::unique_ptr<Pending> pending(static_cast<Pending *>(data));
}

void AsyncRunner::worker(gpointer data, gpointer user_data) {
    auto *self = static_cast<AsyncRunner *>(user_data);
    std::unique_ptr<Job> job(static_cast<Job *>(data));
    if (g_atomic_int_get(&self->stopping_)) {
        return;
    }
    job->body();
}

} // namespace dastore
