#include "utils/WorkerPool.hpp"
#include <memory>
#include <stdexcept>

namespace FeedLine {

struct WorkerPool::Job {
    std::packaged_task<void()> task;
};

WorkerPool::WorkerPool(unsigned maxThreads)
    : pool_(nullptr), maxThreads_(maxThreads > 0 ? maxThreads : 1) {
    GError* error = nullptr;
    pool_ = g_thread_pool_new(&WorkerPool::runJob, this, static_cast<gint>(maxThreads_), FALSE, &error);
    if (!pool_) {
        std::string message = error ? error->message : "unknown error";
        if (error) g_error_free(error);
        throw std::runtime_error("Failed to create worker pool: " + message);
    }
}

WorkerPool::~WorkerPool() {
    {
        std::lock_guard<std::mutex> lock(submitMutex_);
        closing_ = true;
    }
    g_thread_pool_free(pool_, FALSE, TRUE);
}

void WorkerPool::runJob(gpointer data, gpointer) {
    std::unique_ptr<Job> job(static_cast<Job*>(data));
    job->task();
}

std::future<void> WorkerPool::submit(std::function<void()> work, const std::string& name) {
    auto* job = new Job{std::packaged_task<void()>([work = std::move(work), name]() {
        try {
            work();
        } catch (const std::exception& e) {
            g_warning("worker job '%s' failed: %s", name.c_str(), e.what());
        }
    })};
    std::future<void> done = job->task.get_future();

    GError* error = nullptr;
    bool queued = false;
    {
        std::lock_guard<std::mutex> lock(submitMutex_);
        if (closing_) {
            g_debug("pool shutting down, dropping '%s'", name.c_str());
            delete job;
            std::promise<void> dropped;
            dropped.set_value();
            return dropped.get_future();
        }
        queued = g_thread_pool_push(pool_, job, &error);
    }
    if (!queued) {
        g_warning("could not queue '%s' (%s), running inline", name.c_str(),
                  error ? error->message : "unknown error");
        if (error) g_error_free(error);
        runJob(job, this);
    }
    return done;
}

}
