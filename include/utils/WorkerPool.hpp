#pragma once
#include <glib.h>
#include <functional>
#include <future>
#include <mutex>
#include <string>

namespace FeedLine {

// Bounded pool for blocking network and parsing work, backed by GThreadPool
class WorkerPool {
public:
    explicit WorkerPool(unsigned maxThreads = 8);
    // Waits for queued jobs to finish; jobs submitted meanwhile are dropped
    ~WorkerPool();
    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    // std::exception escaping the job is logged; the future only signals completion
    std::future<void> submit(std::function<void()> job, const std::string& name = "job");

    unsigned maxThreads() const { return maxThreads_; }

private:
    struct Job;
    static void runJob(gpointer data, gpointer userData);
    GThreadPool* pool_;
    unsigned maxThreads_;
    std::mutex submitMutex_;
    bool closing_ = false;
};

}
