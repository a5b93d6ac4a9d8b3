#include "worker_pool.hpp"

#include <algorithm>

namespace gitmigrate {

WorkerPool::WorkerPool(size_t max_workers, TaskRunner runner)
    : max_workers_(std::max<size_t>(1, max_workers)), runner_(std::move(runner)) {
    threads_.reserve(max_workers_);
}

WorkerPool::~WorkerPool() {
    {
        std::lock_guard<std::mutex> lk(mtx_);
        stop_ = true;
    }
    jobs_cv_.notify_all();
    for (auto& t : threads_) {
        if (t.joinable())
            t.join();
    }
}

void WorkerPool::submit(MigrationTask task, int attempt) {
    {
        std::lock_guard<std::mutex> lk(mtx_);
        jobs_.push_back(Job{std::move(task), attempt});
        // Threads are started lazily: never more than submissions or the cap.
        if (threads_.size() < max_workers_)
            threads_.emplace_back([this] { worker_loop(); });
    }
    jobs_cv_.notify_one();
}

Completion WorkerPool::next_completion() {
    std::unique_lock<std::mutex> lk(mtx_);
    done_cv_.wait(lk, [this] { return !done_.empty(); });
    Completion c = std::move(done_.front());
    done_.pop_front();
    return c;
}

void WorkerPool::worker_loop() {
    while (true) {
        Job job;
        {
            std::unique_lock<std::mutex> lk(mtx_);
            jobs_cv_.wait(lk, [this] { return stop_ || !jobs_.empty(); });
            if (jobs_.empty())
                return;
            job = std::move(jobs_.front());
            jobs_.pop_front();
        }
        Completion c;
        c.attempt = job.attempt;
        try {
            c.report = runner_(job.task);
        } catch (const std::exception& e) {
            c.fault = e.what();
        } catch (...) {
            c.fault = "unknown exception";
        }
        c.task = std::move(job.task);
        {
            std::lock_guard<std::mutex> lk(mtx_);
            done_.push_back(std::move(c));
        }
        done_cv_.notify_one();
    }
}

} // namespace gitmigrate
