#ifndef WORKER_POOL_HPP
#define WORKER_POOL_HPP

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "migration_types.hpp"
#include "mirror_executor.hpp"
#include "thread_compat.hpp"

namespace gitmigrate {

/// Executes one task; may throw, faults are captured by the pool.
using TaskRunner = std::function<TransferReport(const MigrationTask&)>;

/**
 * @brief Result of one job handed back by WorkerPool::next_completion().
 */
struct Completion {
    MigrationTask task;
    int attempt = 1;
    TransferReport report;
    std::optional<std::string> fault; ///< Set when the runner threw
};

/**
 * @brief Bounded pool running migration tasks on worker threads.
 *
 * At most `max_workers` runner invocations execute at any instant; further
 * submissions wait in a FIFO queue. Finished jobs are queued for a single
 * consumer in completion order. Destroying the pool waits for queued and
 * running jobs to finish.
 */
class WorkerPool {
  public:
    WorkerPool(size_t max_workers, TaskRunner runner);
    ~WorkerPool();

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    void submit(MigrationTask task, int attempt);

    /**
     * @brief Block until the next job finishes and return it.
     *
     * Must not be called more often than submit().
     */
    Completion next_completion();

    size_t max_workers() const { return max_workers_; }

  private:
    struct Job {
        MigrationTask task;
        int attempt = 1;
    };

    void worker_loop();

    const size_t max_workers_;
    TaskRunner runner_;

    std::mutex mtx_;
    std::condition_variable jobs_cv_;
    std::condition_variable done_cv_;
    std::deque<Job> jobs_;
    std::deque<Completion> done_;
    bool stop_ = false;
    std::vector<th_compat::jthread> threads_;
};

} // namespace gitmigrate

#endif // WORKER_POOL_HPP
