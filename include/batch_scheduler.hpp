#ifndef BATCH_SCHEDULER_HPP
#define BATCH_SCHEDULER_HPP

#include <cstddef>
#include <functional>
#include <vector>

#include "logger.hpp"
#include "migration_types.hpp"
#include "worker_pool.hpp"

namespace gitmigrate {

/// Called once per drained task with the number drained so far.
using ProgressCallback = std::function<void(size_t completed, size_t total)>;

struct FirstPassResult {
    BatchResult result;
    std::vector<FailedTask> failed; ///< Every failure, tagged with attempt 1
};

/**
 * @brief Build the detail record for a finished job.
 *
 * A runner fault becomes an UNEXPECTED failure carrying the fault text.
 */
TaskOutcome outcome_from(const Completion& completion);

/**
 * @brief Runs the first pass of a batch on a bounded worker pool.
 */
class BatchScheduler {
  public:
    BatchScheduler(TaskRunner runner, LogSink& log);

    /**
     * @brief Run every task once.
     *
     * Results are drained by the calling thread in completion order. For
     * each drained task the counters and details are updated and
     * @p on_progress (if set) is invoked exactly once.
     */
    FirstPassResult run_first_pass(const std::vector<MigrationTask>& tasks,
                                   const BatchSettings& settings,
                                   const ProgressCallback& on_progress = {}) const;

  private:
    TaskRunner runner_;
    LogSink& log_;
};

} // namespace gitmigrate

#endif // BATCH_SCHEDULER_HPP
