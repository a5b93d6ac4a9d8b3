#ifndef RETRY_COORDINATOR_HPP
#define RETRY_COORDINATOR_HPP

#include <chrono>
#include <functional>
#include <vector>

#include "logger.hpp"
#include "migration_types.hpp"
#include "worker_pool.hpp"

namespace gitmigrate {

/// Waits out the delay before a retry dispatch.
using RetrySleeper = std::function<void(std::chrono::seconds)>;

/**
 * @brief Re-runs failed tasks until they succeed or exhaust their retries.
 *
 * A task may be attempted `1 + max_retries` times in total. Retries run in
 * rounds; each round dispatches every still-failing task that has attempts
 * left, waiting `retry_delay` before each dispatch, and drains the round
 * before the next one starts.
 */
class RetryCoordinator {
  public:
    RetryCoordinator(TaskRunner runner, LogSink& log, RetrySleeper sleeper = {});

    /**
     * @brief Reconcile retries of @p failed into @p result.
     *
     * Returns @p result unchanged when retries are disabled, `max_retries`
     * is zero or nothing failed.
     */
    BatchResult run_retries(const std::vector<FailedTask>& failed,
                            const BatchSettings& settings, BatchResult result) const;

  private:
    TaskRunner runner_;
    LogSink& log_;
    RetrySleeper sleeper_;
};

} // namespace gitmigrate

#endif // RETRY_COORDINATOR_HPP
