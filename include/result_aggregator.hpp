#ifndef RESULT_AGGREGATOR_HPP
#define RESULT_AGGREGATOR_HPP

#include <cstddef>
#include <mutex>
#include <string>

#include "migration_types.hpp"

namespace gitmigrate {

/**
 * @brief Mutex-guarded accumulator for a BatchResult.
 *
 * All mutations keep `failed == failed_names.size()` and never count a task
 * name twice in the failed list.
 */
class ResultAggregator {
  public:
    enum class RetryUpdate {
        RECOVERED,     ///< Task moved from failed to succeeded
        STILL_FAILING, ///< Detail updated, counters unchanged
        NOT_FAILED     ///< Success for a name not in the failed list; counters unchanged
    };

    explicit ResultAggregator(size_t total = 0);
    explicit ResultAggregator(BatchResult initial);

    /// Record a first-pass outcome.
    void record(const TaskOutcome& outcome);

    /**
     * @brief Reconcile a retry attempt into the result.
     *
     * The detail record of the task is marked `retry=true` with @p attempt in
     * every case.
     */
    RetryUpdate record_retry(const TaskOutcome& outcome);

    BatchResult snapshot() const;
    size_t completed() const;

  private:
    TaskOutcome& detail_for(const std::string& name);

    mutable std::mutex mtx_;
    BatchResult result_;
};

} // namespace gitmigrate

#endif // RESULT_AGGREGATOR_HPP
