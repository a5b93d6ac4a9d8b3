#ifndef MIGRATOR_HPP
#define MIGRATOR_HPP

#include <filesystem>
#include <vector>

#include "batch_scheduler.hpp"
#include "logger.hpp"
#include "migration_types.hpp"
#include "mirror_executor.hpp"
#include "preflight.hpp"
#include "retry_coordinator.hpp"
#include "transfer_operation.hpp"

namespace gitmigrate {

/**
 * @brief Runs a whole batch: first pass, then retries of the failures.
 *
 * Wires one MirrorTransferExecutor into the BatchScheduler and the
 * RetryCoordinator. All per-task failures end up in the returned
 * BatchResult; only invalid input throws.
 */
class Migrator {
  public:
    Migrator(TransferOperation& transfer, LogSink& log, BatchSettings settings,
             std::filesystem::path workspace_root = {}, RetrySleeper sleeper = {});

    /**
     * @brief Probe every destination, warning about unreachable ones.
     *
     * @return Names of tasks whose destination did not answer.
     */
    std::vector<std::string> preflight(const std::vector<MigrationTask>& tasks) const;

    /**
     * @brief Migrate every task.
     *
     * @throws ConfigValidationError if task names are not unique or the
     *         settings are out of range. Nothing is executed in that case.
     */
    BatchResult run(const std::vector<MigrationTask>& tasks,
                    const ProgressCallback& on_progress = {}) const;

    const BatchSettings& settings() const { return settings_; }

  private:
    TransferOperation& transfer_;
    LogSink& log_;
    BatchSettings settings_;
    MirrorTransferExecutor executor_;
    RetrySleeper sleeper_;
};

} // namespace gitmigrate

#endif // MIGRATOR_HPP
