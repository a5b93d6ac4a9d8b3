#include "migrator.hpp"

#include "config_utils.hpp"
#include "time_utils.hpp"

namespace gitmigrate {

Migrator::Migrator(TransferOperation& transfer, LogSink& log, BatchSettings settings,
                   std::filesystem::path workspace_root, RetrySleeper sleeper)
    : transfer_(transfer), log_(log), settings_(settings),
      executor_(transfer, log, settings.transfer_timeout, std::move(workspace_root)),
      sleeper_(std::move(sleeper)) {}

std::vector<std::string> Migrator::preflight(const std::vector<MigrationTask>& tasks) const {
    PreflightValidator validator(transfer_, log_);
    return validator.check_destinations(tasks);
}

BatchResult Migrator::run(const std::vector<MigrationTask>& tasks,
                          const ProgressCallback& on_progress) const {
    if (settings_.max_concurrent == 0)
        throw ConfigValidationError("max_concurrent must be at least 1");
    if (settings_.max_retries < 0)
        throw ConfigValidationError("max_retries must not be negative");
    ensure_unique_names(tasks);

    const auto started = std::chrono::steady_clock::now();
    TaskRunner runner = [this](const MigrationTask& task) { return executor_.run(task); };

    BatchScheduler scheduler(runner, log_);
    FirstPassResult first = scheduler.run_first_pass(tasks, settings_, on_progress);

    RetryCoordinator retries(runner, log_, sleeper_);
    BatchResult result = retries.run_retries(first.failed, settings_, std::move(first.result));

    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started);
    log_.info("Batch migration finished", {{"success", std::to_string(result.success)},
                                           {"failed", std::to_string(result.failed)},
                                           {"elapsed", format_elapsed(elapsed)}});
    return result;
}

} // namespace gitmigrate
