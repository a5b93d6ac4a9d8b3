#ifndef MIRROR_EXECUTOR_HPP
#define MIRROR_EXECUTOR_HPP

#include <chrono>
#include <filesystem>
#include <string>

#include "logger.hpp"
#include "migration_types.hpp"
#include "transfer_operation.hpp"

namespace gitmigrate {

/**
 * @brief Outcome of one run of a migration task.
 */
struct TransferReport {
    bool success = false;
    FailureKind failure = FailureKind::NONE;
    std::string detail;   ///< Redacted error description, empty on success
    size_t refs = 0;      ///< References found in the fetched mirror
};

/**
 * @brief Runs the fetch and push legs of one migration.
 *
 * Each run gets its own temporary workspace below the workspace root. The
 * workspace is removed on every exit path. The executor holds no per-task
 * state, so one instance may serve all workers concurrently.
 */
class MirrorTransferExecutor {
  public:
    MirrorTransferExecutor(TransferOperation& transfer, LogSink& log,
                           std::chrono::seconds timeout = kDefaultTransferTimeout,
                           std::filesystem::path workspace_root = {});

    /**
     * @brief Migrate @p task, classifying any failure.
     *
     * Never throws; every failure is logged and reported in the result.
     */
    TransferReport run(const MigrationTask& task) const noexcept;

    /// Convenience wrapper returning only the success flag.
    bool transfer(const MigrationTask& task) const noexcept { return run(task).success; }

    std::chrono::seconds timeout() const { return timeout_; }
    const std::filesystem::path& workspace_root() const { return root_; }

  private:
    size_t execute(const MigrationTask& task) const;
    void inspect(const MigrationTask& task, const std::filesystem::path& mirror,
                 size_t& refs) const;

    TransferOperation& transfer_;
    LogSink& log_;
    std::chrono::seconds timeout_;
    std::filesystem::path root_;
};

/**
 * @brief Turn a CommandResult into an exception when it signals failure.
 *
 * @param result  Result of the external operation.
 * @param what    Operation label used in the message ("mirror fetch").
 * @param secrets Secret material to redact from captured output.
 * @throws TransferTimeoutError if the operation timed out.
 * @throws TransferError if it exited with a non-zero status.
 */
void check_transfer_result(const CommandResult& result, const std::string& what,
                           const std::vector<std::string>& secrets);

} // namespace gitmigrate

#endif // MIRROR_EXECUTOR_HPP
