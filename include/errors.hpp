#ifndef ERRORS_HPP
#define ERRORS_HPP

#include <stdexcept>
#include <string>
#include <utility>

namespace gitmigrate {

/**
 * @brief Classification attached to a failed task outcome.
 */
enum class FailureKind {
    NONE,       ///< Task succeeded
    CREDENTIAL, ///< Authentication descriptor incomplete or key file missing
    TRANSFER,   ///< External operation exited non-zero
    TIMEOUT,    ///< External operation exceeded its timeout
    UNEXPECTED  ///< Any other fault while running the task
};

const char* failure_kind_name(FailureKind kind);

/** Base of every error raised by the migration core. */
class MigrationError : public std::runtime_error {
  public:
    using std::runtime_error::runtime_error;
};

/** Task catalog is missing required structure. Fatal before any task runs. */
class ConfigValidationError : public MigrationError {
  public:
    using MigrationError::MigrationError;
};

/** Authentication descriptor cannot be turned into connection parameters. */
class CredentialError : public MigrationError {
  public:
    using MigrationError::MigrationError;
};

/**
 * @brief External transfer operation exited with a non-zero status.
 *
 * Carries the captured diagnostic output with any embedded secret already
 * redacted.
 */
class TransferError : public MigrationError {
  public:
    TransferError(const std::string& what, int exit_code, std::string output)
        : MigrationError(what), exit_code_(exit_code), output_(std::move(output)) {}

    int exit_code() const noexcept { return exit_code_; }
    const std::string& output() const noexcept { return output_; }

  private:
    int exit_code_;
    std::string output_;
};

/** External transfer operation did not finish within its timeout. */
class TransferTimeoutError : public MigrationError {
  public:
    using MigrationError::MigrationError;
};

/** Workspace, I/O or other fault while running a task. */
class UnexpectedError : public MigrationError {
  public:
    using MigrationError::MigrationError;
};

} // namespace gitmigrate

#endif // ERRORS_HPP
