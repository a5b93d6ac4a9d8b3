#ifndef MIGRATION_TYPES_HPP
#define MIGRATION_TYPES_HPP

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "errors.hpp"

namespace gitmigrate {

/// Default per-call timeout of the external transfer operation.
constexpr std::chrono::seconds kDefaultTransferTimeout{300};
/// Timeout of the advisory reachability probe.
constexpr std::chrono::seconds kProbeTimeout{10};

struct NoAuth {};

struct TokenAuth {
    std::string token;
};

struct BasicAuth {
    std::string username;
    std::string password;
};

struct SshAuth {
    std::optional<std::filesystem::path> key_path;
};

/**
 * @brief Closed set of authentication descriptors.
 *
 * Consumers dispatch with std::visit so every alternative is handled.
 */
using AuthCredential = std::variant<NoAuth, TokenAuth, BasicAuth, SshAuth>;

/** @return "none", "token", "basic" or "ssh". */
const char* auth_kind_name(const AuthCredential& cred);

struct SourceEndpoint {
    std::string url;
    std::string branch = "main";
    AuthCredential auth = NoAuth{};
};

struct DestinationEndpoint {
    std::string url;
    bool create_if_missing = true;
    AuthCredential auth = NoAuth{};
};

/// Free-form options handed through to the push leg (e.g. "mirror", "prune").
using TaskOptions = std::map<std::string, std::string>;

struct MigrationTask {
    std::string name; ///< Unique within a batch
    SourceEndpoint source;
    DestinationEndpoint destination;
    TaskOptions options;
};

struct BatchSettings {
    size_t max_concurrent = 3;
    bool retry_on_failure = true;
    int max_retries = 2;
    std::chrono::seconds retry_delay{5};
    std::chrono::seconds transfer_timeout = kDefaultTransferTimeout;
};

/**
 * @brief Per-task detail record.
 */
struct TaskOutcome {
    std::string name;
    bool success = false;
    int attempt = 1;                  ///< Attempt that produced this record
    bool retry = false;               ///< Set once a retry pass touched the task
    FailureKind failure = FailureKind::NONE;
    std::optional<std::string> error; ///< Redacted error detail
};

/**
 * @brief Aggregate outcome of a batch.
 *
 * After the batch settles `success + failed == total` and
 * `failed == failed_names.size()`.
 */
struct BatchResult {
    size_t total = 0;
    size_t success = 0;
    size_t failed = 0;
    std::vector<std::string> failed_names;
    std::vector<TaskOutcome> details;

    bool all_succeeded() const { return failed == 0; }
    const TaskOutcome* find(const std::string& name) const;
};

/// First-pass failure handed to the retry coordinator.
struct FailedTask {
    MigrationTask task;
    int attempt = 1;
};

} // namespace gitmigrate

#endif // MIGRATION_TYPES_HPP
