#ifndef TRANSFER_OPERATION_HPP
#define TRANSFER_OPERATION_HPP

#include <chrono>
#include <filesystem>
#include <string>
#include <vector>

#include "credential_resolver.hpp"
#include "migration_types.hpp"
#include "process_runner.hpp"

namespace gitmigrate {

using procutil::CommandResult;

/**
 * @brief Port to the external mirror transfer operation.
 *
 * One method per operation kind. Implementations report failures through the
 * returned CommandResult (non-zero exit or timed_out) and only throw for
 * faults that prevent the operation from being attempted at all.
 */
class TransferOperation {
  public:
    virtual ~TransferOperation() = default;

    /// Full mirror fetch of @p url into a new bare repository at @p dest.
    virtual CommandResult mirror_fetch(const std::string& url, const std::filesystem::path& dest,
                                       const EnvOverrides& env, std::chrono::seconds timeout) = 0;

    /// Push every reference of @p repo to @p url.
    virtual CommandResult mirror_push(const std::filesystem::path& repo, const std::string& url,
                                      const EnvOverrides& env, std::chrono::seconds timeout,
                                      const TaskOptions& options) = 0;

    /// Lightweight remote listing used as a reachability check.
    virtual CommandResult remote_probe(const std::string& url, const EnvOverrides& env,
                                       std::chrono::seconds timeout) = 0;
};

/**
 * @brief TransferOperation backed by the `git` command-line client.
 *
 * - mirror-fetch: `git clone --mirror <url> <dest>`
 * - mirror-push:  `git -C <repo> push --mirror <url>`, or with option
 *   `mirror=false`, `git -C <repo> push --all --follow-tags [--prune] <url>`
 * - remote-probe: `git ls-remote --heads <url>`
 *
 * Every invocation sets `GIT_TERMINAL_PROMPT=0` so git never waits for
 * interactive input.
 */
class GitCliTransfer : public TransferOperation {
  public:
    explicit GitCliTransfer(std::string git_program = "git");

    CommandResult mirror_fetch(const std::string& url, const std::filesystem::path& dest,
                               const EnvOverrides& env, std::chrono::seconds timeout) override;
    CommandResult mirror_push(const std::filesystem::path& repo, const std::string& url,
                              const EnvOverrides& env, std::chrono::seconds timeout,
                              const TaskOptions& options) override;
    CommandResult remote_probe(const std::string& url, const EnvOverrides& env,
                               std::chrono::seconds timeout) override;

    /// Arguments used for the push leg; exposed for tests.
    static std::vector<std::string> push_arguments(const std::filesystem::path& repo,
                                                   const std::string& url,
                                                   const TaskOptions& options);

  private:
    CommandResult run(std::vector<std::string> args, const EnvOverrides& env,
                      std::chrono::seconds timeout) const;

    std::string git_;
};

/**
 * @brief Interpret a textual option flag ("true", "yes", "1", "on").
 *
 * @return @p fallback when @p key is absent.
 */
bool option_enabled(const TaskOptions& options, const std::string& key, bool fallback);

} // namespace gitmigrate

#endif // TRANSFER_OPERATION_HPP
