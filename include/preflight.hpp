#ifndef PREFLIGHT_HPP
#define PREFLIGHT_HPP

#include <chrono>
#include <string>
#include <vector>

#include "logger.hpp"
#include "migration_types.hpp"
#include "transfer_operation.hpp"

namespace gitmigrate {

/**
 * @brief Advisory reachability check of destination endpoints.
 *
 * A failed probe never stops the batch; callers log a warning and continue.
 */
class PreflightValidator {
  public:
    PreflightValidator(TransferOperation& transfer, LogSink& log,
                       std::chrono::seconds timeout = kProbeTimeout);

    /**
     * @brief Probe @p endpoint with a remote listing.
     *
     * Credential, network, authentication and timeout failures all yield
     * `false`. Never throws.
     */
    bool probe(const DestinationEndpoint& endpoint) const noexcept;

    /**
     * @brief Probe the destination of every task, warning about each
     *        unreachable one.
     *
     * @return Names of the tasks whose destination could not be reached.
     */
    std::vector<std::string> check_destinations(const std::vector<MigrationTask>& tasks) const;

  private:
    TransferOperation& transfer_;
    LogSink& log_;
    std::chrono::seconds timeout_;
};

} // namespace gitmigrate

#endif // PREFLIGHT_HPP
