#include "preflight.hpp"

#include "credential_resolver.hpp"

namespace gitmigrate {

PreflightValidator::PreflightValidator(TransferOperation& transfer, LogSink& log,
                                       std::chrono::seconds timeout)
    : transfer_(transfer), log_(log), timeout_(timeout) {}

bool PreflightValidator::probe(const DestinationEndpoint& endpoint) const noexcept {
    try {
        PreparedEndpoint prepared = prepare_endpoint(endpoint.url, endpoint.auth);
        CommandResult r = transfer_.remote_probe(prepared.url, prepared.env, timeout_);
        if (r.timed_out) {
            log_.debug("Probe timed out", {{"url", redact_url(endpoint.url)}});
            return false;
        }
        if (r.exit_code != 0) {
            log_.debug("Probe failed", {{"url", redact_url(endpoint.url)},
                                        {"exit", std::to_string(r.exit_code)},
                                        {"output", redact_secrets(r.output, prepared.secrets)}});
            return false;
        }
        return true;
    } catch (const std::exception& e) {
        log_.warning("Error while validating access",
                     {{"url", redact_url(endpoint.url)}, {"error", e.what()}});
        return false;
    }
}

std::vector<std::string>
PreflightValidator::check_destinations(const std::vector<MigrationTask>& tasks) const {
    std::vector<std::string> unreachable;
    log_.info("Validating access to destination repositories");
    for (const auto& task : tasks) {
        if (!probe(task.destination)) {
            log_.warning("Could not validate access to destination",
                         {{"task", task.name}, {"url", redact_url(task.destination.url)}});
            unreachable.push_back(task.name);
        }
    }
    return unreachable;
}

} // namespace gitmigrate
