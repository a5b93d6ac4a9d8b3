#include "mirror_executor.hpp"

#include <memory>

#include "credential_resolver.hpp"
#include "git_utils.hpp"
#include "system_utils.hpp"

namespace fs = std::filesystem;

namespace gitmigrate {

void check_transfer_result(const CommandResult& result, const std::string& what,
                           const std::vector<std::string>& secrets) {
    if (result.timed_out)
        throw TransferTimeoutError(what + " exceeded its time limit");
    if (result.exit_code != 0) {
        std::string output = redact_secrets(result.output, secrets);
        while (!output.empty() && (output.back() == '\n' || output.back() == '\r'))
            output.pop_back();
        std::string msg = what + " failed (exit " + std::to_string(result.exit_code) + ")";
        if (!output.empty())
            msg += ": " + output;
        throw TransferError(msg, result.exit_code, std::move(output));
    }
}

MirrorTransferExecutor::MirrorTransferExecutor(TransferOperation& transfer, LogSink& log,
                                               std::chrono::seconds timeout,
                                               fs::path workspace_root)
    : transfer_(transfer), log_(log), timeout_(timeout), root_(std::move(workspace_root)) {}

void MirrorTransferExecutor::inspect(const MigrationTask& task, const fs::path& mirror,
                                     size_t& refs) const {
    git::GitInitGuard guard;
    std::string err;
    auto summary = git::inspect_mirror(mirror, &err);
    if (!summary) {
        log_.warning("Cannot inspect fetched mirror", {{"task", task.name}, {"error", err}});
        return;
    }
    refs = summary->refs;
    if (summary->refs == 0) {
        log_.warning("Source repository has no references", {{"task", task.name}});
        return;
    }
    if (!task.source.branch.empty() && !summary->has_branch(task.source.branch)) {
        log_.warning("Configured source branch not found in mirror",
                     {{"task", task.name}, {"branch", task.source.branch}});
    }
    log_.debug("Mirror fetched", {{"task", task.name},
                                  {"refs", std::to_string(summary->refs)},
                                  {"branches", std::to_string(summary->branches.size())},
                                  {"tags", std::to_string(summary->tags)}});
}

static std::unique_ptr<procutil::TempWorkspace> make_workspace(const fs::path& configured,
                                                              const std::string& label) {
    try {
        const fs::path root = configured.empty() ? fs::temp_directory_path() : configured;
        return std::make_unique<procutil::TempWorkspace>(root, label);
    } catch (const fs::filesystem_error& e) {
        throw UnexpectedError(std::string("cannot create workspace: ") + e.what());
    }
}

size_t MirrorTransferExecutor::execute(const MigrationTask& task) const {
    auto workspace = make_workspace(root_, task.name);
    const fs::path mirror = workspace->path() / "repo.git";

    PreparedEndpoint src = prepare_endpoint(task.source.url, task.source.auth);
    if (src.env.count(kSshCommandVar))
        log_.debug("Host key verification disabled for key-based source authentication",
                   {{"task", task.name}});
    log_.debug("Fetching mirror",
               {{"task", task.name}, {"source", redact_url(task.source.url)}});
    check_transfer_result(transfer_.mirror_fetch(src.url, mirror, src.env, timeout_),
                          "mirror fetch", src.secrets);

    size_t refs = 0;
    inspect(task, mirror, refs);

    for (const auto& kv : task.options) {
        if (kv.first != "mirror" && kv.first != "prune")
            log_.debug("Ignoring unknown task option", {{"task", task.name}, {"option", kv.first}});
    }
    PreparedEndpoint dst = prepare_endpoint(task.destination.url, task.destination.auth);
    if (dst.env.count(kSshCommandVar))
        log_.debug("Host key verification disabled for key-based destination authentication",
                   {{"task", task.name}});
    log_.debug("Pushing mirror",
               {{"task", task.name}, {"destination", redact_url(task.destination.url)}});
    check_transfer_result(
        transfer_.mirror_push(mirror, dst.url, dst.env, timeout_, task.options), "mirror push",
        dst.secrets);
    return refs;
}

TransferReport MirrorTransferExecutor::run(const MigrationTask& task) const noexcept {
    TransferReport report;
    try {
        report.refs = execute(task);
        report.success = true;
        log_.debug("Migration finished", {{"task", task.name}});
        return report;
    } catch (const CredentialError& e) {
        report.failure = FailureKind::CREDENTIAL;
        report.detail = e.what();
    } catch (const TransferTimeoutError& e) {
        report.failure = FailureKind::TIMEOUT;
        report.detail = e.what();
    } catch (const TransferError& e) {
        report.failure = FailureKind::TRANSFER;
        report.detail = e.what();
    } catch (const UnexpectedError& e) {
        report.failure = FailureKind::UNEXPECTED;
        report.detail = e.what();
    } catch (const std::exception& e) {
        report.failure = FailureKind::UNEXPECTED;
        report.detail = std::string("unexpected error: ") + e.what();
    } catch (...) {
        report.failure = FailureKind::UNEXPECTED;
        report.detail = "unexpected error: unknown exception";
    }
    log_.error("Migration failed", {{"task", task.name},
                                    {"kind", failure_kind_name(report.failure)},
                                    {"error", report.detail}});
    return report;
}

} // namespace gitmigrate
