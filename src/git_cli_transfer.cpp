#include "transfer_operation.hpp"

#include <algorithm>
#include <cctype>

namespace fs = std::filesystem;

namespace gitmigrate {

bool option_enabled(const TaskOptions& options, const std::string& key, bool fallback) {
    auto it = options.find(key);
    if (it == options.end())
        return fallback;
    std::string v = it->second;
    std::transform(v.begin(), v.end(), v.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (v == "true" || v == "yes" || v == "1" || v == "on")
        return true;
    if (v == "false" || v == "no" || v == "0" || v == "off")
        return false;
    return fallback;
}

GitCliTransfer::GitCliTransfer(std::string git_program) : git_(std::move(git_program)) {}

CommandResult GitCliTransfer::run(std::vector<std::string> args, const EnvOverrides& env,
                                  std::chrono::seconds timeout) const {
    procutil::CommandSpec spec;
    spec.program = git_;
    spec.args = std::move(args);
    spec.env = env;
    spec.env.emplace("GIT_TERMINAL_PROMPT", "0");
    spec.timeout = timeout;
    return procutil::run_command(spec);
}

CommandResult GitCliTransfer::mirror_fetch(const std::string& url, const fs::path& dest,
                                           const EnvOverrides& env, std::chrono::seconds timeout) {
    return run({"clone", "--mirror", "--quiet", "--", url, dest.string()}, env, timeout);
}

std::vector<std::string> GitCliTransfer::push_arguments(const fs::path& repo,
                                                        const std::string& url,
                                                        const TaskOptions& options) {
    std::vector<std::string> args{"-C", repo.string(), "push"};
    if (option_enabled(options, "mirror", true)) {
        args.push_back("--mirror");
    } else {
        args.push_back("--all");
        args.push_back("--follow-tags");
        if (option_enabled(options, "prune", false))
            args.push_back("--prune");
    }
    args.push_back("--quiet");
    args.push_back("--");
    args.push_back(url);
    return args;
}

CommandResult GitCliTransfer::mirror_push(const fs::path& repo, const std::string& url,
                                          const EnvOverrides& env, std::chrono::seconds timeout,
                                          const TaskOptions& options) {
    return run(push_arguments(repo, url, options), env, timeout);
}

CommandResult GitCliTransfer::remote_probe(const std::string& url, const EnvOverrides& env,
                                           std::chrono::seconds timeout) {
    return run({"ls-remote", "--heads", "--", url}, env, timeout);
}

} // namespace gitmigrate
