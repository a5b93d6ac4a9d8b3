#include "process_runner.hpp"

#include <cerrno>
#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include <algorithm>
#include <climits>
#include <system_error>
#include <thread>

#include "system_utils.hpp"

extern char** environ;

namespace procutil {

namespace {

using Clock = std::chrono::steady_clock;

std::vector<std::string> build_environment(const std::map<std::string, std::string>& overrides) {
    std::vector<std::string> env;
    for (char** e = environ; e && *e; ++e) {
        std::string entry(*e);
        auto eq = entry.find('=');
        std::string key = entry.substr(0, eq);
        if (overrides.count(key))
            continue;
        env.push_back(std::move(entry));
    }
    for (const auto& [k, v] : overrides)
        env.push_back(k + "=" + v);
    return env;
}

std::vector<char*> to_pointers(std::vector<std::string>& items) {
    std::vector<char*> out;
    out.reserve(items.size() + 1);
    for (auto& s : items)
        out.push_back(s.data());
    out.push_back(nullptr);
    return out;
}

int decode_status(int status) {
    if (WIFEXITED(status))
        return WEXITSTATUS(status);
    if (WIFSIGNALED(status))
        return 128 + WTERMSIG(status);
    return -1;
}

int remaining_ms(bool has_deadline, Clock::time_point deadline) {
    if (!has_deadline)
        return -1;
    auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - Clock::now());
    return static_cast<int>(std::clamp<long long>(left.count(), 0, INT_MAX));
}

} // namespace

CommandResult run_command(const CommandSpec& spec, size_t max_output) {
    std::vector<std::string> argv_store;
    argv_store.reserve(spec.args.size() + 1);
    argv_store.push_back(spec.program);
    argv_store.insert(argv_store.end(), spec.args.begin(), spec.args.end());
    std::vector<std::string> env_store = build_environment(spec.env);
    std::vector<char*> argv = to_pointers(argv_store);
    std::vector<char*> envp = to_pointers(env_store);
    const std::string workdir = spec.working_dir.string();

    int fds[2];
    if (pipe2(fds, O_CLOEXEC) != 0)
        throw std::system_error(errno, std::generic_category(), "pipe2");
    UniqueFd read_end(fds[0]);
    UniqueFd write_end(fds[1]);

    pid_t pid = fork();
    if (pid < 0)
        throw std::system_error(errno, std::generic_category(), "fork");
    if (pid == 0) {
        setpgid(0, 0);
        int devnull = open("/dev/null", O_RDONLY);
        if (devnull >= 0)
            dup2(devnull, STDIN_FILENO);
        dup2(write_end.get(), STDOUT_FILENO);
        dup2(write_end.get(), STDERR_FILENO);
        if (!workdir.empty() && chdir(workdir.c_str()) != 0)
            _exit(127);
        execvpe(argv[0], argv.data(), envp.data());
        _exit(127);
    }
    setpgid(pid, pid);
    write_end.reset();

    const bool has_deadline = spec.timeout.count() > 0;
    const Clock::time_point deadline = Clock::now() + spec.timeout;
    CommandResult result;
    fcntl(read_end.get(), F_SETFL, fcntl(read_end.get(), F_GETFL) | O_NONBLOCK);

    char buf[4096];
    bool eof = false;
    while (!eof) {
        int wait_ms = remaining_ms(has_deadline, deadline);
        if (has_deadline && wait_ms == 0) {
            result.timed_out = true;
            break;
        }
        pollfd pfd{read_end.get(), POLLIN, 0};
        int rc = poll(&pfd, 1, wait_ms);
        if (rc < 0) {
            if (errno == EINTR)
                continue;
            break;
        }
        if (rc == 0)
            continue;
        ssize_t n = read(read_end.get(), buf, sizeof(buf));
        if (n > 0) {
            size_t room = max_output > result.output.size() ? max_output - result.output.size() : 0;
            result.output.append(buf, std::min(room, static_cast<size_t>(n)));
        } else if (n == 0) {
            eof = true;
        } else if (errno != EAGAIN && errno != EINTR) {
            eof = true;
        }
    }

    int status = 0;
    while (!result.timed_out) {
        pid_t w = waitpid(pid, &status, WNOHANG);
        if (w == pid) {
            result.exit_code = decode_status(status);
            return result;
        }
        if (w < 0 && errno != EINTR)
            return result;
        if (has_deadline && Clock::now() >= deadline) {
            result.timed_out = true;
            break;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }

    kill(-pid, SIGKILL);
    kill(pid, SIGKILL);
    while (waitpid(pid, &status, 0) < 0 && errno == EINTR) {
    }
    result.exit_code = decode_status(status);
    return result;
}

} // namespace procutil
