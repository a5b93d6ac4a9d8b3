#ifndef PROCESS_RUNNER_HPP
#define PROCESS_RUNNER_HPP

#include <chrono>
#include <filesystem>
#include <map>
#include <string>
#include <vector>

namespace procutil {

/**
 * @brief Description of a child process to launch.
 */
struct CommandSpec {
    std::string program;                    ///< Looked up on PATH
    std::vector<std::string> args;          ///< Arguments after argv[0]
    std::map<std::string, std::string> env; ///< Overrides on top of the inherited environment
    std::filesystem::path working_dir;      ///< Empty keeps the current directory
    std::chrono::milliseconds timeout{0};   ///< Zero disables the deadline
};

/**
 * @brief Outcome of a child process.
 */
struct CommandResult {
    int exit_code = -1;     ///< Exit status, 128+signal, or 127 when exec failed
    std::string output;     ///< Combined stdout and stderr
    bool timed_out = false; ///< The deadline expired and the child was killed

    bool ok() const { return !timed_out && exit_code == 0; }
};

/**
 * @brief Run a command to completion, capturing its output.
 *
 * The child runs in its own process group with stdin redirected from
 * /dev/null. When the timeout expires the whole group receives SIGKILL and
 * the result is flagged as timed out. Output beyond @p max_output bytes is
 * discarded.
 *
 * @throws std::system_error when the pipe or the child cannot be created.
 */
CommandResult run_command(const CommandSpec& spec, size_t max_output = 1 << 20);

} // namespace procutil

#endif // PROCESS_RUNNER_HPP
