#ifndef OPTIONS_HPP
#define OPTIONS_HPP
#include <chrono>
#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include "config_utils.hpp"
#include "logger.hpp"

/**
 * @brief Logging overrides given on the command line.
 *
 * Unset members leave the catalog's `logging` section in effect.
 */
struct LoggingOptions {
    std::optional<std::string> log_file;
    std::optional<LogLevel> log_level;
    std::optional<size_t> max_log_size;
    bool json_log = false;
};

/**
 * @brief Batch overrides given on the command line.
 */
struct BatchOverrides {
    std::optional<size_t> concurrency;
    std::optional<int> max_retries;
    std::optional<std::chrono::seconds> retry_delay;
    std::optional<std::chrono::seconds> timeout;
    bool no_retry = false;
};

struct Options {
    std::filesystem::path config_file = "config.yaml";
    bool config_json = false;
    bool show_help = false;
    bool print_version = false;
    bool dry_run = false;
    bool preflight = true;
    bool silent = false;
    bool no_colors = false;
    std::filesystem::path workspace;
    std::filesystem::path report_file;
    LoggingOptions logging;
    BatchOverrides batch;
};

/**
 * Parse command-line arguments into an Options instance.
 *
 * @param argc Number of command-line arguments.
 * @param argv Argument vector.
 * @return Populated Options structure.
 * @throws std::runtime_error on unknown flags, missing or invalid values.
 */
Options parse_options(int argc, char* argv[]);

/**
 * Apply command line overrides on top of a loaded catalog.
 *
 * Side effects: updates @p catalog settings and logging sections.
 */
void apply_overrides(const Options& opts, gitmigrate::TaskCatalog& catalog);

/**
 * Print usage information to stdout.
 */
void print_help(const char* prog);

#endif // OPTIONS_HPP
