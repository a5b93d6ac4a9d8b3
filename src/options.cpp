#include <climits>
#include <map>
#include <set>
#include <stdexcept>
#include <string>
#include "arg_parser.hpp"
#include "options.hpp"
#include "parse_utils.hpp"

namespace fs = std::filesystem;

Options parse_options(int argc, char* argv[]) {
    const std::set<std::string> value_flags{"--concurrency",  "--max-retries", "--retry-delay",
                                            "--timeout",      "--workspace",   "--report",
                                            "--log-file",     "--log-level",   "--max-log-size"};
    std::set<std::string> known{"--help",         "--version",   "--config-json", "--no-retry",
                                "--no-preflight", "--dry-run",   "--json-log",    "--silent",
                                "--no-colors"};
    known.insert(value_flags.begin(), value_flags.end());
    const std::map<char, std::string> short_map{{'h', "--help"},
                                                {'V', "--version"},
                                                {'s', "--silent"},
                                                {'n', "--concurrency"},
                                                {'l', "--log-file"},
                                                {'L', "--log-level"}};
    ArgParser parser(argc, argv, known, short_map, value_flags);

    Options opts;
    opts.show_help = parser.has_flag("--help");
    opts.print_version = parser.has_flag("--version");
    if (opts.show_help || opts.print_version)
        return opts;

    if (!parser.unknown_flags().empty())
        throw std::runtime_error("Unknown option: " + parser.unknown_flags().front());
    if (!parser.missing_values().empty())
        throw std::runtime_error(parser.missing_values().front() + " requires a value");
    if (parser.positional().size() > 1)
        throw std::runtime_error("Unexpected argument: " + parser.positional()[1]);
    if (!parser.positional().empty())
        opts.config_file = parser.positional().front();

    opts.config_json = parser.has_flag("--config-json");
    opts.dry_run = parser.has_flag("--dry-run");
    opts.preflight = !parser.has_flag("--no-preflight");
    opts.silent = parser.has_flag("--silent");
    opts.no_colors = parser.has_flag("--no-colors");
    if (parser.has_flag("--workspace"))
        opts.workspace = parser.get_option("--workspace");
    if (parser.has_flag("--report"))
        opts.report_file = parser.get_option("--report");

    bool ok = true;
    if (parser.has_flag("--concurrency")) {
        opts.batch.concurrency = parse_size_t(parser, "--concurrency", 1, 1024, ok);
        if (!ok)
            throw std::runtime_error("Invalid value for --concurrency");
    }
    if (parser.has_flag("--max-retries")) {
        opts.batch.max_retries = parse_int(parser, "--max-retries", 0, INT_MAX, ok);
        if (!ok)
            throw std::runtime_error("Invalid value for --max-retries");
    }
    if (parser.has_flag("--retry-delay")) {
        opts.batch.retry_delay = parse_duration(parser, "--retry-delay", ok);
        if (!ok)
            throw std::runtime_error("Invalid value for --retry-delay");
    }
    if (parser.has_flag("--timeout")) {
        auto t = parse_duration(parser, "--timeout", ok);
        if (!ok || t.count() < 1)
            throw std::runtime_error("Invalid value for --timeout");
        opts.batch.timeout = t;
    }
    opts.batch.no_retry = parser.has_flag("--no-retry");

    if (parser.has_flag("--log-file")) {
        std::string file = parser.get_option("--log-file");
        if (file.empty())
            throw std::runtime_error("--log-file requires a value");
        opts.logging.log_file = file;
    }
    if (parser.has_flag("--log-level")) {
        LogLevel level = LogLevel::INFO;
        const std::string val = parser.get_option("--log-level");
        if (!parse_log_level(val, level))
            throw std::runtime_error("Invalid log level: " + val);
        opts.logging.log_level = level;
    }
    if (parser.has_flag("--max-log-size")) {
        opts.logging.max_log_size = parse_bytes(parser, "--max-log-size", ok);
        if (!ok)
            throw std::runtime_error("Invalid value for --max-log-size");
    }
    opts.logging.json_log = parser.has_flag("--json-log");
    return opts;
}

void apply_overrides(const Options& opts, gitmigrate::TaskCatalog& catalog) {
    auto& s = catalog.settings;
    if (opts.batch.concurrency)
        s.max_concurrent = *opts.batch.concurrency;
    if (opts.batch.max_retries)
        s.max_retries = *opts.batch.max_retries;
    if (opts.batch.retry_delay)
        s.retry_delay = *opts.batch.retry_delay;
    if (opts.batch.timeout)
        s.transfer_timeout = *opts.batch.timeout;
    if (opts.batch.no_retry)
        s.retry_on_failure = false;

    auto& l = catalog.logging;
    if (opts.logging.log_file)
        l.file = *opts.logging.log_file;
    if (opts.logging.log_level)
        l.level = *opts.logging.log_level;
    if (opts.logging.max_log_size)
        l.max_size = *opts.logging.max_log_size;
    if (opts.logging.json_log)
        l.json = true;
}
