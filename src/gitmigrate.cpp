/**
 * @file gitmigrate.cpp
 * @brief CLI entry point running a batch of repository migrations.
 *
 * Loads the task catalog, configures logging, probes destinations and hands
 * the tasks to the Migrator. The exit status tells whether every migration
 * succeeded.
 */

#include <iostream>

#include "config_utils.hpp"
#include "git_utils.hpp"
#include "logger.hpp"
#include "migrator.hpp"
#include "options.hpp"
#include "report.hpp"
#include "version.hpp"

using namespace gitmigrate;

namespace {

constexpr int kExitOk = 0;
constexpr int kExitTaskFailures = 1;
constexpr int kExitConfigError = 2;

void setup_logging(const LoggingSettings& l, bool silent) {
    set_console_logging(!silent);
    set_json_logging(l.json);
    set_log_compression(l.compress);
    if (!l.file.empty())
        init_logger(l.file, l.level, l.max_size, l.max_files);
    else
        set_log_level(l.level);
    if (l.syslog)
        init_syslog();
}

} // namespace

/**
 * @brief Application entry point.
 *
 * @return 0 if every migration succeeded or help/version/dry-run was
 *         requested, 1 if any migration failed after retries, 2 on
 *         configuration or usage errors.
 */
int main(int argc, char* argv[]) {
    git::GitInitGuard git_guard;
    Options opts;
    TaskCatalog catalog;
    try {
        opts = parse_options(argc, argv);
        if (opts.show_help) {
            print_help(argv[0]);
            return kExitOk;
        }
        if (opts.print_version) {
            std::cout << GITMIGRATE_VERSION << "\n";
            return kExitOk;
        }
        catalog = load_task_catalog(opts.config_file.string(), opts.config_json);
        apply_overrides(opts, catalog);
    } catch (const std::exception& e) {
        std::cerr << "Configuration error: " << e.what() << "\n";
        return kExitConfigError;
    }

    const ReportColors colors = make_report_colors(opts.no_colors);
    if (opts.dry_run) {
        std::cout << render_plan(catalog, colors);
        return kExitOk;
    }

    try {
        setup_logging(catalog.logging, opts.silent);
        LogSink& log = default_log_sink();
        log.info("Starting gitmigrate", {{"version", GITMIGRATE_VERSION},
                                         {"config", opts.config_file.string()}});

        GitCliTransfer transfer;
        Migrator migrator(transfer, log, catalog.settings, opts.workspace);
        if (opts.preflight)
            migrator.preflight(catalog.tasks);

        ProgressCallback progress;
        if (!opts.silent)
            progress = [](size_t done, size_t total) {
                std::cout << render_progress(done, total) << std::endl;
            };
        BatchResult result = migrator.run(catalog.tasks, progress);

        if (!opts.silent)
            std::cout << render_summary(result, colors);
        if (!opts.report_file.empty())
            write_report(opts.report_file, result);
        log.info("Migration complete", {{"success", std::to_string(result.success)},
                                        {"failed", std::to_string(result.failed)}});
        shutdown_logger();
        return result.all_succeeded() ? kExitOk : kExitTaskFailures;
    } catch (const ConfigValidationError& e) {
        log_error(std::string("Configuration error: ") + e.what());
        shutdown_logger();
        std::cerr << "Configuration error: " << e.what() << "\n";
        return kExitConfigError;
    } catch (const std::exception& e) {
        log_error(std::string("Unexpected error: ") + e.what());
        shutdown_logger();
        std::cerr << "Unexpected error: " << e.what() << "\n";
        return kExitTaskFailures;
    }
}
