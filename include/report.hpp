#ifndef REPORT_HPP
#define REPORT_HPP

#include <cstddef>
#include <filesystem>
#include <string>

#include <nlohmann/json.hpp>

#include "config_utils.hpp"
#include "migration_types.hpp"

/**
 * @brief ANSI sequences used by the console report.
 *
 * All members are empty when colors are disabled.
 */
struct ReportColors {
    std::string reset;
    std::string green;
    std::string yellow;
    std::string red;
    std::string cyan;
    std::string bold;
};

/**
 * @brief Create a color palette honoring the user's preference.
 */
ReportColors make_report_colors(bool no_colors);

/** @return `Progress: [completed/total] p%` with one decimal. */
std::string render_progress(size_t completed, size_t total);

/**
 * @brief Render the final summary block.
 *
 * Lists total, success and failure counts followed by the failed task names.
 */
std::string render_summary(const gitmigrate::BatchResult& result, const ReportColors& colors);

/**
 * @brief Render the dry-run plan of a catalog.
 *
 * URLs are redacted; credentials are shown only by kind.
 */
std::string render_plan(const gitmigrate::TaskCatalog& catalog, const ReportColors& colors);

/// Serialize a result, details included, for `--report`.
nlohmann::json result_to_json(const gitmigrate::BatchResult& result);

/**
 * @brief Write @p result as pretty-printed JSON to @p path.
 *
 * @throws std::runtime_error if the file cannot be written.
 */
void write_report(const std::filesystem::path& path, const gitmigrate::BatchResult& result);

#endif // REPORT_HPP
