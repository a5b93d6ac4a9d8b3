#ifndef CONFIG_UTILS_HPP
#define CONFIG_UTILS_HPP

#include <cstddef>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "logger.hpp"
#include "migration_types.hpp"

namespace gitmigrate {

/**
 * @brief Logging section of a task catalog.
 */
struct LoggingSettings {
    LogLevel level = LogLevel::INFO;
    std::string file = "migration.log"; ///< Empty disables file logging
    bool json = false;
    size_t max_size = 0;    ///< Rotation threshold in bytes, 0 disables rotation
    size_t max_files = 3;
    bool compress = false;
    bool syslog = false;
};

/**
 * @brief Validated contents of a task catalog file.
 */
struct TaskCatalog {
    std::vector<MigrationTask> tasks;
    BatchSettings settings;
    LoggingSettings logging;
};

/**
 * @brief Load and validate the task catalog at @p path.
 *
 * The format is chosen by extension (`.json` selects JSON, anything else
 * YAML) unless @p force_json is set.
 *
 * @throws ConfigValidationError if the file cannot be read or parsed, or if
 *         its structure is invalid.
 */
TaskCatalog load_task_catalog(const std::string& path, bool force_json = false);

/// Parse a YAML catalog document.
TaskCatalog parse_yaml_catalog(const std::string& text);

/// Parse a JSON catalog document.
TaskCatalog parse_json_catalog(const std::string& text);

/**
 * @brief Build a catalog from an already parsed document tree.
 *
 * YAML documents are converted to the same tree before validation so both
 * formats share one set of rules.
 */
TaskCatalog build_catalog(const nlohmann::json& root);

/**
 * @brief Expand `${VAR}` references in @p value from the environment.
 *
 * @param field Field path used in the error message.
 * @throws ConfigValidationError when a referenced variable is undefined or a
 *         reference is unterminated.
 */
std::string expand_env_vars(const std::string& value, const std::string& field);

/**
 * @brief Reject duplicate task names.
 *
 * @throws ConfigValidationError naming the first duplicate.
 */
void ensure_unique_names(const std::vector<MigrationTask>& tasks);

} // namespace gitmigrate

#endif // CONFIG_UTILS_HPP
