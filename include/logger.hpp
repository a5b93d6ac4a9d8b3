#ifndef LOGGER_HPP
#define LOGGER_HPP
#include <cstddef>
#include <map>
#include <string>

enum class LogLevel { DEBUG = 0, INFO, WARNING, ERR };

using LogFields = std::map<std::string, std::string>;

/**
 * @brief Initialize the file logger.
 *
 * Opens the log file at @p path and starts the background writer thread.
 * Calling it again reopens the sink at the new path.
 *
 * @param path      Filesystem path where the log file will be written.
 * @param level     Minimum @ref LogLevel severity to record.
 * @param max_size  Maximum size in bytes before rotating the file. A value of
 *                  `0` disables size-based rotation.
 * @param max_files Number of rotated log files to keep.
 */
void init_logger(const std::string& path, LogLevel level = LogLevel::INFO, size_t max_size = 0,
                 size_t max_files = 1);

/** @brief Set the global minimum log level. */
void set_log_level(LogLevel level);

/** @brief Emit JSON objects (one per line) instead of plain text. */
void set_json_logging(bool enable);

/** @brief Gzip rotated log files. */
void set_log_compression(bool enable);

/** @brief Configure how many rotated log files are retained. */
void set_log_rotation(size_t max_files);

/**
 * @brief Mirror every accepted entry to stderr.
 *
 * Console mirroring works without a log file, so the CLI can report before
 * (or instead of) calling init_logger().
 */
void set_console_logging(bool enable);

/**
 * @brief Check whether the file logger has been initialized.
 */
bool logger_initialized();

/**
 * @brief Parse a textual level such as "DEBUG", "info" or "ERROR".
 *
 * @param text  Level name, case-insensitive. "WARN" and "ERR" are accepted.
 * @param level Receives the parsed level on success.
 * @return `false` if @p text does not name a level.
 */
bool parse_log_level(const std::string& text, LogLevel& level);

/**
 * @brief Log a message with structured key/value fields.
 *
 * @param level   Severity level for the event.
 * @param message Human-readable text describing the event.
 * @param fields  Field names and values providing structured context.
 */
void log_event(LogLevel level, const std::string& message, const LogFields& fields = {});

void log_debug(const std::string& msg, const LogFields& fields = {});
void log_info(const std::string& msg, const LogFields& fields = {});
void log_warning(const std::string& msg, const LogFields& fields = {});
void log_error(const std::string& msg, const LogFields& fields = {});

/**
 * @brief Initialize system logging using the specified facility.
 *
 * No-op outside Linux.
 */
void init_syslog(int facility = 0);

/** @brief Block until the queue has been written out. */
void flush_logger();

/** @brief Shut down the logging subsystem and release resources. */
void shutdown_logger();

/**
 * @brief Destination for diagnostic events.
 *
 * Components receive a sink by reference at construction instead of calling
 * the process-wide functions directly, so tests can capture what they log.
 */
class LogSink {
  public:
    virtual ~LogSink() = default;

    virtual void write(LogLevel level, const std::string& message, const LogFields& fields) = 0;

    void debug(const std::string& msg, const LogFields& fields = {}) {
        write(LogLevel::DEBUG, msg, fields);
    }
    void info(const std::string& msg, const LogFields& fields = {}) {
        write(LogLevel::INFO, msg, fields);
    }
    void warning(const std::string& msg, const LogFields& fields = {}) {
        write(LogLevel::WARNING, msg, fields);
    }
    void error(const std::string& msg, const LogFields& fields = {}) {
        write(LogLevel::ERR, msg, fields);
    }
};

/**
 * @brief Sink forwarding to the process-wide logger.
 */
LogSink& default_log_sink();

#endif // LOGGER_HPP
