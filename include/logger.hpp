#ifndef LOGGER_HPP
#define LOGGER_HPP
#include <cstddef>
#include <map>
#include <optional>
#include <string>

enum class LogLevel { DEBUG = 0, INFO, WARNING, ERR };

/**
 * @brief Initialize the file logger.
 *
 * Opens the log file at @p path for appending. Calling it again switches to
 * the new file; when the new file cannot be opened the previous one is kept.
 *
 * @param path      Filesystem path where the log file will be written.
 * @param level     Minimum @ref LogLevel severity to record.
 * @param max_size  Maximum size in bytes before rotating the file. A value of
 *                  `0` disables size-based rotation.
 * @param max_files Number of rotated log files to keep.
 * @return `true` if @p path is now the active log file.
 */
bool init_logger(const std::string& path, LogLevel level = LogLevel::INFO, size_t max_size = 0,
                 size_t max_files = 1);

/** @brief Set the global minimum log level. */
void set_log_level(LogLevel level);

/**
 * @brief Enable or disable JSON formatted logging.
 *
 * @param enable Set to `true` to emit one JSON object per line instead of
 *               plain text.
 */
void set_json_logging(bool enable);

/** @brief Gzip rotated files (`<log>.1.gz`, `<log>.2.gz`, ...). */
void set_log_compression(bool enable);

/** @return `true` if a log file is open. */
bool logger_initialized();

/** @return Upper case label of @p level as written to the log. */
const char* log_level_name(LogLevel level);

/**
 * @brief Parse a level name (DEBUG, INFO, WARNING/WARN, ERROR), ignoring case.
 */
std::optional<LogLevel> parse_log_level(const std::string& name);

/**
 * @brief Log a message with structured key/value fields.
 *
 * Plain lines look like `[2024-01-02 03:04:05] [INFO] msg key=value`.
 */
void log_event(LogLevel level, const std::string& message,
               const std::map<std::string, std::string>& fields = {});

void log_debug(const std::string& msg);
void log_debug(const std::string& msg, const std::map<std::string, std::string>& fields);
void log_info(const std::string& msg);
void log_info(const std::string& msg, const std::map<std::string, std::string>& fields);
void log_warning(const std::string& msg);
void log_warning(const std::string& msg, const std::map<std::string, std::string>& fields);
void log_error(const std::string& msg);
void log_error(const std::string& msg, const std::map<std::string, std::string>& fields);

/** @brief Flush pending output to disk. */
void flush_logger();

/**
 * @brief Shut down the logging subsystem and release resources.
 */
void shutdown_logger();

#endif // LOGGER_HPP
