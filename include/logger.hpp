#ifndef LOGGER_HPP
#define LOGGER_HPP
#include <cstddef>
#include <map>
#include <string>

enum class LogLevel { DEBUG = 0, INFO, WARNING, ERR };

/**
 * @brief Initialize the file logger.
 *
 * Opens the log file at @p path for append and starts the background writer
 * thread. Calling it again reopens the logger on the new path.
 *
 * @param path      Filesystem path where the log file will be written.
 * @param level     Minimum @ref LogLevel severity to record.
 * @param max_size  Maximum size in bytes before rotating the file. A value of
 *                  `0` disables size-based rotation.
 * @param max_files Number of rotated log files to keep.
 */
void init_logger(const std::string& path, LogLevel level = LogLevel::INFO, size_t max_size = 0,
                 size_t max_files = 1);

/**
 * @brief Parse a level name such as `debug`, `INFO`, `warn` or `error`.
 *
 * @return `true` and sets @p out when @p text names a level.
 */
bool parse_log_level(const std::string& text, LogLevel& out);

/** @return Upper-case label written in front of each entry. */
const char* log_level_label(LogLevel level);

/**
 * @brief Enable or disable JSON formatted logging.
 *
 * @param enable Set to `true` to emit one JSON object per line instead of
 *               plain text.
 */
void set_json_logging(bool enable);

/// Gzip rotated files (`<log>.1.gz`, `<log>.2.gz`, ...).
void set_log_compression(bool enable);

void set_log_rotation(size_t max_files);

/**
 * @brief Register a value that must never reach the log file.
 *
 * Every occurrence in messages and field values is replaced by `***`.
 * Credentials embedded in URLs (`https://secret@host/...`) are masked even
 * when not registered.
 */
void add_log_secret(const std::string& secret);

/// Forget all values registered with add_log_secret().
void clear_log_secrets();

/** @return @p text with registered secrets and URL credentials masked. */
std::string redact_secrets(const std::string& text);

bool logger_initialized();

void log_event(LogLevel level, const std::string& message);
void log_event(LogLevel level, const std::string& message, const std::string& data);
void log_event(LogLevel level, const std::string& message,
               const std::map<std::string, std::string>& fields);

void log_debug(const std::string& msg);
void log_debug(const std::string& msg, const std::string& data);
void log_debug(const std::string& msg, const std::map<std::string, std::string>& fields);

void log_info(const std::string& msg);
void log_info(const std::string& msg, const std::string& data);
void log_info(const std::string& msg, const std::map<std::string, std::string>& fields);

void log_warning(const std::string& msg);
void log_warning(const std::string& msg, const std::string& data);
void log_warning(const std::string& msg, const std::map<std::string, std::string>& fields);

void log_error(const std::string& msg);
void log_error(const std::string& msg, const std::string& data);
void log_error(const std::string& msg, const std::map<std::string, std::string>& fields);

/**
 * @brief Block until every queued entry has been written.
 */
void flush_logger();

/**
 * @brief Drain the queue, stop the writer thread and close the file.
 */
void shutdown_logger();

#endif // LOGGER_HPP
