#ifndef LOGGING_HPP
#define LOGGING_HPP

#include <string>

namespace camrec {

/**
 * @file logging.hpp
 * @brief Process-wide log verbosity for the tagged console log lines.
 */

enum class LogLevel { Debug = 0, Info = 1, Warn = 2, Error = 3 };

/**
 * @brief Parse "debug", "info", "warn" or "error".
 */
bool parseLogLevel(const std::string& text, LogLevel& level);

/**
 * @brief Set verbosity and map it onto FFmpeg's logger.
 */
void setLogLevel(LogLevel level);

LogLevel logLevel();

/** @brief True when lines of @p level should be printed. */
bool logEnabled(LogLevel level);

} // namespace camrec

#endif // LOGGING_HPP
