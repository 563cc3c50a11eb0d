/**
 * @file logger.h
 * @brief Logging interface and log level definitions
 * @author Haoming Bai <haomingbai@hotmail.com>
 * @date   2025-10-21
 *
 * Copyright © 2025 Haoming Bai
 * SPDX-License-Identifier: MIT
 *
 * @details
 * The server, its connections and every request task log through a single
 * Logger instance. The server starts with a logger that discards everything;
 * the quote service installs a ConsoleLogger at startup.
 */

#pragma once

#ifndef QUOTEAPI_LOGGER_H_
#define QUOTEAPI_LOGGER_H_

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace quoteapi {

/**
 * @brief Log levels for categorizing log messages by severity
 *
 * @code
 * task->Log(LogLevel::kInfo, "GET /quotes -> 200 (84 us)");
 * server->Log(LogLevel::kFatal, "Failed to bind 0.0.0.0:8080");
 * @endcode
 */
enum class LogLevel : std::uint8_t {
  kTrace = 0,  ///< Detailed debugging information (most verbose)
  kDebug,      ///< Debugging information useful during development
  kInfo,       ///< General operational information about system state
  kWarn,       ///< Warning messages indicating potential issues
  kError,      ///< Error messages indicating operation failures
  kFatal       ///< Fatal errors causing application termination (least verbose)
};

/**
 * @brief Get the upper-case name of a log level ("TRACE" ... "FATAL")
 * @param level Log level
 * @return Static name of the level
 */
const char* LogLevelToString(LogLevel level) noexcept;

/**
 * @brief Parse a log level name, ignoring case
 * @param name One of trace, debug, info, warn, error, fatal
 * @return The level, or std::nullopt for an unknown name
 */
std::optional<LogLevel> ParseLogLevel(std::string_view name);

/**
 * @brief Abstract interface for logging implementations
 *
 * Implementations must be thread-safe: Log() is called concurrently from
 * I/O threads and from the worker pool.
 *
 * @code
 * class FileLogger : public Logger {
 *  public:
 *   explicit FileLogger(const std::string& filename) : file_(filename) {}
 *
 *   void Log(LogLevel level, std::string message) override {
 *     std::lock_guard<std::mutex> lock(mtx_);
 *     file_ << "[" << LogLevelToString(level) << "] " << message << '\n';
 *   }
 *
 *  private:
 *   std::mutex mtx_;
 *   std::ofstream file_;
 * };
 *
 * server->SetLogger(std::make_shared<FileLogger>("quoteapi.log"));
 * @endcode
 */
class Logger {
 public:
  /**
   * @brief Log a message with specified severity level
   * @param level Severity level of the log message
   * @param message Log message content
   */
  virtual void Log(LogLevel level, std::string message) = 0;

  /**
   * @brief Virtual destructor for proper cleanup
   */
  virtual ~Logger() = default;
};

}  // namespace quoteapi

#endif
