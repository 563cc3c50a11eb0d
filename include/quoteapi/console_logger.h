/**
 * @file console_logger.h
 * @brief Logger writing timestamped lines to std::clog
 * @author Haoming Bai <haomingbai@hotmail.com>
 * @date   2025-10-21
 *
 * Copyright © 2025 Haoming Bai
 * SPDX-License-Identifier: MIT
 */

#pragma once

#ifndef QUOTEAPI_CONSOLE_LOGGER_H_
#define QUOTEAPI_CONSOLE_LOGGER_H_

#include <iosfwd>
#include <mutex>
#include <string>

#include "quoteapi/logger.h"
#include "quoteapi/trait.h"

namespace quoteapi {

/**
 * @brief Thread-safe logger for the service binary
 *
 * Each message becomes one line:
 * @code
 * [2025-10-21T08:15:02.114Z INFO]: GET /quotes -> 200 (84 us)
 * @endcode
 * Messages below the minimum level are dropped.
 */
class ConsoleLogger : public Logger,
                      public NonCopyableNonMovable<ConsoleLogger> {
 public:
  void Log(LogLevel level, std::string message) override;

  /**
   * @brief Log to std::clog
   * @param min_level Least severe level that is written
   */
  explicit ConsoleLogger(LogLevel min_level = LogLevel::kInfo);

  /**
   * @brief Log to another stream, which must outlive the logger
   */
  ConsoleLogger(std::ostream& out, LogLevel min_level);

 private:
  std::mutex mtx_;
  std::ostream& out_;
  LogLevel min_level_;
};

}  // namespace quoteapi

#endif
