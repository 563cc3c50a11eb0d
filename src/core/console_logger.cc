/**
 * @file console_logger.cc
 * @brief Logger writing timestamped lines to std::clog
 * @author Haoming Bai <haomingbai@hotmail.com>
 * @date   2025-10-21
 *
 * Copyright © 2025 Haoming Bai
 * SPDX-License-Identifier: MIT
 */

#include "quoteapi/console_logger.h"

#include <chrono>
#include <cstddef>
#include <cstdio>
#include <ctime>
#include <iostream>
#include <mutex>
#include <ostream>
#include <string>

#include "quoteapi/logger.h"

using quoteapi::ConsoleLogger;

namespace {

std::string UtcTimestamp() {
  auto now = std::chrono::system_clock::now();
  auto secs = std::chrono::system_clock::to_time_t(now);
  auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
                    now.time_since_epoch())
                    .count() %
                1000;

  std::tm tm{};
  gmtime_r(&secs, &tm);

  char buf[32];
  std::size_t len = std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%S", &tm);
  std::snprintf(buf + len, sizeof(buf) - len, ".%03dZ",
                static_cast<int>(millis));
  return buf;
}

}  // namespace

ConsoleLogger::ConsoleLogger(LogLevel min_level)
    : out_(std::clog), min_level_(min_level) {}

ConsoleLogger::ConsoleLogger(std::ostream& out, LogLevel min_level)
    : out_(out), min_level_(min_level) {}

void ConsoleLogger::Log(LogLevel level, std::string message) {
  if (level < min_level_) {
    return;
  }

  auto stamp = UtcTimestamp();

  std::lock_guard<std::mutex> lock(mtx_);
  out_ << '[' << stamp << ' ' << LogLevelToString(level) << "]: " << message
       << '\n';
  out_.flush();
}
