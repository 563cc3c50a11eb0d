/**
 * @file logger.cc
 * @brief Log level names
 * @author Haoming Bai <haomingbai@hotmail.com>
 * @date   2025-10-03
 *
 * Copyright © 2025 Haoming Bai
 * SPDX-License-Identifier: MIT
 */

#include "quoteapi/logger.h"

#include <boost/algorithm/string/predicate.hpp>
#include <optional>
#include <string_view>

namespace quoteapi {

const char* LogLevelToString(LogLevel level) noexcept {
  switch (level) {
    case LogLevel::kTrace:
      return "TRACE";
    case LogLevel::kDebug:
      return "DEBUG";
    case LogLevel::kInfo:
      return "INFO";
    case LogLevel::kWarn:
      return "WARN";
    case LogLevel::kError:
      return "ERROR";
    case LogLevel::kFatal:
      return "FATAL";
  }

  return "UNKNOWN";
}

std::optional<LogLevel> ParseLogLevel(std::string_view name) {
  for (auto level : {LogLevel::kTrace, LogLevel::kDebug, LogLevel::kInfo,
                     LogLevel::kWarn, LogLevel::kError, LogLevel::kFatal}) {
    if (boost::algorithm::iequals(name, LogLevelToString(level))) {
      return level;
    }
  }

  return std::nullopt;
}

}  // namespace quoteapi
