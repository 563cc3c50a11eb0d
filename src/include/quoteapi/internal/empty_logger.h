/**
 * @file empty_logger.h
 * @brief Logger that discards everything
 * @author Haoming Bai <haomingbai@hotmail.com>
 * @date   2025-10-03
 *
 * Copyright © 2025 Haoming Bai
 * SPDX-License-Identifier: MIT
 */

#pragma once

#ifndef QUOTEAPI_INTERNAL_EMPTY_LOGGER_H_
#define QUOTEAPI_INTERNAL_EMPTY_LOGGER_H_

#include <string>

#include "quoteapi/logger.h"

namespace quoteapi {

namespace internal {

/**
 * @brief Default logger of a fresh HttpServer.
 */
class EmptyLogger : public Logger {
 public:
  void Log(LogLevel level, std::string message) override;
};

}  // namespace internal

}  // namespace quoteapi

#endif
