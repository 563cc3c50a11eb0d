/**
 * @file empty_logger.cc
 * @brief Logger that discards everything
 * @author Haoming Bai <haomingbai@hotmail.com>
 * @date   2025-10-03
 *
 * Copyright © 2025 Haoming Bai
 * SPDX-License-Identifier: MIT
 */

#include "quoteapi/internal/empty_logger.h"

#include <string>

#include "quoteapi/logger.h"

void quoteapi::internal::EmptyLogger::Log(
    [[maybe_unused]] quoteapi::LogLevel level,
    [[maybe_unused]] std::string message) {}
