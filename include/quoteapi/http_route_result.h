/**
 * @file http_route_result.h
 * @brief Outcome of matching a request target against the route table
 * @author Haoming Bai <haomingbai@hotmail.com>
 * @date   2025-10-21
 *
 * Copyright © 2025 Haoming Bai
 * SPDX-License-Identifier: MIT
 */

#pragma once

#ifndef QUOTEAPI_HTTP_ROUTE_RESULT_H_
#define QUOTEAPI_HTTP_ROUTE_RESULT_H_

#include <cstddef>
#include <string>
#include <vector>

namespace quoteapi {
class HttpRequestAspectHandler;
class HttpRequestHandler;

/**
 * @brief Result of routing an HTTP request
 *
 * Handler and aspect pointers are non-owning; they live in the route table
 * for as long as the server does.
 */
struct HttpRouteResult {
  std::string current_location;         ///< Matched route path
  std::vector<std::string> parameters;  ///< Decoded path parameters
  std::vector<HttpRequestAspectHandler *>
      aspects;                  ///< Aspect handlers to execute
  HttpRequestHandler *handler;  ///< Main request handler
  std::size_t max_body_size;    ///< Maximum allowed request body size
  std::size_t read_expiry;      ///< Read operation timeout in ms
  std::size_t write_expiry;     ///< Write operation timeout in ms
};
}  // namespace quoteapi

#endif
