/**
 * @file not_found_route_handler.h
 * @brief Fallback handler for unmatched requests
 * @author Haoming Bai <haomingbai@hotmail.com>
 * @date   2025-09-29
 *
 * Copyright © 2025 Haoming Bai
 * SPDX-License-Identifier: MIT
 */

#pragma once

#ifndef QUOTEAPI_INTERNAL_NOT_FOUND_ROUTE_HANDLER_H_
#define QUOTEAPI_INTERNAL_NOT_FOUND_ROUTE_HANDLER_H_

#include <memory>

#include "quoteapi/http_request_handler.h"
#include "quoteapi/trait.h"

namespace quoteapi {

namespace route_internal {

/**
 * @brief Answers 404 with {"error":"Not Found"} and closes the connection.
 */
class NotFoundRouteHandler : public HttpRequestHandler,
                             public CopyableMovable<NotFoundRouteHandler> {
 public:
  NotFoundRouteHandler() = default;

  void Service(std::shared_ptr<HttpServerTask> task) override;

  ~NotFoundRouteHandler() override = default;
};

}  // namespace route_internal

}  // namespace quoteapi

#endif
