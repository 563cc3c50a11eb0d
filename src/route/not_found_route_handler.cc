/**
 * @file not_found_route_handler.cc
 * @brief Fallback handler for unmatched requests
 * @author Haoming Bai <haomingbai@hotmail.com>
 * @date   2025-10-01
 *
 * Copyright © 2025 Haoming Bai
 * SPDX-License-Identifier: MIT
 */

#include "quoteapi/internal/not_found_route_handler.h"

#include <boost/beast/http/field.hpp>
#include <boost/beast/http/status.hpp>
#include <memory>

#include "quoteapi/http_server_task.h"

using quoteapi::route_internal::NotFoundRouteHandler;

void NotFoundRouteHandler::Service(std::shared_ptr<HttpServerTask> task) {
  task->GetResponse().result(boost::beast::http::status::not_found);
  task->SetField(boost::beast::http::field::content_type,
                 "application/json; charset=utf-8");
  task->SetBody(R"({"error":"Not Found"})");
  task->SetKeepAlive(false);
}
