/**
 * @file http_request_handler.h
 * @brief Interface and adapters for HTTP request handlers
 * @author Haoming Bai <haomingbai@hotmail.com>
 * @date   2025-10-21
 *
 * Copyright © 2025 Haoming Bai
 * SPDX-License-Identifier: MIT
 *
 * @details
 * Defines the interface for HTTP request handlers and a template adapter
 * for creating handlers from function objects and lambdas.
 */

#pragma once

#ifndef QUOTEAPI_HTTP_REQUEST_HANDLER_H_
#define QUOTEAPI_HTTP_REQUEST_HANDLER_H_

#include <exception>
#include <memory>
#include <utility>

#include "quoteapi/http_server_task.h"
#include "quoteapi/logger.h"
#include "quoteapi/trait.h"

namespace quoteapi {
class HttpServerTask;

/**
 * @brief Interface for HTTP request handlers
 *
 * A handler reads the request from the task and fills in its response.
 * The response is written back when the task is released, so a handler
 * only has to return.
 *
 * @code
 * class AllQuotesHandler : public HttpRequestHandler {
 *  public:
 *   void Service(std::shared_ptr<HttpServerTask> task) override {
 *     task->GetResponse().result(boost::beast::http::status::ok);
 *     task->SetBody(WriteJson(QuotesToJson(catalog_->AllQuotes())));
 *   }
 * };
 * @endcode
 */
class HttpRequestHandler {
 public:
  /**
   * @brief Process an HTTP request and generate response
   * @param task HTTP server task containing request and response objects
   *
   * @note An exception escaping Service() is logged by the task and the
   *       client receives 500.
   */
  virtual void Service(std::shared_ptr<HttpServerTask> task) = 0;

  /**
   * @brief Virtual destructor for proper cleanup
   */
  virtual ~HttpRequestHandler() = default;
};

/**
 * @brief Adapter for creating request handlers from function objects
 *
 * Exceptions thrown by the wrapped callable are logged at kWarn and
 * swallowed, leaving whatever response the callable had built so far.
 *
 * @tparam Fn Type of callable object (must accept
 * std::shared_ptr<HttpServerTask>)
 *
 * @code
 * server->AddRouteEntry(HttpRequestMethod::kGet, "/ping",
 *                       [](std::shared_ptr<HttpServerTask> task) {
 *                         task->SetBody("pong");
 *                       });
 * @endcode
 */
template <typename Fn>
  requires requires(Fn fn, std::shared_ptr<HttpServerTask> task) {
    { fn(task) };
  }
class FunctionRouteHandler
    : public HttpRequestHandler,
      public NonCopyableNonMovable<FunctionRouteHandler<Fn>> {
 public:
  /**
   * @brief Construct a function-based route handler
   * @param fn Callable object that processes HTTP requests
   */
  explicit FunctionRouteHandler(Fn fn) : fn_(std::move(fn)) {}

  /**
   * @brief Process HTTP request by invoking the wrapped function
   * @param task HTTP server task to process
   */
  void Service(std::shared_ptr<HttpServerTask> task) override try {
    fn_(task);
  } catch (const std::exception& e) {
    task->Log(LogLevel::kWarn, e.what());
  }

 private:
  Fn fn_;  ///< Wrapped callable object
};

}  // namespace quoteapi

#endif
