/**
 * @file http_request_aspect_handler.h
 * @brief Pre/post hooks wrapped around request handlers
 * @author Haoming Bai <haomingbai@hotmail.com>
 * @date   2025-10-21
 *
 * Copyright © 2025 Haoming Bai
 * SPDX-License-Identifier: MIT
 *
 * @details
 * Aspects run before and after the route handler. Pre-service hooks run in
 * registration order (global, method, route); post-service hooks run in the
 * reverse order. The quote service uses a global aspect for access logging.
 */

#pragma once

#ifndef QUOTEAPI_HTTP_REQUEST_ASPECT_HANDLER_H_
#define QUOTEAPI_HTTP_REQUEST_ASPECT_HANDLER_H_

#include <memory>
#include <utility>

#include "quoteapi/trait.h"

namespace quoteapi {

class HttpServerTask;

/**
 * @brief Interface for HTTP request aspect handlers
 *
 * @code
 * class CorsAspect : public HttpRequestAspectHandler {
 *  public:
 *   void PreService(std::shared_ptr<HttpServerTask>) override {}
 *
 *   void PostService(std::shared_ptr<HttpServerTask> task) override {
 *     task->SetField("Access-Control-Allow-Origin", "*");
 *   }
 * };
 * @endcode
 */
class HttpRequestAspectHandler {
 public:
  /**
   * @brief Execute before the main request handler
   * @param task HTTP server task being processed
   */
  virtual void PreService(std::shared_ptr<HttpServerTask> task) = 0;

  /**
   * @brief Execute after the main request handler
   * @param task HTTP server task that was processed
   */
  virtual void PostService(std::shared_ptr<HttpServerTask> task) = 0;

  /**
   * @brief Virtual destructor for proper cleanup
   */
  virtual ~HttpRequestAspectHandler() = default;
};

/**
 * @brief Adapter for creating aspect handlers from function objects
 *
 * @tparam F1 Type of pre-service function
 * @tparam F2 Type of post-service function
 */
template <typename F1, typename F2>
class FunctionRequestAspectHandler
    : public HttpRequestAspectHandler,
      public NonCopyableNonMovable<FunctionRequestAspectHandler<F1, F2>> {
 public:
  void PreService(std::shared_ptr<HttpServerTask> task) override { f1_(task); }

  void PostService(std::shared_ptr<HttpServerTask> task) override { f2_(task); }

  /**
   * @brief Construct function-based aspect handler
   * @param f1 Pre-service function
   * @param f2 Post-service function
   */
  FunctionRequestAspectHandler(F1 f1, F2 f2)
      : f1_(std::move(f1)), f2_(std::move(f2)) {}

 private:
  F1 f1_;  ///< Pre-service function object
  F2 f2_;  ///< Post-service function object
};

}  // namespace quoteapi

#endif
