/**
 * @file http_server_task.h
 * @brief HTTP server task representing a single request-response cycle
 * @author Haoming Bai <haomingbai@hotmail.com>
 * @date   2025-10-21
 *
 * Copyright © 2025 Haoming Bai
 * SPDX-License-Identifier: MIT
 *
 * @details
 * A task is created by a connection once a full request has been read. It
 * drives the aspect chain and the route handler on the worker pool and
 * writes the response back through the connection when the last reference
 * to it is released.
 */

#pragma once

#ifndef QUOTEAPI_HTTP_SERVER_TASK_H_
#define QUOTEAPI_HTTP_SERVER_TASK_H_

#include <boost/beast/http.hpp>
#include <boost/beast/http/field.hpp>
#include <boost/beast/http/fields.hpp>
#include <boost/beast/http/message.hpp>
#include <boost/beast/http/string_body.hpp>
#include <chrono>
#include <cstddef>
#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "quoteapi/http_route_result.h"
#include "quoteapi/logger.h"
#include "quoteapi/trait.h"

namespace quoteapi {

class HttpServerConnection;
class HttpServer;

// Type aliases for Boost.Beast HTTP types
using HttpRequest = boost::beast::http::request<boost::beast::http::string_body,
                                                boost::beast::http::fields>;

using HttpResponse =
    boost::beast::http::response<boost::beast::http::string_body,
                                 boost::beast::http::fields>;

/**
 * @brief Represents a single HTTP request-response cycle
 *
 * The response starts as an empty 200 with the request's HTTP version.
 * Handlers and aspects mutate it through the accessors below.
 *
 * @code
 * void Service(std::shared_ptr<HttpServerTask> task) override {
 *   const auto& tag = task->GetPathParameters().front();
 *   task->GetResponse().result(boost::beast::http::status::ok);
 *   task->SetField(boost::beast::http::field::content_type,
 *                  "application/json; charset=utf-8");
 *   task->SetBody(WriteJson(QuotesToJson(catalog_->QuotesByTag(tag))));
 * }
 * @endcode
 */
class HttpServerTask : public NonCopyableNonMovable<HttpServerTask>,
                       public std::enable_shared_from_this<HttpServerTask> {
 public:
  /**
   * @brief Get the HTTP request object
   * @return Reference to the HTTP request
   */
  HttpRequest& GetRequest() noexcept;

  /**
   * @brief Get the HTTP response object
   * @return Reference to the HTTP response
   */
  HttpResponse& GetResponse() noexcept;

  /**
   * @brief Set the response body content
   * @param body Response body string
   */
  void SetBody(std::string body);

  /**
   * @brief Append content to the response body
   * @param body Content to append to existing body
   */
  void AppendBody(const std::string_view body);

  /**
   * @brief Set a response header field by string key
   * @param key Header field name
   * @param value Header field value
   */
  void SetField(const std::string_view key, const std::string_view value);

  /**
   * @brief Set a response header field by Boost.Beast field enum
   * @param key Header field enum
   * @param value Header field value
   */
  void SetField(boost::beast::http::field key, const std::string_view value);

  /**
   * @brief Enable or disable keep-alive for this connection
   * @param value true to keep connection alive, false to close
   *
   * @note Defaults to what the client asked for in the request.
   */
  void SetKeepAlive(bool value) noexcept;

  /**
   * @brief Log a message through the server's logger
   * @param level Log level
   * @param message Log message
   */
  void Log(LogLevel level, std::string message);

  /**
   * @brief Post a function to the server's worker pool
   * @param fn Function to execute asynchronously
   */
  void Post(std::function<void()> fn);

  /**
   * @brief Check if the underlying connection is still available
   * @return true if connection is open and the server is running
   */
  bool IsAvailable() noexcept;

  /**
   * @brief Get the matched location (target path as routed)
   * @return The current location
   */
  const std::string& GetCurrentLocation() const noexcept;

  /**
   * @brief Get the decoded values captured by {param} route segments
   * @return The path parameters of the task, in pattern order
   */
  const std::vector<std::string>& GetPathParameters() const noexcept;

  /**
   * @brief Time elapsed since the request was handed to this task
   * @return Elapsed time in microseconds
   */
  std::chrono::microseconds GetElapsed() const noexcept;

  /**
   * @brief Constructor of the server task
   * @param req The request of this http request.
   * @param route_result The route result of the request according to the target
   *    of the request.
   * @param conn The connection of this task.
   */
  HttpServerTask(HttpRequest req, HttpRouteResult route_result,
                 std::shared_ptr<HttpServerConnection> conn);

  /**
   * @brief Start the aspect and handler chain on the worker pool.
   */
  void Start();

  /**
   * @brief Writes the response through the connection.
   */
  ~HttpServerTask();

 private:
  void DoPreService(std::size_t curr_idx);

  void DoService();

  void DoPostService(std::size_t curr_idx);

  HttpRequest req_;    ///< HTTP request data
  HttpResponse resp_;  ///< HTTP response data
  std::shared_ptr<HttpServerConnection> conn_;  ///< Associated connection
  HttpRouteResult route_result_;  ///< Handler, aspects and parameters
  HttpServer* srv_;               ///< Owning server
  std::chrono::steady_clock::time_point start_time_;  ///< Task creation time
  bool keep_alive_;                                   ///< Keep-alive flag
};

}  // namespace quoteapi

#endif
