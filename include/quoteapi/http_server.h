/**
 * @file http_server.h
 * @brief Asynchronous HTTP server with routing and aspects
 * @author Haoming Bai <haomingbai@hotmail.com>
 * @date   2025-10-21
 *
 * Copyright © 2025 Haoming Bai
 * SPDX-License-Identifier: MIT
 *
 * @details
 * The transport under the quote API. Accepts plain TCP or TLS connections
 * on one io_context driven by a group of I/O threads, routes each request
 * through the route table and runs handlers on a separate worker pool.
 */

#pragma once

#ifndef QUOTEAPI_HTTP_SERVER_H_
#define QUOTEAPI_HTTP_SERVER_H_

#include <atomic>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl/context.hpp>
#include <boost/asio/thread_pool.hpp>
#include <boost/beast/http/verb.hpp>
#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <thread>
#include <type_traits>
#include <utility>
#include <vector>

#include "quoteapi/http_request_aspect_handler.h"
#include "quoteapi/http_request_handler.h"
#include "quoteapi/http_request_method.h"
#include "quoteapi/http_route_result.h"
#include "quoteapi/http_server_task.h"
#include "quoteapi/logger.h"
#include "quoteapi/trait.h"

namespace quoteapi {

class HttpRouteTable;

/**
 * @brief HTTP server with routing, aspects and TLS support
 *
 * Configuration calls return the server for chaining. They take effect only
 * while the server is stopped; calls made while it runs are ignored.
 *
 * @code
 * auto server = std::make_unique<HttpServer>(4);  // 4 worker threads
 *
 * server->SetLogger(logger)
 *     ->SetDefaultReadExpiry(4000)
 *     ->AddRouteEntry(HttpRequestMethod::kGet, "/ping",
 *                     [](std::shared_ptr<HttpServerTask> task) {
 *                       task->SetBody("pong");
 *                     })
 *     ->AddListen({boost::asio::ip::make_address("0.0.0.0"), 8080});
 *
 * server->Start(1);  // 1 I/O thread
 * @endcode
 */
class HttpServer : public NonCopyableNonMovable<HttpServer> {
 public:
  /**
   * @brief Post a function to be executed on the worker pool
   * @param fn Function to execute asynchronously
   */
  void Post(std::function<void()> fn);

  /**
   * @brief Add a route with a handler object
   * @param method HTTP method
   * @param url Route pattern (supports parameters like {tag})
   * @param handler Request handler
   * @return Pointer to server for method chaining
   */
  HttpServer* AddRouteEntry(HttpRequestMethod method, const std::string_view url,
                            std::unique_ptr<HttpRequestHandler> handler);

  /**
   * @brief Add a route with a function object (lambda or function pointer)
   * @tparam Func Callable type accepting std::shared_ptr<HttpServerTask>
   * @param method HTTP method
   * @param str Route pattern
   * @param func Callable to handle requests
   * @return Pointer to server for method chaining
   */
  template <typename Func>
    requires requires(std::shared_ptr<HttpServerTask> task, Func fn) {
      { fn(task) };
    }
  HttpServer* AddRouteEntry(HttpRequestMethod method, const std::string_view str,
                            Func&& func) {
    auto handler = std::make_unique<FunctionRouteHandler<std::decay_t<Func>>>(
        std::forward<Func>(func));

    return AddRouteEntry(method, str, std::move(handler));
  }

  /**
   * @brief Add an exclusive route that swallows every deeper path
   * @param method HTTP method
   * @param url Route pattern
   * @param handler Request handler
   * @return Pointer to server for method chaining
   */
  HttpServer* AddExclusiveRouteEntry(HttpRequestMethod method,
                                     const std::string_view url,
                                     std::unique_ptr<HttpRequestHandler> handler);

  /**
   * @brief Add an aspect handler to a specific route
   * @param method HTTP method
   * @param url Route pattern
   * @param aspect Aspect handler
   * @return Pointer to server for method chaining
   */
  HttpServer* AddAspect(HttpRequestMethod method, const std::string_view url,
                        std::unique_ptr<HttpRequestAspectHandler> aspect);

  /**
   * @brief Add an aspect with function objects for pre/post processing
   * @tparam F1 Pre-service function type
   * @tparam F2 Post-service function type
   * @param method HTTP method
   * @param url Route pattern
   * @param f1 Pre-service function
   * @param f2 Post-service function
   * @return Pointer to server for method chaining
   */
  template <typename F1, typename F2>
  HttpServer* AddAspect(HttpRequestMethod method, const std::string_view url,
                        F1 f1, F2 f2) {
    auto aspect = std::make_unique<FunctionRequestAspectHandler<F1, F2>>(
        std::move(f1), std::move(f2));

    return AddAspect(method, url, std::move(aspect));
  }

  /**
   * @brief Add a global aspect for a specific HTTP method
   * @param method HTTP method
   * @param aspect Aspect handler
   * @return Pointer to server for method chaining
   */
  HttpServer* AddGlobalAspect(HttpRequestMethod method,
                              std::unique_ptr<HttpRequestAspectHandler> aspect);

  /**
   * @brief Add a global aspect for all HTTP methods
   * @param aspect Aspect handler
   * @return Pointer to server for method chaining
   */
  HttpServer* AddGlobalAspect(std::unique_ptr<HttpRequestAspectHandler> aspect);

  /**
   * @brief Add a global aspect with functions for specific HTTP method
   * @tparam F1 Pre-service function type
   * @tparam F2 Post-service function type
   * @param method HTTP method
   * @param f1 Pre-service function
   * @param f2 Post-service function
   * @return Pointer to server for method chaining
   */
  template <typename F1, typename F2>
  HttpServer* AddGlobalAspect(HttpRequestMethod method, F1 f1, F2 f2) {
    std::unique_ptr<HttpRequestAspectHandler> aspect = std::make_unique<FunctionRequestAspectHandler<F1, F2>>(
        std::move(f1), std::move(f2));

    return AddGlobalAspect(method, std::move(aspect));
  }

  /**
   * @brief Add a global aspect with functions for all HTTP methods
   * @tparam F1 Pre-service function type
   * @tparam F2 Post-service function type
   * @param f1 Pre-service function
   * @param f2 Post-service function
   * @return Pointer to server for method chaining
   */
  template <typename F1, typename F2>
  HttpServer* AddGlobalAspect(F1 f1, F2 f2) {
    auto aspect = std::make_unique<FunctionRequestAspectHandler<F1, F2>>(
        std::move(f1), std::move(f2));

    return AddGlobalAspect(std::move(aspect));
  }

  /**
   * @brief Open, bind and listen on an endpoint
   * @param ep TCP endpoint to listen on; port 0 picks an ephemeral port
   * @return Pointer to server for method chaining
   *
   * @throws boost::system::system_error if the endpoint cannot be bound
   */
  HttpServer* AddListen(boost::asio::ip::tcp::endpoint ep);

  /**
   * @brief Get the local endpoints of all listening acceptors
   * @return Bound endpoints, with ephemeral ports resolved
   */
  std::vector<boost::asio::ip::tcp::endpoint> GetListenEndpoints();

  /**
   * @brief Set read timeout for a specific route
   * @param method HTTP method
   * @param url Route pattern
   * @param expiry Read timeout in milliseconds
   * @return Pointer to server for method chaining
   */
  HttpServer* SetReadExpiry(HttpRequestMethod method, std::string_view url,
                            std::size_t expiry);

  /**
   * @brief Set header read timeout for all requests
   * @param expiry Header read timeout in milliseconds
   * @return Pointer to server for method chaining
   */
  HttpServer* SetHeaderReadExpiry(std::size_t expiry);

  /**
   * @brief Set write timeout for a specific route
   * @param method HTTP method
   * @param url Route pattern
   * @param expiry Write timeout in milliseconds
   * @return Pointer to server for method chaining
   */
  HttpServer* SetWriteExpiry(HttpRequestMethod method, std::string_view url,
                             std::size_t expiry);

  /**
   * @brief Set maximum body size for a specific route
   * @param method HTTP method
   * @param url Route pattern
   * @param size Maximum body size in bytes
   * @return Pointer to server for method chaining
   */
  HttpServer* SetMaxBodySize(HttpRequestMethod method, std::string_view url,
                             std::size_t size);

  /**
   * @brief Set default read timeout for all routes
   * @param expiry Read timeout in milliseconds
   * @return Pointer to server for method chaining
   */
  HttpServer* SetDefaultReadExpiry(std::size_t expiry);

  /**
   * @brief Set default write timeout for all routes
   * @param expiry Write timeout in milliseconds
   * @return Pointer to server for method chaining
   */
  HttpServer* SetDefaultWriteExpiry(std::size_t expiry);

  /**
   * @brief Set default maximum body size for all routes
   * @param size Maximum body size in bytes
   * @return Pointer to server for method chaining
   */
  HttpServer* SetDefaultMaxBodySize(std::size_t size);

  /**
   * @brief Set keep-alive connection timeout
   * @param timeout Keep-alive timeout in milliseconds
   * @return Pointer to server for method chaining
   */
  HttpServer* SetKeepAliveTimeout(std::size_t timeout);

  /**
   * @brief Set the handler used when no route matches
   * @param handler Global fallback handler for requests.
   * @return Pointer to server for method chaining
   */
  HttpServer* SetDefaultHandler(std::unique_ptr<HttpRequestHandler> handler);

  /**
   * @brief Serve TLS on every listener using this context
   * @param ctx The ssl context of the server
   * @return Pointer to server for method chaining
   */
  HttpServer* SetSslContext(boost::asio::ssl::context ctx);

  /**
   * @brief Go back to plain TCP
   * @return Pointer to server for method chaining
   */
  HttpServer* UnsetSslContext();

  /**
   * @brief Set the logger of the server
   * @param logger The shared ptr of the logger
   * @return Pointer to server for method chaining
   */
  HttpServer* SetLogger(std::shared_ptr<Logger> logger);

  /**
   * @brief Log a message with specified level
   * @param level Log level
   * @param message Log message
   */
  void Log(LogLevel level, std::string message);

  /**
   * @brief Route a request to find appropriate handler
   * @param method The method of the request
   * @param target Request target (path and optional query)
   * @return Routing result with handler and aspects
   */
  HttpRouteResult Route(HttpRequestMethod method, std::string_view target);

  /**
   * @brief Get keep-alive timeout setting
   * @return Keep-alive timeout in milliseconds
   */
  std::size_t GetKeepAliveTimeout() const noexcept;

  /**
   * @brief Check if server is running
   * @return true if server is running, false otherwise
   */
  bool IsRunning() const noexcept;

  /**
   * @brief Stop accepting, drain in-flight work and join all threads
   *
   * The server may be started again afterwards on the same endpoints.
   */
  void Stop();

  /**
   * @brief Start accepting with the given number of I/O threads
   * @param thread_count Number of threads running the io_context
   * @return false if thread_count is 0 or the server already runs
   */
  bool Start(std::size_t thread_count);

  /**
   * @brief Convert Boost.Beast HTTP verb to internal representation
   * @param verb Boost.Beast HTTP verb
   * @return Internal HTTP request method, kUnknown for other verbs
   */
  static HttpRequestMethod BeastHttpVerbToHttpRequestMethod(
      boost::beast::http::verb verb);

  /**
   * @brief Convert internal HTTP method to Boost.Beast verb
   * @param method Internal HTTP request method
   * @return Boost.Beast HTTP verb
   */
  static boost::beast::http::verb HttpRequestMethodToBeastHttpVerb(
      HttpRequestMethod method);

  /**
   * @brief Construct a stopped server
   * @param thread_num Size of the worker pool running handlers
   */
  explicit HttpServer(std::size_t thread_num);

  /**
   * @brief Construct a stopped server with a default-sized worker pool
   */
  HttpServer();

  ~HttpServer();

 private:
  void DoAccept(boost::asio::ip::tcp::acceptor& acc);

  /**
   * @brief Apply a configuration change under the exclusive lock.
   *
   * Does nothing while the server is running. When @p change returns
   * false, "Rejected <subject>" is logged at kWarn.
   *
   * @param subject What is being configured, for the warning.
   * @param change The mutation; returns false if it was refused.
   * @return this, for chaining.
   */
  HttpServer* Configure(std::string_view subject,
                        const std::function<bool()>& change);

  std::optional<boost::asio::ssl::context>
      ssl_ctx_;                  ///< The ssl context of the server
  boost::asio::io_context ioc_;  ///< The io context of the server
  std::vector<std::thread>
      io_threads_;  ///< Locations to store the threads to run io_context
  std::vector<boost::asio::ip::tcp::acceptor>
      acceptors_;                   ///< Acceptors to accept socket
  std::shared_mutex mtx_;           ///< Guards configuration and state
  std::mutex lifecycle_mtx_;        ///< Serializes Start and Stop
  std::shared_ptr<Logger> logger_;  ///< Logger to take log.
  std::unique_ptr<boost::asio::thread_pool>
      thread_pool_;                              ///< Worker pool for tasks
  std::unique_ptr<HttpRouteTable> route_table_;  ///< Route table
  std::size_t header_read_expiry_;  ///< Default expiry for reading headers
  std::size_t keep_alive_timeout_;  ///< Timeout for keep alive connection
  std::size_t thread_cnt_;          ///< Worker pool size, 0 for default
  std::atomic<bool> is_running_;    ///< Var to show if the server is running
};

}  // namespace quoteapi

#endif
