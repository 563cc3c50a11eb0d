/**
 * @file http_route_table.h
 * @brief Per-method route tree with aspects and request limits
 * @author Haoming Bai <haomingbai@hotmail.com>
 * @date   2025-09-24
 *
 * Copyright © 2025 Haoming Bai
 * SPDX-License-Identifier: MIT
 *
 * @details
 * The table itself is not synchronized. HttpServer registers routes while
 * stopped and only reads the table while running.
 */

#pragma once

#ifndef QUOTEAPI_INTERNAL_HTTP_ROUTE_TABLE_H_
#define QUOTEAPI_INTERNAL_HTTP_ROUTE_TABLE_H_

#include <array>
#include <boost/url/url_view.hpp>
#include <cstddef>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "quoteapi/http_request_method.h"
#include "quoteapi/http_route_result.h"
#include "quoteapi/internal/http_route_table_layer.h"
#include "quoteapi/trait.h"

namespace quoteapi {

class HttpRequestHandler;

class HttpRequestAspectHandler;

namespace route_internal {

/**
 * @brief Check a route pattern before registration
 *
 * A pattern starts with '/', uses only URL path characters or whole
 * {name} segments, has balanced braces and no ".." outside a parameter.
 *
 * @param target Route pattern
 * @return true if the pattern can be registered
 */
bool IsValidParametricTarget(const std::string_view target);

}  // namespace route_internal

/**
 * @brief Route tree with aspect support
 *
 * - Literal segments match exactly, {name} segments capture one decoded
 *   segment as a path parameter
 * - Aspects run in the order global, method-specific, route-specific
 * - Exclusive routes take every path below them
 * - Limits are per route, falling back to table defaults
 *
 * @code
 * HttpRouteTable table;
 * table.AddRouteEntry(HttpRequestMethod::kGet, "/quotes/tag/{tag}",
 *                     std::make_unique<QuotesByTagHandler>(catalog));
 *
 * auto result = table.Route(HttpRequestMethod::kGet, "/quotes/tag/humor");
 * // result.parameters == {"humor"}
 * @endcode
 */
class HttpRouteTable : NonCopyableNonMovable<HttpRouteTable> {
 public:
  /**
   * @brief Route an HTTP request to the appropriate handler
   * @param method HTTP request method
   * @param target Request target; the query string is ignored
   * @return Routing result; the default handler when nothing matches
   */
  HttpRouteResult Route(HttpRequestMethod method,
                        const std::string_view target) noexcept;

  /**
   * @brief Add a route entry with a handler
   * @param method HTTP method this route applies to
   * @param target Route pattern (supports parameters like {name})
   * @param handler Request handler for this route
   * @return false if the method or pattern is invalid
   */
  bool AddRouteEntry(HttpRequestMethod method, const std::string_view target,
                     std::unique_ptr<HttpRequestHandler> handler);

  /**
   * @brief Add an exclusive route that bypasses parameter routes
   *
   * @code
   * AddExclusiveRouteEntry(kGet, "/static", static_handler);
   * AddRouteEntry(kGet, "/static/{file}", param_handler);
   *
   * // "/static"     -> static_handler
   * // "/static/abc" -> static_handler
   * @endcode
   *
   * @return false if the method or pattern is invalid
   */
  bool AddExclusiveRouteEntry(HttpRequestMethod method,
                              const std::string_view target,
                              std::unique_ptr<HttpRequestHandler> handler);

  /**
   * @brief Add an aspect handler to a specific route
   * @return false if the method or pattern is invalid
   */
  bool AddAspect(HttpRequestMethod method, const std::string_view target,
                 std::unique_ptr<HttpRequestAspectHandler> aspect);

  /**
   * @brief Add a global aspect for a specific HTTP method
   * @return false if the method is invalid
   */
  bool AddGlobalAspect(HttpRequestMethod method,
                       std::unique_ptr<HttpRequestAspectHandler> aspect);

  /**
   * @brief Add a global aspect for all HTTP methods
   * @return false if aspect is null
   */
  bool AddGlobalAspect(std::unique_ptr<HttpRequestAspectHandler> aspect);

  bool SetReadExpiry(HttpRequestMethod method, const std::string_view target,
                     std::size_t expiry);

  bool SetWriteExpiry(HttpRequestMethod method, const std::string_view target,
                      std::size_t expiry);

  bool SetMaxBodySize(HttpRequestMethod method, const std::string_view target,
                      std::size_t max_body_size);

  void SetDefaultReadExpiry(std::size_t expiry) noexcept;

  void SetDefaultWriteExpiry(std::size_t expiry) noexcept;

  void SetDefaultMaxBodySize(std::size_t max_body_size) noexcept;

  /**
   * @brief Replace the handler used for unmatched requests
   * @return false if handler is null
   */
  bool SetDefaultHandler(std::unique_ptr<HttpRequestHandler> handler);

  /**
   * @brief Construct an empty table answering 404 to everything
   */
  HttpRouteTable();

 private:
  /**
   * @brief Layer for a registration pattern, or null if the method or
   *        pattern is not accepted.
   */
  route_internal::HttpRouteTableLayer *LayerForPattern(
      HttpRequestMethod method, const std::string_view target);

  /**
   * @brief Walk the pattern, creating missing layers on the way.
   * @return The layer of the last segment.
   */
  route_internal::HttpRouteTableLayer *GetOrCreateRouteTableLayer(
      HttpRequestMethod method, const std::string_view target);

  /**
   * @brief Result pointing at the default handler.
   * @param method Request method, selects method-specific global aspects.
   * @param location Path reported as the current location.
   */
  HttpRouteResult BuildDefaultRouteResult(HttpRequestMethod method,
                                          std::string location) const noexcept;

  /**
   * @brief Match URL segments against the route tree.
   * @param url Parsed target.
   * @param route_layer In/out: starts at the method root, ends at the match.
   * @param out_location Receives the matched path.
   * @param out_parameters Receives decoded {param} values.
   * @return false if some segment has no literal or param child.
   */
  bool MatchSegments(const boost::urls::url_view &url,
                     route_internal::HttpRouteTableLayer *&route_layer,
                     std::string &out_location,
                     std::vector<std::string> &out_parameters) const noexcept;

  /**
   * @brief Aspects in execution order: global, method, route.
   * @param route_layer Matched layer, may be null.
   */
  std::vector<HttpRequestAspectHandler *> CollectAspects(
      route_internal::HttpRouteTableLayer *route_layer,
      HttpRequestMethod method) const noexcept;

  static bool IsRoutableMethod(HttpRequestMethod method) noexcept;

  static constexpr std::size_t kHttpRequestMethodNum =
      static_cast<std::size_t>(HttpRequestMethod::kUnknown);
  std::array<std::unique_ptr<route_internal::HttpRouteTableLayer>,
             kHttpRequestMethodNum>
      entrance_;  ///< Routing layers per HTTP method
  std::array<std::vector<std::unique_ptr<HttpRequestAspectHandler>>,
             kHttpRequestMethodNum>
      global_specific_aspects_;  ///< Method-specific global aspects
  std::vector<std::unique_ptr<HttpRequestAspectHandler>>
      global_aspects_;  ///< Global aspects for all methods
  std::unique_ptr<HttpRequestHandler>
      default_handler_;  ///< Fallback handler for unmatched routes
  std::size_t default_max_body_size_;  ///< Default maximum request body size
  std::size_t default_read_expiry_;    ///< Default read timeout
  std::size_t default_write_expiry_;   ///< Default write timeout
};

}  // namespace quoteapi

#endif
