/**
 * @file http_route_table_layer.h
 * @brief One path segment of the route tree
 * @author Haoming Bai <haomingbai@hotmail.com>
 * @date   2025-09-25
 *
 * Copyright © 2025 Haoming Bai
 * SPDX-License-Identifier: MIT
 *
 * @details
 * A layer owns its literal children, an optional parameter child, the
 * handler and aspects bound at this depth, and per-route limits that
 * override the table defaults when non-zero.
 */

#pragma once

#ifndef QUOTEAPI_INTERNAL_HTTP_ROUTE_TABLE_LAYER_H_
#define QUOTEAPI_INTERNAL_HTTP_ROUTE_TABLE_LAYER_H_

#include <cstddef>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

#include "quoteapi/trait.h"

namespace quoteapi {

class HttpRequestHandler;
class HttpRequestAspectHandler;

namespace route_internal {

/**
 * @brief Node of the per-method route tree
 *
 * @code
 * // Tree for the quote API (GET):
 * // "" (root handler)
 * //   ├── "quote" -> "random" (handler)
 * //   ├── "quotes" (handler)
 * //   │      └── "tag" -> param (handler)
 * //   └── "stats" (handler)
 * @endcode
 */
class HttpRouteTableLayer : NonCopyableNonMovable<HttpRouteTableLayer> {
 public:
  void SetMaxBodySize(std::size_t max_body_size) noexcept;

  std::size_t GetMaxBodySize() const noexcept;

  void SetReadExpiry(std::size_t expiry) noexcept;

  std::size_t GetReadExpiry() const noexcept;

  void SetWriteExpiry(std::size_t expiry) noexcept;

  std::size_t GetWriteExpiry() const noexcept;

  /**
   * @brief Bind the handler of this layer, replacing any earlier one
   * @return false if handler is null
   */
  bool SetHandler(std::unique_ptr<HttpRequestHandler> handler) noexcept;

  /**
   * @brief Set the child matched by a {param} segment
   * @return false if route is null
   */
  bool SetParamRoute(std::unique_ptr<HttpRouteTableLayer> route) noexcept;

  /**
   * @brief Add or replace the child for a literal segment
   * @return false if key is empty or link is null
   */
  bool SetRoute(std::string key, std::unique_ptr<HttpRouteTableLayer> link);

  /**
   * @brief Mark this layer exclusive
   *
   * An exclusive layer stops matching at the first unknown segment and
   * serves the request itself instead of descending into the param child.
   */
  void SetExclusive(bool flag) noexcept;

  bool IsExclusive() const noexcept;

  HttpRouteTableLayer *GetParamRoute() noexcept;

  /**
   * @brief Look up the child for a literal segment
   * @return The child, nullptr if absent
   */
  HttpRouteTableLayer *GetRoute(const std::string &key) noexcept;

  HttpRequestHandler *GetHandler() noexcept;

  bool AddAspect(std::unique_ptr<HttpRequestAspectHandler> aspect);

  std::size_t GetAspectNum() const noexcept;

  std::vector<HttpRequestAspectHandler *> GetAspects() const;

  HttpRouteTableLayer();

 private:
  std::unordered_map<std::string, std::unique_ptr<HttpRouteTableLayer>>
      map_;  ///< Children by literal segment
  std::vector<std::unique_ptr<HttpRequestAspectHandler>>
      aspects_;  ///< Route-specific aspects
  std::unique_ptr<HttpRouteTableLayer>
      param_route_;  ///< Child for {param} segments
  std::unique_ptr<HttpRequestHandler> handler_;  ///< Handler of this layer
  std::size_t max_body_size_;                    ///< 0 means table default
  std::size_t read_expiry_;                      ///< 0 means table default
  std::size_t write_expiry_;                     ///< 0 means table default
  bool exclusive_;                               ///< Swallow deeper segments
};

}  // namespace route_internal

}  // namespace quoteapi

#endif
