/**
 * @file http_request_method.h
 * @brief HTTP request methods understood by the route table
 * @author Haoming Bai <haomingbai@hotmail.com>
 * @date   2025-10-21
 *
 * Copyright © 2025 Haoming Bai
 * SPDX-License-Identifier: MIT
 *
 * @details
 * The route table keeps one routing tree per method. The quote API only
 * registers kGet routes, so requests with any other method fall through to
 * the default (404) handler.
 */

#pragma once

#ifndef QUOTEAPI_HTTP_REQUEST_METHOD_H_
#define QUOTEAPI_HTTP_REQUEST_METHOD_H_

#include <cstdint>

namespace quoteapi {

/**
 * @brief HTTP request methods
 *
 * @code
 * server->AddRouteEntry(HttpRequestMethod::kGet, "/quotes",
 *                       std::make_unique<AllQuotesHandler>(catalog));
 * @endcode
 */
enum class HttpRequestMethod : std::uint8_t {
  kGet = 0,  ///< Retrieve a resource
  kPost,     ///< Create a new resource
  kPut,      ///< Replace an existing resource
  kDelete,   ///< Remove a resource
  kPatch,    ///< Partially update a resource
  kHead,     ///< Retrieve resource headers only
  kOptions,  ///< Describe communication options
  kUnknown   ///< Any verb not listed above; never routed
};

}  // namespace quoteapi

#endif
