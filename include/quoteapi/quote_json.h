/**
 * @file quote_json.h
 * @brief JSON shapes of the quote API
 * @author Haoming Bai <haomingbai@hotmail.com>
 * @date   2025-10-21
 *
 * Copyright © 2025 Haoming Bai
 * SPDX-License-Identifier: MIT
 *
 * @details
 * Field names and nesting are the wire contract:
 * @code
 * quote:  {"text": "...", "author": "...", "tags": ["..."]}
 * error:  {"error": "..."}
 * stats:  {"processInfo": {"workingSet": "42 MB"}}
 * root:   {"message": "Quote API", "endpoints": {"randomQuote": ...}}
 * @endcode
 */

#pragma once

#ifndef QUOTEAPI_QUOTE_JSON_H_
#define QUOTEAPI_QUOTE_JSON_H_

#include <json/json.h>

#include <string>
#include <string_view>
#include <vector>

#include "quoteapi/quote.h"
#include "quoteapi/quote_catalog.h"

namespace quoteapi {

/// Content-Type sent with every JSON body.
inline constexpr std::string_view kJsonContentType =
    "application/json; charset=utf-8";

Json::Value QuoteToJson(const Quote& quote);

/**
 * @brief Array of quote objects, in the given order
 */
Json::Value QuotesToJson(const std::vector<Quote>& quotes);

/**
 * @brief {"error": message}, with invalid UTF-8 bytes replaced by U+FFFD
 */
Json::Value ErrorToJson(std::string_view message);

Json::Value StatsToJson(const StatsSnapshot& stats);

/**
 * @brief Service name and the paths of its endpoints
 */
Json::Value ApiInfoToJson();

/**
 * @brief Serialize compactly, without indentation or trailing newline
 *
 * Non-ASCII characters are written as UTF-8 rather than escaped.
 */
std::string WriteJson(const Json::Value& value);

}  // namespace quoteapi

#endif
