/**
 * @file quote_json.cc
 * @brief JSON shapes of the quote API
 * @author Haoming Bai <haomingbai@hotmail.com>
 * @date   2025-10-21
 *
 * Copyright © 2025 Haoming Bai
 * SPDX-License-Identifier: MIT
 */

#include "quoteapi/quote_json.h"

#include <json/json.h>

#include <boost/locale/utf.hpp>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "quoteapi/quote.h"
#include "quoteapi/quote_catalog.h"

namespace quoteapi {

namespace {

// Each byte that does not start a valid UTF-8 sequence becomes U+FFFD.
std::string ReplaceInvalidUtf8(std::string_view text) {
  using Utf8 = boost::locale::utf::utf_traits<char>;
  constexpr std::string_view kReplacement = "\xEF\xBF\xBD";

  std::string out;
  out.reserve(text.size());

  auto it = text.begin();
  while (it != text.end()) {
    auto start = it;
    auto cp = Utf8::decode(it, text.end());
    if (cp == boost::locale::utf::illegal ||
        cp == boost::locale::utf::incomplete) {
      out.append(kReplacement);
      it = start + 1;
    } else {
      out.append(start, it);
    }
  }
  return out;
}

}  // namespace

Json::Value QuoteToJson(const Quote& quote) {
  Json::Value tags(Json::arrayValue);
  for (const auto& tag : quote.tags) {
    tags.append(tag);
  }

  Json::Value out(Json::objectValue);
  out["text"] = quote.text;
  out["author"] = quote.author;
  out["tags"] = std::move(tags);
  return out;
}

Json::Value QuotesToJson(const std::vector<Quote>& quotes) {
  Json::Value out(Json::arrayValue);
  for (const auto& q : quotes) {
    out.append(QuoteToJson(q));
  }
  return out;
}

Json::Value ErrorToJson(std::string_view message) {
  Json::Value out(Json::objectValue);
  out["error"] = ReplaceInvalidUtf8(message);
  return out;
}

Json::Value StatsToJson(const StatsSnapshot& stats) {
  Json::Value process_info(Json::objectValue);
  process_info["workingSet"] = stats.working_set;

  Json::Value out(Json::objectValue);
  out["processInfo"] = std::move(process_info);
  return out;
}

Json::Value ApiInfoToJson() {
  Json::Value endpoints(Json::objectValue);
  endpoints["randomQuote"] = "/quote/random";
  endpoints["quotesByTag"] = "/quotes/tag/{tag}";
  endpoints["allQuotes"] = "/quotes";
  endpoints["stats"] = "/stats";

  Json::Value out(Json::objectValue);
  out["message"] = "Quote API";
  out["endpoints"] = std::move(endpoints);
  return out;
}

std::string WriteJson(const Json::Value& value) {
  Json::StreamWriterBuilder builder;
  builder["indentation"] = "";
  builder["emitUTF8"] = true;
  return Json::writeString(builder, value);
}

}  // namespace quoteapi
