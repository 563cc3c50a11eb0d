/**
 * @file quote_routes.cc
 * @brief HTTP handlers binding the quote catalog to the server
 * @author Haoming Bai <haomingbai@hotmail.com>
 * @date   2025-10-21
 *
 * Copyright © 2025 Haoming Bai
 * SPDX-License-Identifier: MIT
 */

#include "quoteapi/quote_routes.h"

#include <json/json.h>

#include <boost/beast/http/field.hpp>
#include <boost/beast/http/status.hpp>
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>

#include "quoteapi/http_request_method.h"
#include "quoteapi/http_server.h"
#include "quoteapi/http_server_task.h"
#include "quoteapi/logger.h"
#include "quoteapi/quote_catalog.h"
#include "quoteapi/quote_json.h"

namespace quoteapi {

namespace {

namespace http = boost::beast::http;

void ReplyJson(HttpServerTask& task, http::status status,
               const Json::Value& body) {
  task.GetResponse().result(status);
  task.SetField(http::field::content_type, kJsonContentType);
  task.SetBody(WriteJson(body));
}

}  // namespace

QuoteRouteHandler::QuoteRouteHandler(
    std::shared_ptr<const QuoteCatalog> catalog)
    : catalog_(std::move(catalog)) {
  if (!catalog_) {
    throw std::invalid_argument("Quote handlers need a catalog");
  }
}

const QuoteCatalog& QuoteRouteHandler::Catalog() const noexcept {
  return *catalog_;
}

void ApiInfoHandler::Service(std::shared_ptr<HttpServerTask> task) {
  ReplyJson(*task, http::status::ok, ApiInfoToJson());
}

void RandomQuoteHandler::Service(std::shared_ptr<HttpServerTask> task) {
  ReplyJson(*task, http::status::ok, QuoteToJson(Catalog().RandomQuote()));
}

void AllQuotesHandler::Service(std::shared_ptr<HttpServerTask> task) {
  ReplyJson(*task, http::status::ok, QuotesToJson(Catalog().AllQuotes()));
}

void QuotesByTagHandler::Service(std::shared_ptr<HttpServerTask> task) {
  const auto& params = task->GetPathParameters();
  if (params.empty()) {
    ReplyJson(*task, http::status::not_found, ErrorToJson("Not Found"));
    return;
  }

  try {
    ReplyJson(*task, http::status::ok,
              QuotesToJson(Catalog().QuotesByTag(params.front())));
  } catch (const TagNotFoundError& e) {
    ReplyJson(*task, http::status::not_found, ErrorToJson(e.what()));
  }
}

void StatsHandler::Service(std::shared_ptr<HttpServerTask> task) {
  try {
    ReplyJson(*task, http::status::ok, StatsToJson(Catalog().Stats()));
  } catch (const std::runtime_error& e) {
    task->Log(LogLevel::kError,
              std::string("Reading process memory failed: ") + e.what());
    ReplyJson(*task, http::status::internal_server_error,
              ErrorToJson("Internal Server Error"));
  }
}

void AccessLogAspect::PreService(
    [[maybe_unused]] std::shared_ptr<HttpServerTask> task) {}

void AccessLogAspect::PostService(std::shared_ptr<HttpServerTask> task) {
  auto& req = task->GetRequest();

  auto method = req.method_string();
  auto target = req.target();

  std::string line(method.data(), method.size());
  line += ' ';
  line.append(target.data(), target.size());
  line += " -> ";
  line += std::to_string(task->GetResponse().result_int());
  line += " (";
  line += std::to_string(task->GetElapsed().count());
  line += " us)";

  task->Log(LogLevel::kInfo, std::move(line));
}

void RegisterQuoteRoutes(HttpServer& server,
                         std::shared_ptr<const QuoteCatalog> catalog) {
  server
      .AddRouteEntry(HttpRequestMethod::kGet, "/",
                     std::make_unique<ApiInfoHandler>())
      ->AddRouteEntry(HttpRequestMethod::kGet, "/quote/random",
                      std::make_unique<RandomQuoteHandler>(catalog))
      ->AddRouteEntry(HttpRequestMethod::kGet, "/quotes",
                      std::make_unique<AllQuotesHandler>(catalog))
      ->AddRouteEntry(HttpRequestMethod::kGet, "/quotes/tag/{tag}",
                      std::make_unique<QuotesByTagHandler>(catalog))
      ->AddRouteEntry(HttpRequestMethod::kGet, "/stats",
                      std::make_unique<StatsHandler>(catalog))
      ->AddGlobalAspect(std::make_unique<AccessLogAspect>());
}

}  // namespace quoteapi
