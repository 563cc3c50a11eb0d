/**
 * @file quote_routes.h
 * @brief HTTP handlers binding the quote catalog to the server
 * @author Haoming Bai <haomingbai@hotmail.com>
 * @date   2025-10-21
 *
 * Copyright © 2025 Haoming Bai
 * SPDX-License-Identifier: MIT
 *
 * @details
 * | Route                 | Handler              |
 * |-----------------------|----------------------|
 * | GET /                 | ApiInfoHandler       |
 * | GET /quote/random     | RandomQuoteHandler   |
 * | GET /quotes           | AllQuotesHandler     |
 * | GET /quotes/tag/{tag} | QuotesByTagHandler   |
 * | GET /stats            | StatsHandler         |
 *
 * Anything else gets the server's default 404 {"error":"Not Found"}.
 */

#pragma once

#ifndef QUOTEAPI_QUOTE_ROUTES_H_
#define QUOTEAPI_QUOTE_ROUTES_H_

#include <memory>

#include "quoteapi/http_request_aspect_handler.h"
#include "quoteapi/http_request_handler.h"
#include "quoteapi/quote_catalog.h"

namespace quoteapi {

class HttpServer;

/**
 * @brief Base of the catalog-backed handlers
 */
class QuoteRouteHandler : public HttpRequestHandler {
 public:
  explicit QuoteRouteHandler(std::shared_ptr<const QuoteCatalog> catalog);

 protected:
  const QuoteCatalog& Catalog() const noexcept;

 private:
  std::shared_ptr<const QuoteCatalog> catalog_;
};

/**
 * @brief GET / : service name and endpoint paths
 */
class ApiInfoHandler : public HttpRequestHandler {
 public:
  void Service(std::shared_ptr<HttpServerTask> task) override;
};

/**
 * @brief GET /quote/random
 */
class RandomQuoteHandler : public QuoteRouteHandler {
 public:
  using QuoteRouteHandler::QuoteRouteHandler;

  void Service(std::shared_ptr<HttpServerTask> task) override;
};

/**
 * @brief GET /quotes
 */
class AllQuotesHandler : public QuoteRouteHandler {
 public:
  using QuoteRouteHandler::QuoteRouteHandler;

  void Service(std::shared_ptr<HttpServerTask> task) override;
};

/**
 * @brief GET /quotes/tag/{tag}
 *
 * Answers 404 with the catalog's message when no quote has the tag.
 */
class QuotesByTagHandler : public QuoteRouteHandler {
 public:
  using QuoteRouteHandler::QuoteRouteHandler;

  void Service(std::shared_ptr<HttpServerTask> task) override;
};

/**
 * @brief GET /stats
 *
 * Answers 500 when the memory probe fails.
 */
class StatsHandler : public QuoteRouteHandler {
 public:
  using QuoteRouteHandler::QuoteRouteHandler;

  void Service(std::shared_ptr<HttpServerTask> task) override;
};

/**
 * @brief Logs "<METHOD> <target> -> <status> (<elapsed> us)" at kInfo
 */
class AccessLogAspect : public HttpRequestAspectHandler {
 public:
  void PreService(std::shared_ptr<HttpServerTask> task) override;

  void PostService(std::shared_ptr<HttpServerTask> task) override;
};

/**
 * @brief Install the quote routes and access logging
 * @param server A stopped server
 * @param catalog Catalog shared by all handlers
 */
void RegisterQuoteRoutes(HttpServer& server,
                         std::shared_ptr<const QuoteCatalog> catalog);

}  // namespace quoteapi

#endif
