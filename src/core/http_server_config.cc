/**
 * @file http_server_config.cc
 * @brief Configuration of a stopped server
 * @author Haoming Bai <haomingbai@hotmail.com>
 * @date   2025-10-03
 *
 * Copyright © 2025 Haoming Bai
 * SPDX-License-Identifier: MIT
 */

#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl/context.hpp>
#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <utility>

#include "quoteapi/http_request_aspect_handler.h"
#include "quoteapi/http_request_handler.h"
#include "quoteapi/http_request_method.h"
#include "quoteapi/http_server.h"
#include "quoteapi/internal/http_route_table.h"
#include "quoteapi/logger.h"

using quoteapi::HttpRequestAspectHandler;
using quoteapi::HttpRequestHandler;
using quoteapi::HttpRequestMethod;
using quoteapi::HttpServer;

namespace {

std::string RouteSubject(std::string_view what, std::string_view url) {
  std::string subject(what);
  subject += ": ";
  subject += url;
  return subject;
}

}  // namespace

HttpServer* HttpServer::Configure(std::string_view subject,
                                  const std::function<bool()>& change) {
  std::unique_lock<std::shared_mutex> lock(mtx_);

  if (is_running_) {
    return this;
  }

  if (!change()) {
    logger_->Log(LogLevel::kWarn, "Rejected " + std::string(subject));
  }
  return this;
}

HttpServer* HttpServer::AddRouteEntry(
    HttpRequestMethod method, const std::string_view url,
    std::unique_ptr<HttpRequestHandler> handler) {
  return Configure(RouteSubject("route pattern", url), [&] {
    return route_table_->AddRouteEntry(method, url, std::move(handler));
  });
}

HttpServer* HttpServer::AddExclusiveRouteEntry(
    HttpRequestMethod method, const std::string_view url,
    std::unique_ptr<HttpRequestHandler> handler) {
  return Configure(RouteSubject("exclusive route pattern", url), [&] {
    return route_table_->AddExclusiveRouteEntry(method, url,
                                                std::move(handler));
  });
}

HttpServer* HttpServer::AddAspect(
    HttpRequestMethod method, const std::string_view url,
    std::unique_ptr<HttpRequestAspectHandler> aspect) {
  return Configure(RouteSubject("aspect on", url), [&] {
    return route_table_->AddAspect(method, url, std::move(aspect));
  });
}

HttpServer* HttpServer::AddGlobalAspect(
    HttpRequestMethod method, std::unique_ptr<HttpRequestAspectHandler> aspect) {
  return Configure("method aspect", [&] {
    return route_table_->AddGlobalAspect(method, std::move(aspect));
  });
}

HttpServer* HttpServer::AddGlobalAspect(
    std::unique_ptr<HttpRequestAspectHandler> aspect) {
  return Configure("global aspect", [&] {
    return route_table_->AddGlobalAspect(std::move(aspect));
  });
}

HttpServer* HttpServer::AddListen(boost::asio::ip::tcp::endpoint ep) {
  // The acceptor opens, binds with SO_REUSEADDR and listens; a failure
  // throws out of Configure with the lock released.
  return Configure("listen endpoint", [&] {
    acceptors_.emplace_back(ioc_, ep);
    return true;
  });
}

HttpServer* HttpServer::SetReadExpiry(HttpRequestMethod method,
                                      std::string_view url,
                                      std::size_t expiry) {
  return Configure(RouteSubject("read expiry for", url), [&] {
    return route_table_->SetReadExpiry(method, url, expiry);
  });
}

HttpServer* HttpServer::SetWriteExpiry(HttpRequestMethod method,
                                       std::string_view url,
                                       std::size_t expiry) {
  return Configure(RouteSubject("write expiry for", url), [&] {
    return route_table_->SetWriteExpiry(method, url, expiry);
  });
}

HttpServer* HttpServer::SetMaxBodySize(HttpRequestMethod method,
                                       std::string_view url,
                                       std::size_t size) {
  return Configure(RouteSubject("body limit for", url), [&] {
    return route_table_->SetMaxBodySize(method, url, size);
  });
}

HttpServer* HttpServer::SetHeaderReadExpiry(std::size_t expiry) {
  return Configure("header read expiry", [&] {
    header_read_expiry_ = expiry;
    return true;
  });
}

HttpServer* HttpServer::SetKeepAliveTimeout(std::size_t timeout) {
  return Configure("keep-alive timeout", [&] {
    keep_alive_timeout_ = timeout;
    return true;
  });
}

HttpServer* HttpServer::SetDefaultReadExpiry(std::size_t expiry) {
  return Configure("default read expiry", [&] {
    route_table_->SetDefaultReadExpiry(expiry);
    return true;
  });
}

HttpServer* HttpServer::SetDefaultWriteExpiry(std::size_t expiry) {
  return Configure("default write expiry", [&] {
    route_table_->SetDefaultWriteExpiry(expiry);
    return true;
  });
}

HttpServer* HttpServer::SetDefaultMaxBodySize(std::size_t size) {
  return Configure("default body limit", [&] {
    route_table_->SetDefaultMaxBodySize(size);
    return true;
  });
}

HttpServer* HttpServer::SetDefaultHandler(
    std::unique_ptr<HttpRequestHandler> handler) {
  return Configure("null default handler", [&] {
    return route_table_->SetDefaultHandler(std::move(handler));
  });
}

HttpServer* HttpServer::SetSslContext(boost::asio::ssl::context ctx) {
  return Configure("TLS context", [&] {
    ssl_ctx_.emplace(std::move(ctx));
    return true;
  });
}

HttpServer* HttpServer::UnsetSslContext() {
  return Configure("TLS context", [&] {
    ssl_ctx_.reset();
    return true;
  });
}

HttpServer* HttpServer::SetLogger(std::shared_ptr<Logger> logger) {
  return Configure("null logger", [&] {
    if (!logger) {
      return false;
    }
    logger_ = std::move(logger);
    return true;
  });
}
