/**
 * @file http_server.cc
 * @brief Server construction and shared services
 * @author Haoming Bai <haomingbai@hotmail.com>
 * @date   2025-10-03
 *
 * Copyright © 2025 Haoming Bai
 * SPDX-License-Identifier: MIT
 */

#include "quoteapi/http_server.h"

#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/thread_pool.hpp>
#include <cstddef>
#include <functional>
#include <memory>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "quoteapi/http_request_method.h"
#include "quoteapi/http_route_result.h"
#include "quoteapi/internal/empty_logger.h"
#include "quoteapi/internal/http_route_table.h"
#include "quoteapi/logger.h"

using quoteapi::HttpRequestMethod;
using quoteapi::HttpRouteResult;
using quoteapi::HttpServer;

HttpServer::HttpServer(std::size_t thread_num)
    : logger_(std::make_shared<internal::EmptyLogger>()),
      thread_pool_(std::make_unique<boost::asio::thread_pool>(thread_num)),
      route_table_(std::make_unique<HttpRouteTable>()),
      header_read_expiry_(3000),
      keep_alive_timeout_(4000),
      thread_cnt_(thread_num),
      is_running_(false) {}

HttpServer::HttpServer()
    : logger_(std::make_shared<internal::EmptyLogger>()),
      thread_pool_(std::make_unique<boost::asio::thread_pool>()),
      route_table_(std::make_unique<HttpRouteTable>()),
      header_read_expiry_(3000),
      keep_alive_timeout_(4000),
      thread_cnt_(0),
      is_running_(false) {}

HttpServer::~HttpServer() { Stop(); }

void HttpServer::Post(std::function<void()> fn) {
  std::shared_lock<std::shared_mutex> lock(mtx_);

  if (!is_running_) {
    return;
  }

  boost::asio::post(thread_pool_->get_executor(), std::move(fn));
}

void HttpServer::Log(LogLevel level, std::string message) {
  logger_->Log(level, std::move(message));
}

HttpRouteResult HttpServer::Route(HttpRequestMethod method,
                                  std::string_view target) {
  std::shared_lock<std::shared_mutex> lock(mtx_);
  return route_table_->Route(method, target);
}

std::vector<boost::asio::ip::tcp::endpoint> HttpServer::GetListenEndpoints() {
  std::shared_lock<std::shared_mutex> lock(mtx_);

  std::vector<boost::asio::ip::tcp::endpoint> eps;
  eps.reserve(acceptors_.size());
  for (auto& acc : acceptors_) {
    boost::system::error_code ec;
    auto ep = acc.local_endpoint(ec);
    if (!ec) {
      eps.push_back(ep);
    }
  }

  return eps;
}

std::size_t HttpServer::GetKeepAliveTimeout() const noexcept {
  return keep_alive_timeout_;
}

bool HttpServer::IsRunning() const noexcept { return is_running_; }
