/**
 * @file http_server_connection.cc
 * @brief Request cycle shared by plain and TLS connections
 * @author Haoming Bai <haomingbai@hotmail.com>
 * @date   2025-09-30
 *
 * Copyright © 2025 Haoming Bai
 * SPDX-License-Identifier: MIT
 */

#include "quoteapi/internal/http_server_connection.h"

#include <boost/asio/post.hpp>
#include <boost/beast/core/flat_buffer.hpp>
#include <boost/beast/http/parser.hpp>
#include <boost/beast/http/string_body.hpp>
#include <chrono>
#include <cstddef>
#include <memory>
#include <string>
#include <string_view>
#include <utility>

#include "quoteapi/http_server.h"
#include "quoteapi/http_server_task.h"
#include "quoteapi/logger.h"

using quoteapi::HttpServerConnection;

namespace {

using RequestParser =
    boost::beast::http::request_parser<boost::beast::http::string_body>;

}  // namespace

void HttpServerConnection::Log(quoteapi::LogLevel level, std::string message) {
  srv_->Log(level, std::move(message));
}

void HttpServerConnection::Run() {
  if (!IsServerRunning() || !IsStreamAvailable()) {
    boost::asio::post(strand_,
                      [self = shared_from_this(), this] { DoClose(); });
    return;
  }

  boost::asio::post(strand_, [self = shared_from_this(), this] {
    ArmTimer(header_read_expiry_);
    DoReadHeader();
  });
}

void HttpServerConnection::WriteResponse(HttpResponse resp, bool keep_alive) {
  boost::asio::post(strand_, [self = shared_from_this(), this,
                              resp = std::move(resp), keep_alive]() mutable {
    if (!IsServerRunning() || !IsStreamAvailable()) {
      DoClose();
      return;
    }

    DoWriteResponse(std::move(resp), keep_alive);
  });
}

void HttpServerConnection::DoRoute() {
  CancelTimer();

  if (!parser_->is_header_done() || !IsServerRunning() ||
      !IsStreamAvailable()) {
    DoClose();
    return;
  }

  auto &req = parser_->get();
  route_result_ = srv_->Route(
      HttpServer::BeastHttpVerbToHttpRequestMethod(req.method()),
      std::string_view(req.target().data(), req.target().size()));

  if (route_result_.handler == nullptr) {
    DoClose();
    return;
  }

  ArmTimer(route_result_.read_expiry);

  if (route_result_.max_body_size) {
    parser_->body_limit(route_result_.max_body_size);
  }

  DoReadBody();
}

void HttpServerConnection::MakeHttpServerTask() {
  CancelTimer();

  if (!IsServerRunning() || !IsStreamAvailable()) {
    DoClose();
    return;
  }

  write_expiry_ = route_result_.write_expiry;
  auto task = std::make_shared<HttpServerTask>(
      parser_->release(), std::move(route_result_), shared_from_this());
  route_result_ = {};
  task->Start();
}

void HttpServerConnection::DoCycle() {
  if (!IsServerRunning() || !IsStreamAvailable()) {
    DoClose();
    return;
  }

  route_result_ = {};
  parser_ = std::make_unique<RequestParser>();

  // An idle keep-alive connection gets the idle timeout on top of the
  // usual header timeout.
  ArmTimer(header_read_expiry_ + keep_alive_timeout_);
  DoReadHeader();
}

void HttpServerConnection::ArmTimer(std::size_t expiry) {
  if (!expiry) {
    return;
  }

  timer_.expires_after(std::chrono::milliseconds(expiry));
  timer_.async_wait(
      [self = shared_from_this(), this](boost::system::error_code ec) {
        if (!ec) {
          Log(LogLevel::kDebug, "Connection timed out");
          DoClose();
        }
      });
}

void HttpServerConnection::CancelTimer() noexcept { timer_.cancel(); }

HttpServerConnection::HttpServerConnection(
    boost::asio::strand<boost::asio::any_io_executor> strand, HttpServer *srv,
    std::size_t header_read_expiry, std::size_t keep_alive_timeout)
    : strand_(std::move(strand)),
      timer_(strand_),
      buf_(8192),
      route_result_{},
      srv_(srv),
      parser_(std::make_unique<RequestParser>()),
      header_read_expiry_(header_read_expiry),
      keep_alive_timeout_(keep_alive_timeout),
      write_expiry_(0) {}

bool HttpServerConnection::IsServerRunning() const noexcept {
  return srv_->IsRunning();
}

quoteapi::HttpServer *HttpServerConnection::GetServer() const noexcept {
  return srv_;
}

RequestParser &HttpServerConnection::GetParser() noexcept { return *parser_; }

std::size_t HttpServerConnection::GetKeepAliveTimeout() const noexcept {
  return keep_alive_timeout_ / 1000 ? keep_alive_timeout_ / 1000 : 1;
}

std::size_t HttpServerConnection::GetWriteExpiry() const noexcept {
  return write_expiry_;
}

boost::asio::strand<boost::asio::any_io_executor> &
HttpServerConnection::GetStrand() noexcept {
  return strand_;
}

boost::beast::flat_buffer &HttpServerConnection::GetBuffer() noexcept {
  return buf_;
}
