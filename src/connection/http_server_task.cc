/**
 * @file http_server_task.cc
 * @brief Aspect and handler pipeline of one request
 * @author Haoming Bai <haomingbai@hotmail.com>
 * @date   2025-10-02
 *
 * Copyright © 2025 Haoming Bai
 * SPDX-License-Identifier: MIT
 */

#include "quoteapi/http_server_task.h"

#include <boost/beast/http/field.hpp>
#include <boost/beast/http/status.hpp>
#include <chrono>
#include <cstddef>
#include <exception>
#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <utility>

#include "quoteapi/http_request_aspect_handler.h"
#include "quoteapi/http_request_handler.h"
#include "quoteapi/http_server.h"
#include "quoteapi/internal/http_server_connection.h"
#include "quoteapi/logger.h"

using quoteapi::HttpRequest;
using quoteapi::HttpResponse;
using quoteapi::HttpServerTask;

HttpServerTask::HttpServerTask(HttpRequest req, HttpRouteResult route_result,
                               std::shared_ptr<HttpServerConnection> conn)
    : req_(std::move(req)),
      resp_(boost::beast::http::status::ok, req_.version()),
      conn_(std::move(conn)),
      route_result_(std::move(route_result)),
      srv_(conn_->GetServer()),
      start_time_(std::chrono::steady_clock::now()),
      keep_alive_(req_.keep_alive()) {}

HttpRequest &HttpServerTask::GetRequest() noexcept { return req_; }

HttpResponse &HttpServerTask::GetResponse() noexcept { return resp_; }

void HttpServerTask::SetBody(std::string body) {
  resp_.body() = std::move(body);
}

void HttpServerTask::AppendBody(const std::string_view body) {
  resp_.body() += body;
}

void HttpServerTask::SetField(const std::string_view key,
                              const std::string_view value) {
  resp_.set(key, value);
}

void HttpServerTask::SetField(boost::beast::http::field key,
                              const std::string_view value) {
  resp_.set(key, value);
}

void HttpServerTask::SetKeepAlive(bool value) noexcept { keep_alive_ = value; }

void HttpServerTask::Log(quoteapi::LogLevel level, std::string message) {
  srv_->Log(level, std::move(message));
}

void HttpServerTask::Post(std::function<void()> fn) {
  srv_->Post(std::move(fn));
}

bool HttpServerTask::IsAvailable() noexcept {
  return conn_ && srv_->IsRunning() && conn_->IsStreamAvailable();
}

const std::string &HttpServerTask::GetCurrentLocation() const noexcept {
  return route_result_.current_location;
}

const std::vector<std::string> &HttpServerTask::GetPathParameters()
    const noexcept {
  return route_result_.parameters;
}

std::chrono::microseconds HttpServerTask::GetElapsed() const noexcept {
  return std::chrono::duration_cast<std::chrono::microseconds>(
      std::chrono::steady_clock::now() - start_time_);
}

HttpServerTask::~HttpServerTask() {
  if (!conn_) {
    return;
  }

  conn_->WriteResponse(std::move(resp_), keep_alive_);
}

void HttpServerTask::Start() {
  Post([self = shared_from_this(), this] { DoPreService(0); });
}

void HttpServerTask::DoPreService(std::size_t curr_idx) {
  if (curr_idx >= route_result_.aspects.size()) {
    Post([self = shared_from_this(), this] { DoService(); });
    return;
  }

  try {
    route_result_.aspects[curr_idx]->PreService(shared_from_this());
  } catch (const std::exception &e) {
    Log(LogLevel::kError, std::string("Aspect failed: ") + e.what());
  }

  Post([self = shared_from_this(), this, curr_idx] {
    DoPreService(curr_idx + 1);
  });
}

void HttpServerTask::DoService() {
  try {
    route_result_.handler->Service(shared_from_this());
  } catch (const std::exception &e) {
    Log(LogLevel::kError, std::string("Unhandled exception in handler for ") +
                              route_result_.current_location + ": " + e.what());
    resp_.result(boost::beast::http::status::internal_server_error);
    resp_.set(boost::beast::http::field::content_type,
              "application/json; charset=utf-8");
    resp_.body() = R"({"error":"Internal Server Error"})";
  }

  if (!route_result_.aspects.empty()) {
    Post([self = shared_from_this(), this] {
      DoPostService(route_result_.aspects.size() - 1);
    });
  }
}

void HttpServerTask::DoPostService(std::size_t curr_idx) {
  try {
    route_result_.aspects[curr_idx]->PostService(shared_from_this());
  } catch (const std::exception &e) {
    Log(LogLevel::kError, std::string("Aspect failed: ") + e.what());
  }

  if (curr_idx != 0) {
    Post([self = shared_from_this(), this, curr_idx] {
      DoPostService(curr_idx - 1);
    });
  }
}
