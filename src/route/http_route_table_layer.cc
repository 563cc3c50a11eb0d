/**
 * @file http_route_table_layer.cc
 * @brief Route tree node
 * @author Haoming Bai <haomingbai@hotmail.com>
 * @date   2025-09-25
 *
 * Copyright © 2025 Haoming Bai
 * SPDX-License-Identifier: MIT
 */

#include "quoteapi/internal/http_route_table_layer.h"

#include <cstddef>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "quoteapi/http_request_aspect_handler.h"
#include "quoteapi/http_request_handler.h"

using quoteapi::HttpRequestAspectHandler;
using quoteapi::HttpRequestHandler;
using quoteapi::route_internal::HttpRouteTableLayer;

HttpRouteTableLayer::HttpRouteTableLayer()
    : param_route_(nullptr),
      handler_(nullptr),
      max_body_size_(0),
      read_expiry_(0),
      write_expiry_(0),
      exclusive_(false) {}

void HttpRouteTableLayer::SetMaxBodySize(std::size_t max_body_size) noexcept {
  max_body_size_ = max_body_size;
}

void HttpRouteTableLayer::SetReadExpiry(std::size_t expiry) noexcept {
  read_expiry_ = expiry;
}

void HttpRouteTableLayer::SetWriteExpiry(std::size_t expiry) noexcept {
  write_expiry_ = expiry;
}

bool HttpRouteTableLayer::SetHandler(
    std::unique_ptr<HttpRequestHandler> handler) noexcept {
  if (!handler) {
    return false;
  }

  handler_ = std::move(handler);
  return true;
}

bool HttpRouteTableLayer::SetParamRoute(
    std::unique_ptr<HttpRouteTableLayer> route) noexcept {
  if (!route) {
    return false;
  }

  param_route_ = std::move(route);
  return true;
}

bool HttpRouteTableLayer::SetRoute(std::string key,
                                   std::unique_ptr<HttpRouteTableLayer> link) {
  if (key.empty() || !link) {
    return false;
  }

  map_.insert_or_assign(std::move(key), std::move(link));
  return true;
}

void HttpRouteTableLayer::SetExclusive(bool flag) noexcept {
  exclusive_ = flag;
}

bool HttpRouteTableLayer::IsExclusive() const noexcept { return exclusive_; }

HttpRouteTableLayer* HttpRouteTableLayer::GetParamRoute() noexcept {
  return param_route_.get();
}

HttpRouteTableLayer* HttpRouteTableLayer::GetRoute(
    const std::string& key) noexcept {
  auto it = map_.find(key);
  return it == map_.end() ? nullptr : it->second.get();
}

HttpRequestHandler* HttpRouteTableLayer::GetHandler() noexcept {
  return handler_.get();
}

bool HttpRouteTableLayer::AddAspect(
    std::unique_ptr<HttpRequestAspectHandler> aspect) {
  if (!aspect) {
    return false;
  }

  aspects_.emplace_back(std::move(aspect));
  return true;
}

std::vector<HttpRequestAspectHandler*> HttpRouteTableLayer::GetAspects()
    const {
  std::vector<HttpRequestAspectHandler*> aspects;
  aspects.reserve(aspects_.size());
  for (auto const& a : aspects_) {
    aspects.emplace_back(a.get());
  }

  return aspects;
}

std::size_t HttpRouteTableLayer::GetAspectNum() const noexcept {
  return aspects_.size();
}

std::size_t HttpRouteTableLayer::GetMaxBodySize() const noexcept {
  return max_body_size_;
}

std::size_t HttpRouteTableLayer::GetReadExpiry() const noexcept {
  return read_expiry_;
}

std::size_t HttpRouteTableLayer::GetWriteExpiry() const noexcept {
  return write_expiry_;
}
