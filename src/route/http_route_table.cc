/**
 * @file http_route_table.cc
 * @brief Route registration and matching
 * @author Haoming Bai <haomingbai@hotmail.com>
 * @date   2025-09-28
 *
 * Copyright © 2025 Haoming Bai
 * SPDX-License-Identifier: MIT
 */

#include "quoteapi/internal/http_route_table.h"

#include <boost/regex.hpp>
#include <boost/url/parse.hpp>
#include <cstddef>
#include <iterator>
#include <memory>
#include <ranges>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "quoteapi/http_request_aspect_handler.h"
#include "quoteapi/http_request_handler.h"
#include "quoteapi/http_request_method.h"
#include "quoteapi/internal/http_route_table_layer.h"
#include "quoteapi/internal/not_found_route_handler.h"

using quoteapi::HttpRequestAspectHandler;
using quoteapi::HttpRequestHandler;
using quoteapi::HttpRequestMethod;
using quoteapi::HttpRouteResult;
using quoteapi::HttpRouteTable;
using quoteapi::route_internal::HttpRouteTableLayer;

bool quoteapi::route_internal::IsValidParametricTarget(
    const std::string_view target) {
  if (target.empty() || target.length() > 2048 || target.front() != '/') {
    return false;
  }

  // Path characters, or a whole {name} parameter.
  static const boost::regex valid_target_regex(
      R"(^/([a-zA-Z0-9\-._~!$&'()*+,;=:@/%]|\{[a-zA-Z0-9_\-]*\})*$)",
      boost::regex::ECMAScript);

  if (!boost::regex_match(target.begin(), target.end(), valid_target_regex)) {
    return false;
  }

  int depth = 0;
  std::string literal;
  for (char c : target) {
    if (c == '{') {
      if (++depth > 1) {
        return false;
      }
    } else if (c == '}') {
      if (--depth < 0) {
        return false;
      }
    } else if (depth == 0) {
      literal.push_back(c);
    }
  }

  return depth == 0 && literal.find("..") == std::string::npos;
}

bool HttpRouteTable::IsRoutableMethod(HttpRequestMethod method) noexcept {
  return static_cast<std::size_t>(method) < kHttpRequestMethodNum;
}

HttpRouteResult HttpRouteTable::Route(HttpRequestMethod method,
                                      std::string_view target) noexcept {
  std::string path(target.substr(0, target.find('?')));
  if (path.empty()) {
    path = "/";
  }

  if (!IsRoutableMethod(method)) {
    return BuildDefaultRouteResult(method, std::move(path));
  }

  HttpRouteTableLayer *route_layer =
      entrance_[static_cast<std::size_t>(method)].get();

  auto parsed = boost::urls::parse_origin_form(target);
  if (!parsed) {
    return BuildDefaultRouteResult(method, std::move(path));
  }

  std::string current_location;
  std::vector<std::string> parameters;
  if (!MatchSegments(*parsed, route_layer, current_location, parameters)) {
    return BuildDefaultRouteResult(method, std::move(path));
  }

  HttpRequestHandler *handler = route_layer->GetHandler();
  if (!handler) {
    return BuildDefaultRouteResult(method, std::move(path));
  }

  auto max_body_size = route_layer->GetMaxBodySize()
                           ? route_layer->GetMaxBodySize()
                           : default_max_body_size_;
  auto read_expiry = route_layer->GetReadExpiry()
                         ? route_layer->GetReadExpiry()
                         : default_read_expiry_;
  auto write_expiry = route_layer->GetWriteExpiry()
                          ? route_layer->GetWriteExpiry()
                          : default_write_expiry_;

  HttpRouteResult result = {
      .current_location = std::move(current_location),
      .parameters = std::move(parameters),
      .aspects = CollectAspects(route_layer, method),
      .handler = handler,
      .max_body_size = max_body_size,
      .read_expiry = read_expiry,
      .write_expiry = write_expiry,
  };

  return result;
}

bool HttpRouteTable::AddRouteEntry(
    HttpRequestMethod method, const std::string_view target,
    std::unique_ptr<HttpRequestHandler> handler) {
  auto *route_layer = LayerForPattern(method, target);
  return route_layer && route_layer->SetHandler(std::move(handler));
}

bool HttpRouteTable::AddExclusiveRouteEntry(
    HttpRequestMethod method, const std::string_view target,
    std::unique_ptr<HttpRequestHandler> handler) {
  auto *route_layer = LayerForPattern(method, target);
  if (!route_layer || !route_layer->SetHandler(std::move(handler))) {
    return false;
  }

  route_layer->SetExclusive(true);
  return true;
}

HttpRouteTableLayer *HttpRouteTable::LayerForPattern(
    HttpRequestMethod method, const std::string_view target) {
  if (!IsRoutableMethod(method) ||
      !route_internal::IsValidParametricTarget(target)) {
    return nullptr;
  }

  return GetOrCreateRouteTableLayer(method, target);
}

HttpRouteTableLayer *HttpRouteTable::GetOrCreateRouteTableLayer(
    HttpRequestMethod method, const std::string_view target) {
  auto route_layer = entrance_[static_cast<std::size_t>(method)].get();

  std::string_view url = target.substr(0, target.find('?'));
  auto url_segments = url | std::views::split('/') |
                      std::views::transform([](auto &&word) {
                        return std::string_view(word.begin(), word.end());
                      });

  for (auto word : url_segments) {
    if (word.empty()) {
      continue;
    }

    HttpRouteTableLayer *next = word.front() == '{'
                                    ? route_layer->GetParamRoute()
                                    : route_layer->GetRoute(std::string(word));
    if (!next) {
      auto new_layer = std::make_unique<HttpRouteTableLayer>();
      next = new_layer.get();
      if (word.front() == '{') {
        route_layer->SetParamRoute(std::move(new_layer));
      } else {
        route_layer->SetRoute(std::string(word), std::move(new_layer));
      }
    }

    route_layer = next;
  }

  return route_layer;
}

HttpRouteResult HttpRouteTable::BuildDefaultRouteResult(
    HttpRequestMethod method, std::string location) const noexcept {
  HttpRouteResult result = {
      .current_location = std::move(location),
      .parameters = {},
      .aspects = CollectAspects(nullptr, method),
      .handler = default_handler_.get(),
      .max_body_size = default_max_body_size_,
      .read_expiry = default_read_expiry_,
      .write_expiry = default_write_expiry_,
  };

  return result;
}

bool HttpRouteTable::MatchSegments(
    const boost::urls::url_view &url, HttpRouteTableLayer *&route_layer,
    std::string &out_location,
    std::vector<std::string> &out_parameters) const noexcept {
  out_location.clear();
  out_parameters.clear();

  // Segments come out percent-decoded.
  auto segments = url.segments();
  for (auto it = segments.begin(); it != segments.end(); ++it) {
    std::string seg = *it;
    if (seg.empty()) {
      // Only a trailing slash may leave an empty segment.
      if (std::next(it) == segments.end()) {
        break;
      }
      return false;
    }

    if (HttpRouteTableLayer *next = route_layer->GetRoute(seg)) {
      route_layer = next;
    } else if (route_layer->IsExclusive()) {
      break;
    } else if (HttpRouteTableLayer *param = route_layer->GetParamRoute()) {
      out_parameters.push_back(seg);
      route_layer = param;
    } else {
      return false;
    }

    out_location.push_back('/');
    out_location.append(seg);
  }

  if (out_location.empty()) {
    out_location = "/";
  }

  return true;
}

std::vector<HttpRequestAspectHandler *> HttpRouteTable::CollectAspects(
    HttpRouteTableLayer *route_layer, HttpRequestMethod method) const noexcept {
  std::vector<HttpRequestAspectHandler *> aspects;
  auto method_idx = static_cast<std::size_t>(method);
  bool routable = IsRoutableMethod(method);

  std::size_t reserve_size = global_aspects_.size();
  if (routable) {
    reserve_size += global_specific_aspects_[method_idx].size();
  }
  if (route_layer) {
    reserve_size += route_layer->GetAspectNum();
  }
  aspects.reserve(reserve_size);

  for (auto const &a : global_aspects_) {
    aspects.emplace_back(a.get());
  }

  if (routable) {
    for (auto const &a : global_specific_aspects_[method_idx]) {
      aspects.emplace_back(a.get());
    }
  }

  if (route_layer) {
    auto route_aspects = route_layer->GetAspects();
    aspects.insert(aspects.end(), route_aspects.begin(), route_aspects.end());
  }

  return aspects;
}

bool HttpRouteTable::AddAspect(
    HttpRequestMethod method, const std::string_view target,
    std::unique_ptr<HttpRequestAspectHandler> aspect) {
  auto *route_layer = LayerForPattern(method, target);
  return route_layer && route_layer->AddAspect(std::move(aspect));
}

bool HttpRouteTable::AddGlobalAspect(
    HttpRequestMethod method,
    std::unique_ptr<HttpRequestAspectHandler> aspect) {
  if (!IsRoutableMethod(method) || !aspect) {
    return false;
  }

  global_specific_aspects_[static_cast<std::size_t>(method)].emplace_back(
      std::move(aspect));
  return true;
}

bool HttpRouteTable::AddGlobalAspect(
    std::unique_ptr<HttpRequestAspectHandler> aspect) {
  if (!aspect) {
    return false;
  }

  global_aspects_.emplace_back(std::move(aspect));
  return true;
}

bool HttpRouteTable::SetWriteExpiry(HttpRequestMethod method,
                                    const std::string_view target,
                                    std::size_t expiry) {
  auto *route_layer = LayerForPattern(method, target);
  if (!route_layer) {
    return false;
  }

  route_layer->SetWriteExpiry(expiry);
  return true;
}

bool HttpRouteTable::SetReadExpiry(HttpRequestMethod method,
                                   const std::string_view target,
                                   std::size_t expiry) {
  auto *route_layer = LayerForPattern(method, target);
  if (!route_layer) {
    return false;
  }

  route_layer->SetReadExpiry(expiry);
  return true;
}

bool HttpRouteTable::SetMaxBodySize(HttpRequestMethod method,
                                    const std::string_view target,
                                    std::size_t max_body_size) {
  auto *route_layer = LayerForPattern(method, target);
  if (!route_layer) {
    return false;
  }

  route_layer->SetMaxBodySize(max_body_size);
  return true;
}

void HttpRouteTable::SetDefaultWriteExpiry(std::size_t expiry) noexcept {
  default_write_expiry_ = expiry;
}

void HttpRouteTable::SetDefaultReadExpiry(std::size_t expiry) noexcept {
  default_read_expiry_ = expiry;
}

void HttpRouteTable::SetDefaultMaxBodySize(std::size_t max_body_size) noexcept {
  default_max_body_size_ = max_body_size;
}

bool HttpRouteTable::SetDefaultHandler(
    std::unique_ptr<HttpRequestHandler> handler) {
  if (!handler) {
    return false;
  }

  default_handler_ = std::move(handler);
  return true;
}

HttpRouteTable::HttpRouteTable()
    : default_handler_(
          std::make_unique<route_internal::NotFoundRouteHandler>()),
      default_max_body_size_(16384),
      default_read_expiry_(4000),
      default_write_expiry_(4000) {
  for (auto &it : entrance_) {
    it = std::make_unique<HttpRouteTableLayer>();
  }
}
