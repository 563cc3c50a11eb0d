/**
 * @file http_server_util.cc
 * @brief Conversion between Beast verbs and routed methods
 * @author Haoming Bai <haomingbai@hotmail.com>
 * @date   2025-10-03
 *
 * Copyright © 2025 Haoming Bai
 * SPDX-License-Identifier: MIT
 */

#include <boost/beast/http/verb.hpp>

#include "quoteapi/http_request_method.h"
#include "quoteapi/http_server.h"

using quoteapi::HttpRequestMethod;
using quoteapi::HttpServer;

HttpRequestMethod HttpServer::BeastHttpVerbToHttpRequestMethod(
    boost::beast::http::verb verb) {
  switch (verb) {
    case boost::beast::http::verb::get:
      return HttpRequestMethod::kGet;
    case boost::beast::http::verb::post:
      return HttpRequestMethod::kPost;
    case boost::beast::http::verb::put:
      return HttpRequestMethod::kPut;
    case boost::beast::http::verb::delete_:
      return HttpRequestMethod::kDelete;
    case boost::beast::http::verb::patch:
      return HttpRequestMethod::kPatch;
    case boost::beast::http::verb::head:
      return HttpRequestMethod::kHead;
    case boost::beast::http::verb::options:
      return HttpRequestMethod::kOptions;
    default:
      return HttpRequestMethod::kUnknown;
  }
}

boost::beast::http::verb HttpServer::HttpRequestMethodToBeastHttpVerb(
    HttpRequestMethod method) {
  switch (method) {
    case HttpRequestMethod::kGet:
      return boost::beast::http::verb::get;
    case HttpRequestMethod::kPost:
      return boost::beast::http::verb::post;
    case HttpRequestMethod::kPut:
      return boost::beast::http::verb::put;
    case HttpRequestMethod::kDelete:
      return boost::beast::http::verb::delete_;
    case HttpRequestMethod::kPatch:
      return boost::beast::http::verb::patch;
    case HttpRequestMethod::kHead:
      return boost::beast::http::verb::head;
    case HttpRequestMethod::kOptions:
      return boost::beast::http::verb::options;
    case HttpRequestMethod::kUnknown:
      break;
  }

  return boost::beast::http::verb::unknown;
}
