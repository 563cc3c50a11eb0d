/**
 * @file http_server_connection_impl.h
 * @brief HTTP connection over a plain TCP or a TLS stream
 * @author Haoming Bai <haomingbai@hotmail.com>
 * @date   2025-10-01
 *
 * Copyright © 2025 Haoming Bai
 * SPDX-License-Identifier: MIT
 */

#pragma once

#ifndef QUOTEAPI_INTERNAL_HTTP_SERVER_CONNECTION_IMPL_H_
#define QUOTEAPI_INTERNAL_HTTP_SERVER_CONNECTION_IMPL_H_

#include <atomic>
#include <boost/asio/bind_executor.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/post.hpp>
#include <boost/beast/core/stream_traits.hpp>
#include <boost/beast/core/tcp_stream.hpp>
#include <boost/beast/http/field.hpp>
#include <boost/beast/http/read.hpp>
#include <boost/beast/http/write.hpp>
#include <boost/beast/ssl.hpp>
#include <chrono>
#include <cstddef>
#include <memory>
#include <string>
#include <type_traits>
#include <utility>

#include "quoteapi/http_server_task.h"
#include "quoteapi/internal/http_server_connection.h"

namespace quoteapi {
namespace connection_internal {

namespace helper {

template <typename T>
struct IsBeastSslStream : std::false_type {};

template <typename NextLayer>
struct IsBeastSslStream<boost::beast::ssl_stream<NextLayer>> : std::true_type {
};

inline boost::asio::ip::tcp::socket& GetLowestSocket(
    boost::beast::tcp_stream& s) {
  return s.socket();
}

inline boost::asio::ip::tcp::socket& GetLowestSocket(
    boost::beast::ssl_stream<boost::beast::tcp_stream>& s) {
  return s.next_layer().socket();
}

}  // namespace helper

template <typename S>
concept ValidStream = requires(S s) {
  { helper::GetLowestSocket(s) };
};

/**
 * @brief Connection bound to a concrete stream type
 *
 * For TLS streams the handshake runs before the first request and a TLS
 * shutdown precedes closing the socket.
 *
 * @tparam S boost::beast::tcp_stream or
 *           boost::beast::ssl_stream<boost::beast::tcp_stream>
 */
template <ValidStream S>
class HttpServerConnectionImpl : public HttpServerConnection {
 public:
  HttpServerConnectionImpl(
      S stream, boost::asio::strand<boost::asio::any_io_executor> strand,
      HttpServer* srv, std::size_t header_read_expiry,
      std::size_t keep_alive_timeout)
      : HttpServerConnection(std::move(strand), srv, header_read_expiry,
                             keep_alive_timeout),
        stream_(std::move(stream)),
        closed_(false) {}

  /**
   * @brief Handshake when needed, then start serving requests
   */
  void Start() {
    if constexpr (helper::IsBeastSslStream<S>::value) {
      boost::asio::post(GetStrand(), [self = this->shared_from_this(), this] {
        boost::beast::get_lowest_layer(stream_).expires_after(
            std::chrono::milliseconds(kHandshakeExpiry));
        stream_.async_handshake(
            boost::asio::ssl::stream_base::server,
            boost::asio::bind_executor(
                GetStrand(), [self, this](boost::system::error_code ec) {
                  boost::beast::get_lowest_layer(stream_).expires_never();
                  if (ec) {
                    Log(LogLevel::kDebug,
                        "TLS handshake failed: " + ec.message());
                    DoClose();
                    return;
                  }
                  Run();
                }));
      });
    } else {
      Run();
    }
  }

  void DoClose() override {
    if (closed_.exchange(true)) {
      return;
    }

    CancelTimer();

    if (!helper::GetLowestSocket(stream_).is_open()) {
      return;
    }

    if constexpr (helper::IsBeastSslStream<S>::value) {
      boost::beast::get_lowest_layer(stream_).expires_after(
          std::chrono::milliseconds(kHandshakeExpiry));
      stream_.async_shutdown(boost::asio::bind_executor(
          GetStrand(), [self = this->shared_from_this(),
                        this]([[maybe_unused]] boost::system::error_code ec) {
            boost::system::error_code socket_ec;
            helper::GetLowestSocket(stream_).close(socket_ec);
          }));
    } else {
      boost::system::error_code ec;
      helper::GetLowestSocket(stream_).shutdown(
          boost::asio::ip::tcp::socket::shutdown_both, ec);
      helper::GetLowestSocket(stream_).close(ec);
    }
  }

  bool IsStreamAvailable() const noexcept override { return !closed_; }

 protected:
  void DoWriteResponse(HttpResponse resp, bool keep_alive) override {
    resp.keep_alive(keep_alive);
    if (keep_alive) {
      resp.set(boost::beast::http::field::keep_alive,
               "timeout=" + std::to_string(GetKeepAliveTimeout()));
    }
    resp.prepare_payload();

    resp_ = std::move(resp);

    if (GetWriteExpiry()) {
      boost::beast::get_lowest_layer(stream_).expires_after(
          std::chrono::milliseconds(GetWriteExpiry()));
    }

    boost::beast::http::async_write(
        stream_, resp_,
        boost::asio::bind_executor(
            GetStrand(), [self = this->shared_from_this(), this, keep_alive](
                             boost::system::error_code ec,
                             [[maybe_unused]] std::size_t bytes_transferred) {
              boost::beast::get_lowest_layer(stream_).expires_never();
              if (ec || !keep_alive) {
                DoClose();
              } else {
                DoCycle();
              }
            }));
  }

  void DoReadHeader() override {
    if (!IsServerRunning() || !IsStreamAvailable()) {
      DoClose();
      return;
    }

    boost::beast::http::async_read_header(
        stream_, GetBuffer(), GetParser(),
        boost::asio::bind_executor(
            GetStrand(), [self = this->shared_from_this(), this](
                             boost::system::error_code ec,
                             [[maybe_unused]] std::size_t bytes_transferred) {
              if (ec) {
                DoClose();
              } else {
                DoRoute();
              }
            }));
  }

  void DoReadBody() override {
    if (!IsServerRunning() || !IsStreamAvailable()) {
      DoClose();
      return;
    }

    boost::beast::http::async_read(
        stream_, GetBuffer(), GetParser(),
        boost::asio::bind_executor(
            GetStrand(), [self = this->shared_from_this(), this](
                             boost::system::error_code ec,
                             [[maybe_unused]] std::size_t bytes_transferred) {
              if (ec) {
                Log(LogLevel::kDebug, "Request read failed: " + ec.message());
                DoClose();
              } else {
                MakeHttpServerTask();
              }
            }));
  }

 private:
  static constexpr std::size_t kHandshakeExpiry = 5000;

  HttpResponse resp_;  ///< Response being written
  S stream_;
  std::atomic<bool> closed_;
};

}  // namespace connection_internal
}  // namespace quoteapi

#endif
