/**
 * @file http_server_runtime.cc
 * @brief Start, stop and the accept loop
 * @author Haoming Bai <haomingbai@hotmail.com>
 * @date   2025-10-03
 *
 * Copyright © 2025 Haoming Bai
 * SPDX-License-Identifier: MIT
 */

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/error.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/strand.hpp>
#include <boost/asio/thread_pool.hpp>
#include <boost/beast/core/tcp_stream.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/ssl/ssl_stream.hpp>
#include <cstddef>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include "quoteapi/http_server.h"
#include "quoteapi/internal/http_server_connection_impl.h"
#include "quoteapi/logger.h"

using quoteapi::HttpServer;

bool HttpServer::Start(std::size_t thread_cnt) {
  if (thread_cnt == 0) {
    return false;
  }

  std::lock_guard<std::mutex> lifecycle_lock(lifecycle_mtx_);
  std::unique_lock<std::shared_mutex> lock(mtx_);

  if (is_running_) {
    return false;
  }

  is_running_ = true;

  for (auto& acc : acceptors_) {
    DoAccept(acc);
  }

  io_threads_.reserve(thread_cnt);
  for (std::size_t i = 0; i < thread_cnt; i++) {
    io_threads_.emplace_back([this] { ioc_.run(); });
  }

  return true;
}

void HttpServer::Stop() {
  std::lock_guard<std::mutex> lifecycle_lock(lifecycle_mtx_);
  std::vector<boost::asio::ip::tcp::endpoint> eps;

  {
    std::unique_lock<std::shared_mutex> lock(mtx_);

    if (!is_running_) {
      return;
    }

    is_running_ = false;
    eps.reserve(acceptors_.size());
    for (auto& acc : acceptors_) {
      boost::system::error_code ec;
      auto ep = acc.local_endpoint(ec);
      if (!ec) {
        eps.push_back(ep);
      }
      acc.close(ec);
    }
  }

  // Workers post nothing once is_running_ is false, so the pool drains.
  // Responses of drained tasks reach their strands, which close them.
  thread_pool_->join();

  // Idle keep-alive reads would hold the io threads until they time out.
  ioc_.stop();
  for (auto& it : io_threads_) {
    it.join();
  }

  // Run completions left behind by stop(), accept handlers included, while
  // the acceptors they refer to still exist.
  ioc_.restart();
  ioc_.poll();

  std::unique_lock<std::shared_mutex> lock(mtx_);

  io_threads_.clear();
  if (thread_cnt_) {
    thread_pool_ = std::make_unique<boost::asio::thread_pool>(thread_cnt_);
  } else {
    thread_pool_ = std::make_unique<boost::asio::thread_pool>();
  }

  acceptors_.clear();
  for (const auto& ep : eps) {
    try {
      acceptors_.emplace_back(ioc_, ep);
    } catch (const boost::system::system_error& e) {
      logger_->Log(LogLevel::kError, "Failed to rebind listener: " +
                                         std::string(e.what()));
    }
  }
}

void HttpServer::DoAccept(boost::asio::ip::tcp::acceptor& acc) {
  acc.async_accept(
      boost::asio::make_strand(ioc_),
      [this, &acc](boost::system::error_code ec,
                   boost::asio::ip::tcp::socket skt) {
        // The acceptor was closed by Stop() and may no longer exist.
        if (ec == boost::asio::error::operation_aborted) {
          return;
        }

        if (ec) {
          Log(LogLevel::kWarn, "Accept failed: " + ec.message());
        } else {
          boost::beast::tcp_stream stream(std::move(skt));
          boost::asio::strand<boost::asio::any_io_executor> strand(
              stream.get_executor());

          if (ssl_ctx_.has_value()) {
            using SslStream =
                boost::beast::ssl_stream<boost::beast::tcp_stream>;
            std::make_shared<
                connection_internal::HttpServerConnectionImpl<SslStream>>(
                SslStream(std::move(stream), ssl_ctx_.value()),
                std::move(strand), this, header_read_expiry_,
                keep_alive_timeout_)
                ->Start();
          } else {
            std::make_shared<connection_internal::HttpServerConnectionImpl<
                boost::beast::tcp_stream>>(std::move(stream), std::move(strand),
                                           this, header_read_expiry_,
                                           keep_alive_timeout_)
                ->Start();
          }
        }

        if (is_running_ && acc.is_open()) {
          DoAccept(acc);
        }
      });
}
