/**
 * @file http_server_connection.h
 * @brief Transport-independent part of an HTTP/1.1 server connection
 * @author Haoming Bai <haomingbai@hotmail.com>
 * @date   2025-09-25
 *
 * Copyright © 2025 Haoming Bai
 * SPDX-License-Identifier: MIT
 *
 * @details
 * A connection cycles read header -> route -> read body -> task -> write
 * until the client or a timeout ends it. All connection state is touched
 * only on the connection's strand; handlers run on the server's worker
 * pool and reach back through WriteResponse().
 */

#pragma once

#ifndef QUOTEAPI_INTERNAL_HTTP_SERVER_CONNECTION_H_
#define QUOTEAPI_INTERNAL_HTTP_SERVER_CONNECTION_H_

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/strand.hpp>
#include <boost/beast/core/flat_buffer.hpp>
#include <boost/beast/http/parser.hpp>
#include <boost/beast/http/string_body.hpp>
#include <cstddef>
#include <memory>
#include <string>

#include "quoteapi/http_route_result.h"
#include "quoteapi/http_server_task.h"
#include "quoteapi/logger.h"
#include "quoteapi/trait.h"

namespace quoteapi {

class HttpServer;

/**
 * @brief Abstract base class for HTTP server connections
 *
 * Derived classes supply the stream: reading, writing and closing.
 *
 * @code
 * class HttpTcpConnection : public HttpServerConnection {
 *  public:
 *   bool IsStreamAvailable() const noexcept override;
 *   void DoWriteResponse(HttpResponse resp, bool keep_alive) override;
 *   void DoClose() override;
 *
 *  protected:
 *   void DoReadHeader() override;
 *   void DoReadBody() override;
 *
 *  private:
 *   boost::beast::tcp_stream stream_;
 * };
 * @endcode
 */
class HttpServerConnection
    : public NonCopyableNonMovable<HttpServerConnection>,
      public std::enable_shared_from_this<HttpServerConnection> {
 public:
  /**
   * @brief Log a message through the server's logger
   * @param level Log level
   * @param message Log message
   */
  void Log(LogLevel level, std::string message);

  /**
   * @brief Check if the HTTP server is running
   * @return true if server is running, false otherwise
   */
  bool IsServerRunning() const noexcept;

  /**
   * @brief Get the server owning this connection
   */
  HttpServer *GetServer() const noexcept;

  /**
   * @brief Check if the underlying stream is still open
   */
  virtual bool IsStreamAvailable() const noexcept = 0;

  /**
   * @brief Start the first request cycle
   */
  void Run();

  /**
   * @brief Hand a finished response back to the connection
   *
   * Safe to call from any thread; the write happens on the strand.
   *
   * @param resp HTTP response to write
   * @param keep_alive Whether to read another request afterwards
   */
  void WriteResponse(HttpResponse resp, bool keep_alive);

  /**
   * @brief Close the connection. Called on the strand.
   */
  virtual void DoClose() = 0;

  /**
   * @brief Construct a HTTP server connection
   * @param strand Strand serializing this connection
   * @param srv Owning server, outlives the connection's I/O
   * @param header_read_expiry Header read timeout in milliseconds
   * @param keep_alive_timeout Keep-alive timeout in milliseconds
   */
  HttpServerConnection(boost::asio::strand<boost::asio::any_io_executor> strand,
                       HttpServer *srv, std::size_t header_read_expiry,
                       std::size_t keep_alive_timeout);

  virtual ~HttpServerConnection() = default;

 protected:
  /**
   * @brief Write the response to the stream. Called on the strand.
   */
  virtual void DoWriteResponse(HttpResponse resp, bool keep_alive) = 0;

  /**
   * @brief Read HTTP request headers, then call DoRoute()
   */
  virtual void DoReadHeader() = 0;

  /**
   * @brief Read HTTP request body, then call MakeHttpServerTask()
   */
  virtual void DoReadBody() = 0;

  /**
   * @brief Route the parsed header and arm the body read timer
   */
  void DoRoute();

  /**
   * @brief Hand the complete request to a new task
   */
  void MakeHttpServerTask();

  /**
   * @brief Reset per-request state and wait for the next request
   */
  void DoCycle();

  /**
   * @brief Cancel the pending read timer
   */
  void CancelTimer() noexcept;

  boost::beast::flat_buffer &GetBuffer() noexcept;

  boost::asio::strand<boost::asio::any_io_executor> &GetStrand() noexcept;

  boost::beast::http::request_parser<boost::beast::http::string_body>
      &GetParser() noexcept;

  /**
   * @brief Keep-alive timeout for the Keep-Alive header
   * @return Timeout in whole seconds, at least 1
   */
  std::size_t GetKeepAliveTimeout() const noexcept;

  /**
   * @brief Write timeout of the route being answered
   * @return Timeout in milliseconds, 0 for none
   */
  std::size_t GetWriteExpiry() const noexcept;

 private:
  void ArmTimer(std::size_t expiry);

  boost::asio::strand<boost::asio::any_io_executor>
      strand_;                       ///< Serializes all connection state
  boost::asio::steady_timer timer_;  ///< Header, body and idle timeouts
  boost::beast::flat_buffer buf_;    ///< Buffer for reading requests
  HttpRouteResult route_result_;     ///< Result of routing the current request
  HttpServer *srv_;                  ///< Owning server
  std::unique_ptr<
      boost::beast::http::request_parser<boost::beast::http::string_body>>
      parser_;                      ///< Parser of the current request
  std::size_t header_read_expiry_;  ///< Header read timeout in ms
  std::size_t keep_alive_timeout_;  ///< Keep-alive timeout in ms
  std::size_t write_expiry_;        ///< Write timeout of the current route
};

}  // namespace quoteapi

#endif
