/**
 * @file service_config.h
 * @brief Command line and config file options of the quote service
 * @author Haoming Bai <haomingbai@hotmail.com>
 * @date   2025-10-21
 *
 * Copyright © 2025 Haoming Bai
 * SPDX-License-Identifier: MIT
 */

#pragma once

#ifndef QUOTEAPI_SERVICE_CONFIG_H_
#define QUOTEAPI_SERVICE_CONFIG_H_

#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl/context.hpp>
#include <cstddef>
#include <cstdint>
#include <iosfwd>
#include <optional>
#include <string>

#include "quoteapi/logger.h"

namespace quoteapi {

/**
 * @brief Validated service settings; timeouts are in milliseconds
 */
struct ServiceConfig {
  std::string address = "0.0.0.0";
  std::uint16_t port = 8080;
  std::size_t io_threads = 1;
  std::size_t worker_threads = 4;
  LogLevel log_level = LogLevel::kInfo;
  std::size_t header_read_expiry = 3000;
  std::size_t read_expiry = 4000;
  std::size_t write_expiry = 4000;
  std::size_t keep_alive_timeout = 4000;
  std::size_t max_body_size = 16384;
  std::optional<std::uint64_t> seed;  ///< Fixed seed for random quotes
  std::string tls_cert;               ///< PEM certificate chain, or empty
  std::string tls_key;                ///< PEM private key, or empty

  /**
   * @brief Whether the listener should speak TLS
   */
  bool UseTls() const noexcept;
};

/**
 * @brief Parse the command line and an optional INI file given by --config
 *
 * Command line values win over the file. With --help the usage text goes
 * to help_out and std::nullopt is returned.
 *
 * @code
 * quoteapi_server --port 9000 --log-level debug --config quoteapi.ini
 * @endcode
 *
 * @throws boost::program_options::error on unknown or malformed options
 * @throws std::invalid_argument on values out of range, an invalid address,
 *         an unknown log level, or only one of --tls-cert/--tls-key
 */
std::optional<ServiceConfig> LoadServiceConfig(int argc,
                                               const char* const argv[],
                                               std::ostream& help_out);

/**
 * @brief LoadServiceConfig() printing help to std::cout
 */
std::optional<ServiceConfig> LoadServiceConfig(int argc,
                                               const char* const argv[]);

/**
 * @brief Endpoint to listen on
 */
boost::asio::ip::tcp::endpoint ListenEndpoint(const ServiceConfig& config);

/**
 * @brief TLS server context loaded from tls_cert and tls_key
 * @throws boost::system::system_error if either file cannot be loaded
 */
boost::asio::ssl::context MakeServerSslContext(const ServiceConfig& config);

}  // namespace quoteapi

#endif
