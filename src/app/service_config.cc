/**
 * @file service_config.cc
 * @brief Command line and config file options of the quote service
 * @author Haoming Bai <haomingbai@hotmail.com>
 * @date   2025-10-21
 *
 * Copyright © 2025 Haoming Bai
 * SPDX-License-Identifier: MIT
 */

#include "quoteapi/service_config.h"

#include <boost/asio/ip/address.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl/context.hpp>
#include <boost/program_options/options_description.hpp>
#include <boost/program_options/parsers.hpp>
#include <boost/program_options/variables_map.hpp>
#include <cstddef>
#include <cstdint>
#include <iostream>
#include <optional>
#include <ostream>
#include <stdexcept>
#include <string>

#include "quoteapi/logger.h"

namespace po = boost::program_options;

namespace quoteapi {

namespace {

void RequirePositive(const char* name, std::size_t value) {
  if (value == 0) {
    throw std::invalid_argument(std::string("--") + name +
                                " must be at least 1");
  }
}

}  // namespace

bool ServiceConfig::UseTls() const noexcept {
  return !tls_cert.empty() && !tls_key.empty();
}

std::optional<ServiceConfig> LoadServiceConfig(int argc,
                                               const char* const argv[],
                                               std::ostream& help_out) {
  ServiceConfig config;
  std::string config_path;
  unsigned int port = config.port;
  std::string log_level = "info";
  std::uint64_t seed = 0;

  po::options_description common_opts("Options");
  auto opt = common_opts.add_options();
  opt("address,a",
      po::value(&config.address)->default_value(config.address)
          ->value_name("ip"),
      "Address to listen on");
  opt("port,p", po::value(&port)->default_value(port)->value_name("num"),
      "Port to listen on, 0 for any free port");
  opt("io-threads",
      po::value(&config.io_threads)->default_value(config.io_threads)
          ->value_name("num"),
      "Threads running network I/O");
  opt("worker-threads",
      po::value(&config.worker_threads)->default_value(config.worker_threads)
          ->value_name("num"),
      "Threads running request handlers");
  opt("log-level",
      po::value(&log_level)->default_value(log_level)->value_name("level"),
      "Least severe level logged: trace, debug, info, warn, error, fatal");
  opt("header-read-expiry",
      po::value(&config.header_read_expiry)
          ->default_value(config.header_read_expiry)
          ->value_name("ms"),
      "Time allowed to receive request headers");
  opt("read-expiry",
      po::value(&config.read_expiry)->default_value(config.read_expiry)
          ->value_name("ms"),
      "Time allowed to receive a request body");
  opt("write-expiry",
      po::value(&config.write_expiry)->default_value(config.write_expiry)
          ->value_name("ms"),
      "Time allowed to send a response");
  opt("keep-alive-timeout",
      po::value(&config.keep_alive_timeout)
          ->default_value(config.keep_alive_timeout)
          ->value_name("ms"),
      "Time an idle keep-alive connection stays open");
  opt("max-body-size",
      po::value(&config.max_body_size)->default_value(config.max_body_size)
          ->value_name("bytes"),
      "Largest accepted request body");
  opt("seed", po::value(&seed)->value_name("num"),
      "Fixed seed for random quote selection");
  opt("tls-cert", po::value(&config.tls_cert)->value_name("path"),
      "Server certificate chain in PEM format");
  opt("tls-key", po::value(&config.tls_key)->value_name("path"),
      "Private key for --tls-cert in PEM format");

  po::options_description desc("quoteapi_server");
  desc.add_options()("help,h", "Show this message")(
      "config,c", po::value(&config_path)->value_name("path"),
      "INI file with any of the options below");
  desc.add(common_opts);

  po::variables_map vm;
  po::store(po::parse_command_line(argc, argv, desc), vm);

  if (vm.count("help")) {
    help_out << desc << "\n";
    return std::nullopt;
  }

  if (vm.count("config")) {
    auto path = vm["config"].as<std::string>();
    po::store(po::parse_config_file<char>(path.c_str(), common_opts), vm);
  }

  po::notify(vm);

  if (port > 65535) {
    throw std::invalid_argument("--port must be between 0 and 65535");
  }
  config.port = static_cast<std::uint16_t>(port);

  RequirePositive("io-threads", config.io_threads);
  RequirePositive("worker-threads", config.worker_threads);

  auto level = ParseLogLevel(log_level);
  if (!level) {
    throw std::invalid_argument("Unknown log level: " + log_level);
  }
  config.log_level = *level;

  boost::system::error_code ec;
  boost::asio::ip::make_address(config.address, ec);
  if (ec) {
    throw std::invalid_argument("Invalid listen address: " + config.address);
  }

  if (vm.count("seed")) {
    config.seed = seed;
  }

  if (config.tls_cert.empty() != config.tls_key.empty()) {
    throw std::invalid_argument(
        "--tls-cert and --tls-key must be given together");
  }

  return config;
}

std::optional<ServiceConfig> LoadServiceConfig(int argc,
                                               const char* const argv[]) {
  return LoadServiceConfig(argc, argv, std::cout);
}

boost::asio::ip::tcp::endpoint ListenEndpoint(const ServiceConfig& config) {
  return {boost::asio::ip::make_address(config.address), config.port};
}

boost::asio::ssl::context MakeServerSslContext(const ServiceConfig& config) {
  namespace ssl = boost::asio::ssl;

  ssl::context ctx(ssl::context::tls_server);
  ctx.set_options(ssl::context::default_workarounds | ssl::context::no_sslv2 |
                  ssl::context::no_sslv3 | ssl::context::single_dh_use);
  ctx.use_certificate_chain_file(config.tls_cert);
  ctx.use_private_key_file(config.tls_key, ssl::context::pem);
  return ctx;
}

}  // namespace quoteapi
