/**
 * @file main.cc
 * @brief quoteapi_server entry point
 * @author Haoming Bai <haomingbai@hotmail.com>
 * @date   2025-10-21
 *
 * Copyright © 2025 Haoming Bai
 * SPDX-License-Identifier: MIT
 */

#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>
#include <boost/system/system_error.hpp>
#include <chrono>
#include <csignal>
#include <exception>
#include <iostream>
#include <memory>
#include <optional>
#include <sstream>
#include <string>

#include "quoteapi/quoteapi.h"

int main(int argc, char* argv[]) {
  using quoteapi::LogLevel;

  auto startup_begin = std::chrono::steady_clock::now();

  std::optional<quoteapi::ServiceConfig> config;
  try {
    config = quoteapi::LoadServiceConfig(argc, argv);
  } catch (const std::exception& e) {
    std::cerr << e.what() << "\n";
    return 1;
  }

  if (!config) {
    return 0;
  }

  auto logger = std::make_shared<quoteapi::ConsoleLogger>(config->log_level);

  std::shared_ptr<const quoteapi::QuoteCatalog> catalog =
      std::make_shared<const quoteapi::QuoteCatalog>(
          quoteapi::DefaultQuotes(),
          std::make_shared<quoteapi::ProcStatmMemoryProbe>(), config->seed);

  auto server = std::make_unique<quoteapi::HttpServer>(config->worker_threads);
  server->SetLogger(logger)
      ->SetHeaderReadExpiry(config->header_read_expiry)
      ->SetDefaultReadExpiry(config->read_expiry)
      ->SetDefaultWriteExpiry(config->write_expiry)
      ->SetKeepAliveTimeout(config->keep_alive_timeout)
      ->SetDefaultMaxBodySize(config->max_body_size);

  if (config->UseTls()) {
    try {
      server->SetSslContext(quoteapi::MakeServerSslContext(*config));
    } catch (const std::exception& e) {
      std::cerr << "Cannot load TLS certificate or key: " << e.what() << "\n";
      return 1;
    }
  }

  quoteapi::RegisterQuoteRoutes(*server, catalog);

  try {
    server->AddListen(quoteapi::ListenEndpoint(*config));
  } catch (const boost::system::system_error& e) {
    logger->Log(LogLevel::kFatal, "Failed to listen on " + config->address +
                                      ":" + std::to_string(config->port) +
                                      ": " + e.what());
    return 1;
  }

  if (!server->Start(config->io_threads)) {
    logger->Log(LogLevel::kFatal, "Failed to start the server");
    return 1;
  }

  for (const auto& ep : server->GetListenEndpoints()) {
    std::ostringstream os;
    os << ep;
    logger->Log(LogLevel::kInfo, std::string("Listening on ") +
                                     (config->UseTls() ? "https://" : "http://") +
                                     os.str());
  }

  auto startup_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                        std::chrono::steady_clock::now() - startup_begin)
                        .count();
  logger->Log(LogLevel::kInfo,
              "Application started in " + std::to_string(startup_ms) + "ms");

  boost::asio::io_context signal_ioc;
  boost::asio::signal_set signals(signal_ioc, SIGINT, SIGTERM);
  signals.async_wait([&logger](boost::system::error_code ec, int signo) {
    if (!ec) {
      logger->Log(LogLevel::kInfo, "Received signal " + std::to_string(signo) +
                                       ", shutting down");
    }
  });
  signal_ioc.run();

  server->Stop();
  logger->Log(LogLevel::kInfo, "Server stopped");

  return 0;
}
