#include <gtest/gtest.h>

#include <atomic>
#include <barrier>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <exception>
#include <memory>
#include <mutex>
#include <random>
#include <stdexcept>
#include <stop_token>
#include <string>
#include <thread>
#include <vector>

#include "quoteapi/http_server.h"
#include "quoteapi/process_memory.h"
#include "quoteapi/quote.h"
#include "quoteapi/quote_catalog.h"
#include "quoteapi/quote_routes.h"
#include "test_http_client.h"

namespace {

namespace http = boost::beast::http;

// Stress test configuration driven by environment variables.
struct StressConfig {
  std::size_t threads;
  std::size_t iterations;
  std::uint64_t seed;
  std::chrono::milliseconds timeout;
};

// Read size values from environment with fallback.
std::size_t GetEnvSize(const char* name, std::size_t fallback) {
  if (const char* val = std::getenv(name)) {
    try {
      return static_cast<std::size_t>(std::stoull(val));
    } catch (const std::exception&) {
      return fallback;
    }
  }
  return fallback;
}

// Load stress config with safe defaults.
StressConfig LoadConfig() {
  StressConfig cfg{};
  cfg.threads = GetEnvSize("QUOTEAPI_STRESS_THREADS", 8);
  cfg.iterations = GetEnvSize("QUOTEAPI_STRESS_ITERATIONS", 100);
  cfg.seed = GetEnvSize("QUOTEAPI_STRESS_SEED", 1337);
  cfg.timeout = std::chrono::milliseconds(
      GetEnvSize("QUOTEAPI_STRESS_TIMEOUT_MS", 15000));
  return cfg;
}

// Check one response; returns an error description or an empty string.
std::string CheckResponse(const std::string& target,
                          const http::response<http::string_body>& res) {
  auto expected = target == "/quotes/tag/nonexistent-tag-xyz"
                      ? http::status::not_found
                      : http::status::ok;
  if (res.result() != expected) {
    return "GET " + target + " returned " + std::to_string(res.result_int());
  }
  if (res[http::field::content_type] != "application/json; charset=utf-8") {
    return "GET " + target + " missing JSON content type";
  }
  if (res.body().empty() ||
      (res.body().front() != '{' && res.body().front() != '[')) {
    return "GET " + target + " body is not JSON: " + res.body();
  }
  return {};
}

}  // namespace

// Run concurrent readers against every quote route.
TEST(StressQuoteApiConcurrencyTest, ConcurrentReaders) {
  const auto cfg = LoadConfig();
  SCOPED_TRACE(::testing::Message()
               << "threads=" << cfg.threads
               << " iterations=" << cfg.iterations << " seed=" << cfg.seed
               << " timeout_ms=" << cfg.timeout.count());

  auto catalog = std::make_shared<const quoteapi::QuoteCatalog>(
      quoteapi::DefaultQuotes(),
      std::make_shared<quoteapi::ProcStatmMemoryProbe>());

  auto server = std::make_unique<quoteapi::HttpServer>(cfg.threads);
  quoteapi::RegisterQuoteRoutes(*server, catalog);

  quoteapi::test::ServerGuard guard(std::move(server));
  auto port = quoteapi::test::StartOnEphemeralPort(guard, 2);

  const std::vector<std::string> targets = {
      "/", "/quote/random", "/quotes", "/quotes/tag/programming",
      "/quotes/tag/HUMOR", "/quotes/tag/nonexistent-tag-xyz", "/stats"};

  std::atomic<std::size_t> finished{0};
  std::atomic<std::size_t> failures{0};

  std::mutex mtx;
  std::condition_variable cv;
  std::vector<std::string> errors;

  std::barrier sync(static_cast<std::ptrdiff_t>(cfg.threads));
  std::vector<std::jthread> workers;
  workers.reserve(cfg.threads);

  for (std::size_t t = 0; t < cfg.threads; ++t) {
    workers.emplace_back([&, t](std::stop_token st) {
      std::mt19937_64 rng(cfg.seed + t);
      std::uniform_int_distribution<std::size_t> pick(0, targets.size() - 1);
      sync.arrive_and_wait();

      for (std::size_t i = 0; i < cfg.iterations && !st.stop_requested(); ++i) {
        const auto& target = targets[pick(rng)];
        try {
          auto res = quoteapi::test::DoRequestWithRetry(http::verb::get, port,
                                                        target);
          auto err = CheckResponse(target, res);
          if (!err.empty()) {
            std::lock_guard<std::mutex> lock(mtx);
            errors.push_back(std::move(err));
            failures.fetch_add(1, std::memory_order_relaxed);
          }
        } catch (const std::exception& ex) {
          std::lock_guard<std::mutex> lock(mtx);
          errors.emplace_back(std::string("request failed: ") + ex.what());
          failures.fetch_add(1, std::memory_order_relaxed);
        }
      }

      finished.fetch_add(1, std::memory_order_relaxed);
      cv.notify_one();
    });
  }

  std::unique_lock<std::mutex> lock(mtx);
  bool ok = cv.wait_for(lock, cfg.timeout, [&] {
    return finished.load(std::memory_order_relaxed) == cfg.threads;
  });

  if (!ok) {
    for (auto& th : workers) {
      th.request_stop();
    }
    ADD_FAILURE() << "Timeout waiting for concurrent requests. finished="
                  << finished.load() << "/" << cfg.threads;
  }

  if (!errors.empty()) {
    ADD_FAILURE() << "Encountered " << errors.size()
                  << " request failures; first: " << errors.front();
  }
  lock.unlock();

  EXPECT_EQ(failures.load(), 0u);
}

// Concurrent random picks from one catalog stay inside the catalog.
TEST(StressQuoteApiConcurrencyTest, ConcurrentRandomPicks) {
  const auto cfg = LoadConfig();
  quoteapi::QuoteCatalog catalog(
      quoteapi::DefaultQuotes(),
      std::make_shared<quoteapi::ProcStatmMemoryProbe>(), cfg.seed);
  const auto& all = catalog.AllQuotes();

  std::atomic<std::size_t> misses{0};
  {
    std::vector<std::jthread> workers;
    for (std::size_t t = 0; t < cfg.threads; ++t) {
      workers.emplace_back([&] {
        for (std::size_t i = 0; i < cfg.iterations * 10; ++i) {
          const auto* q = &catalog.RandomQuote();
          if (q < all.data() || q >= all.data() + all.size()) {
            misses.fetch_add(1, std::memory_order_relaxed);
          }
        }
      });
    }
  }

  EXPECT_EQ(misses.load(), 0u);
}
