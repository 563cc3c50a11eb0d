/**
 * @file quote_catalog.h
 * @brief Immutable in-memory quote catalog
 * @author Haoming Bai <haomingbai@hotmail.com>
 * @date   2025-10-21
 *
 * Copyright © 2025 Haoming Bai
 * SPDX-License-Identifier: MIT
 *
 * @details
 * The catalog is built once in main and shared with every handler as
 * std::shared_ptr<const QuoteCatalog>. Its quotes never change after
 * construction. The random generator is the only mutable state and sits
 * behind a mutex, so all operations may be called from any worker thread.
 */

#pragma once

#ifndef QUOTEAPI_QUOTE_CATALOG_H_
#define QUOTEAPI_QUOTE_CATALOG_H_

#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <random>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

#include "quoteapi/process_memory.h"
#include "quoteapi/quote.h"
#include "quoteapi/trait.h"

namespace quoteapi {

/**
 * @brief No quote carries the requested tag
 *
 * what() is "No quotes found with tag '<tag>'" with the tag exactly as the
 * caller supplied it.
 */
class TagNotFoundError : public std::runtime_error {
 public:
  explicit TagNotFoundError(std::string tag);

  /**
   * @brief The tag as given, before lowercasing
   */
  const std::string& GetTag() const noexcept;

 private:
  std::string tag_;
};

/**
 * @brief Memory statistics taken at the time of the call
 */
struct StatsSnapshot {
  std::string working_set;  ///< Formatted like "42 MB"
};

/**
 * @brief Read-only quote collection
 *
 * @code
 * auto catalog = std::make_shared<const QuoteCatalog>(
 *     DefaultQuotes(), std::make_shared<ProcStatmMemoryProbe>());
 *
 * const Quote& q = catalog->RandomQuote();
 * auto humor = catalog->QuotesByTag("Humor");  // 2 quotes
 * @endcode
 */
class QuoteCatalog : public NonCopyableNonMovable<QuoteCatalog> {
 public:
  /**
   * @brief Pick one quote uniformly at random
   */
  const Quote& RandomQuote() const;

  /**
   * @brief Quotes carrying the tag, compared case-insensitively
   *
   * The tag is lowercased (ASCII) and must equal one of a quote's tags.
   *
   * @param tag Tag to look for
   * @return Matching quotes in catalog order, never empty
   * @throws TagNotFoundError if no quote matches
   */
  std::vector<Quote> QuotesByTag(std::string_view tag) const;

  /**
   * @brief Every quote in catalog order
   */
  const std::vector<Quote>& AllQuotes() const noexcept;

  /**
   * @brief Measure the process memory now
   * @throws std::runtime_error if the probe fails
   */
  StatsSnapshot Stats() const;

  std::size_t Size() const noexcept;

  /**
   * @brief Build a catalog
   * @param quotes Quotes in catalog order
   * @param probe Memory probe used by Stats()
   * @param seed Fixed generator seed; std::random_device when empty
   * @throws std::invalid_argument if quotes is empty, a quote lacks text or
   *         author, or probe is null
   */
  QuoteCatalog(std::vector<Quote> quotes,
               std::shared_ptr<const MemoryProbe> probe,
               std::optional<std::uint64_t> seed = std::nullopt);

 private:
  std::vector<Quote> quotes_;
  std::shared_ptr<const MemoryProbe> probe_;
  mutable std::mutex rng_mtx_;     ///< Guards rng_
  mutable std::mt19937_64 rng_;    ///< Generator for RandomQuote()
};

}  // namespace quoteapi

#endif
