/**
 * @file quote_catalog.cc
 * @brief Immutable in-memory quote catalog
 * @author Haoming Bai <haomingbai@hotmail.com>
 * @date   2025-10-21
 *
 * Copyright © 2025 Haoming Bai
 * SPDX-License-Identifier: MIT
 */

#include "quoteapi/quote_catalog.h"

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <iterator>
#include <memory>
#include <mutex>
#include <optional>
#include <random>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "quoteapi/process_memory.h"
#include "quoteapi/quote.h"

using quoteapi::QuoteCatalog;
using quoteapi::TagNotFoundError;

namespace {

std::string AsciiLower(std::string_view s) {
  std::string out(s);
  std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) {
    return static_cast<char>(c >= 'A' && c <= 'Z' ? c - 'A' + 'a' : c);
  });
  return out;
}

std::uint64_t RandomSeed() {
  std::random_device rd;
  return (static_cast<std::uint64_t>(rd()) << 32) | rd();
}

}  // namespace

TagNotFoundError::TagNotFoundError(std::string tag)
    : std::runtime_error("No quotes found with tag '" + tag + "'"),
      tag_(std::move(tag)) {}

const std::string& TagNotFoundError::GetTag() const noexcept { return tag_; }

QuoteCatalog::QuoteCatalog(std::vector<Quote> quotes,
                           std::shared_ptr<const MemoryProbe> probe,
                           std::optional<std::uint64_t> seed)
    : quotes_(std::move(quotes)),
      probe_(std::move(probe)),
      rng_(seed.has_value() ? *seed : RandomSeed()) {
  if (quotes_.empty()) {
    throw std::invalid_argument("QuoteCatalog needs at least one quote");
  }

  if (!probe_) {
    throw std::invalid_argument("QuoteCatalog needs a memory probe");
  }

  for (std::size_t i = 0; i < quotes_.size(); i++) {
    if (quotes_[i].text.empty() || quotes_[i].author.empty()) {
      throw std::invalid_argument("Quote " + std::to_string(i) +
                                  " has no text or author");
    }
  }
}

const quoteapi::Quote& QuoteCatalog::RandomQuote() const {
  std::uniform_int_distribution<std::size_t> dist(0, quotes_.size() - 1);

  std::size_t idx;
  {
    std::lock_guard<std::mutex> lock(rng_mtx_);
    idx = dist(rng_);
  }

  return quotes_[idx];
}

std::vector<quoteapi::Quote> QuoteCatalog::QuotesByTag(
    std::string_view tag) const {
  auto needle = AsciiLower(tag);

  std::vector<Quote> matches;
  std::copy_if(quotes_.begin(), quotes_.end(), std::back_inserter(matches),
               [&needle](const Quote& q) {
                 return std::find(q.tags.begin(), q.tags.end(), needle) !=
                        q.tags.end();
               });

  if (matches.empty()) {
    throw TagNotFoundError(std::string(tag));
  }

  return matches;
}

const std::vector<quoteapi::Quote>& QuoteCatalog::AllQuotes() const noexcept {
  return quotes_;
}

quoteapi::StatsSnapshot QuoteCatalog::Stats() const {
  return StatsSnapshot{.working_set =
                           FormatWorkingSet(probe_->WorkingSetBytes())};
}

std::size_t QuoteCatalog::Size() const noexcept { return quotes_.size(); }
