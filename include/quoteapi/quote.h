/**
 * @file quote.h
 * @brief Quote record and the built-in seed list
 * @author Haoming Bai <haomingbai@hotmail.com>
 * @date   2025-10-21
 *
 * Copyright © 2025 Haoming Bai
 * SPDX-License-Identifier: MIT
 */

#pragma once

#ifndef QUOTEAPI_QUOTE_H_
#define QUOTEAPI_QUOTE_H_

#include <string>
#include <vector>

namespace quoteapi {

/**
 * @brief An attributed quote
 *
 * Tags are lowercase and kept in the order given; duplicates are allowed.
 * A quote has no id; its position in the catalog identifies it.
 */
struct Quote {
  std::string text;               ///< Quote text, never empty
  std::string author;             ///< Attribution, never empty
  std::vector<std::string> tags;  ///< Lowercase tags

  bool operator==(const Quote &) const = default;
};

/**
 * @brief The ten quotes the service starts with, in catalog order
 */
std::vector<Quote> DefaultQuotes();

}  // namespace quoteapi

#endif
