/**
 * @file seed_quotes.cc
 * @brief Built-in quotes
 * @author Haoming Bai <haomingbai@hotmail.com>
 * @date   2025-10-21
 *
 * Copyright © 2025 Haoming Bai
 * SPDX-License-Identifier: MIT
 */

#include <vector>

#include "quoteapi/quote.h"

std::vector<quoteapi::Quote> quoteapi::DefaultQuotes() {
  return {
      {.text = "The only way to do great work is to love what you do.",
       .author = "Steve Jobs",
       .tags = {"motivation", "work"}},
      {.text = "Innovation distinguishes between a leader and a follower.",
       .author = "Steve Jobs",
       .tags = {"innovation", "leadership"}},
      {.text = "Code is like humor. When you have to explain it, it's bad.",
       .author = "Cory House",
       .tags = {"programming", "humor"}},
      {.text = "First, solve the problem. Then, write the code.",
       .author = "John Johnson",
       .tags = {"programming", "problem-solving"}},
      {.text = "Simplicity is the soul of efficiency.",
       .author = "Austin Freeman",
       .tags = {"simplicity", "efficiency"}},
      {.text = "Make it work, make it right, make it fast.",
       .author = "Kent Beck",
       .tags = {"programming", "best-practices"}},
      {.text = "Any fool can write code that a computer can understand. Good "
               "programmers write code that humans can understand.",
       .author = "Martin Fowler",
       .tags = {"programming", "clean-code"}},
      {.text = "Premature optimization is the root of all evil.",
       .author = "Donald Knuth",
       .tags = {"optimization", "programming"}},
      {.text = "The best error message is the one that never shows up.",
       .author = "Thomas Fuchs",
       .tags = {"user-experience", "programming"}},
      {.text = "Walking on water and developing software from a "
               "specification are easy if both are frozen.",
       .author = "Edward V. Berard",
       .tags = {"humor", "software-development"}},
  };
}
