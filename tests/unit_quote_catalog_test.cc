#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <algorithm>
#include <cstddef>
#include <memory>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>

#include "quoteapi/process_memory.h"
#include "quoteapi/quote.h"
#include "quoteapi/quote_catalog.h"

namespace {

using quoteapi::Quote;
using quoteapi::QuoteCatalog;

// Probe reporting a fixed resident size.
class FixedMemoryProbe : public quoteapi::MemoryProbe {
 public:
  explicit FixedMemoryProbe(std::size_t bytes) : bytes_(bytes) {}

  std::size_t WorkingSetBytes() const override { return bytes_; }

 private:
  std::size_t bytes_;
};

class FailingMemoryProbe : public quoteapi::MemoryProbe {
 public:
  std::size_t WorkingSetBytes() const override {
    throw std::runtime_error("statm unavailable");
  }
};

std::shared_ptr<const quoteapi::MemoryProbe> FixedProbe(
    std::size_t bytes = 42u * 1024 * 1024) {
  return std::make_shared<FixedMemoryProbe>(bytes);
}

QuoteCatalog MakeDefaultCatalog() {
  return QuoteCatalog(quoteapi::DefaultQuotes(), FixedProbe(), 7);
}

std::vector<std::string> Authors(const std::vector<Quote>& quotes) {
  std::vector<std::string> out;
  for (const auto& q : quotes) {
    out.push_back(q.author);
  }
  return out;
}

}  // namespace

// The default catalog holds ten quotes in seed order.
TEST(QuoteCatalogTest, AllQuotesReturnsSeedCatalog) {
  auto catalog = MakeDefaultCatalog();

  const auto& all = catalog.AllQuotes();
  ASSERT_EQ(all.size(), 10u);
  EXPECT_EQ(catalog.Size(), 10u);
  EXPECT_EQ(all.front().author, "Steve Jobs");
  EXPECT_EQ(all.front().text,
            "The only way to do great work is to love what you do.");
  EXPECT_EQ(all.back().author, "Edward V. Berard");
  EXPECT_EQ(all, quoteapi::DefaultQuotes());
  EXPECT_EQ(catalog.AllQuotes(), all);
}

// Every random pick is a member of the catalog.
TEST(QuoteCatalogTest, RandomQuoteIsMember) {
  auto catalog = MakeDefaultCatalog();
  const auto& all = catalog.AllQuotes();

  for (int i = 0; i < 200; ++i) {
    const auto& q = catalog.RandomQuote();
    EXPECT_NE(std::find(all.begin(), all.end(), q), all.end());
  }
}

// Random picks eventually cover more than one quote.
TEST(QuoteCatalogTest, RandomQuoteVaries) {
  auto catalog = MakeDefaultCatalog();

  std::set<std::string> seen;
  for (int i = 0; i < 200; ++i) {
    seen.insert(catalog.RandomQuote().text);
  }
  EXPECT_GT(seen.size(), 1u);
}

// Two catalogs with the same seed pick the same sequence.
TEST(QuoteCatalogTest, SeedMakesPicksDeterministic) {
  QuoteCatalog a(quoteapi::DefaultQuotes(), FixedProbe(), 1234);
  QuoteCatalog b(quoteapi::DefaultQuotes(), FixedProbe(), 1234);

  for (int i = 0; i < 50; ++i) {
    EXPECT_EQ(a.RandomQuote(), b.RandomQuote());
  }
}

// A single-quote catalog always returns that quote.
TEST(QuoteCatalogTest, SingleQuoteCatalog) {
  Quote only{.text = "t", .author = "a", .tags = {}};
  QuoteCatalog catalog({only}, FixedProbe());

  for (int i = 0; i < 10; ++i) {
    EXPECT_EQ(catalog.RandomQuote(), only);
  }
}

// Tag filtering returns the matching subset in catalog order.
TEST(QuoteCatalogTest, QuotesByTagReturnsSubsetInOrder) {
  auto catalog = MakeDefaultCatalog();

  auto programming = catalog.QuotesByTag("programming");
  EXPECT_EQ(Authors(programming),
            (std::vector<std::string>{"Cory House", "John Johnson",
                                      "Kent Beck", "Martin Fowler",
                                      "Donald Knuth", "Thomas Fuchs"}));
  for (const auto& q : programming) {
    EXPECT_NE(std::find(q.tags.begin(), q.tags.end(), "programming"),
              q.tags.end());
  }

  auto humor = catalog.QuotesByTag("humor");
  EXPECT_EQ(Authors(humor), (std::vector<std::string>{"Cory House",
                                                      "Edward V. Berard"}));

  EXPECT_EQ(catalog.QuotesByTag("programming"), programming);
}

// Tag matching ignores ASCII case.
TEST(QuoteCatalogTest, QuotesByTagIsCaseInsensitive) {
  auto catalog = MakeDefaultCatalog();

  EXPECT_EQ(catalog.QuotesByTag("PROGRAMMING"),
            catalog.QuotesByTag("programming"));
  EXPECT_EQ(catalog.QuotesByTag("Clean-Code").size(), 1u);
}

// Tag matching is exact, not a substring search.
TEST(QuoteCatalogTest, QuotesByTagIsExact) {
  auto catalog = MakeDefaultCatalog();

  EXPECT_THROW(catalog.QuotesByTag("program"), quoteapi::TagNotFoundError);
  EXPECT_THROW(catalog.QuotesByTag(""), quoteapi::TagNotFoundError);
  EXPECT_THROW(catalog.QuotesByTag("programming "),
               quoteapi::TagNotFoundError);
}

// A miss reports the tag as the caller gave it.
TEST(QuoteCatalogTest, UnknownTagThrowsWithGivenTag) {
  auto catalog = MakeDefaultCatalog();

  try {
    catalog.QuotesByTag("nonexistent-tag-xyz");
    FAIL() << "expected TagNotFoundError";
  } catch (const quoteapi::TagNotFoundError& e) {
    EXPECT_STREQ(e.what(),
                 "No quotes found with tag 'nonexistent-tag-xyz'");
    EXPECT_EQ(e.GetTag(), "nonexistent-tag-xyz");
  }

  try {
    catalog.QuotesByTag("NoSuchTag");
    FAIL() << "expected TagNotFoundError";
  } catch (const quoteapi::TagNotFoundError& e) {
    EXPECT_STREQ(e.what(), "No quotes found with tag 'NoSuchTag'");
  }
}

// Duplicate tags on a quote do not duplicate the quote in results.
TEST(QuoteCatalogTest, DuplicateTagsMatchOnce) {
  QuoteCatalog catalog(
      {{.text = "a", .author = "x", .tags = {"dup", "dup"}},
       {.text = "b", .author = "y", .tags = {"other"}}},
      FixedProbe());

  auto result = catalog.QuotesByTag("dup");
  ASSERT_EQ(result.size(), 1u);
  EXPECT_EQ(result.front().text, "a");
  EXPECT_EQ(result.front().tags.size(), 2u);
}

// Stats formats the probe reading in whole megabytes.
TEST(QuoteCatalogTest, StatsUsesProbe) {
  QuoteCatalog catalog(quoteapi::DefaultQuotes(),
                       FixedProbe(42u * 1024 * 1024 + 1000));
  EXPECT_EQ(catalog.Stats().working_set, "42 MB");
}

// Stats is measured on every call, never cached.
TEST(QuoteCatalogTest, StatsIsLive) {
  class CountingProbe : public quoteapi::MemoryProbe {
   public:
    std::size_t WorkingSetBytes() const override {
      return ++calls_ * 1024 * 1024;
    }

   private:
    mutable std::size_t calls_{0};
  };

  QuoteCatalog catalog(quoteapi::DefaultQuotes(),
                       std::make_shared<CountingProbe>());
  EXPECT_EQ(catalog.Stats().working_set, "1 MB");
  EXPECT_EQ(catalog.Stats().working_set, "2 MB");
}

// Probe failures reach the caller.
TEST(QuoteCatalogTest, StatsPropagatesProbeFailure) {
  QuoteCatalog catalog(quoteapi::DefaultQuotes(),
                       std::make_shared<FailingMemoryProbe>());
  EXPECT_THROW(catalog.Stats(), std::runtime_error);
}

// The live probe reports a positive size.
TEST(QuoteCatalogTest, StatsWithProcProbeIsPositive) {
  QuoteCatalog catalog(quoteapi::DefaultQuotes(),
                       std::make_shared<quoteapi::ProcStatmMemoryProbe>());

  for (int i = 0; i < 3; ++i) {
    EXPECT_THAT(catalog.Stats().working_set,
                ::testing::MatchesRegex("[1-9][0-9]* MB"));
  }
}

// Construction rejects an empty catalog, a missing probe and blank quotes.
TEST(QuoteCatalogTest, RejectsInvalidConstruction) {
  EXPECT_THROW(QuoteCatalog({}, FixedProbe()), std::invalid_argument);
  EXPECT_THROW(QuoteCatalog(quoteapi::DefaultQuotes(), nullptr),
               std::invalid_argument);
  EXPECT_THROW(
      QuoteCatalog({{.text = "", .author = "a", .tags = {}}}, FixedProbe()),
      std::invalid_argument);
  EXPECT_THROW(
      QuoteCatalog({{.text = "t", .author = "", .tags = {}}}, FixedProbe()),
      std::invalid_argument);
}
