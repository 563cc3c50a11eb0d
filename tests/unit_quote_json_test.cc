#include <gtest/gtest.h>
#include <json/json.h>

#include <memory>
#include <sstream>
#include <string>
#include <vector>

#include "quoteapi/quote.h"
#include "quoteapi/quote_catalog.h"
#include "quoteapi/quote_json.h"

namespace {

Json::Value Parse(const std::string& text) {
  Json::CharReaderBuilder builder;
  Json::Value root;
  std::string errs;
  std::istringstream in(text);
  EXPECT_TRUE(Json::parseFromStream(builder, in, &root, &errs)) << errs;
  return root;
}

}  // namespace

// A quote serializes with text, author and tags.
TEST(QuoteJsonTest, QuoteShape) {
  quoteapi::Quote q{.text = "Make it work, make it right, make it fast.",
                    .author = "Kent Beck",
                    .tags = {"programming", "best-practices"}};

  auto json = quoteapi::QuoteToJson(q);
  ASSERT_TRUE(json.isObject());
  EXPECT_EQ(json.size(), 3u);
  EXPECT_EQ(json["text"].asString(), q.text);
  EXPECT_EQ(json["author"].asString(), "Kent Beck");
  ASSERT_TRUE(json["tags"].isArray());
  ASSERT_EQ(json["tags"].size(), 2u);
  EXPECT_EQ(json["tags"][0].asString(), "programming");
  EXPECT_EQ(json["tags"][1].asString(), "best-practices");
}

// A quote without tags still carries an empty array.
TEST(QuoteJsonTest, EmptyTagsIsArray) {
  quoteapi::Quote q{.text = "t", .author = "a", .tags = {}};

  auto json = quoteapi::QuoteToJson(q);
  EXPECT_TRUE(json["tags"].isArray());
  EXPECT_EQ(json["tags"].size(), 0u);
  EXPECT_EQ(quoteapi::WriteJson(json),
            R"({"author":"a","tags":[],"text":"t"})");
}

// Lists keep their order.
TEST(QuoteJsonTest, QuotesArrayKeepsOrder) {
  auto quotes = quoteapi::DefaultQuotes();

  auto json = quoteapi::QuotesToJson(quotes);
  ASSERT_TRUE(json.isArray());
  ASSERT_EQ(json.size(), quotes.size());
  for (Json::ArrayIndex i = 0; i < json.size(); ++i) {
    EXPECT_EQ(json[i]["text"].asString(), quotes[i].text);
  }

  EXPECT_EQ(quoteapi::WriteJson(quoteapi::QuotesToJson({})), "[]");
}

TEST(QuoteJsonTest, ErrorShape) {
  EXPECT_EQ(quoteapi::WriteJson(quoteapi::ErrorToJson(
                "No quotes found with tag 'nonexistent-tag-xyz'")),
            R"({"error":"No quotes found with tag 'nonexistent-tag-xyz'"})");
}

TEST(QuoteJsonTest, StatsShape) {
  auto json = quoteapi::StatsToJson(quoteapi::StatsSnapshot{.working_set =
                                                                "42 MB"});
  EXPECT_EQ(quoteapi::WriteJson(json),
            R"({"processInfo":{"workingSet":"42 MB"}})");
}

// The index document lists every served endpoint.
TEST(QuoteJsonTest, ApiInfoShape) {
  auto json = quoteapi::ApiInfoToJson();
  EXPECT_EQ(json["message"].asString(), "Quote API");

  const auto& endpoints = json["endpoints"];
  ASSERT_TRUE(endpoints.isObject());
  EXPECT_EQ(endpoints.size(), 4u);
  EXPECT_EQ(endpoints["randomQuote"].asString(), "/quote/random");
  EXPECT_EQ(endpoints["quotesByTag"].asString(), "/quotes/tag/{tag}");
  EXPECT_EQ(endpoints["allQuotes"].asString(), "/quotes");
  EXPECT_EQ(endpoints["stats"].asString(), "/stats");
}

// Output is compact and keeps non-ASCII text as UTF-8.
TEST(QuoteJsonTest, WriterIsCompactUtf8) {
  quoteapi::Quote q{.text = "Caf\xC3\xA9 \"au\" lait", .author = "B",
                    .tags = {"x"}};

  auto text = quoteapi::WriteJson(quoteapi::QuoteToJson(q));
  EXPECT_EQ(text.find('\n'), std::string::npos);
  EXPECT_EQ(text.find(": "), std::string::npos);
  EXPECT_NE(text.find("Caf\xC3\xA9"), std::string::npos);
  EXPECT_NE(text.find(R"(\"au\")"), std::string::npos);

  auto back = Parse(text);
  EXPECT_EQ(back["text"].asString(), q.text);
}

// Bytes that are not UTF-8 never reach the error body.
TEST(QuoteJsonTest, ErrorReplacesInvalidUtf8) {
  auto json = quoteapi::ErrorToJson("tag '\xFF\xFE' caf\xC3\xA9 \xE2\x82");
  EXPECT_EQ(json["error"].asString(),
            "tag '\xEF\xBF\xBD\xEF\xBF\xBD' caf\xC3\xA9 "
            "\xEF\xBF\xBD\xEF\xBF\xBD");

  auto text = quoteapi::WriteJson(json);
  EXPECT_EQ(text.find('\xFF'), std::string::npos);
  EXPECT_EQ(Parse(text)["error"].asString(), json["error"].asString());
}

TEST(QuoteJsonTest, ContentType) {
  EXPECT_EQ(quoteapi::kJsonContentType, "application/json; charset=utf-8");
}
