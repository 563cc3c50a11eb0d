#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <memory>
#include <sstream>
#include <string>

#include "quoteapi/console_logger.h"
#include "quoteapi/http_server.h"
#include "quoteapi/logger.h"

namespace {

// Mock logger used to verify Log calls.
class MockLogger : public quoteapi::Logger {
 public:
  MOCK_METHOD(void, Log, (quoteapi::LogLevel, std::string), (override));
};

}  // namespace

// Verify server forwards Log calls to the configured logger.
TEST(LoggerTest, SetLoggerAndLog) {
  quoteapi::HttpServer server(1);
  auto logger = std::make_shared<MockLogger>();

  server.SetLogger(logger);

  EXPECT_CALL(*logger, Log(quoteapi::LogLevel::kInfo, "hello"));
  server.Log(quoteapi::LogLevel::kInfo, "hello");
}

// Rejected route patterns are reported as warnings.
TEST(LoggerTest, InvalidRouteIsLoggedAsWarning) {
  quoteapi::HttpServer server(1);
  auto logger = std::make_shared<::testing::NiceMock<MockLogger>>();
  server.SetLogger(logger);

  EXPECT_CALL(*logger, Log(quoteapi::LogLevel::kWarn,
                           ::testing::HasSubstr("no-slash")));
  server.AddRouteEntry(quoteapi::HttpRequestMethod::kGet, "no-slash",
                       [](std::shared_ptr<quoteapi::HttpServerTask>) {});
}

// Level names parse case-insensitively.
TEST(LoggerTest, ParsesLevelNames) {
  EXPECT_EQ(quoteapi::ParseLogLevel("trace"), quoteapi::LogLevel::kTrace);
  EXPECT_EQ(quoteapi::ParseLogLevel("INFO"), quoteapi::LogLevel::kInfo);
  EXPECT_EQ(quoteapi::ParseLogLevel("Warn"), quoteapi::LogLevel::kWarn);
  EXPECT_EQ(quoteapi::ParseLogLevel("fatal"), quoteapi::LogLevel::kFatal);
  EXPECT_FALSE(quoteapi::ParseLogLevel("verbose").has_value());
  EXPECT_FALSE(quoteapi::ParseLogLevel("").has_value());
}

// Each record is one line with a UTC timestamp and the level name.
TEST(LoggerTest, ConsoleLoggerFormatsRecord) {
  std::ostringstream out;
  quoteapi::ConsoleLogger logger(out, quoteapi::LogLevel::kTrace);

  logger.Log(quoteapi::LogLevel::kError, "disk on fire");

  auto line = out.str();
  ASSERT_FALSE(line.empty());
  EXPECT_EQ(line.back(), '\n');
  line.pop_back();
  EXPECT_THAT(line, ::testing::MatchesRegex(
                        R"(\[[0-9]{4}-[0-9]{2}-[0-9]{2}T[0-9]{2}:[0-9]{2}:)"
                        R"([0-9]{2}\.[0-9]{3}Z ERROR\]: disk on fire)"));
}

// Records below the minimum level are dropped.
TEST(LoggerTest, ConsoleLoggerFiltersByLevel) {
  std::ostringstream out;
  quoteapi::ConsoleLogger logger(out, quoteapi::LogLevel::kWarn);

  logger.Log(quoteapi::LogLevel::kDebug, "hidden");
  logger.Log(quoteapi::LogLevel::kInfo, "hidden too");
  logger.Log(quoteapi::LogLevel::kWarn, "shown");

  auto text = out.str();
  EXPECT_EQ(text.find("hidden"), std::string::npos);
  EXPECT_NE(text.find("WARN]: shown"), std::string::npos);
}
