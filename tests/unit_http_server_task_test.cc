#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/strand.hpp>
#include <boost/beast/http/field.hpp>
#include <boost/beast/http/status.hpp>
#include <chrono>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>

#include "quoteapi/http_request_aspect_handler.h"
#include "quoteapi/http_request_handler.h"
#include "quoteapi/http_server.h"
#include "quoteapi/http_server_task.h"
#include "quoteapi/internal/http_server_connection.h"
#include "quoteapi/logger.h"

namespace {

namespace http = boost::beast::http;

// Minimal handler used to construct HttpServerTask in tests.
class DummyHandler : public quoteapi::HttpRequestHandler {
 public:
  void Service(std::shared_ptr<quoteapi::HttpServerTask>) override {}
};

// Appends a marker so the call order is visible in the body.
class MarkingHandler : public quoteapi::HttpRequestHandler {
 public:
  void Service(std::shared_ptr<quoteapi::HttpServerTask> task) override {
    task->AppendBody("handler|");
  }
};

class ThrowingHandler : public quoteapi::HttpRequestHandler {
 public:
  void Service(std::shared_ptr<quoteapi::HttpServerTask>) override {
    throw std::runtime_error("boom");
  }
};

class MarkingAspect : public quoteapi::HttpRequestAspectHandler {
 public:
  explicit MarkingAspect(std::string name) : name_(std::move(name)) {}

  void PreService(std::shared_ptr<quoteapi::HttpServerTask> task) override {
    task->AppendBody("pre" + name_ + "|");
  }

  void PostService(std::shared_ptr<quoteapi::HttpServerTask> task) override {
    task->AppendBody("post" + name_ + "|");
  }

 private:
  std::string name_;
};

class MockLogger : public quoteapi::Logger {
 public:
  MOCK_METHOD(void, Log, (quoteapi::LogLevel, std::string), (override));
};

// Fake connection captures responses without network I/O.
class FakeConnection : public quoteapi::HttpServerConnection {
 public:
  FakeConnection(boost::asio::strand<boost::asio::any_io_executor> strand,
                 quoteapi::HttpServer* server)
      : quoteapi::HttpServerConnection(std::move(strand), server, 0, 0) {}

  bool IsStreamAvailable() const noexcept override { return !closed_; }

  void DoClose() override { closed_ = true; }

  bool closed() const { return closed_; }

  bool wrote_response() const { return wrote_response_; }

  const std::optional<quoteapi::HttpResponse>& last_response() const {
    return last_response_;
  }

  bool last_keep_alive() const { return last_keep_alive_; }

 protected:
  void DoWriteResponse(quoteapi::HttpResponse resp, bool keep_alive) override {
    last_response_ = std::move(resp);
    wrote_response_ = true;
    last_keep_alive_ = keep_alive;
  }

  void DoReadHeader() override {}
  void DoReadBody() override {}

 private:
  bool closed_{false};
  bool wrote_response_{false};
  bool last_keep_alive_{false};
  std::optional<quoteapi::HttpResponse> last_response_;
};

// Build a minimal route result for unit testing tasks.
quoteapi::HttpRouteResult MakeRouteResult(
    quoteapi::HttpRequestHandler* handler,
    std::vector<quoteapi::HttpRequestAspectHandler*> aspects = {}) {
  return quoteapi::HttpRouteResult{
      .current_location = "/",
      .parameters = {},
      .aspects = std::move(aspects),
      .handler = handler,
      .max_body_size = 0,
      .read_expiry = 0,
      .write_expiry = 0,
  };
}

quoteapi::HttpRequest MakeGet(const std::string& target) {
  quoteapi::HttpRequest req{http::verb::get, target, 11};
  req.keep_alive(true);
  return req;
}

// Drive the test io_context until the connection wrote or closed.
void RunUntilSettled(boost::asio::io_context& ioc, const FakeConnection& conn) {
  auto work = boost::asio::make_work_guard(ioc);
  auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(2);
  while (!conn.wrote_response() && !conn.closed() &&
         std::chrono::steady_clock::now() < deadline) {
    ioc.run_one_for(std::chrono::milliseconds(50));
  }
}

// Holds a running server without listeners and a connection on a local
// io_context.
struct TaskFixture {
  TaskFixture() : strand(ioc.get_executor()) {
    server.SetLogger(logger);
    started = server.Start(1);
    conn = std::make_shared<FakeConnection>(std::move(strand), &server);
  }

  quoteapi::HttpServer server{1};
  std::shared_ptr<::testing::NiceMock<MockLogger>> logger =
      std::make_shared<::testing::NiceMock<MockLogger>>();
  boost::asio::io_context ioc;
  boost::asio::strand<boost::asio::any_io_executor> strand;
  std::shared_ptr<FakeConnection> conn;
  bool started{false};
};

}  // namespace

// Releasing the task writes a default 200 with the request's keep-alive.
TEST(HttpServerTaskTest, DestructorWritesResponse) {
  TaskFixture f;
  ASSERT_TRUE(f.started);
  DummyHandler handler;

  {
    auto task = std::make_shared<quoteapi::HttpServerTask>(
        MakeGet("/"), MakeRouteResult(&handler), f.conn);
    task->SetBody("hello");
  }

  RunUntilSettled(f.ioc, *f.conn);

  ASSERT_TRUE(f.conn->wrote_response());
  ASSERT_TRUE(f.conn->last_response().has_value());
  EXPECT_EQ(f.conn->last_response()->result(), http::status::ok);
  EXPECT_EQ(f.conn->last_response()->body(), "hello");
  EXPECT_TRUE(f.conn->last_keep_alive());
}

// SetKeepAlive(false) reaches the connection.
TEST(HttpServerTaskTest, KeepAliveCanBeDisabled) {
  TaskFixture f;
  ASSERT_TRUE(f.started);
  DummyHandler handler;

  {
    auto task = std::make_shared<quoteapi::HttpServerTask>(
        MakeGet("/"), MakeRouteResult(&handler), f.conn);
    task->SetKeepAlive(false);
  }

  RunUntilSettled(f.ioc, *f.conn);

  ASSERT_TRUE(f.conn->wrote_response());
  EXPECT_FALSE(f.conn->last_keep_alive());
}

// A stopped server closes the connection instead of writing.
TEST(HttpServerTaskTest, StoppedServerClosesConnection) {
  quoteapi::HttpServer server(1);
  boost::asio::io_context ioc;
  boost::asio::strand<boost::asio::any_io_executor> strand(ioc.get_executor());
  auto conn = std::make_shared<FakeConnection>(std::move(strand), &server);
  DummyHandler handler;

  {
    auto task = std::make_shared<quoteapi::HttpServerTask>(
        MakeGet("/"), MakeRouteResult(&handler), conn);
  }

  RunUntilSettled(ioc, *conn);

  EXPECT_FALSE(conn->wrote_response());
  EXPECT_TRUE(conn->closed());
}

// Pre hooks run in order, then the handler, then post hooks in reverse.
TEST(HttpServerTaskTest, RunsAspectsAroundHandler) {
  TaskFixture f;
  ASSERT_TRUE(f.started);
  MarkingHandler handler;
  MarkingAspect first("A");
  MarkingAspect second("B");

  {
    auto task = std::make_shared<quoteapi::HttpServerTask>(
        MakeGet("/quotes"), MakeRouteResult(&handler, {&first, &second}),
        f.conn);
    task->Start();
  }

  RunUntilSettled(f.ioc, *f.conn);

  ASSERT_TRUE(f.conn->wrote_response());
  EXPECT_EQ(f.conn->last_response()->body(),
            "preA|preB|handler|postB|postA|");
}

// A handler exception becomes a logged 500 with a JSON error body.
TEST(HttpServerTaskTest, HandlerExceptionBecomesInternalServerError) {
  TaskFixture f;
  ASSERT_TRUE(f.started);
  ThrowingHandler handler;

  EXPECT_CALL(*f.logger, Log(quoteapi::LogLevel::kError,
                             ::testing::HasSubstr("boom")))
      .Times(1);

  {
    auto task = std::make_shared<quoteapi::HttpServerTask>(
        MakeGet("/stats"), MakeRouteResult(&handler), f.conn);
    task->Start();
  }

  RunUntilSettled(f.ioc, *f.conn);

  ASSERT_TRUE(f.conn->wrote_response());
  const auto& resp = *f.conn->last_response();
  EXPECT_EQ(resp.result(), http::status::internal_server_error);
  EXPECT_EQ(resp[http::field::content_type], "application/json; charset=utf-8");
  EXPECT_EQ(resp.body(), R"({"error":"Internal Server Error"})");
}

// Function handlers log their own exceptions at kWarn.
TEST(HttpServerTaskTest, FunctionHandlerExceptionIsLoggedAsWarning) {
  TaskFixture f;
  ASSERT_TRUE(f.started);
  quoteapi::FunctionRouteHandler handler(
      [](std::shared_ptr<quoteapi::HttpServerTask> task) {
        task->SetBody("partial");
        throw std::runtime_error("lambda failed");
      });

  EXPECT_CALL(*f.logger,
              Log(quoteapi::LogLevel::kWarn, "lambda failed"))
      .Times(1);

  {
    auto task = std::make_shared<quoteapi::HttpServerTask>(
        MakeGet("/"), MakeRouteResult(&handler), f.conn);
    task->Start();
  }

  RunUntilSettled(f.ioc, *f.conn);

  ASSERT_TRUE(f.conn->wrote_response());
  EXPECT_EQ(f.conn->last_response()->result(), http::status::ok);
  EXPECT_EQ(f.conn->last_response()->body(), "partial");
}

// Path parameters from the route result are exposed unchanged.
TEST(HttpServerTaskTest, ExposesPathParameters) {
  TaskFixture f;
  ASSERT_TRUE(f.started);
  DummyHandler handler;

  auto result = MakeRouteResult(&handler);
  result.current_location = "/quotes/tag/clean-code";
  result.parameters = {"clean-code"};

  auto task = std::make_shared<quoteapi::HttpServerTask>(
      MakeGet("/quotes/tag/clean%2Dcode"), std::move(result), f.conn);
  EXPECT_EQ(task->GetCurrentLocation(), "/quotes/tag/clean-code");
  ASSERT_EQ(task->GetPathParameters().size(), 1u);
  EXPECT_EQ(task->GetPathParameters().front(), "clean-code");
  EXPECT_GE(task->GetElapsed().count(), 0);
}
