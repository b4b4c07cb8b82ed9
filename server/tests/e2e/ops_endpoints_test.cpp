#include <chrono>
#include <cstdlib>
#include <thread>

#include <boost/asio/connect.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core/flat_buffer.hpp>
#include <boost/beast/core/tcp_stream.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/version.hpp>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include "scheduler/app.hpp"
#include "scheduler/api_response.hpp"

namespace {

scheduler::AppConfig TestConfig(unsigned short port) {
  scheduler::AppConfig cfg{};
  const char* host = std::getenv("DB_HOST");
  cfg.port = port;
  cfg.db_host = host ? host : "127.0.0.1";
  cfg.db_port = 3306;
  cfg.db_user = "app";
  cfg.db_password = "app_pass";
  cfg.db_name = "studio_db";
  cfg.log_level = "warn";
  cfg.default_max_sessions_per_week = 250;
  cfg.reconcile_interval_seconds = 0;
  cfg.ops_token = "ops-secret";
  return cfg;
}

struct SimpleHttpResponse {
  boost::beast::http::status status;
  nlohmann::json body;
};

void ExpectSuccessEnvelope(const nlohmann::json& body) {
  ASSERT_TRUE(body.is_object());
  EXPECT_TRUE(body["success"].get<bool>());
  ASSERT_TRUE(body.contains("data"));
  EXPECT_TRUE(body["data"].is_object());
  ASSERT_TRUE(body.contains("error"));
  EXPECT_TRUE(body["error"].is_null());
  ASSERT_TRUE(body.contains("meta"));
  EXPECT_TRUE(body["meta"].contains("timestamp"));
}

void ExpectErrorEnvelope(const nlohmann::json& body, const std::string& code) {
  ASSERT_TRUE(body.is_object());
  EXPECT_FALSE(body["success"].get<bool>());
  ASSERT_TRUE(body.contains("data"));
  EXPECT_TRUE(body["data"].is_null());
  ASSERT_TRUE(body.contains("error"));
  EXPECT_TRUE(body["error"].is_object());
  EXPECT_EQ(body["error"]["code"], code);
}

class OpsEndpointsFixture : public ::testing::Test {
 protected:
  void SetUp() override {
    config_ = TestConfig(18094);
    app_ = std::make_unique<scheduler::ServerApp>(config_);
    server_thread_ = std::thread([this]() { app_->Run(); });
    std::this_thread::sleep_for(std::chrono::milliseconds(300));
  }

  void TearDown() override {
    app_->Stop();
    if (server_thread_.joinable()) {
      server_thread_.join();
    }
  }

  SimpleHttpResponse Send(boost::beast::http::verb verb, const std::string& target, const std::string& body = "",
                          const std::string& extra_header_name = "", const std::string& extra_header_value = "") {
    boost::asio::io_context ioc;
    boost::asio::ip::tcp::resolver resolver{ioc};
    boost::beast::tcp_stream stream{ioc};
    auto const results = resolver.resolve("127.0.0.1", std::to_string(config_.port));
    stream.connect(results);

    boost::beast::http::request<boost::beast::http::string_body> req{verb, target, 11};
    req.set(boost::beast::http::field::host, "localhost");
    req.set(boost::beast::http::field::user_agent, BOOST_BEAST_VERSION_STRING);
    if (!extra_header_name.empty()) {
      req.set(extra_header_name, extra_header_value);
    }
    if (!body.empty()) {
      req.set(boost::beast::http::field::content_type, "application/json");
      req.body() = body;
    }
    req.prepare_payload();

    boost::beast::http::write(stream, req);

    boost::beast::flat_buffer buffer;
    boost::beast::http::response<boost::beast::http::string_body> res;
    boost::beast::http::read(stream, buffer, res);

    SimpleHttpResponse result{res.result(), nlohmann::json::parse(res.body())};
    boost::beast::error_code ec;
    stream.socket().shutdown(boost::asio::ip::tcp::socket::shutdown_both, ec);
    return result;
  }

  SimpleHttpResponse Get(const std::string& target) { return Send(boost::beast::http::verb::get, target); }

  SimpleHttpResponse Post(const std::string& target, const nlohmann::json& body) {
    return Send(boost::beast::http::verb::post, target, body.dump());
  }

  scheduler::AppConfig config_;
  std::unique_ptr<scheduler::ServerApp> app_;
  std::thread server_thread_;
};

}  // namespace

TEST_F(OpsEndpointsFixture, MetricsCountRequests) {
  auto first = Get("/metrics");
  ASSERT_EQ(first.status, boost::beast::http::status::ok);
  ExpectSuccessEnvelope(first.body);
  EXPECT_TRUE(first.body["data"].contains("bookings"));
  EXPECT_TRUE(first.body["data"].contains("reconcile"));
  auto initial_total = first.body["data"]["requests"]["total"].get<std::uint64_t>();

  auto health = Get("/api/health");
  ASSERT_EQ(health.status, boost::beast::http::status::ok);
  ExpectSuccessEnvelope(health.body);
  EXPECT_EQ(health.body["data"]["status"], "ok");

  auto second = Get("/metrics");
  auto second_total = second.body["data"]["requests"]["total"].get<std::uint64_t>();
  EXPECT_GE(second_total, initial_total + 2);
}

TEST_F(OpsEndpointsFixture, ReconcileRequiresOpsToken) {
  auto missing = Send(boost::beast::http::verb::post, "/ops/reconcile");
  EXPECT_EQ(missing.status, boost::beast::http::status::unauthorized);
  ExpectErrorEnvelope(missing.body, "unauthorized");

  auto wrong = Send(boost::beast::http::verb::post, "/ops/reconcile", "", "X-Ops-Token", "nope");
  EXPECT_EQ(wrong.status, boost::beast::http::status::unauthorized);
}

TEST_F(OpsEndpointsFixture, MalformedBookingsAreRejectedBeforeStorage) {
  nlohmann::json unknown_type{{"sessionType", "pilates_party"},
                              {"machineId", 1},
                              {"scheduledStart", "2031-03-12T10:00:00Z"},
                              {"scheduledEnd", "2031-03-12T11:00:00Z"}};
  auto unknown = Post("/api/bookings", unknown_type);
  EXPECT_EQ(unknown.status, boost::beast::http::status::bad_request);
  ExpectErrorEnvelope(unknown.body, "unknown_session_type");
  EXPECT_EQ(unknown.body["error"]["detail"]["step"], "classify");

  nlohmann::json reversed{{"sessionType", "non_bookable"},
                          {"machineId", 1},
                          {"scheduledStart", "2031-03-12T11:00:00Z"},
                          {"scheduledEnd", "2031-03-12T10:00:00Z"}};
  auto interval = Post("/api/bookings", reversed);
  EXPECT_EQ(interval.status, boost::beast::http::status::bad_request);
  ExpectErrorEnvelope(interval.body, "invalid_interval");
  EXPECT_EQ(interval.body["error"]["detail"]["kind"], "validation");

  auto broken = Send(boost::beast::http::verb::post, "/api/bookings", "{not json");
  EXPECT_EQ(broken.status, boost::beast::http::status::bad_request);
  ExpectErrorEnvelope(broken.body, "bad_request");
}

TEST_F(OpsEndpointsFixture, AvailabilityDegradesOnInvalidResource) {
  auto result =
      Get("/api/availability?resourceType=trainer&resourceId=0&start=2031-03-12T10%3A00%3A00Z&end=2031-03-12T11%3A00%3A00Z");
  ASSERT_EQ(result.status, boost::beast::http::status::ok);
  ExpectSuccessEnvelope(result.body);
  EXPECT_TRUE(result.body["data"]["available"].get<bool>());
  EXPECT_TRUE(result.body["data"]["degraded"].get<bool>());

  auto malformed_time = Get("/api/availability?resourceType=machine&resourceId=3&start=yesterday&end=2031-03-12T11:00:00Z");
  ASSERT_EQ(malformed_time.status, boost::beast::http::status::ok);
  EXPECT_TRUE(malformed_time.body["data"]["available"].get<bool>());
  EXPECT_TRUE(malformed_time.body["data"]["degraded"].get<bool>());
  EXPECT_EQ(malformed_time.body["data"]["resourceId"], 3);

  auto malformed_id = Get("/api/availability?resourceType=trainer&resourceId=abc&start=2031-03-12T10:00:00Z&end=2031-03-12T11:00:00Z");
  ASSERT_EQ(malformed_id.status, boost::beast::http::status::ok);
  EXPECT_TRUE(malformed_id.body["data"]["degraded"].get<bool>());

  auto metrics = Get("/metrics");
  EXPECT_GE(metrics.body["data"]["availability"]["degradedChecks"].get<std::uint64_t>(), 3u);

  auto bad_type = Get("/api/availability?resourceType=room&resourceId=1&start=2031-03-12T10:00:00Z&end=2031-03-12T11:00:00Z");
  EXPECT_EQ(bad_type.status, boost::beast::http::status::bad_request);
}

TEST_F(OpsEndpointsFixture, UnknownRoutesReturnNotFound) {
  auto missing = Get("/api/unknown");
  EXPECT_EQ(missing.status, boost::beast::http::status::not_found);
  ExpectErrorEnvelope(missing.body, "not_found");

  auto bad_id = Get("/api/sessions/abc");
  EXPECT_EQ(bad_id.status, boost::beast::http::status::bad_request);
  ExpectErrorEnvelope(bad_id.body, "invalid_field");
}
