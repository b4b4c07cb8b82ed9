/*
 * 설명: HTTP 연결을 처리하고 예약/세션/가용성/주간 한도/운영 엔드포인트를 제공한다.
 * 버전: v1.1.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/e2e/ops_endpoints_test.cpp
 */
#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>

#include "scheduler/api_response.hpp"
#include "scheduler/availability.hpp"
#include "scheduler/booking_service.hpp"
#include "scheduler/config.hpp"
#include "scheduler/observability.hpp"
#include "scheduler/weekly_quota.hpp"

namespace scheduler {

class HttpSession : public std::enable_shared_from_this<HttpSession> {
 public:
  using Response = boost::beast::http::response<boost::beast::http::string_body>;

  HttpSession(boost::asio::ip::tcp::socket socket, const AppConfig& config,
              std::shared_ptr<BookingService> booking_service, std::shared_ptr<AvailabilityChecker> availability,
              std::shared_ptr<WeeklyQuotaChecker> quota, std::shared_ptr<Observability> observability);
  void Run();

 private:
  void DoRead();
  void OnRead(boost::beast::error_code ec, std::size_t bytes_transferred);
  void HandleRequest();
  void Route(const std::string& path, const std::string& query, Response& res);
  void RouteSession(std::int64_t session_id, const std::vector<std::string>& segments, Response& res);
  void HandleAvailability(const std::string& query, Response& res);
  void HandleQuota(const std::string& query, Response& res);
  void HandleReconcile(Response& res);
  bool HasOpsToken() const;
  void WriteJson(Response& res, boost::beast::http::status status, const nlohmann::json& envelope);
  void WriteError(Response& res, const BookingError& error);
  void SendResponse(std::shared_ptr<Response> res);

  boost::beast::tcp_stream stream_;
  boost::beast::flat_buffer buffer_;
  boost::beast::http::request<boost::beast::http::string_body> req_;
  AppConfig config_;
  std::shared_ptr<BookingService> booking_service_;
  std::shared_ptr<AvailabilityChecker> availability_;
  std::shared_ptr<WeeklyQuotaChecker> quota_;
  std::shared_ptr<Observability> observability_;
  std::chrono::steady_clock::time_point request_start_;
  std::string trace_id_;
};

}  // namespace scheduler
