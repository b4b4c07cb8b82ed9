/*
 * 설명: 서버 전체 수명주기와 주기적 정합성 복구 타이머를 관리한다.
 * 버전: v1.2.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/e2e/ops_endpoints_test.cpp
 */
#pragma once

#include <atomic>
#include <cstddef>
#include <memory>
#include <thread>
#include <vector>

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/steady_timer.hpp>

#include "scheduler/availability.hpp"
#include "scheduler/booking_service.hpp"
#include "scheduler/config.hpp"
#include "scheduler/db_client.hpp"
#include "scheduler/notification.hpp"
#include "scheduler/observability.hpp"
#include "scheduler/session_repository.hpp"
#include "scheduler/weekly_quota.hpp"

namespace scheduler {

class Listener;

class ServerApp {
 public:
  explicit ServerApp(const AppConfig& config);
  ~ServerApp();

  void Run();
  void Stop();

  boost::asio::io_context& GetContext() { return ioc_; }
  const AppConfig& GetConfig() const { return config_; }
  std::shared_ptr<BookingService> GetBookingService() { return booking_service_; }
  std::shared_ptr<AvailabilityChecker> GetAvailabilityChecker() { return availability_; }
  std::shared_ptr<WeeklyQuotaChecker> GetQuotaChecker() { return quota_; }
  std::shared_ptr<Observability> GetObservability() { return observability_; }

 private:
  void RunWorkers();
  void ScheduleReconcile();

  AppConfig config_;
  boost::asio::io_context ioc_;
  boost::asio::executor_work_guard<boost::asio::io_context::executor_type> work_guard_;
  boost::asio::steady_timer reconcile_timer_;
  std::shared_ptr<Listener> listener_;
  std::shared_ptr<Observability> observability_;
  std::shared_ptr<MariaDbClient> db_client_;
  std::shared_ptr<SessionRepository> repository_;
  std::shared_ptr<AvailabilityChecker> availability_;
  std::shared_ptr<WeeklyQuotaChecker> quota_;
  std::shared_ptr<NotificationSink> notifier_;
  std::shared_ptr<BookingService> booking_service_;
  std::vector<std::thread> workers_;
  std::atomic<bool> running_{false};
};

}  // namespace scheduler
