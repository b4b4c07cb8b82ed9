/*
 * 설명: 구조화(JSON) 로그와 예약 엔진 메트릭 카운터를 관리한다.
 * 버전: v1.1.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/e2e/ops_endpoints_test.cpp
 */
#pragma once

#include <atomic>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

namespace scheduler {

enum class LogLevel { kDebug = 0, kInfo = 1, kWarn = 2, kError = 3 };

std::optional<LogLevel> ParseLogLevel(std::string_view text);
std::string_view ToString(LogLevel level);

struct LogContext {
  std::string trace_id;
  std::string name;
  LogLevel level{LogLevel::kInfo};
  std::optional<std::int64_t> session_id;
  std::optional<std::int64_t> member_id;
  long latency_ms{0};
  nlohmann::json detail;
};

struct MetricsSnapshot {
  std::uint64_t request_total{0};
  std::uint64_t request_errors{0};
  std::uint64_t bookings_confirmed{0};
  std::uint64_t bookings_waitlisted{0};
  std::uint64_t promotions{0};
  std::uint64_t conflict_advisories{0};
  std::uint64_t degraded_checks{0};
  std::uint64_t reconcile_repairs{0};
};

class Observability {
 public:
  explicit Observability(LogLevel min_level = LogLevel::kInfo) : min_level_(min_level) {}

  std::string NextTraceId();
  void IncrementRequest();
  void IncrementError();
  void RecordBooking(bool waitlisted);
  void RecordPromotions(std::uint64_t count);
  void RecordConflictAdvisory();
  void RecordDegradedCheck();
  void RecordReconcileRepair();
  MetricsSnapshot Snapshot() const;

  void Log(const LogContext& ctx) const;
  void Warn(const std::string& name, const nlohmann::json& detail) const;
  bool Enabled(LogLevel level) const { return level >= min_level_; }

 private:
  LogLevel min_level_;
  std::atomic<std::uint64_t> request_total_{0};
  std::atomic<std::uint64_t> request_errors_{0};
  std::atomic<std::uint64_t> bookings_confirmed_{0};
  std::atomic<std::uint64_t> bookings_waitlisted_{0};
  std::atomic<std::uint64_t> promotions_{0};
  std::atomic<std::uint64_t> conflict_advisories_{0};
  std::atomic<std::uint64_t> degraded_checks_{0};
  std::atomic<std::uint64_t> reconcile_repairs_{0};
  std::atomic<std::uint64_t> trace_counter_{0};
  mutable std::mutex output_mutex_;
};

}  // namespace scheduler
