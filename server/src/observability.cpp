/*
 * 설명: 구조화 로그와 예약 엔진 메트릭 카운터를 관리한다.
 * 버전: v1.1.0
 * 관련 문서: DESIGN.md
 */
#include "scheduler/observability.hpp"

#include <chrono>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace scheduler {

std::optional<LogLevel> ParseLogLevel(std::string_view text) {
  if (text == "debug") {
    return LogLevel::kDebug;
  }
  if (text == "info") {
    return LogLevel::kInfo;
  }
  if (text == "warn" || text == "warning") {
    return LogLevel::kWarn;
  }
  if (text == "error") {
    return LogLevel::kError;
  }
  return std::nullopt;
}

std::string_view ToString(LogLevel level) {
  switch (level) {
    case LogLevel::kDebug:
      return "debug";
    case LogLevel::kInfo:
      return "info";
    case LogLevel::kWarn:
      return "warn";
    case LogLevel::kError:
      return "error";
  }
  return "info";
}

std::string Observability::NextTraceId() {
  auto now = std::chrono::steady_clock::now().time_since_epoch().count();
  std::ostringstream oss;
  oss << std::hex << now << "-" << trace_counter_.fetch_add(1);
  return oss.str();
}

void Observability::IncrementRequest() { request_total_.fetch_add(1); }

void Observability::IncrementError() { request_errors_.fetch_add(1); }

void Observability::RecordBooking(bool waitlisted) {
  if (waitlisted) {
    bookings_waitlisted_.fetch_add(1);
  } else {
    bookings_confirmed_.fetch_add(1);
  }
}

void Observability::RecordPromotions(std::uint64_t count) { promotions_.fetch_add(count); }

void Observability::RecordConflictAdvisory() { conflict_advisories_.fetch_add(1); }

void Observability::RecordDegradedCheck() { degraded_checks_.fetch_add(1); }

void Observability::RecordReconcileRepair() { reconcile_repairs_.fetch_add(1); }

MetricsSnapshot Observability::Snapshot() const {
  MetricsSnapshot snapshot;
  snapshot.request_total = request_total_.load();
  snapshot.request_errors = request_errors_.load();
  snapshot.bookings_confirmed = bookings_confirmed_.load();
  snapshot.bookings_waitlisted = bookings_waitlisted_.load();
  snapshot.promotions = promotions_.load();
  snapshot.conflict_advisories = conflict_advisories_.load();
  snapshot.degraded_checks = degraded_checks_.load();
  snapshot.reconcile_repairs = reconcile_repairs_.load();
  return snapshot;
}

void Observability::Log(const LogContext& ctx) const {
  if (!Enabled(ctx.level)) {
    return;
  }
  nlohmann::json log_json;
  log_json["level"] = ToString(ctx.level);
  log_json["traceId"] = ctx.trace_id;
  log_json["eventName"] = ctx.name;
  log_json["latencyMs"] = ctx.latency_ms;
  if (ctx.session_id) {
    log_json["sessionId"] = *ctx.session_id;
  }
  if (ctx.member_id) {
    log_json["memberId"] = *ctx.member_id;
  }
  if (!ctx.detail.is_null()) {
    log_json["detail"] = ctx.detail;
  }
  std::lock_guard<std::mutex> lock(output_mutex_);
  std::cout << log_json.dump() << std::endl;
}

void Observability::Warn(const std::string& name, const nlohmann::json& detail) const {
  LogContext ctx;
  ctx.name = name;
  ctx.level = LogLevel::kWarn;
  ctx.detail = detail;
  Log(ctx);
}

}  // namespace scheduler
