/*
 * 설명: 주간 구간 계산과 스튜디오 주간 한도 집계를 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/weekly_quota_test.cpp, server/tests/it/booking_it_test.cpp
 */
#include "scheduler/weekly_quota.hpp"

#include <cmath>
#include <ctime>
#include <vector>

#include "scheduler/db_client.hpp"
#include "scheduler/session_policy.hpp"
#include "scheduler/time_util.hpp"

namespace scheduler {
namespace {
Timestamp LocalMidnight(std::tm tm) {
  tm.tm_hour = 0;
  tm.tm_min = 0;
  tm.tm_sec = 0;
  tm.tm_isdst = -1;
  return std::chrono::system_clock::from_time_t(std::mktime(&tm));
}
}  // namespace

std::string_view ToString(QuotaTier tier) {
  switch (tier) {
    case QuotaTier::kNominal:
      return "nominal";
    case QuotaTier::kWarning:
      return "warning";
    case QuotaTier::kCritical:
      return "critical";
  }
  return "nominal";
}

int MondayOffset(int weekday) { return weekday == 0 ? -6 : 1 - weekday; }

WeekWindow ComputeWeekWindow(Timestamp date) {
  std::time_t tt = std::chrono::system_clock::to_time_t(TruncateToMillis(date));
  std::tm local{};
  localtime_r(&tt, &local);

  std::tm monday = local;
  monday.tm_mday += MondayOffset(local.tm_wday);
  std::tm next_monday = monday;
  next_monday.tm_mday += 7;

  // mktime이 월/연 경계와 DST 전환을 정규화한다.
  WeekWindow window;
  window.start = LocalMidnight(monday);
  window.end = LocalMidnight(next_monday) - std::chrono::milliseconds(1);
  return window;
}

QuotaTier ClassifyQuotaTier(int percentage) {
  if (percentage >= 95) {
    return QuotaTier::kCritical;
  }
  if (percentage >= 80) {
    return QuotaTier::kWarning;
  }
  return QuotaTier::kNominal;
}

QuotaStatus BuildQuotaStatus(std::size_t current_count, int max_allowed) {
  QuotaStatus status;
  status.current_count = current_count;
  status.max_allowed = max_allowed;
  status.can_book = max_allowed > 0 && current_count < static_cast<std::size_t>(max_allowed);
  if (max_allowed <= 0) {
    status.percentage = 100;
  } else {
    status.percentage =
        static_cast<int>(std::lround(static_cast<double>(current_count) / static_cast<double>(max_allowed) * 100.0));
  }
  status.tier = ClassifyQuotaTier(status.percentage);
  return status;
}

nlohmann::json ToJson(const QuotaStatus& status) {
  return {{"currentCount", status.current_count},
          {"maxAllowed", status.max_allowed},
          {"canBook", status.can_book},
          {"percentage", status.percentage},
          {"tier", ToString(status.tier)},
          {"weekStart", ToIsoString(status.window.start)},
          {"weekEnd", ToIsoString(status.window.end)}};
}

WeeklyQuotaChecker::WeeklyQuotaChecker(std::shared_ptr<SessionRepository> repository, int default_max_allowed)
    : repository_(std::move(repository)), default_max_allowed_(default_max_allowed) {}

QuotaStatus WeeklyQuotaChecker::CheckStudioQuota(Timestamp date) const {
  auto window = ComputeWeekWindow(date);
  std::vector<SessionType> counted;
  for (auto type : kAllSessionTypes) {
    if (Classify(type).counts_toward_capacity) {
      counted.push_back(type);
    }
  }
  auto current = repository_->CountSessionsInWindow(window.start, window.end, counted);
  auto max_allowed = repository_->LoadWeeklyCeiling().value_or(default_max_allowed_);
  auto status = BuildQuotaStatus(current, max_allowed);
  status.window = window;
  return status;
}

}  // namespace scheduler
