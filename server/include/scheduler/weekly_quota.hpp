/*
 * 설명: 로컬 달력 기준 월~일 주간 구간을 계산하고 스튜디오 주간 세션 한도를 검사한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/weekly_quota_test.cpp, server/tests/it/booking_it_test.cpp
 */
#pragma once

#include <cstddef>
#include <memory>
#include <string_view>

#include <nlohmann/json.hpp>

#include "scheduler/model.hpp"
#include "scheduler/session_repository.hpp"

namespace scheduler {

// start = 월요일 00:00:00.000, end = 일요일 23:59:59.999 (양 끝 포함).
struct WeekWindow {
  Timestamp start;
  Timestamp end;
};

enum class QuotaTier { kNominal, kWarning, kCritical };

std::string_view ToString(QuotaTier tier);

struct QuotaStatus {
  std::size_t current_count{0};
  int max_allowed{0};
  bool can_book{false};
  int percentage{0};
  QuotaTier tier{QuotaTier::kNominal};
  WeekWindow window;
};

// tm_wday 기준: 일요일(0)은 -6일, 나머지는 1 - weekday.
int MondayOffset(int weekday);

WeekWindow ComputeWeekWindow(Timestamp date);

QuotaTier ClassifyQuotaTier(int percentage);

QuotaStatus BuildQuotaStatus(std::size_t current_count, int max_allowed);

nlohmann::json ToJson(const QuotaStatus& status);

class WeeklyQuotaChecker {
 public:
  WeeklyQuotaChecker(std::shared_ptr<SessionRepository> repository, int default_max_allowed);

  QuotaStatus CheckStudioQuota(Timestamp date) const;

 private:
  std::shared_ptr<SessionRepository> repository_;
  int default_max_allowed_;
};

}  // namespace scheduler
