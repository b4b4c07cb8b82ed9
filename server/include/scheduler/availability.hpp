/*
 * 설명: 트레이너/머신의 시간 구간 충돌을 검사한다. 충돌은 예약을 막지 않는 권고 정보이며,
 *       검사를 수행할 수 없으면 로그를 남기고 available=true로 응답한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/interval_conflict_test.cpp
 */
#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "scheduler/model.hpp"
#include "scheduler/observability.hpp"
#include "scheduler/session_repository.hpp"

namespace scheduler {

struct AvailabilityResult {
  ResourceRef resource;
  bool available{true};
  std::vector<SessionRecord> conflicts;
  std::string message;
  // 입력 오류나 저장소 장애로 검사를 건너뛰었는지 여부.
  bool degraded{false};
};

// 반열린 구간 [start, end)와 [s, e)는 s < end && e > start 일 때만 겹친다. 끝과 시작이 같으면 겹치지 않는다.
inline bool IntervalsOverlap(Timestamp s, Timestamp e, Timestamp start, Timestamp end) { return s < end && e > start; }

std::vector<SessionRecord> FindConflicts(const std::vector<SessionRecord>& existing, Timestamp start, Timestamp end,
                                         std::optional<std::int64_t> exclude_session_id);

std::string BuildAvailabilityMessage(ResourceKind kind, std::size_t conflict_count);

nlohmann::json ToJson(const AvailabilityResult& result);

class AvailabilityChecker {
 public:
  AvailabilityChecker(std::shared_ptr<SessionRepository> repository, std::shared_ptr<Observability> observability);

  AvailabilityResult Check(const ResourceRef& resource, Timestamp start, Timestamp end,
                           std::optional<std::int64_t> exclude_session_id = std::nullopt) const;

  // 검사할 수 없는 입력에 대해 경고 로그와 함께 available=true, degraded=true 결과를 만든다.
  AvailabilityResult Degrade(const ResourceRef& resource, const std::string& reason) const;

 private:

  std::shared_ptr<SessionRepository> repository_;
  std::shared_ptr<Observability> observability_;
};

}  // namespace scheduler
