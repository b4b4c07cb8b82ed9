/*
 * 설명: 리소스 시간 충돌 검사와 권고 메시지 생성을 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/interval_conflict_test.cpp
 */
#include "scheduler/availability.hpp"

#include <sstream>

#include "scheduler/time_util.hpp"

namespace scheduler {
namespace {
const char* ResourceLabel(ResourceKind kind) { return kind == ResourceKind::kTrainer ? "Trainer" : "Machine"; }
}  // namespace

std::vector<SessionRecord> FindConflicts(const std::vector<SessionRecord>& existing, Timestamp start, Timestamp end,
                                         std::optional<std::int64_t> exclude_session_id) {
  std::vector<SessionRecord> conflicts;
  for (const auto& session : existing) {
    if (session.status == SessionStatus::kCancelled) {
      continue;
    }
    if (exclude_session_id && session.id == *exclude_session_id) {
      continue;
    }
    if (IntervalsOverlap(session.scheduled_start, session.scheduled_end, start, end)) {
      conflicts.push_back(session);
    }
  }
  return conflicts;
}

std::string BuildAvailabilityMessage(ResourceKind kind, std::size_t conflict_count) {
  std::ostringstream oss;
  oss << ResourceLabel(kind);
  if (conflict_count == 0) {
    oss << " is available for this time slot";
  } else {
    oss << " has " << conflict_count << " conflicting " << (conflict_count == 1 ? "session" : "sessions")
        << " during this time";
  }
  return oss.str();
}

nlohmann::json ToJson(const AvailabilityResult& result) {
  nlohmann::json conflicts = nlohmann::json::array();
  for (const auto& session : result.conflicts) {
    conflicts.push_back(ToJson(session));
  }
  return {{"resourceType", ToString(result.resource.kind)},
          {"resourceId", result.resource.id},
          {"available", result.available},
          {"conflicts", conflicts},
          {"message", result.message},
          {"degraded", result.degraded}};
}

AvailabilityChecker::AvailabilityChecker(std::shared_ptr<SessionRepository> repository,
                                         std::shared_ptr<Observability> observability)
    : repository_(std::move(repository)), observability_(std::move(observability)) {}

AvailabilityResult AvailabilityChecker::Check(const ResourceRef& resource, Timestamp start, Timestamp end,
                                              std::optional<std::int64_t> exclude_session_id) const {
  if (resource.id <= 0) {
    return Degrade(resource, "resource id must be positive");
  }
  start = TruncateToMillis(start);
  end = TruncateToMillis(end);
  if (end <= start) {
    return Degrade(resource, "end time must be after start time");
  }

  std::vector<SessionRecord> candidates;
  try {
    candidates = repository_->ListActiveSessionsForResource(resource, start, end);
  } catch (const DbException& ex) {
    return Degrade(resource, std::string("session store unavailable: ") + ex.what());
  }

  AvailabilityResult result;
  result.resource = resource;
  result.conflicts = FindConflicts(candidates, start, end, exclude_session_id);
  result.available = result.conflicts.empty();
  result.message = BuildAvailabilityMessage(resource.kind, result.conflicts.size());
  if (!result.available && observability_) {
    observability_->RecordConflictAdvisory();
  }
  return result;
}

AvailabilityResult AvailabilityChecker::Degrade(const ResourceRef& resource, const std::string& reason) const {
  if (observability_) {
    observability_->RecordDegradedCheck();
    observability_->Warn("availability.degraded",
                         {{"resourceType", ToString(resource.kind)}, {"resourceId", resource.id}, {"reason", reason}});
  }
  AvailabilityResult result;
  result.resource = resource;
  result.available = true;
  result.degraded = true;
  result.message = std::string("Availability could not be checked (") + reason + "); booking is not blocked";
  return result;
}

}  // namespace scheduler
