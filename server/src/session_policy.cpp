/*
 * 설명: 세션 유형 규칙 표를 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/session_policy_test.cpp
 */
#include "scheduler/session_policy.hpp"

namespace scheduler {

PolicyFlags Classify(SessionType type) {
  PolicyFlags flags;
  switch (type) {
    case SessionType::kTrial:
      flags.creates_member = true;
      flags.bypasses_weekly_quota = true;
      flags.counts_toward_capacity = true;
      break;
    case SessionType::kMember:
      flags.requires_member = true;
      flags.counts_toward_capacity = true;
      break;
    case SessionType::kContractual:
      flags.requires_member = true;
      flags.required_member_type = MemberType::kTrial;
      flags.bypasses_weekly_quota = true;
      flags.counts_toward_capacity = true;
      break;
    case SessionType::kMultiSite:
      flags.is_guest = true;
      flags.bypasses_weekly_quota = true;
      flags.counts_toward_capacity = true;
      break;
    case SessionType::kCollaboration:
      flags.requires_member = true;
      flags.required_member_type = MemberType::kCollaboration;
      flags.bypasses_weekly_quota = true;
      flags.counts_toward_capacity = true;
      break;
    case SessionType::kMakeup:
      flags.requires_member = true;
      flags.bypasses_weekly_quota = true;
      flags.counts_toward_capacity = true;
      break;
    case SessionType::kNonBookable:
      flags.bypasses_weekly_quota = true;
      flags.takes_participants = false;
      break;
  }
  return flags;
}

}  // namespace scheduler
