/*
 * 설명: 세션 유형별 예약 규칙(회원 필요/회원 생성/주간 한도 우회/정원 집계)을 단일 표로 제공한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/session_policy_test.cpp
 */
#pragma once

#include <array>
#include <optional>

#include "scheduler/model.hpp"

namespace scheduler {

struct PolicyFlags {
  bool requires_member{false};
  bool creates_member{false};
  bool bypasses_weekly_quota{false};
  bool counts_toward_capacity{false};
  // 기존 회원이 특정 유형이어야 하는 경우(contractual -> trial, collaboration -> collaboration).
  std::optional<MemberType> required_member_type;
  // 회원 대신 게스트 정보를 직접 받는 유형.
  bool is_guest{false};
  // 참가자 행을 만들지 않는 시간 차단용 유형.
  bool takes_participants{true};
};

constexpr std::array<SessionType, 7> kAllSessionTypes{
    SessionType::kTrial,         SessionType::kMember, SessionType::kContractual, SessionType::kMultiSite,
    SessionType::kCollaboration, SessionType::kMakeup, SessionType::kNonBookable};

PolicyFlags Classify(SessionType type);

}  // namespace scheduler
