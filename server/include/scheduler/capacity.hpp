/*
 * 설명: 세션 하나의 참가자 상태(확정/대기/취소/노쇼), 정원, 대기 순번, 승격을 관리하는 상태 기계.
 *       잠금된 세션 장부(세션 행 + 참가자 행)를 받아 변경된 행과 알림 이벤트를 돌려준다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/capacity_state_machine_test.cpp, server/tests/it/booking_it_test.cpp
 */
#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "scheduler/model.hpp"

namespace scheduler {

struct SessionLedger {
  SessionRecord session;
  std::vector<ParticipantRecord> participants;
};

enum class NotificationType { kWaitlistAssigned, kWaitlistPromoted };

std::string_view ToString(NotificationType type);

struct NotificationEvent {
  NotificationType type{NotificationType::kWaitlistAssigned};
  std::int64_t session_id{0};
  std::int64_t participant_id{0};
  std::optional<std::int64_t> member_id;
  std::optional<int> position;
};

// 전이 한 번의 결과. 인덱스는 전이 이후의 ledger.participants 기준이다.
struct TransitionOutcome {
  std::optional<std::size_t> target;
  std::vector<std::size_t> changed;
  std::vector<std::size_t> promoted;
  std::optional<ParticipantRecord> removed;
  bool session_changed{false};
  bool waitlist_assigned{false};
};

struct LedgerCheck {
  bool consistent{true};
  std::vector<std::string> violations;
};

class CapacityStateMachine {
 public:
  TransitionOutcome Admit(SessionLedger& ledger, ParticipantRecord candidate) const;
  TransitionOutcome ChangeStatus(SessionLedger& ledger, std::size_t index, BookingStatus next) const;
  TransitionOutcome RemoveFromWaitlist(SessionLedger& ledger, std::size_t index) const;
  TransitionOutcome ChangeCeiling(SessionLedger& ledger, int max_participants) const;

  // 카운터를 확정 행 수로 다시 맞추고 대기 순번을 1..k로 재부여한 뒤, 남는 자리가 있으면 대기열 앞부터 승격한다.
  TransitionOutcome Repair(SessionLedger& ledger) const;

 private:
  void PromoteWhileSeatsFree(SessionLedger& ledger, TransitionOutcome& outcome) const;
  void CloseGapAfter(SessionLedger& ledger, int vacated_position, TransitionOutcome& outcome) const;
  int NextWaitlistPosition(const SessionLedger& ledger) const;
};

// 전이 결과에서 알림 이벤트를 만든다. 새 행의 id가 채워진 뒤(저장 이후)에 호출해야 한다.
std::vector<NotificationEvent> CollectEvents(const SessionLedger& ledger, const TransitionOutcome& outcome);

LedgerCheck CheckLedgerInvariants(const SessionLedger& ledger);

std::optional<std::size_t> FindParticipantByMember(const SessionLedger& ledger, std::int64_t member_id);
std::optional<std::size_t> FindParticipantById(const SessionLedger& ledger, std::int64_t participant_id);

}  // namespace scheduler
