/*
 * 설명: 정원/대기열 상태 기계를 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/capacity_state_machine_test.cpp, server/tests/it/booking_it_test.cpp
 */
#include "scheduler/capacity.hpp"

#include <algorithm>
#include <utility>
#include <sstream>

#include "scheduler/engine_error.hpp"

namespace scheduler {
namespace {
void MarkChanged(TransitionOutcome& outcome, std::size_t index) {
  if (std::find(outcome.changed.begin(), outcome.changed.end(), index) == outcome.changed.end()) {
    outcome.changed.push_back(index);
  }
}

bool AcceptsPromotion(const SessionRecord& session) {
  return session.status == SessionStatus::kScheduled || session.status == SessionStatus::kInProgress;
}

int CountConfirmed(const SessionLedger& ledger) {
  return static_cast<int>(std::count_if(ledger.participants.begin(), ledger.participants.end(),
                                        [](const ParticipantRecord& p) { return p.status == BookingStatus::kConfirmed; }));
}

[[noreturn]] void RejectTransition(BookingStatus from, BookingStatus to) {
  std::ostringstream oss;
  oss << "허용되지 않는 상태 전이입니다: " << ToString(from) << " -> " << ToString(to);
  throw EngineError(ErrorKind::kValidation, "invalid_transition", oss.str());
}
}  // namespace

std::string_view ToString(NotificationType type) {
  return type == NotificationType::kWaitlistAssigned ? "waitlist_assigned" : "waitlist_promoted";
}

TransitionOutcome CapacityStateMachine::Admit(SessionLedger& ledger, ParticipantRecord candidate) const {
  if (!AcceptsPromotion(ledger.session)) {
    throw EngineError(ErrorKind::kValidation, "session_closed", "취소되었거나 종료된 세션에는 예약할 수 없습니다");
  }
  if (candidate.member_id) {
    for (const auto& existing : ledger.participants) {
      if (existing.member_id == candidate.member_id && !IsTerminal(existing.status)) {
        throw EngineError(ErrorKind::kValidation, "duplicate_booking", "이미 이 세션에 예약된 회원입니다");
      }
    }
  }

  TransitionOutcome outcome;
  candidate.id = 0;
  candidate.session_id = ledger.session.id;
  if (ledger.session.current_participants < ledger.session.max_participants) {
    candidate.status = BookingStatus::kConfirmed;
    candidate.waitlist_position.reset();
    ledger.session.current_participants += 1;
    outcome.session_changed = true;
  } else {
    candidate.status = BookingStatus::kWaitlisted;
    candidate.waitlist_position = NextWaitlistPosition(ledger);
    outcome.waitlist_assigned = true;
  }
  ledger.participants.push_back(std::move(candidate));
  outcome.target = ledger.participants.size() - 1;
  MarkChanged(outcome, *outcome.target);
  return outcome;
}

TransitionOutcome CapacityStateMachine::ChangeStatus(SessionLedger& ledger, std::size_t index,
                                                     BookingStatus next) const {
  TransitionOutcome outcome;
  outcome.target = index;
  auto& row = ledger.participants.at(index);
  if (row.status == next) {
    return outcome;
  }
  if (IsTerminal(row.status)) {
    RejectTransition(row.status, next);
  }

  if (row.status == BookingStatus::kConfirmed) {
    if (next == BookingStatus::kWaitlisted) {
      RejectTransition(row.status, next);
    }
    row.status = next;
    MarkChanged(outcome, index);
    if (ledger.session.current_participants > 0) {
      ledger.session.current_participants -= 1;
    }
    outcome.session_changed = true;
    PromoteWhileSeatsFree(ledger, outcome);
    return outcome;
  }

  // waitlisted
  int vacated = row.waitlist_position.value_or(0);
  if (next == BookingStatus::kConfirmed) {
    if (!AcceptsPromotion(ledger.session) ||
        ledger.session.current_participants >= ledger.session.max_participants) {
      throw EngineError(ErrorKind::kCapacity, "session_full", "세션 정원이 가득 차 확정할 수 없습니다");
    }
    row.status = BookingStatus::kConfirmed;
    row.waitlist_position.reset();
    ledger.session.current_participants += 1;
    outcome.session_changed = true;
    outcome.promoted.push_back(index);
  } else {
    row.status = next;
    row.waitlist_position.reset();
  }
  MarkChanged(outcome, index);
  CloseGapAfter(ledger, vacated, outcome);
  return outcome;
}

TransitionOutcome CapacityStateMachine::RemoveFromWaitlist(SessionLedger& ledger, std::size_t index) const {
  const auto& row = ledger.participants.at(index);
  if (row.status != BookingStatus::kWaitlisted) {
    throw EngineError(ErrorKind::kValidation, "not_waitlisted", "대기열에 있는 참가자만 삭제할 수 있습니다");
  }
  TransitionOutcome outcome;
  int vacated = row.waitlist_position.value_or(0);
  outcome.removed = row;
  ledger.participants.erase(ledger.participants.begin() + static_cast<std::ptrdiff_t>(index));
  CloseGapAfter(ledger, vacated, outcome);
  return outcome;
}

TransitionOutcome CapacityStateMachine::ChangeCeiling(SessionLedger& ledger, int max_participants) const {
  if (max_participants < 1) {
    throw EngineError(ErrorKind::kValidation, "invalid_capacity", "max_participants는 1 이상이어야 합니다");
  }
  TransitionOutcome outcome;
  if (ledger.session.max_participants != max_participants) {
    ledger.session.max_participants = max_participants;
    outcome.session_changed = true;
  }
  PromoteWhileSeatsFree(ledger, outcome);
  return outcome;
}

TransitionOutcome CapacityStateMachine::Repair(SessionLedger& ledger) const {
  TransitionOutcome outcome;
  int confirmed = CountConfirmed(ledger);
  if (ledger.session.current_participants != confirmed) {
    ledger.session.current_participants = confirmed;
    outcome.session_changed = true;
  }

  std::vector<std::size_t> waitlisted;
  for (std::size_t i = 0; i < ledger.participants.size(); ++i) {
    auto& p = ledger.participants[i];
    if (p.status == BookingStatus::kWaitlisted) {
      waitlisted.push_back(i);
    } else if (p.waitlist_position) {
      p.waitlist_position.reset();
      MarkChanged(outcome, i);
    }
  }
  // 기존 순번을 최대한 보존하고, 순번이 없는 행은 먼저 예약된(id가 작은) 순서로 뒤에 붙인다.
  std::stable_sort(waitlisted.begin(), waitlisted.end(), [&](std::size_t a, std::size_t b) {
    const auto& pa = ledger.participants[a];
    const auto& pb = ledger.participants[b];
    if (pa.waitlist_position.has_value() != pb.waitlist_position.has_value()) {
      return pa.waitlist_position.has_value();
    }
    if (pa.waitlist_position && *pa.waitlist_position != *pb.waitlist_position) {
      return *pa.waitlist_position < *pb.waitlist_position;
    }
    return pa.id < pb.id;
  });
  int expected = 1;
  for (auto i : waitlisted) {
    auto& p = ledger.participants[i];
    if (p.waitlist_position != expected) {
      p.waitlist_position = expected;
      MarkChanged(outcome, i);
    }
    ++expected;
  }
  PromoteWhileSeatsFree(ledger, outcome);
  return outcome;
}

void CapacityStateMachine::PromoteWhileSeatsFree(SessionLedger& ledger, TransitionOutcome& outcome) const {
  if (!AcceptsPromotion(ledger.session)) {
    return;
  }
  while (ledger.session.current_participants < ledger.session.max_participants) {
    std::optional<std::size_t> head;
    for (std::size_t i = 0; i < ledger.participants.size(); ++i) {
      const auto& p = ledger.participants[i];
      if (p.status != BookingStatus::kWaitlisted || !p.waitlist_position) {
        continue;
      }
      if (!head || *p.waitlist_position < *ledger.participants[*head].waitlist_position) {
        head = i;
      }
    }
    if (!head) {
      return;
    }
    auto& promoted = ledger.participants[*head];
    int vacated = *promoted.waitlist_position;
    promoted.status = BookingStatus::kConfirmed;
    promoted.waitlist_position.reset();
    ledger.session.current_participants += 1;
    outcome.session_changed = true;
    outcome.promoted.push_back(*head);
    MarkChanged(outcome, *head);
    CloseGapAfter(ledger, vacated, outcome);
  }
}

void CapacityStateMachine::CloseGapAfter(SessionLedger& ledger, int vacated_position,
                                         TransitionOutcome& outcome) const {
  if (vacated_position <= 0) {
    return;
  }
  for (std::size_t i = 0; i < ledger.participants.size(); ++i) {
    auto& p = ledger.participants[i];
    if (p.status == BookingStatus::kWaitlisted && p.waitlist_position && *p.waitlist_position > vacated_position) {
      *p.waitlist_position -= 1;
      MarkChanged(outcome, i);
    }
  }
}

int CapacityStateMachine::NextWaitlistPosition(const SessionLedger& ledger) const {
  int highest = 0;
  for (const auto& p : ledger.participants) {
    if (p.status == BookingStatus::kWaitlisted && p.waitlist_position) {
      highest = std::max(highest, *p.waitlist_position);
    }
  }
  return highest + 1;
}

std::vector<NotificationEvent> CollectEvents(const SessionLedger& ledger, const TransitionOutcome& outcome) {
  std::vector<NotificationEvent> events;
  if (outcome.waitlist_assigned && outcome.target) {
    const auto& row = ledger.participants.at(*outcome.target);
    events.push_back(NotificationEvent{NotificationType::kWaitlistAssigned, ledger.session.id, row.id, row.member_id,
                                       row.waitlist_position});
  }
  for (auto index : outcome.promoted) {
    const auto& row = ledger.participants.at(index);
    events.push_back(
        NotificationEvent{NotificationType::kWaitlistPromoted, ledger.session.id, row.id, row.member_id, std::nullopt});
  }
  return events;
}

LedgerCheck CheckLedgerInvariants(const SessionLedger& ledger) {
  LedgerCheck check;
  auto fail = [&check](const std::string& violation) {
    check.consistent = false;
    check.violations.push_back(violation);
  };

  int confirmed = CountConfirmed(ledger);
  if (confirmed != ledger.session.current_participants) {
    std::ostringstream oss;
    oss << "current_participants=" << ledger.session.current_participants << " confirmed=" << confirmed;
    fail(oss.str());
  }

  std::vector<int> positions;
  for (const auto& p : ledger.participants) {
    if (p.status == BookingStatus::kWaitlisted) {
      if (!p.waitlist_position) {
        fail("waitlisted participant " + std::to_string(p.id) + " has no position");
        continue;
      }
      positions.push_back(*p.waitlist_position);
    } else if (p.waitlist_position) {
      fail("participant " + std::to_string(p.id) + " keeps a position outside the waitlist");
    }
  }
  std::sort(positions.begin(), positions.end());
  for (std::size_t i = 0; i < positions.size(); ++i) {
    if (positions[i] != static_cast<int>(i) + 1) {
      fail("waitlist positions are not contiguous from 1");
      break;
    }
  }
  if (AcceptsPromotion(ledger.session) && confirmed < ledger.session.max_participants && !positions.empty()) {
    std::ostringstream oss;
    oss << "free seat (" << confirmed << "/" << ledger.session.max_participants << ") while " << positions.size()
        << " participant(s) wait";
    fail(oss.str());
  }
  return check;
}

std::optional<std::size_t> FindParticipantByMember(const SessionLedger& ledger, std::int64_t member_id) {
  std::optional<std::size_t> latest;
  for (std::size_t i = 0; i < ledger.participants.size(); ++i) {
    const auto& p = ledger.participants[i];
    if (p.member_id != member_id) {
      continue;
    }
    if (!IsTerminal(p.status)) {
      return i;
    }
    latest = i;
  }
  return latest;
}

std::optional<std::size_t> FindParticipantById(const SessionLedger& ledger, std::int64_t participant_id) {
  for (std::size_t i = 0; i < ledger.participants.size(); ++i) {
    if (ledger.participants[i].id == participant_id) {
      return i;
    }
  }
  return std::nullopt;
}

}  // namespace scheduler
