/*
 * 설명: 예약 오케스트레이터. 세션 유형 정책, 충돌 권고, 주간 한도, 정원 상태 기계를 묶어
 *       예약 생성과 상태 변경을 세션 단위 트랜잭션 하나로 실행한다. 세션 저장소를 쓰는 유일한 진입점이다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/booking_validation_test.cpp, server/tests/it/booking_it_test.cpp
 */
#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "scheduler/availability.hpp"
#include "scheduler/capacity.hpp"
#include "scheduler/db_client.hpp"
#include "scheduler/engine_error.hpp"
#include "scheduler/notification.hpp"
#include "scheduler/observability.hpp"
#include "scheduler/session_policy.hpp"
#include "scheduler/session_repository.hpp"
#include "scheduler/weekly_quota.hpp"

namespace scheduler {

struct ParticipantRequest {
  std::optional<std::int64_t> member_id;
  GuestInfo guest;
  std::optional<TrialMemberDraft> trial_member;
};

struct BookingRequest {
  SessionType session_type{SessionType::kMember};
  std::int64_t machine_id{0};
  std::optional<std::int64_t> trainer_id;
  Timestamp scheduled_start;
  Timestamp scheduled_end;
  int max_participants{1};
  ParticipantRequest participant;
  std::string notes;
};

struct BookingConfirmation {
  SessionRecord session;
  std::optional<ParticipantRecord> participant;
  std::optional<std::int64_t> created_member_id;
  std::vector<AvailabilityResult> advisories;
  std::optional<QuotaStatus> quota;
};

struct StatusChange {
  SessionRecord session;
  std::optional<ParticipantRecord> participant;
  std::vector<ParticipantRecord> promoted;
};

struct ReconcileReport {
  std::size_t checked{0};
  std::size_t repaired{0};
};

// 저장소를 건드리지 않는 요청 형태 검사. 실패 시 EngineError(kValidation).
void ValidateBookingRequest(const BookingRequest& request, const PolicyFlags& flags);
void ValidateParticipantRequest(const ParticipantRequest& request, const PolicyFlags& flags);

// 세션 상태는 scheduled -> in_progress -> completed 로만 진행하며, 진행 중까지는 cancelled 로 끝낼 수 있다.
bool IsSessionTransitionAllowed(SessionStatus from, SessionStatus to);

nlohmann::json ToJson(const BookingError& error);

class BookingService {
 public:
  BookingService(std::shared_ptr<MariaDbClient> db_client, std::shared_ptr<SessionRepository> repository,
                 std::shared_ptr<AvailabilityChecker> availability, std::shared_ptr<WeeklyQuotaChecker> quota,
                 std::shared_ptr<NotificationSink> notifier, std::shared_ptr<Observability> observability);

  Outcome<BookingConfirmation> CreateBooking(const BookingRequest& request);
  Outcome<StatusChange> AddParticipant(std::int64_t session_id, const ParticipantRequest& request);
  Outcome<StatusChange> UpdateParticipantStatus(std::int64_t session_id, std::int64_t member_id, BookingStatus next);
  Outcome<StatusChange> UpdateParticipantStatusById(std::int64_t session_id, std::int64_t participant_id,
                                                    BookingStatus next);
  Outcome<StatusChange> RemoveFromWaitlist(std::int64_t session_id, std::int64_t participant_id);
  Outcome<StatusChange> UpdateSessionCapacity(std::int64_t session_id, int max_participants);
  Outcome<SessionRecord> UpdateSessionStatus(std::int64_t session_id, SessionStatus next);
  Outcome<std::int64_t> DeleteSession(std::int64_t session_id);
  Outcome<SessionLedger> GetSession(std::int64_t session_id) const;
  Outcome<ReconcileReport> Reconcile();

 private:
  template <typename T>
  Outcome<T> Guard(const char* operation, const std::function<T(std::string&)>& body) const;

  Outcome<StatusChange> MutateLedger(const char* operation, std::int64_t session_id,
                                     const std::function<TransitionOutcome(MYSQL*, SessionLedger&)>& transition);
  void ValidateMember(std::int64_t member_id, const PolicyFlags& flags) const;
  void Dispatch(const std::vector<NotificationEvent>& events) const;

  std::shared_ptr<MariaDbClient> db_client_;
  std::shared_ptr<SessionRepository> repository_;
  std::shared_ptr<AvailabilityChecker> availability_;
  std::shared_ptr<WeeklyQuotaChecker> quota_;
  std::shared_ptr<NotificationSink> notifier_;
  std::shared_ptr<Observability> observability_;
  CapacityStateMachine state_machine_;
};

}  // namespace scheduler
