/*
 * 설명: 예약 생성, 참가자 상태 변경, 세션 편집, 정합성 복구를 세션 단위 트랜잭션으로 실행한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/booking_validation_test.cpp, server/tests/it/booking_it_test.cpp
 */
#include "scheduler/booking_service.hpp"

#include <chrono>
#include <exception>
#include <sstream>
#include <utility>

#include "scheduler/time_util.hpp"

namespace scheduler {
namespace {
bool HasText(const std::string& value) { return value.find_first_not_of(" \t\r\n") != std::string::npos; }

int SessionStatusRank(SessionStatus status) {
  switch (status) {
    case SessionStatus::kScheduled:
      return 0;
    case SessionStatus::kInProgress:
      return 1;
    case SessionStatus::kCompleted:
      return 2;
    case SessionStatus::kCancelled:
      return 3;
  }
  return 0;
}

[[noreturn]] void RaiseValidation(const std::string& code, const std::string& message) {
  throw EngineError(ErrorKind::kValidation, code, message);
}

[[noreturn]] void RaiseSessionNotFound(std::int64_t session_id) {
  throw EngineError(ErrorKind::kNotFound, "session_not_found",
                    "세션을 찾을 수 없습니다: " + std::to_string(session_id));
}

StatusChange BuildChange(const SessionLedger& ledger, const TransitionOutcome& outcome) {
  StatusChange change;
  change.session = ledger.session;
  if (outcome.target) {
    change.participant = ledger.participants.at(*outcome.target);
  } else if (outcome.removed) {
    change.participant = outcome.removed;
  }
  for (auto index : outcome.promoted) {
    change.promoted.push_back(ledger.participants.at(index));
  }
  return change;
}

long ElapsedMs(std::chrono::steady_clock::time_point started) {
  return static_cast<long>(
      std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - started).count());
}
}  // namespace

void ValidateParticipantRequest(const ParticipantRequest& request, const PolicyFlags& flags) {
  if (!flags.takes_participants) {
    RaiseValidation("participants_not_allowed", "이 세션 유형은 참가자를 받지 않습니다");
  }
  if (flags.requires_member && (!request.member_id || *request.member_id <= 0)) {
    RaiseValidation("missing_member", "이 세션 유형은 회원 id가 필요합니다");
  }
  if (flags.is_guest && (!HasText(request.guest.first_name) || !HasText(request.guest.last_name))) {
    RaiseValidation("missing_guest", "게스트 예약에는 이름과 성이 필요합니다");
  }
  if (flags.creates_member) {
    if (!request.trial_member || !HasText(request.trial_member->first_name) ||
        !HasText(request.trial_member->last_name)) {
      RaiseValidation("missing_trial_member", "체험 예약에는 새 회원의 이름과 성이 필요합니다");
    }
  }
}

void ValidateBookingRequest(const BookingRequest& request, const PolicyFlags& flags) {
  if (TruncateToMillis(request.scheduled_end) <= TruncateToMillis(request.scheduled_start)) {
    RaiseValidation("invalid_interval", "종료 시각은 시작 시각보다 늦어야 합니다");
  }
  if (request.max_participants < 1) {
    RaiseValidation("invalid_capacity", "max_participants는 1 이상이어야 합니다");
  }
  if (request.machine_id <= 0) {
    RaiseValidation("missing_machine", "머신 id가 필요합니다");
  }
  if (request.trainer_id && *request.trainer_id <= 0) {
    RaiseValidation("invalid_trainer", "트레이너 id는 양수여야 합니다");
  }
  if (flags.takes_participants) {
    ValidateParticipantRequest(request.participant, flags);
  }
}

bool IsSessionTransitionAllowed(SessionStatus from, SessionStatus to) {
  if (from == SessionStatus::kCompleted || from == SessionStatus::kCancelled) {
    return false;
  }
  if (to == SessionStatus::kCancelled) {
    return true;
  }
  return SessionStatusRank(to) > SessionStatusRank(from);
}

nlohmann::json ToJson(const BookingError& error) {
  return {{"kind", ToString(error.kind)}, {"step", error.step}, {"retryable", error.retryable}};
}

BookingService::BookingService(std::shared_ptr<MariaDbClient> db_client, std::shared_ptr<SessionRepository> repository,
                               std::shared_ptr<AvailabilityChecker> availability,
                               std::shared_ptr<WeeklyQuotaChecker> quota, std::shared_ptr<NotificationSink> notifier,
                               std::shared_ptr<Observability> observability)
    : db_client_(std::move(db_client)),
      repository_(std::move(repository)),
      availability_(std::move(availability)),
      quota_(std::move(quota)),
      notifier_(std::move(notifier)),
      observability_(std::move(observability)) {}

template <typename T>
Outcome<T> BookingService::Guard(const char* operation, const std::function<T(std::string&)>& body) const {
  std::string step = "classify";
  BookingError error;
  try {
    return Outcome<T>::Success(body(step));
  } catch (const EngineError& ex) {
    error = BookingError{ex.kind, ex.code, ex.what(), step, ex.kind == ErrorKind::kConcurrency};
  } catch (const DbException& ex) {
    if (ex.retryable) {
      error = BookingError{ErrorKind::kConcurrency, "transaction_conflict",
                           std::string("세션 잠금 경합으로 요청을 완료하지 못했습니다: ") + ex.what(), step, true};
    } else {
      std::ostringstream oss;
      oss << "저장소 오류(" << ex.code << "): " << ex.what();
      error = BookingError{ErrorKind::kInternal, "store_failure", oss.str(), step, false};
    }
  } catch (const std::exception& ex) {
    error = BookingError{ErrorKind::kInternal, "internal_error", std::string("예상하지 못한 오류: ") + ex.what(), step,
                         false};
  }
  observability_->Warn(std::string(operation) + ".rejected", {{"code", error.code},
                                                              {"kind", ToString(error.kind)},
                                                              {"step", error.step},
                                                              {"message", error.message}});
  return Outcome<T>::Failure(std::move(error));
}

void BookingService::ValidateMember(std::int64_t member_id, const PolicyFlags& flags) const {
  auto member = repository_->FindMember(member_id);
  if (!member) {
    throw EngineError(ErrorKind::kNotFound, "member_not_found", "회원을 찾을 수 없습니다: " + std::to_string(member_id));
  }
  if (flags.required_member_type && member->member_type != *flags.required_member_type) {
    std::ostringstream oss;
    oss << "이 세션 유형은 " << ToString(*flags.required_member_type) << " 회원만 예약할 수 있습니다 (현재: "
        << ToString(member->member_type) << ")";
    RaiseValidation("member_type_mismatch", oss.str());
  }
}

void BookingService::Dispatch(const std::vector<NotificationEvent>& events) const {
  for (const auto& event : events) {
    try {
      notifier_->Publish(event);
    } catch (const std::exception& ex) {
      observability_->Warn("notification.failed", {{"type", ToString(event.type)},
                                                   {"sessionId", event.session_id},
                                                   {"participantId", event.participant_id},
                                                   {"error", ex.what()}});
      continue;
    }
    LogContext ctx;
    ctx.name = "notification.dispatched";
    ctx.session_id = event.session_id;
    ctx.member_id = event.member_id;
    ctx.detail = {{"type", ToString(event.type)}, {"participantId", event.participant_id}};
    observability_->Log(ctx);
  }
}

Outcome<BookingConfirmation> BookingService::CreateBooking(const BookingRequest& request) {
  auto started = std::chrono::steady_clock::now();
  std::vector<NotificationEvent> events;
  auto outcome = Guard<BookingConfirmation>("booking.create", [&](std::string& step) {
    auto flags = Classify(request.session_type);

    step = "validate";
    ValidateBookingRequest(request, flags);
    auto machine = repository_->FindMachine(request.machine_id);
    if (!machine) {
      throw EngineError(ErrorKind::kNotFound, "machine_not_found",
                        "머신을 찾을 수 없습니다: " + std::to_string(request.machine_id));
    }
    if (!machine->is_available) {
      RaiseValidation("machine_unavailable", "사용 중지된 머신입니다: " + machine->name);
    }
    if (flags.requires_member) {
      ValidateMember(*request.participant.member_id, flags);
    }

    BookingConfirmation confirmation;
    step = "availability";
    if (request.trainer_id) {
      confirmation.advisories.push_back(availability_->Check({ResourceKind::kTrainer, *request.trainer_id},
                                                             request.scheduled_start, request.scheduled_end));
    }
    confirmation.advisories.push_back(availability_->Check({ResourceKind::kMachine, request.machine_id},
                                                           request.scheduled_start, request.scheduled_end));

    step = "quota";
    if (!flags.bypasses_weekly_quota) {
      auto quota = quota_->CheckStudioQuota(request.scheduled_start);
      confirmation.quota = quota;
      if (!quota.can_book) {
        std::ostringstream oss;
        oss << "이번 주 스튜디오 세션 한도에 도달했습니다 (" << quota.current_count << "/" << quota.max_allowed << ")";
        throw EngineError(ErrorKind::kCapacity, "weekly_quota_exceeded", oss.str());
      }
    }

    step = "write";
    db_client_->ExecuteTransactionWithRetry([&](MYSQL* conn) {
      SessionLedger ledger;
      ledger.session.machine_id = request.machine_id;
      ledger.session.trainer_id = request.trainer_id;
      ledger.session.scheduled_start = TruncateToMillis(request.scheduled_start);
      ledger.session.scheduled_end = TruncateToMillis(request.scheduled_end);
      ledger.session.status = SessionStatus::kScheduled;
      ledger.session.session_type = request.session_type;
      ledger.session.max_participants = request.max_participants;
      ledger.session.current_participants = 0;
      ledger.session.notes = request.notes;

      confirmation.created_member_id.reset();
      confirmation.participant.reset();
      events.clear();

      std::optional<std::int64_t> member_id;
      if (flags.requires_member) {
        member_id = request.participant.member_id;
      }
      if (flags.creates_member) {
        member_id = repository_->InsertTrialMember(conn, *request.participant.trial_member);
        confirmation.created_member_id = member_id;
      }
      ledger.session.id = repository_->InsertSession(conn, ledger.session);

      if (flags.takes_participants) {
        ParticipantRecord candidate;
        candidate.member_id = member_id;
        if (flags.is_guest) {
          candidate.guest = request.participant.guest;
        }
        auto result = state_machine_.Admit(ledger, candidate);
        repository_->PersistTransition(conn, ledger, result);
        confirmation.participant = ledger.participants.at(*result.target);
        events = CollectEvents(ledger, result);
      }
      confirmation.session = ledger.session;
      return true;
    });
    return confirmation;
  });

  if (outcome.ok()) {
    const auto& confirmation = *outcome.value;
    if (confirmation.participant) {
      observability_->RecordBooking(confirmation.participant->status == BookingStatus::kWaitlisted);
    }
    LogContext ctx;
    ctx.name = "booking.created";
    ctx.session_id = confirmation.session.id;
    if (confirmation.participant) {
      ctx.member_id = confirmation.participant->member_id;
    }
    ctx.latency_ms = ElapsedMs(started);
    ctx.detail = {{"sessionType", ToString(request.session_type)},
                  {"participantStatus",
                   confirmation.participant ? std::string(ToString(confirmation.participant->status)) : "none"}};
    observability_->Log(ctx);
    Dispatch(events);
  }
  return outcome;
}

Outcome<StatusChange> BookingService::MutateLedger(
    const char* operation, std::int64_t session_id,
    const std::function<TransitionOutcome(MYSQL*, SessionLedger&)>& transition) {
  auto started = std::chrono::steady_clock::now();
  std::vector<NotificationEvent> events;
  auto outcome = Guard<StatusChange>(operation, [&](std::string& step) {
    step = "write";
    StatusChange change;
    db_client_->ExecuteTransactionWithRetry([&](MYSQL* conn) {
      auto ledger = repository_->LockLedger(conn, session_id);
      if (!ledger) {
        RaiseSessionNotFound(session_id);
      }
      auto result = transition(conn, *ledger);
      repository_->PersistTransition(conn, *ledger, result);
      change = BuildChange(*ledger, result);
      events = CollectEvents(*ledger, result);
      return true;
    });
    return change;
  });

  if (outcome.ok()) {
    const auto& change = *outcome.value;
    observability_->RecordPromotions(change.promoted.size());
    LogContext ctx;
    ctx.name = operation;
    ctx.session_id = session_id;
    if (change.participant) {
      ctx.member_id = change.participant->member_id;
    }
    ctx.latency_ms = ElapsedMs(started);
    ctx.detail = {{"currentParticipants", change.session.current_participants},
                  {"maxParticipants", change.session.max_participants},
                  {"promoted", change.promoted.size()}};
    observability_->Log(ctx);
    Dispatch(events);
  }
  return outcome;
}

Outcome<StatusChange> BookingService::AddParticipant(std::int64_t session_id, const ParticipantRequest& request) {
  auto outcome = MutateLedger("participant.added", session_id, [&](MYSQL* conn, SessionLedger& ledger) {
    auto flags = Classify(ledger.session.session_type);
    ValidateParticipantRequest(request, flags);
    std::optional<std::int64_t> member_id;
    if (flags.requires_member) {
      ValidateMember(*request.member_id, flags);
      member_id = request.member_id;
    }
    if (flags.creates_member) {
      member_id = repository_->InsertTrialMember(conn, *request.trial_member);
    }
    ParticipantRecord candidate;
    candidate.member_id = member_id;
    if (flags.is_guest) {
      candidate.guest = request.guest;
    }
    return state_machine_.Admit(ledger, candidate);
  });
  if (outcome.ok() && outcome.value->participant) {
    observability_->RecordBooking(outcome.value->participant->status == BookingStatus::kWaitlisted);
  }
  return outcome;
}

Outcome<StatusChange> BookingService::UpdateParticipantStatus(std::int64_t session_id, std::int64_t member_id,
                                                              BookingStatus next) {
  return MutateLedger("participant.status_changed", session_id, [&](MYSQL*, SessionLedger& ledger) {
    auto index = FindParticipantByMember(ledger, member_id);
    if (!index) {
      throw EngineError(ErrorKind::kNotFound, "participant_not_found",
                        "세션에 해당 회원의 예약이 없습니다: " + std::to_string(member_id));
    }
    return state_machine_.ChangeStatus(ledger, *index, next);
  });
}

Outcome<StatusChange> BookingService::UpdateParticipantStatusById(std::int64_t session_id,
                                                                  std::int64_t participant_id, BookingStatus next) {
  return MutateLedger("participant.status_changed", session_id, [&](MYSQL*, SessionLedger& ledger) {
    auto index = FindParticipantById(ledger, participant_id);
    if (!index) {
      throw EngineError(ErrorKind::kNotFound, "participant_not_found",
                        "참가자를 찾을 수 없습니다: " + std::to_string(participant_id));
    }
    return state_machine_.ChangeStatus(ledger, *index, next);
  });
}

Outcome<StatusChange> BookingService::RemoveFromWaitlist(std::int64_t session_id, std::int64_t participant_id) {
  return MutateLedger("waitlist.removed", session_id, [&](MYSQL*, SessionLedger& ledger) {
    auto index = FindParticipantById(ledger, participant_id);
    if (!index) {
      throw EngineError(ErrorKind::kNotFound, "participant_not_found",
                        "참가자를 찾을 수 없습니다: " + std::to_string(participant_id));
    }
    return state_machine_.RemoveFromWaitlist(ledger, *index);
  });
}

Outcome<StatusChange> BookingService::UpdateSessionCapacity(std::int64_t session_id, int max_participants) {
  return MutateLedger("session.capacity_changed", session_id, [&](MYSQL*, SessionLedger& ledger) {
    return state_machine_.ChangeCeiling(ledger, max_participants);
  });
}

Outcome<SessionRecord> BookingService::UpdateSessionStatus(std::int64_t session_id, SessionStatus next) {
  auto outcome = Guard<SessionRecord>("session.status_changed", [&](std::string& step) {
    step = "write";
    SessionRecord session;
    db_client_->ExecuteTransactionWithRetry([&](MYSQL* conn) {
      auto ledger = repository_->LockLedger(conn, session_id);
      if (!ledger) {
        RaiseSessionNotFound(session_id);
      }
      session = ledger->session;
      if (session.status == next) {
        return false;
      }
      if (!IsSessionTransitionAllowed(session.status, next)) {
        std::ostringstream oss;
        oss << "허용되지 않는 세션 상태 전이입니다: " << ToString(session.status) << " -> " << ToString(next);
        RaiseValidation("invalid_transition", oss.str());
      }
      repository_->UpdateSessionStatus(conn, session_id, next);
      session.status = next;
      return true;
    });
    return session;
  });
  if (outcome.ok()) {
    LogContext ctx;
    ctx.name = "session.status_changed";
    ctx.session_id = session_id;
    ctx.detail = {{"status", ToString(outcome.value->status)}};
    observability_->Log(ctx);
  }
  return outcome;
}

Outcome<std::int64_t> BookingService::DeleteSession(std::int64_t session_id) {
  auto outcome = Guard<std::int64_t>("session.deleted", [&](std::string& step) {
    step = "write";
    db_client_->ExecuteTransactionWithRetry([&](MYSQL* conn) {
      if (!repository_->LockLedger(conn, session_id)) {
        RaiseSessionNotFound(session_id);
      }
      repository_->DeleteSessionCascade(conn, session_id);
      return true;
    });
    return session_id;
  });
  if (outcome.ok()) {
    LogContext ctx;
    ctx.name = "session.deleted";
    ctx.session_id = session_id;
    observability_->Log(ctx);
  }
  return outcome;
}

Outcome<SessionLedger> BookingService::GetSession(std::int64_t session_id) const {
  return Guard<SessionLedger>("session.read", [&](std::string& step) {
    step = "validate";
    auto ledger = repository_->LoadLedger(session_id);
    if (!ledger) {
      RaiseSessionNotFound(session_id);
    }
    return *ledger;
  });
}

Outcome<ReconcileReport> BookingService::Reconcile() {
  auto started = std::chrono::steady_clock::now();
  auto outcome = Guard<ReconcileReport>("ops.reconcile", [&](std::string& step) {
    step = "write";
    ReconcileReport report;
    for (auto session_id : repository_->ListSessionIds()) {
      ++report.checked;
      std::vector<std::string> violations;
      std::vector<NotificationEvent> events;
      bool repaired = db_client_->ExecuteTransactionWithRetry([&](MYSQL* conn) {
        violations.clear();
        events.clear();
        auto ledger = repository_->LockLedger(conn, session_id);
        if (!ledger) {
          return false;
        }
        auto check = CheckLedgerInvariants(*ledger);
        if (check.consistent) {
          return false;
        }
        violations = check.violations;
        auto result = state_machine_.Repair(*ledger);
        repository_->PersistTransition(conn, *ledger, result);
        events = CollectEvents(*ledger, result);
        return true;
      });
      if (repaired) {
        ++report.repaired;
        observability_->RecordReconcileRepair();
        observability_->RecordPromotions(events.size());
        observability_->Warn("reconcile.repaired",
                             {{"sessionId", session_id}, {"violations", violations}, {"promoted", events.size()}});
        Dispatch(events);
      }
    }
    return report;
  });
  if (outcome.ok()) {
    LogContext ctx;
    ctx.name = "reconcile.completed";
    ctx.latency_ms = ElapsedMs(started);
    ctx.detail = {{"checked", outcome.value->checked}, {"repaired", outcome.value->repaired}};
    observability_->Log(ctx);
  }
  return outcome;
}

}  // namespace scheduler
