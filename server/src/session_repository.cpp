/*
 * 설명: 세션/참가자 장부 잠금, 전이 반영, 조회 질의를 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md, db/schema.sql
 * 테스트: server/tests/it/booking_it_test.cpp
 */
#include "scheduler/session_repository.hpp"

#include <cstdlib>
#include <sstream>

#include "scheduler/time_util.hpp"

namespace scheduler {
namespace {
constexpr const char* kSessionColumns =
    "id, machine_id, trainer_id, scheduled_start, scheduled_end, status, session_type, max_participants, "
    "current_participants, notes";
constexpr const char* kParticipantColumns =
    "id, session_id, member_id, guest_first_name, guest_last_name, guest_gym_name, booking_status, waitlist_position";

std::int64_t ToInt64(const char* value) { return value ? std::stoll(value) : 0; }
int ToInt(const char* value) { return value ? std::stoi(value) : 0; }
std::string ToText(const char* value) { return value ? std::string{value} : std::string{}; }

std::optional<std::int64_t> ToOptionalInt64(const char* value) {
  if (!value) {
    return std::nullopt;
  }
  return std::stoll(value);
}

template <typename T>
T Require(std::optional<T> parsed, const char* column, const char* raw) {
  if (!parsed) {
    throw DbException(std::string("알 수 없는 컬럼 값: ") + column + "=" + (raw ? raw : "NULL"), 0, false);
  }
  return *parsed;
}

std::string SqlNullable(const std::optional<std::int64_t>& value) {
  return value ? std::to_string(*value) : std::string{"NULL"};
}

std::string SqlNullable(const std::optional<int>& value) { return value ? std::to_string(*value) : std::string{"NULL"}; }
}  // namespace

SessionRepository::SessionRepository(std::shared_ptr<MariaDbClient> db_client) : db_client_(std::move(db_client)) {}

std::optional<SessionLedger> SessionRepository::LockLedger(MYSQL* conn, std::int64_t session_id) const {
  return ReadLedger(conn, session_id, true);
}

std::optional<SessionLedger> SessionRepository::ReadLedger(MYSQL* conn, std::int64_t session_id,
                                                           bool for_update) const {
  std::ostringstream oss;
  oss << "SELECT " << kSessionColumns << " FROM training_sessions WHERE id=" << session_id
      << (for_update ? " FOR UPDATE;" : ";");
  auto res = db_client_->Query(conn, oss.str(), "세션 조회 실패");
  MYSQL_ROW row = mysql_fetch_row(res.get());
  if (!row) {
    return std::nullopt;
  }
  SessionLedger ledger;
  ledger.session = BuildSession(row);
  res.reset();
  ledger.participants = LoadParticipants(conn, session_id, for_update);
  return ledger;
}

std::vector<ParticipantRecord> SessionRepository::LoadParticipants(MYSQL* conn, std::int64_t session_id,
                                                                   bool for_update) const {
  std::ostringstream oss;
  oss << "SELECT " << kParticipantColumns << " FROM training_session_members WHERE session_id=" << session_id
      << " ORDER BY id" << (for_update ? " FOR UPDATE;" : ";");
  auto res = db_client_->Query(conn, oss.str(), "참가자 조회 실패");
  std::vector<ParticipantRecord> participants;
  MYSQL_ROW row;
  while ((row = mysql_fetch_row(res.get())) != nullptr) {
    participants.push_back(BuildParticipant(row));
  }
  return participants;
}

std::int64_t SessionRepository::InsertSession(MYSQL* conn, const SessionRecord& session) const {
  std::ostringstream oss;
  oss << "INSERT INTO training_sessions(machine_id, trainer_id, scheduled_start, scheduled_end, status, session_type, "
         "max_participants, current_participants, notes) VALUES("
      << session.machine_id << ", " << SqlNullable(session.trainer_id) << ", '"
      << ToSqlDateTime(session.scheduled_start) << "', '" << ToSqlDateTime(session.scheduled_end) << "', '"
      << ToString(session.status) << "', '" << ToString(session.session_type) << "', " << session.max_participants
      << ", " << session.current_participants << ", ";
  if (session.notes.empty()) {
    oss << "NULL";
  } else {
    oss << "'" << db_client_->Escape(conn, session.notes) << "'";
  }
  oss << ");";
  db_client_->Execute(conn, oss.str(), "세션 저장 실패");
  return db_client_->LastInsertId(conn);
}

std::int64_t SessionRepository::InsertTrialMember(MYSQL* conn, const TrialMemberDraft& draft) const {
  std::ostringstream oss;
  oss << "INSERT INTO members(first_name, last_name, email, phone, member_type) VALUES('"
      << db_client_->Escape(conn, draft.first_name) << "', '" << db_client_->Escape(conn, draft.last_name) << "', ";
  oss << (draft.email.empty() ? std::string{"NULL"} : "'" + db_client_->Escape(conn, draft.email) + "'") << ", ";
  oss << (draft.phone.empty() ? std::string{"NULL"} : "'" + db_client_->Escape(conn, draft.phone) + "'");
  oss << ", 'trial');";
  db_client_->Execute(conn, oss.str(), "체험 회원 생성 실패");
  return db_client_->LastInsertId(conn);
}

void SessionRepository::PersistTransition(MYSQL* conn, SessionLedger& ledger,
                                          const TransitionOutcome& outcome) const {
  if (outcome.removed) {
    std::ostringstream oss;
    oss << "DELETE FROM training_session_members WHERE id=" << outcome.removed->id << ";";
    db_client_->Execute(conn, oss.str(), "대기 참가자 삭제 실패");
  }

  for (auto index : outcome.changed) {
    auto& row = ledger.participants.at(index);
    std::ostringstream oss;
    if (row.id == 0) {
      auto guest_value = [&](const std::string& value) {
        return value.empty() ? std::string{"NULL"} : "'" + db_client_->Escape(conn, value) + "'";
      };
      oss << "INSERT INTO training_session_members(session_id, member_id, guest_first_name, guest_last_name, "
             "guest_gym_name, booking_status, waitlist_position) VALUES("
          << ledger.session.id << ", " << SqlNullable(row.member_id) << ", " << guest_value(row.guest.first_name)
          << ", " << guest_value(row.guest.last_name) << ", " << guest_value(row.guest.gym_name) << ", '"
          << ToString(row.status) << "', " << SqlNullable(row.waitlist_position) << ");";
      db_client_->Execute(conn, oss.str(), "참가자 저장 실패");
      row.id = db_client_->LastInsertId(conn);
      row.session_id = ledger.session.id;
      continue;
    }
    oss << "UPDATE training_session_members SET booking_status='" << ToString(row.status)
        << "', waitlist_position=" << SqlNullable(row.waitlist_position) << ", updated_at=NOW(3) WHERE id=" << row.id
        << ";";
    db_client_->Execute(conn, oss.str(), "참가자 갱신 실패");
  }

  if (outcome.session_changed) {
    std::ostringstream oss;
    oss << "UPDATE training_sessions SET current_participants=" << ledger.session.current_participants
        << ", max_participants=" << ledger.session.max_participants << " WHERE id=" << ledger.session.id << ";";
    db_client_->Execute(conn, oss.str(), "세션 카운터 갱신 실패");
  }
}

void SessionRepository::UpdateSessionStatus(MYSQL* conn, std::int64_t session_id, SessionStatus status) const {
  std::ostringstream oss;
  oss << "UPDATE training_sessions SET status='" << ToString(status) << "' WHERE id=" << session_id << ";";
  db_client_->Execute(conn, oss.str(), "세션 상태 갱신 실패");
}

void SessionRepository::DeleteSessionCascade(MYSQL* conn, std::int64_t session_id) const {
  std::ostringstream participants;
  participants << "DELETE FROM training_session_members WHERE session_id=" << session_id << ";";
  db_client_->Execute(conn, participants.str(), "참가자 일괄 삭제 실패");
  std::ostringstream session;
  session << "DELETE FROM training_sessions WHERE id=" << session_id << ";";
  db_client_->Execute(conn, session.str(), "세션 삭제 실패");
}

std::optional<SessionLedger> SessionRepository::LoadLedger(std::int64_t session_id) const {
  std::optional<SessionLedger> ledger;
  db_client_->WithConnectionRetry([&](MYSQL* conn) { ledger = ReadLedger(conn, session_id, false); });
  return ledger;
}

std::vector<SessionRecord> SessionRepository::ListActiveSessionsForResource(const ResourceRef& resource,
                                                                            Timestamp from, Timestamp to) const {
  std::vector<SessionRecord> sessions;
  db_client_->WithConnectionRetry([&](MYSQL* conn) {
    const char* column = resource.kind == ResourceKind::kTrainer ? "trainer_id" : "machine_id";
    std::ostringstream oss;
    oss << "SELECT " << kSessionColumns << " FROM training_sessions WHERE " << column << "=" << resource.id
        << " AND status <> 'cancelled' AND scheduled_start <= '" << ToSqlDateTime(to) << "' AND scheduled_end >= '"
        << ToSqlDateTime(from) << "' ORDER BY scheduled_start, id;";
    auto res = db_client_->Query(conn, oss.str(), "리소스 세션 조회 실패");
    MYSQL_ROW row;
    while ((row = mysql_fetch_row(res.get())) != nullptr) {
      sessions.push_back(BuildSession(row));
    }
  });
  return sessions;
}

std::size_t SessionRepository::CountSessionsInWindow(Timestamp from, Timestamp to,
                                                     const std::vector<SessionType>& types) const {
  if (types.empty()) {
    return 0;
  }
  std::size_t count = 0;
  db_client_->WithConnectionRetry([&](MYSQL* conn) {
    std::ostringstream oss;
    oss << "SELECT COUNT(*) FROM training_sessions WHERE status <> 'cancelled' AND scheduled_start >= '"
        << ToSqlDateTime(from) << "' AND scheduled_start <= '" << ToSqlDateTime(to) << "' AND session_type IN (";
    for (std::size_t i = 0; i < types.size(); ++i) {
      oss << (i == 0 ? "'" : ", '") << ToString(types[i]) << "'";
    }
    oss << ");";
    auto res = db_client_->Query(conn, oss.str(), "주간 세션 카운트 실패");
    MYSQL_ROW row = mysql_fetch_row(res.get());
    if (row && row[0]) {
      count = static_cast<std::size_t>(std::stoull(row[0]));
    }
  });
  return count;
}

std::optional<int> SessionRepository::LoadWeeklyCeiling() const {
  std::optional<int> ceiling;
  db_client_->WithConnectionRetry([&](MYSQL* conn) {
    auto res = db_client_->Query(
        conn, "SELECT setting_value FROM studio_settings WHERE setting_key='max_sessions_per_week';", "설정 조회 실패");
    MYSQL_ROW row = mysql_fetch_row(res.get());
    if (row && row[0]) {
      char* end = nullptr;
      long value = std::strtol(row[0], &end, 10);
      if (end != row[0] && *end == '\0') {
        ceiling = static_cast<int>(value);
      }
    }
  });
  return ceiling;
}

std::optional<MemberRecord> SessionRepository::FindMember(std::int64_t member_id) const {
  std::optional<MemberRecord> member;
  db_client_->WithConnectionRetry([&](MYSQL* conn) {
    std::ostringstream oss;
    oss << "SELECT id, first_name, last_name, member_type FROM members WHERE id=" << member_id << ";";
    auto res = db_client_->Query(conn, oss.str(), "회원 조회 실패");
    MYSQL_ROW row = mysql_fetch_row(res.get());
    if (row) {
      member = MemberRecord{ToInt64(row[0]), ToText(row[1]), ToText(row[2]),
                            Require(ParseMemberType(ToText(row[3])), "member_type", row[3])};
    }
  });
  return member;
}

std::optional<MachineRecord> SessionRepository::FindMachine(std::int64_t machine_id) const {
  std::optional<MachineRecord> machine;
  db_client_->WithConnectionRetry([&](MYSQL* conn) {
    std::ostringstream oss;
    oss << "SELECT id, machine_number, name, is_available FROM machines WHERE id=" << machine_id << ";";
    auto res = db_client_->Query(conn, oss.str(), "머신 조회 실패");
    MYSQL_ROW row = mysql_fetch_row(res.get());
    if (row) {
      machine = MachineRecord{ToInt64(row[0]), ToInt(row[1]), ToText(row[2]), ToInt(row[3]) != 0};
    }
  });
  return machine;
}

std::vector<std::int64_t> SessionRepository::ListSessionIds() const {
  std::vector<std::int64_t> ids;
  db_client_->WithConnectionRetry([&](MYSQL* conn) {
    auto res = db_client_->Query(conn, "SELECT id FROM training_sessions ORDER BY id;", "세션 목록 조회 실패");
    MYSQL_ROW row;
    while ((row = mysql_fetch_row(res.get())) != nullptr) {
      ids.push_back(ToInt64(row[0]));
    }
  });
  return ids;
}

void SessionRepository::ClearAll() const {
  db_client_->WithConnectionRetry([&](MYSQL* conn) {
    db_client_->Execute(conn, "DELETE FROM notification_logs;", "알림 로그 초기화 실패");
    db_client_->Execute(conn, "DELETE FROM training_session_members;", "참가자 초기화 실패");
    db_client_->Execute(conn, "DELETE FROM training_sessions;", "세션 초기화 실패");
    db_client_->Execute(conn, "DELETE FROM members;", "회원 초기화 실패");
    db_client_->Execute(conn, "DELETE FROM machines;", "머신 초기화 실패");
  });
}

SessionRecord SessionRepository::BuildSession(MYSQL_ROW row) const {
  SessionRecord session;
  session.id = ToInt64(row[0]);
  session.machine_id = ToInt64(row[1]);
  session.trainer_id = ToOptionalInt64(row[2]);
  session.scheduled_start = Require(ParseSqlDateTime(ToText(row[3])), "scheduled_start", row[3]);
  session.scheduled_end = Require(ParseSqlDateTime(ToText(row[4])), "scheduled_end", row[4]);
  session.status = Require(ParseSessionStatus(ToText(row[5])), "status", row[5]);
  session.session_type = Require(ParseSessionType(ToText(row[6])), "session_type", row[6]);
  session.max_participants = ToInt(row[7]);
  session.current_participants = ToInt(row[8]);
  session.notes = ToText(row[9]);
  return session;
}

ParticipantRecord SessionRepository::BuildParticipant(MYSQL_ROW row) const {
  ParticipantRecord participant;
  participant.id = ToInt64(row[0]);
  participant.session_id = ToInt64(row[1]);
  participant.member_id = ToOptionalInt64(row[2]);
  participant.guest = GuestInfo{ToText(row[3]), ToText(row[4]), ToText(row[5])};
  participant.status = Require(ParseBookingStatus(ToText(row[6])), "booking_status", row[6]);
  if (row[7]) {
    participant.waitlist_position = std::stoi(row[7]);
  }
  return participant;
}

}  // namespace scheduler
