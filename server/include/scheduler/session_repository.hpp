/*
 * 설명: 세션/참가자/회원/머신/설정 테이블에 대한 MariaDB 질의를 담당한다.
 *       MYSQL* 인자를 받는 함수는 호출자의 트랜잭션 안에서 실행된다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md, db/schema.sql
 * 테스트: server/tests/it/booking_it_test.cpp
 */
#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <mariadb/mysql.h>

#include "scheduler/capacity.hpp"
#include "scheduler/db_client.hpp"
#include "scheduler/model.hpp"

namespace scheduler {

class SessionRepository {
 public:
  explicit SessionRepository(std::shared_ptr<MariaDbClient> db_client);

  // 세션 행과 참가자 행을 FOR UPDATE로 잠그고 읽는다. 세션이 없으면 nullopt.
  std::optional<SessionLedger> LockLedger(MYSQL* conn, std::int64_t session_id) const;
  std::int64_t InsertSession(MYSQL* conn, const SessionRecord& session) const;
  std::int64_t InsertTrialMember(MYSQL* conn, const TrialMemberDraft& draft) const;
  // 전이 결과를 반영한다. 새로 추가된 참가자 행의 id를 ledger에 채운다.
  void PersistTransition(MYSQL* conn, SessionLedger& ledger, const TransitionOutcome& outcome) const;
  void UpdateSessionStatus(MYSQL* conn, std::int64_t session_id, SessionStatus status) const;
  void DeleteSessionCascade(MYSQL* conn, std::int64_t session_id) const;

  std::optional<SessionLedger> LoadLedger(std::int64_t session_id) const;
  // [from, to]와 닿거나 겹치는 취소되지 않은 세션. 정확한 겹침 판정은 FindConflicts가 한다.
  std::vector<SessionRecord> ListActiveSessionsForResource(const ResourceRef& resource, Timestamp from,
                                                           Timestamp to) const;
  std::size_t CountSessionsInWindow(Timestamp from, Timestamp to, const std::vector<SessionType>& types) const;
  std::optional<int> LoadWeeklyCeiling() const;
  std::optional<MemberRecord> FindMember(std::int64_t member_id) const;
  std::optional<MachineRecord> FindMachine(std::int64_t machine_id) const;
  std::vector<std::int64_t> ListSessionIds() const;
  void ClearAll() const;

 private:
  SessionRecord BuildSession(MYSQL_ROW row) const;
  ParticipantRecord BuildParticipant(MYSQL_ROW row) const;
  std::vector<ParticipantRecord> LoadParticipants(MYSQL* conn, std::int64_t session_id, bool for_update) const;
  std::optional<SessionLedger> ReadLedger(MYSQL* conn, std::int64_t session_id, bool for_update) const;

  std::shared_ptr<MariaDbClient> db_client_;
};

}  // namespace scheduler
