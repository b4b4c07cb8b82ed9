/*
 * 설명: 세션/참가자/회원/머신 레코드와 상태 열거형, 문자열 및 JSON 변환을 정의한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md, db/schema.sql
 * 테스트: server/tests/unit/capacity_state_machine_test.cpp, server/tests/it/booking_it_test.cpp
 */
#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

namespace scheduler {

using Timestamp = std::chrono::system_clock::time_point;

enum class SessionType { kTrial, kMember, kContractual, kMultiSite, kCollaboration, kMakeup, kNonBookable };

enum class SessionStatus { kScheduled, kInProgress, kCompleted, kCancelled };

enum class BookingStatus { kConfirmed, kWaitlisted, kCancelled, kNoShow };

enum class MemberType { kFull, kTrial, kCollaboration };

enum class ResourceKind { kTrainer, kMachine };

struct ResourceRef {
  ResourceKind kind{ResourceKind::kTrainer};
  std::int64_t id{0};
};

struct GuestInfo {
  std::string first_name;
  std::string last_name;
  std::string gym_name;
};

struct SessionRecord {
  std::int64_t id{0};
  std::int64_t machine_id{0};
  std::optional<std::int64_t> trainer_id;
  Timestamp scheduled_start;
  Timestamp scheduled_end;
  SessionStatus status{SessionStatus::kScheduled};
  SessionType session_type{SessionType::kMember};
  int max_participants{1};
  int current_participants{0};
  std::string notes;
};

struct ParticipantRecord {
  std::int64_t id{0};
  std::int64_t session_id{0};
  std::optional<std::int64_t> member_id;
  GuestInfo guest;
  BookingStatus status{BookingStatus::kConfirmed};
  std::optional<int> waitlist_position;
};

struct MemberRecord {
  std::int64_t id{0};
  std::string first_name;
  std::string last_name;
  MemberType member_type{MemberType::kFull};
};

struct TrialMemberDraft {
  std::string first_name;
  std::string last_name;
  std::string email;
  std::string phone;
};

struct MachineRecord {
  std::int64_t id{0};
  int machine_number{0};
  std::string name;
  bool is_available{true};
};

std::string_view ToString(SessionType type);
std::string_view ToString(SessionStatus status);
std::string_view ToString(BookingStatus status);
std::string_view ToString(MemberType type);
std::string_view ToString(ResourceKind kind);

std::optional<SessionType> ParseSessionType(std::string_view text);
std::optional<SessionStatus> ParseSessionStatus(std::string_view text);
std::optional<BookingStatus> ParseBookingStatus(std::string_view text);
std::optional<MemberType> ParseMemberType(std::string_view text);
std::optional<ResourceKind> ParseResourceKind(std::string_view text);

// cancelled, no_show 은 더 이상 전이하지 않는다.
inline bool IsTerminal(BookingStatus status) {
  return status == BookingStatus::kCancelled || status == BookingStatus::kNoShow;
}

nlohmann::json ToJson(const SessionRecord& session);
nlohmann::json ToJson(const ParticipantRecord& participant);

}  // namespace scheduler
