/*
 * 설명: 상태 열거형의 문자열 변환과 레코드 JSON 직렬화를 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md, db/schema.sql
 * 테스트: server/tests/unit/capacity_state_machine_test.cpp
 */
#include "scheduler/model.hpp"

#include <array>
#include <utility>

#include "scheduler/time_util.hpp"

namespace scheduler {
namespace {
constexpr std::array<std::pair<SessionType, std::string_view>, 7> kSessionTypeNames{{
    {SessionType::kTrial, "trial"},
    {SessionType::kMember, "member"},
    {SessionType::kContractual, "contractual"},
    {SessionType::kMultiSite, "multi_site"},
    {SessionType::kCollaboration, "collaboration"},
    {SessionType::kMakeup, "makeup"},
    {SessionType::kNonBookable, "non_bookable"},
}};

constexpr std::array<std::pair<SessionStatus, std::string_view>, 4> kSessionStatusNames{{
    {SessionStatus::kScheduled, "scheduled"},
    {SessionStatus::kInProgress, "in_progress"},
    {SessionStatus::kCompleted, "completed"},
    {SessionStatus::kCancelled, "cancelled"},
}};

constexpr std::array<std::pair<BookingStatus, std::string_view>, 4> kBookingStatusNames{{
    {BookingStatus::kConfirmed, "confirmed"},
    {BookingStatus::kWaitlisted, "waitlisted"},
    {BookingStatus::kCancelled, "cancelled"},
    {BookingStatus::kNoShow, "no_show"},
}};

constexpr std::array<std::pair<MemberType, std::string_view>, 3> kMemberTypeNames{{
    {MemberType::kFull, "full"},
    {MemberType::kTrial, "trial"},
    {MemberType::kCollaboration, "collaboration"},
}};

constexpr std::array<std::pair<ResourceKind, std::string_view>, 2> kResourceKindNames{{
    {ResourceKind::kTrainer, "trainer"},
    {ResourceKind::kMachine, "machine"},
}};

template <typename Enum, std::size_t N>
std::string_view NameOf(const std::array<std::pair<Enum, std::string_view>, N>& table, Enum value) {
  for (const auto& entry : table) {
    if (entry.first == value) {
      return entry.second;
    }
  }
  return "unknown";
}

template <typename Enum, std::size_t N>
std::optional<Enum> ValueOf(const std::array<std::pair<Enum, std::string_view>, N>& table, std::string_view text) {
  for (const auto& entry : table) {
    if (entry.second == text) {
      return entry.first;
    }
  }
  return std::nullopt;
}
}  // namespace

std::string_view ToString(SessionType type) { return NameOf(kSessionTypeNames, type); }
std::string_view ToString(SessionStatus status) { return NameOf(kSessionStatusNames, status); }
std::string_view ToString(BookingStatus status) { return NameOf(kBookingStatusNames, status); }
std::string_view ToString(MemberType type) { return NameOf(kMemberTypeNames, type); }
std::string_view ToString(ResourceKind kind) { return NameOf(kResourceKindNames, kind); }

std::optional<SessionType> ParseSessionType(std::string_view text) { return ValueOf(kSessionTypeNames, text); }
std::optional<SessionStatus> ParseSessionStatus(std::string_view text) { return ValueOf(kSessionStatusNames, text); }
std::optional<BookingStatus> ParseBookingStatus(std::string_view text) { return ValueOf(kBookingStatusNames, text); }
std::optional<MemberType> ParseMemberType(std::string_view text) { return ValueOf(kMemberTypeNames, text); }
std::optional<ResourceKind> ParseResourceKind(std::string_view text) { return ValueOf(kResourceKindNames, text); }

nlohmann::json ToJson(const SessionRecord& session) {
  nlohmann::json j{{"id", session.id},
                   {"machineId", session.machine_id},
                   {"trainerId", nullptr},
                   {"scheduledStart", ToIsoString(session.scheduled_start)},
                   {"scheduledEnd", ToIsoString(session.scheduled_end)},
                   {"status", ToString(session.status)},
                   {"sessionType", ToString(session.session_type)},
                   {"maxParticipants", session.max_participants},
                   {"currentParticipants", session.current_participants},
                   {"notes", session.notes}};
  if (session.trainer_id) {
    j["trainerId"] = *session.trainer_id;
  }
  return j;
}

nlohmann::json ToJson(const ParticipantRecord& participant) {
  nlohmann::json j{{"id", participant.id},
                   {"sessionId", participant.session_id},
                   {"memberId", nullptr},
                   {"bookingStatus", ToString(participant.status)},
                   {"waitlistPosition", nullptr}};
  if (participant.member_id) {
    j["memberId"] = *participant.member_id;
  }
  if (participant.waitlist_position) {
    j["waitlistPosition"] = *participant.waitlist_position;
  }
  if (!participant.guest.first_name.empty() || !participant.guest.last_name.empty()) {
    j["guest"] = {{"firstName", participant.guest.first_name},
                  {"lastName", participant.guest.last_name},
                  {"gymName", participant.guest.gym_name}};
  }
  return j;
}

}  // namespace scheduler
