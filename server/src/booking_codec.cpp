/*
 * 설명: 예약 요청 JSON 파싱과 결과 직렬화를 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/booking_codec_test.cpp
 */
#include "scheduler/booking_codec.hpp"

#include <algorithm>
#include <cstdint>
#include <limits>
#include <string>
#include <vector>

#include "scheduler/time_util.hpp"

namespace scheduler {
namespace {
[[noreturn]] void RaiseField(const std::string& code, const std::string& message) {
  throw EngineError(ErrorKind::kValidation, code, message);
}

std::optional<std::int64_t> OptionalId(const nlohmann::json& body, const char* key) {
  if (!body.contains(key) || body[key].is_null()) {
    return std::nullopt;
  }
  if (!body[key].is_number_integer()) {
    RaiseField("invalid_field", std::string(key) + " 는 정수여야 합니다");
  }
  return body[key].get<std::int64_t>();
}

std::string OptionalText(const nlohmann::json& body, const char* key) {
  if (!body.contains(key) || body[key].is_null()) {
    return {};
  }
  if (!body[key].is_string()) {
    RaiseField("invalid_field", std::string(key) + " 는 문자열이어야 합니다");
  }
  return body[key].get<std::string>();
}

Timestamp RequiredTimestamp(const nlohmann::json& body, const char* key) {
  if (!body.contains(key) || !body[key].is_string()) {
    RaiseField("invalid_timestamp", std::string(key) + " 는 ISO-8601 문자열이어야 합니다");
  }
  auto parsed = ParseIsoTimestamp(body[key].get<std::string>());
  if (!parsed) {
    RaiseField("invalid_timestamp", std::string(key) + " 의 시각 형식이 올바르지 않습니다");
  }
  return *parsed;
}

const nlohmann::json& RequireObject(const nlohmann::json& body) {
  if (!body.is_object()) {
    RaiseField("bad_request", "JSON 본문은 객체여야 합니다");
  }
  return body;
}
}  // namespace

ParticipantRequest ParseParticipantRequest(const nlohmann::json& body) {
  RequireObject(body);
  ParticipantRequest request;
  request.member_id = OptionalId(body, "memberId");
  if (body.contains("guest") && body["guest"].is_object()) {
    const auto& guest = body["guest"];
    request.guest = GuestInfo{OptionalText(guest, "firstName"), OptionalText(guest, "lastName"),
                              OptionalText(guest, "gymName")};
  }
  if (body.contains("trialMember") && body["trialMember"].is_object()) {
    const auto& trial = body["trialMember"];
    request.trial_member = TrialMemberDraft{OptionalText(trial, "firstName"), OptionalText(trial, "lastName"),
                                            OptionalText(trial, "email"), OptionalText(trial, "phone")};
  }
  return request;
}

BookingRequest ParseBookingRequest(const nlohmann::json& body) {
  RequireObject(body);
  BookingRequest request;
  if (!body.contains("sessionType") || !body["sessionType"].is_string()) {
    RaiseField("unknown_session_type", "sessionType 이 필요합니다");
  }
  auto type = ParseSessionType(body["sessionType"].get<std::string>());
  if (!type) {
    RaiseField("unknown_session_type", "알 수 없는 세션 유형입니다: " + body["sessionType"].get<std::string>());
  }
  request.session_type = *type;
  request.machine_id = OptionalId(body, "machineId").value_or(0);
  request.trainer_id = OptionalId(body, "trainerId");
  request.scheduled_start = RequiredTimestamp(body, "scheduledStart");
  request.scheduled_end = RequiredTimestamp(body, "scheduledEnd");
  if (body.contains("maxParticipants")) {
    request.max_participants = ParseMaxParticipantsField(body);
  }
  request.participant = ParseParticipantRequest(body);
  request.notes = OptionalText(body, "notes");
  return request;
}

BookingStatus ParseBookingStatusField(const nlohmann::json& body) {
  RequireObject(body);
  if (!body.contains("status") || !body["status"].is_string()) {
    RaiseField("invalid_status", "status 가 필요합니다");
  }
  auto status = ParseBookingStatus(body["status"].get<std::string>());
  if (!status) {
    RaiseField("invalid_status", "알 수 없는 예약 상태입니다: " + body["status"].get<std::string>());
  }
  return *status;
}

SessionStatus ParseSessionStatusField(const nlohmann::json& body) {
  RequireObject(body);
  if (!body.contains("status") || !body["status"].is_string()) {
    RaiseField("invalid_status", "status 가 필요합니다");
  }
  auto status = ParseSessionStatus(body["status"].get<std::string>());
  if (!status) {
    RaiseField("invalid_status", "알 수 없는 세션 상태입니다: " + body["status"].get<std::string>());
  }
  return *status;
}

int ParseMaxParticipantsField(const nlohmann::json& body) {
  RequireObject(body);
  if (!body.contains("maxParticipants") || !body["maxParticipants"].is_number_integer()) {
    RaiseField("invalid_capacity", "maxParticipants 는 정수여야 합니다");
  }
  const auto& value = body["maxParticipants"];
  constexpr std::int64_t kMaxCeiling = std::numeric_limits<int>::max();
  bool too_large = value.is_number_unsigned() ? value.get<std::uint64_t>() > static_cast<std::uint64_t>(kMaxCeiling)
                                              : value.get<std::int64_t>() > kMaxCeiling;
  if (too_large || value.get<std::int64_t>() < 1) {
    RaiseField("invalid_capacity", "maxParticipants 는 1 이상 " + std::to_string(kMaxCeiling) + " 이하여야 합니다");
  }
  return static_cast<int>(value.get<std::int64_t>());
}

nlohmann::json ToJson(const BookingConfirmation& confirmation) {
  nlohmann::json advisories = nlohmann::json::array();
  for (const auto& advisory : confirmation.advisories) {
    advisories.push_back(ToJson(advisory));
  }
  nlohmann::json data{{"session", ToJson(confirmation.session)},
                      {"participant", nullptr},
                      {"createdMemberId", nullptr},
                      {"advisories", advisories},
                      {"quota", nullptr}};
  if (confirmation.participant) {
    data["participant"] = ToJson(*confirmation.participant);
  }
  if (confirmation.created_member_id) {
    data["createdMemberId"] = *confirmation.created_member_id;
  }
  if (confirmation.quota) {
    data["quota"] = ToJson(*confirmation.quota);
  }
  return data;
}

nlohmann::json ToJson(const StatusChange& change) {
  nlohmann::json promoted = nlohmann::json::array();
  for (const auto& row : change.promoted) {
    promoted.push_back(ToJson(row));
  }
  nlohmann::json data{{"session", ToJson(change.session)}, {"participant", nullptr}, {"promoted", promoted}};
  if (change.participant) {
    data["participant"] = ToJson(*change.participant);
  }
  return data;
}

nlohmann::json ToJson(const SessionLedger& ledger) {
  nlohmann::json confirmed = nlohmann::json::array();
  nlohmann::json inactive = nlohmann::json::array();
  std::vector<ParticipantRecord> waitlisted;
  for (const auto& row : ledger.participants) {
    if (row.status == BookingStatus::kConfirmed) {
      confirmed.push_back(ToJson(row));
    } else if (row.status == BookingStatus::kWaitlisted) {
      waitlisted.push_back(row);
    } else {
      inactive.push_back(ToJson(row));
    }
  }
  std::sort(waitlisted.begin(), waitlisted.end(), [](const ParticipantRecord& a, const ParticipantRecord& b) {
    return a.waitlist_position.value_or(0) < b.waitlist_position.value_or(0);
  });
  nlohmann::json waitlist = nlohmann::json::array();
  for (const auto& row : waitlisted) {
    waitlist.push_back(ToJson(row));
  }
  return {{"session", ToJson(ledger.session)}, {"confirmed", confirmed}, {"waitlist", waitlist}, {"inactive", inactive}};
}

nlohmann::json ToJson(const ReconcileReport& report) {
  return {{"checked", report.checked}, {"repaired", report.repaired}};
}

unsigned int HttpStatusFor(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::kValidation:
      return 400;
    case ErrorKind::kCapacity:
      return 409;
    case ErrorKind::kConcurrency:
      return 503;
    case ErrorKind::kNotFound:
      return 404;
    case ErrorKind::kInternal:
      return 500;
  }
  return 500;
}

}  // namespace scheduler
