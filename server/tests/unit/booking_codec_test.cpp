#include <cstdint>

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include "scheduler/booking_codec.hpp"
#include "scheduler/time_util.hpp"

namespace {

std::string RejectionCode(const nlohmann::json& body) {
  try {
    scheduler::ParseBookingRequest(body);
  } catch (const scheduler::EngineError& ex) {
    return ex.code;
  }
  return "";
}

nlohmann::json MemberBody() {
  return {{"sessionType", "member"},
          {"machineId", 3},
          {"trainerId", 8},
          {"scheduledStart", "2024-12-02T09:00:00Z"},
          {"scheduledEnd", "2024-12-02T10:00:00Z"},
          {"maxParticipants", 4},
          {"memberId", 42},
          {"notes", "하체 루틴"}};
}

}  // namespace

TEST(BookingCodecTest, ParsesMemberBooking) {
  auto request = scheduler::ParseBookingRequest(MemberBody());
  EXPECT_EQ(request.session_type, scheduler::SessionType::kMember);
  EXPECT_EQ(request.machine_id, 3);
  ASSERT_TRUE(request.trainer_id.has_value());
  EXPECT_EQ(*request.trainer_id, 8);
  EXPECT_EQ(request.max_participants, 4);
  ASSERT_TRUE(request.participant.member_id.has_value());
  EXPECT_EQ(*request.participant.member_id, 42);
  EXPECT_EQ(request.notes, "하체 루틴");
  EXPECT_EQ(scheduler::ToIsoString(request.scheduled_start), "2024-12-02T09:00:00.000Z");
}

TEST(BookingCodecTest, ParsesGuestAndTrialBlocks) {
  nlohmann::json body{{"sessionType", "multi_site"},
                      {"machineId", 1},
                      {"scheduledStart", "2024-12-02T09:00:00Z"},
                      {"scheduledEnd", "2024-12-02T10:00:00Z"},
                      {"guest", {{"firstName", "Ana"}, {"lastName", "Silva"}, {"gymName", "North"}}},
                      {"trialMember", {{"firstName", "Bo"}, {"lastName", "Kim"}}}};
  auto request = scheduler::ParseBookingRequest(body);
  EXPECT_EQ(request.participant.guest.first_name, "Ana");
  EXPECT_EQ(request.participant.guest.gym_name, "North");
  ASSERT_TRUE(request.participant.trial_member.has_value());
  EXPECT_EQ(request.participant.trial_member->last_name, "Kim");
  EXPECT_TRUE(request.participant.trial_member->email.empty());
  EXPECT_EQ(request.max_participants, 1);
}

TEST(BookingCodecTest, UnknownSessionTypeIsRejected) {
  auto body = MemberBody();
  body["sessionType"] = "yoga";
  EXPECT_EQ(RejectionCode(body), "unknown_session_type");
  body.erase("sessionType");
  EXPECT_EQ(RejectionCode(body), "unknown_session_type");
}

TEST(BookingCodecTest, MalformedFieldsAreRejected) {
  auto body = MemberBody();
  body["scheduledStart"] = "2024-12-02 09:00";
  EXPECT_EQ(RejectionCode(body), "invalid_timestamp");

  body = MemberBody();
  body["memberId"] = "42";
  EXPECT_EQ(RejectionCode(body), "invalid_field");

  body = MemberBody();
  body["maxParticipants"] = 1.5;
  EXPECT_EQ(RejectionCode(body), "invalid_capacity");

  EXPECT_EQ(RejectionCode(nlohmann::json::array()), "bad_request");
}

TEST(BookingCodecTest, SeatCeilingOutsideIntRangeIsRejected) {
  auto body = MemberBody();
  body["maxParticipants"] = 4294967297ULL;
  EXPECT_EQ(RejectionCode(body), "invalid_capacity");

  body["maxParticipants"] = static_cast<std::int64_t>(-4294967295LL);
  EXPECT_EQ(RejectionCode(body), "invalid_capacity");

  body["maxParticipants"] = 0;
  EXPECT_EQ(RejectionCode(body), "invalid_capacity");

  EXPECT_EQ(scheduler::ParseMaxParticipantsField({{"maxParticipants", 2147483647}}), 2147483647);
  EXPECT_THROW(scheduler::ParseMaxParticipantsField({{"maxParticipants", 2147483648LL}}), scheduler::EngineError);
}

TEST(BookingCodecTest, StatusFieldsUseClosedVocabulary) {
  EXPECT_EQ(scheduler::ParseBookingStatusField({{"status", "no_show"}}), scheduler::BookingStatus::kNoShow);
  EXPECT_EQ(scheduler::ParseSessionStatusField({{"status", "in_progress"}}), scheduler::SessionStatus::kInProgress);
  EXPECT_THROW(scheduler::ParseBookingStatusField({{"status", "late"}}), scheduler::EngineError);
  EXPECT_THROW(scheduler::ParseSessionStatusField(nlohmann::json::object()), scheduler::EngineError);
}

TEST(BookingCodecTest, LedgerJsonOrdersWaitlistByPosition) {
  scheduler::SessionLedger ledger;
  ledger.session.id = 5;
  ledger.session.max_participants = 1;
  ledger.session.current_participants = 1;
  scheduler::ParticipantRecord confirmed;
  confirmed.id = 1;
  confirmed.member_id = 10;
  scheduler::ParticipantRecord second;
  second.id = 2;
  second.member_id = 11;
  second.status = scheduler::BookingStatus::kWaitlisted;
  second.waitlist_position = 2;
  scheduler::ParticipantRecord first;
  first.id = 3;
  first.member_id = 12;
  first.status = scheduler::BookingStatus::kWaitlisted;
  first.waitlist_position = 1;
  ledger.participants = {confirmed, second, first};

  auto j = scheduler::ToJson(ledger);
  ASSERT_EQ(j["confirmed"].size(), 1u);
  ASSERT_EQ(j["waitlist"].size(), 2u);
  EXPECT_EQ(j["waitlist"][0]["id"], 3);
  EXPECT_EQ(j["waitlist"][1]["waitlistPosition"], 2);
  EXPECT_EQ(j["session"]["currentParticipants"], 1);
}

TEST(BookingCodecTest, ErrorKindsMapToHttpStatus) {
  EXPECT_EQ(scheduler::HttpStatusFor(scheduler::ErrorKind::kValidation), 400u);
  EXPECT_EQ(scheduler::HttpStatusFor(scheduler::ErrorKind::kCapacity), 409u);
  EXPECT_EQ(scheduler::HttpStatusFor(scheduler::ErrorKind::kConcurrency), 503u);
  EXPECT_EQ(scheduler::HttpStatusFor(scheduler::ErrorKind::kNotFound), 404u);
  EXPECT_EQ(scheduler::HttpStatusFor(scheduler::ErrorKind::kInternal), 500u);
}
