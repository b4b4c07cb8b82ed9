#include <gtest/gtest.h>

#include "scheduler/model.hpp"
#include "scheduler/session_policy.hpp"

using scheduler::Classify;
using scheduler::MemberType;
using scheduler::SessionType;

TEST(SessionPolicyTest, MemberSessionIsTheOnlyQuotaBoundType) {
  for (auto type : scheduler::kAllSessionTypes) {
    auto flags = Classify(type);
    EXPECT_EQ(flags.bypasses_weekly_quota, type != SessionType::kMember) << scheduler::ToString(type);
  }
}

TEST(SessionPolicyTest, OnlyNonBookableSkipsCapacityCount) {
  for (auto type : scheduler::kAllSessionTypes) {
    auto flags = Classify(type);
    EXPECT_EQ(flags.counts_toward_capacity, type != SessionType::kNonBookable) << scheduler::ToString(type);
    EXPECT_EQ(flags.takes_participants, type != SessionType::kNonBookable) << scheduler::ToString(type);
  }
}

TEST(SessionPolicyTest, MemberRequirementsFollowTable) {
  EXPECT_FALSE(Classify(SessionType::kTrial).requires_member);
  EXPECT_TRUE(Classify(SessionType::kTrial).creates_member);
  EXPECT_TRUE(Classify(SessionType::kMember).requires_member);
  EXPECT_TRUE(Classify(SessionType::kMakeup).requires_member);
  EXPECT_FALSE(Classify(SessionType::kMultiSite).requires_member);
  EXPECT_TRUE(Classify(SessionType::kMultiSite).is_guest);
  EXPECT_FALSE(Classify(SessionType::kNonBookable).requires_member);

  auto contractual = Classify(SessionType::kContractual);
  EXPECT_TRUE(contractual.requires_member);
  ASSERT_TRUE(contractual.required_member_type.has_value());
  EXPECT_EQ(*contractual.required_member_type, MemberType::kTrial);

  auto collaboration = Classify(SessionType::kCollaboration);
  EXPECT_TRUE(collaboration.requires_member);
  ASSERT_TRUE(collaboration.required_member_type.has_value());
  EXPECT_EQ(*collaboration.required_member_type, MemberType::kCollaboration);

  EXPECT_FALSE(Classify(SessionType::kMember).required_member_type.has_value());
}

TEST(SessionPolicyTest, OnlyTrialCreatesMember) {
  for (auto type : scheduler::kAllSessionTypes) {
    EXPECT_EQ(Classify(type).creates_member, type == SessionType::kTrial) << scheduler::ToString(type);
  }
}

TEST(SessionPolicyTest, ParseSessionTypeRejectsUnknownNames) {
  for (auto type : scheduler::kAllSessionTypes) {
    auto parsed = scheduler::ParseSessionType(scheduler::ToString(type));
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(*parsed, type);
  }
  EXPECT_FALSE(scheduler::ParseSessionType("yoga").has_value());
  EXPECT_FALSE(scheduler::ParseSessionType("").has_value());
  EXPECT_FALSE(scheduler::ParseSessionType("Member").has_value());
}
