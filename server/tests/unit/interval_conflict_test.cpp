#include <chrono>
#include <vector>

#include <gtest/gtest.h>

#include "scheduler/availability.hpp"
#include "scheduler/time_util.hpp"

namespace {

scheduler::Timestamp At(const char* iso) { return *scheduler::ParseIsoTimestamp(iso); }

scheduler::SessionRecord Session(std::int64_t id, const char* start, const char* end,
                                 scheduler::SessionStatus status = scheduler::SessionStatus::kScheduled) {
  scheduler::SessionRecord session;
  session.id = id;
  session.machine_id = 1;
  session.trainer_id = 7;
  session.scheduled_start = At(start);
  session.scheduled_end = At(end);
  session.status = status;
  return session;
}

}  // namespace

TEST(IntervalConflictTest, TouchingIntervalsDoNotConflict) {
  std::vector<scheduler::SessionRecord> existing{Session(1, "2024-12-01T09:00:00Z", "2024-12-01T10:00:00Z")};
  auto conflicts =
      scheduler::FindConflicts(existing, At("2024-12-01T10:00:00Z"), At("2024-12-01T11:00:00Z"), std::nullopt);
  EXPECT_TRUE(conflicts.empty());

  conflicts = scheduler::FindConflicts(existing, At("2024-12-01T08:00:00Z"), At("2024-12-01T09:00:00Z"), std::nullopt);
  EXPECT_TRUE(conflicts.empty());
}

TEST(IntervalConflictTest, PartialOverlapConflicts) {
  std::vector<scheduler::SessionRecord> existing{Session(1, "2024-12-01T09:00:00Z", "2024-12-01T10:00:00Z")};
  auto conflicts =
      scheduler::FindConflicts(existing, At("2024-12-01T09:30:00Z"), At("2024-12-01T10:30:00Z"), std::nullopt);
  ASSERT_EQ(conflicts.size(), 1u);
  EXPECT_EQ(conflicts[0].id, 1);
  EXPECT_EQ(scheduler::BuildAvailabilityMessage(scheduler::ResourceKind::kTrainer, conflicts.size()),
            "Trainer has 1 conflicting session during this time");
}

TEST(IntervalConflictTest, OneMillisecondOverlapConflicts) {
  std::vector<scheduler::SessionRecord> existing{Session(1, "2024-12-01T09:00:00Z", "2024-12-01T10:00:00.001Z")};
  auto conflicts =
      scheduler::FindConflicts(existing, At("2024-12-01T10:00:00Z"), At("2024-12-01T11:00:00Z"), std::nullopt);
  EXPECT_EQ(conflicts.size(), 1u);
}

TEST(IntervalConflictTest, CancelledAndExcludedSessionsAreIgnored) {
  std::vector<scheduler::SessionRecord> existing{
      Session(1, "2024-12-01T09:00:00Z", "2024-12-01T10:00:00Z", scheduler::SessionStatus::kCancelled),
      Session(2, "2024-12-01T09:00:00Z", "2024-12-01T10:00:00Z"),
      Session(3, "2024-12-01T09:15:00Z", "2024-12-01T09:45:00Z", scheduler::SessionStatus::kCompleted)};
  auto conflicts = scheduler::FindConflicts(existing, At("2024-12-01T09:00:00Z"), At("2024-12-01T10:00:00Z"), 2);
  ASSERT_EQ(conflicts.size(), 1u);
  EXPECT_EQ(conflicts[0].id, 3);
}

TEST(IntervalConflictTest, OverlapIsSymmetric) {
  auto a_start = At("2024-12-01T09:00:00Z");
  auto a_end = At("2024-12-01T10:00:00Z");
  auto b_start = At("2024-12-01T09:59:00Z");
  auto b_end = At("2024-12-01T12:00:00Z");
  EXPECT_EQ(scheduler::IntervalsOverlap(a_start, a_end, b_start, b_end),
            scheduler::IntervalsOverlap(b_start, b_end, a_start, a_end));
  EXPECT_TRUE(scheduler::IntervalsOverlap(a_start, a_end, a_start, a_end));
}

TEST(IntervalConflictTest, MessagePluralizesByCount) {
  EXPECT_EQ(scheduler::BuildAvailabilityMessage(scheduler::ResourceKind::kMachine, 0),
            "Machine is available for this time slot");
  EXPECT_EQ(scheduler::BuildAvailabilityMessage(scheduler::ResourceKind::kMachine, 3),
            "Machine has 3 conflicting sessions during this time");
}

TEST(IntervalConflictTest, MalformedInputDegradesToAvailable) {
  scheduler::DbConfig cfg{"127.0.0.1", 1, "nobody", "none", "none"};
  auto db_client = std::make_shared<scheduler::MariaDbClient>(cfg);
  auto repository = std::make_shared<scheduler::SessionRepository>(db_client);
  auto observability = std::make_shared<scheduler::Observability>(scheduler::LogLevel::kError);
  scheduler::AvailabilityChecker checker(repository, observability);

  auto result = checker.Check({scheduler::ResourceKind::kTrainer, 0}, At("2024-12-01T09:00:00Z"),
                              At("2024-12-01T10:00:00Z"));
  EXPECT_TRUE(result.available);
  EXPECT_TRUE(result.degraded);
  EXPECT_TRUE(result.conflicts.empty());

  result = checker.Check({scheduler::ResourceKind::kMachine, 4}, At("2024-12-01T10:00:00Z"),
                         At("2024-12-01T09:00:00Z"));
  EXPECT_TRUE(result.available);
  EXPECT_TRUE(result.degraded);
  EXPECT_EQ(observability->Snapshot().degraded_checks, 2u);
}

TEST(IntervalConflictTest, UnreachableStoreDegradesToAvailable) {
  scheduler::DbConfig cfg{"127.0.0.1", 1, "nobody", "none", "none"};
  auto db_client = std::make_shared<scheduler::MariaDbClient>(cfg);
  auto repository = std::make_shared<scheduler::SessionRepository>(db_client);
  auto observability = std::make_shared<scheduler::Observability>(scheduler::LogLevel::kError);
  scheduler::AvailabilityChecker checker(repository, observability);

  auto result = checker.Check({scheduler::ResourceKind::kTrainer, 9}, At("2024-12-01T09:00:00Z"),
                              At("2024-12-01T10:00:00Z"));
  EXPECT_TRUE(result.available);
  EXPECT_TRUE(result.degraded);
  EXPECT_NE(result.message.find("booking is not blocked"), std::string::npos);
}
