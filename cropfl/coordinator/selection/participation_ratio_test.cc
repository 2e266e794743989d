#include "cropfl/coordinator/selection/participation_ratio.h"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <vector>

#include "absl/strings/str_cat.h"

namespace cropfl::coordinator {
namespace {

using ::testing::ElementsAre;
using ::testing::IsEmpty;

std::vector<std::string> CreateWorkers(int n) {
  std::vector<std::string> workers;
  for (int i = n - 1; i >= 0; --i) {
    workers.push_back(absl::StrCat("worker-", i));
  }
  return workers;
}

// NOLINTNEXTLINE
TEST(ParticipationRatio, NoWorker) {
  ParticipationRatio selector(0.5);
  EXPECT_THAT(selector.Select({}, 1), IsEmpty());
}

// NOLINTNEXTLINE
TEST(ParticipationRatio, FullRatioSelectsAllWorkersSorted) {
  ParticipationRatio selector(1.0);
  EXPECT_THAT(selector.Select(CreateWorkers(3), 1),
              ElementsAre("worker-0", "worker-1", "worker-2"));
}

// NOLINTNEXTLINE
TEST(ParticipationRatio, DuplicatesAreDropped) {
  ParticipationRatio selector(1.0);
  EXPECT_THAT(selector.Select({"worker-1", "worker-0", "worker-1"}, 1),
              ElementsAre("worker-0", "worker-1"));
}

// NOLINTNEXTLINE
TEST(ParticipationRatio, SelectsCeilingOfRatio) {
  ParticipationRatio selector(0.5);
  auto res = selector.Select(CreateWorkers(5), 1);
  EXPECT_THAT(res, ElementsAre("worker-0", "worker-1", "worker-2"));
}

// NOLINTNEXTLINE
TEST(ParticipationRatio, SelectsAtLeastOneWorker) {
  ParticipationRatio selector(0.01);
  ASSERT_EQ(selector.Select(CreateWorkers(4), 1).size(), 1);
}

// NOLINTNEXTLINE
TEST(ParticipationRatio, SelectsAtLeastMinParticipants) {
  ParticipationRatio selector(0.5, /*min_participants=*/2);
  EXPECT_THAT(selector.Select(CreateWorkers(2), 1),
              ElementsAre("worker-0", "worker-1"));
  EXPECT_THAT(selector.Select(CreateWorkers(2), 2),
              ElementsAre("worker-0", "worker-1"));
  EXPECT_EQ(selector.Select(CreateWorkers(3), 1).size(), 2);
  EXPECT_EQ(selector.Select(CreateWorkers(10), 1).size(), 5);
}

// NOLINTNEXTLINE
TEST(ParticipationRatio, MinParticipantsAboveConnectedSelectsAll) {
  ParticipationRatio selector(0.1, /*min_participants=*/5);
  EXPECT_THAT(selector.Select(CreateWorkers(3), 1),
              ElementsAre("worker-0", "worker-1", "worker-2"));
}

// NOLINTNEXTLINE
TEST(ParticipationRatio, WorkersTakeTurns) {
  ParticipationRatio selector(0.5);
  auto workers = CreateWorkers(4);
  EXPECT_THAT(selector.Select(workers, 1), ElementsAre("worker-0", "worker-1"));
  EXPECT_THAT(selector.Select(workers, 2), ElementsAre("worker-2", "worker-3"));
  EXPECT_THAT(selector.Select(workers, 3), ElementsAre("worker-0", "worker-1"));
}

// NOLINTNEXTLINE
TEST(ParticipationRatio, SameRoundSameSelection) {
  ParticipationRatio selector(0.4);
  auto workers = CreateWorkers(7);
  EXPECT_EQ(selector.Select(workers, 5), selector.Select(workers, 5));
}

}  // namespace
}  // namespace cropfl::coordinator
