#include "cropfl/worker/partitioner.h"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <algorithm>
#include <vector>

#include "cropfl/common/errors.h"

namespace cropfl::worker {
namespace {

using ::testing::ElementsAreArray;
using ::testing::UnorderedElementsAreArray;

std::shared_ptr<const Dataset> MakeDataset(size_t num_rows) {
  std::vector<Row> rows;
  for (size_t i = 0; i < num_rows; ++i) {
    rows.push_back({{static_cast<double>(i)}, i % 2 == 0 ? "rice" : "maize"});
  }
  auto dataset = Dataset::Create({"x"}, std::move(rows));
  EXPECT_TRUE(dataset.ok()) << dataset.status();
  return *dataset;
}

class PartitionerTest : public ::testing::Test {};

// NOLINTNEXTLINE
TEST_F(PartitionerTest, NineRowsTwoWorkers) {
  auto dataset = MakeDataset(9);

  auto first = CreatePartition(*dataset, 0, 2, 0.8);
  auto second = CreatePartition(*dataset, 1, 2, 0.8);
  ASSERT_TRUE(first.ok()) << first.status();
  ASSERT_TRUE(second.ok()) << second.status();

  EXPECT_EQ(first->worker_id, "worker-0");
  EXPECT_EQ(first->total_size, 4);
  EXPECT_EQ(first->train_rows.size(), 3);
  EXPECT_EQ(first->eval_rows.size(), 1);

  EXPECT_EQ(second->worker_id, "worker-1");
  EXPECT_EQ(second->total_size, 5);
  EXPECT_EQ(second->train_rows.size(), 4);
  EXPECT_EQ(second->eval_rows.size(), 1);
}

// NOLINTNEXTLINE
TEST_F(PartitionerTest, ShardsCoverTheDatasetExactlyOnce) {
  for (size_t num_rows : {7, 10, 23, 100}) {
    auto dataset = MakeDataset(num_rows);
    for (uint32_t worker_count : {1, 2, 3, 7}) {
      std::vector<size_t> seen;
      for (uint32_t ordinal = 0; ordinal < worker_count; ++ordinal) {
        auto partition =
            CreatePartition(*dataset, ordinal, worker_count, 0.8);
        ASSERT_TRUE(partition.ok()) << partition.status();
        seen.insert(seen.end(), partition->train_indices.begin(),
                    partition->train_indices.end());
        seen.insert(seen.end(), partition->eval_indices.begin(),
                    partition->eval_indices.end());
      }

      std::vector<size_t> all(num_rows);
      for (size_t i = 0; i < num_rows; ++i) all[i] = i;
      EXPECT_THAT(seen, UnorderedElementsAreArray(all))
          << num_rows << " rows, " << worker_count << " workers";
    }
  }
}

// NOLINTNEXTLINE
TEST_F(PartitionerTest, ShardIsContiguous) {
  auto dataset = MakeDataset(10);

  auto partition = CreatePartition(*dataset, 1, 3, 0.5);
  ASSERT_TRUE(partition.ok()) << partition.status();

  std::vector<size_t> shard = partition->train_indices;
  shard.insert(shard.end(), partition->eval_indices.begin(),
               partition->eval_indices.end());
  std::sort(shard.begin(), shard.end());
  EXPECT_THAT(shard, ElementsAreArray({3, 4, 5}));

  for (size_t i = 0; i < partition->train_rows.size(); ++i) {
    EXPECT_EQ(partition->train_rows[i].features[0],
              static_cast<double>(partition->train_indices[i]));
  }
}

// NOLINTNEXTLINE
TEST_F(PartitionerTest, PartitionIsDeterministic) {
  auto dataset = MakeDataset(50);

  auto first = CreatePartition(*dataset, 2, 4, 0.8);
  auto second = CreatePartition(*dataset, 2, 4, 0.8);
  ASSERT_TRUE(first.ok());
  ASSERT_TRUE(second.ok());

  EXPECT_EQ(first->train_indices, second->train_indices);
  EXPECT_EQ(first->eval_indices, second->eval_indices);
}

// NOLINTNEXTLINE
TEST_F(PartitionerTest, TooManyWorkersIsInsufficientData) {
  auto dataset = MakeDataset(3);

  auto partition = CreatePartition(*dataset, 0, 4, 0.8);
  EXPECT_TRUE(IsErrorKind(partition.status(), INSUFFICIENT_DATA))
      << partition.status();
}

// NOLINTNEXTLINE
TEST_F(PartitionerTest, RejectsInvalidArguments) {
  auto dataset = MakeDataset(10);

  EXPECT_EQ(CreatePartition(*dataset, 2, 2, 0.8).status().code(),
            absl::StatusCode::kInvalidArgument);
  EXPECT_EQ(CreatePartition(*dataset, 0, 0, 0.8).status().code(),
            absl::StatusCode::kInvalidArgument);
  EXPECT_EQ(CreatePartition(*dataset, 0, 2, 0.0).status().code(),
            absl::StatusCode::kInvalidArgument);
  EXPECT_EQ(CreatePartition(*dataset, 0, 2, 1.0).status().code(),
            absl::StatusCode::kInvalidArgument);
}

}  // namespace
}  // namespace cropfl::worker
