#ifndef CROPFL_CROPFL_WORKER_PARTITIONER_H_
#define CROPFL_CROPFL_WORKER_PARTITIONER_H_

#include <cstdint>
#include <string>
#include <vector>

#include "absl/status/statusor.h"
#include "cropfl/common/dataset.h"

namespace cropfl::worker {

// Seed of the shuffle applied inside every shard.
inline constexpr uint32_t kPartitionShuffleSeed = 42;

// The exclusive slice of the dataset owned by one worker.
struct Partition {
  std::string worker_id;
  std::vector<Row> train_rows;
  std::vector<Row> eval_rows;
  // Dataset row indices backing train_rows and eval_rows, in the same order.
  std::vector<size_t> train_indices;
  std::vector<size_t> eval_indices;
  size_t total_size = 0;
};

std::string GenerateWorkerId(uint32_t worker_ordinal);

// Slices the dataset contiguously by worker ordinal, every worker getting
// floor(len / worker_count) rows and the last one also the remainder. The
// shard is then shuffled with a fixed seed and floor(n * split_ratio) rows
// become the train slice, the rest the held-out slice. The split is not
// stratified by label.
//
// Returns InsufficientDataError when the shard would be empty and
// InvalidArgument when the ordinal, worker count or split ratio are out of
// range.
absl::StatusOr<Partition> CreatePartition(const Dataset &dataset,
                                          uint32_t worker_ordinal,
                                          uint32_t worker_count,
                                          double split_ratio);

}  // namespace cropfl::worker

#endif  // CROPFL_CROPFL_WORKER_PARTITIONER_H_
