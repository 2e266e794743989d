#include "cropfl/worker/partitioner.h"

#include <cmath>
#include <numeric>
#include <random>

#include "absl/strings/str_cat.h"
#include "cropfl/common/errors.h"

namespace cropfl::worker {
namespace {

// Fisher-Yates over std::mt19937. Yields the same order on every platform.
void DeterministicShuffle(std::vector<size_t> &indices, uint32_t seed) {
  std::mt19937 generator(seed);
  for (size_t i = indices.size(); i > 1; --i) {
    size_t j = generator() % i;
    std::swap(indices[i - 1], indices[j]);
  }
}

}  // namespace

std::string GenerateWorkerId(uint32_t worker_ordinal) {
  return absl::StrCat("worker-", worker_ordinal);
}

absl::StatusOr<Partition> CreatePartition(const Dataset &dataset,
                                          uint32_t worker_ordinal,
                                          uint32_t worker_count,
                                          double split_ratio) {
  if (worker_count < 1)
    return absl::InvalidArgumentError("Worker count must be at least 1.");
  if (worker_ordinal >= worker_count) {
    return absl::InvalidArgumentError(absl::StrCat(
        "Worker ordinal ", worker_ordinal, " not in [0, ", worker_count, ")."));
  }
  if (!(split_ratio > 0 && split_ratio < 1))
    return absl::InvalidArgumentError("Split ratio must be in (0, 1).");

  const size_t shard_size = dataset.size() / worker_count;
  if (shard_size == 0) {
    return InsufficientDataError(
        absl::StrCat("Dataset of ", dataset.size(), " rows cannot feed ",
                     worker_count, " workers."));
  }

  const size_t start = worker_ordinal * shard_size;
  const size_t end = (worker_ordinal == worker_count - 1)
                         ? dataset.size()
                         : start + shard_size;

  std::vector<size_t> shard(end - start);
  std::iota(shard.begin(), shard.end(), start);
  DeterministicShuffle(shard, kPartitionShuffleSeed);

  // The epsilon keeps ratios such as 0.8 * 5 from flooring to 3.
  const auto num_train = static_cast<size_t>(
      std::floor(static_cast<double>(shard.size()) * split_ratio + 1e-9));

  Partition partition;
  partition.worker_id = GenerateWorkerId(worker_ordinal);
  partition.total_size = shard.size();
  partition.train_indices.assign(shard.begin(), shard.begin() + num_train);
  partition.eval_indices.assign(shard.begin() + num_train, shard.end());

  partition.train_rows.reserve(partition.train_indices.size());
  for (auto idx : partition.train_indices)
    partition.train_rows.push_back(dataset.row(idx));
  partition.eval_rows.reserve(partition.eval_indices.size());
  for (auto idx : partition.eval_indices)
    partition.eval_rows.push_back(dataset.row(idx));

  return partition;
}

}  // namespace cropfl::worker
