#ifndef CROPFL_CROPFL_WORKER_WORKER_H_
#define CROPFL_CROPFL_WORKER_WORKER_H_

#include <memory>
#include <string>

#include "absl/status/statusor.h"
#include "cropfl/proto/federation.pb.h"
#include "cropfl/worker/partitioner.h"
#include "cropfl/worker/training/model_trainer.h"

namespace cropfl::worker {

// One autonomous participant of the federation. A worker only ever reads its
// own partition and answers the coordinator's requests; it holds no state
// that a request could mutate, so concurrent requests are safe.
class Worker {
  Partition partition_;
  std::unique_ptr<ModelTrainer> trainer_;

 public:
  Worker(Partition partition, std::unique_ptr<ModelTrainer> trainer);

  ~Worker() = default;

  // Getters
  const std::string &worker_id() const { return partition_.worker_id; }

  const Partition &partition() const { return partition_; }

  const ModelTrainer &trainer() const { return *trainer_; }

  // Parameters of an untrained local model.
  ParameterVector GetParameters() const;

  // Trains on the train slice starting from the configured parameters. The
  // weight of the result is the size of the train slice.
  absl::StatusOr<FitResult> Fit(const RoundConfig &config) const;

  // Scores `parameters` on the held-out slice. The loss is 1 - accuracy and
  // the weight is the size of the held-out slice.
  absl::StatusOr<EvalResult> Evaluate(uint32_t round_number,
                                      const ParameterVector &parameters) const;
};

}  // namespace cropfl::worker

#endif  // CROPFL_CROPFL_WORKER_WORKER_H_
