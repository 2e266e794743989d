#include "cropfl/worker/worker_utils.h"

#include "absl/memory/memory.h"
#include "absl/strings/str_cat.h"
#include "cropfl/common/proto_tensor_serde.h"

namespace cropfl::worker {

using cropfl::proto::TensorOps;

absl::StatusOr<std::unique_ptr<ModelTrainer>> CreateTrainer(
    const std::string &trainer, const ClassTable &class_table,
    int num_features) {
  if (trainer == "SoftmaxRegression")
    return absl::make_unique<SoftmaxRegression>(class_table, num_features);
  if (trainer == "NearestCentroid")
    return absl::make_unique<NearestCentroid>(class_table, num_features);

  return absl::InvalidArgumentError(
      absl::StrCat("Unsupported trainer: ", trainer));
}

WorkerParams DefaultWorkerParams() {
  return TensorOps::ParseTextOrDie<WorkerParams>(R"pb(
    worker_ordinal: 0
    worker_count: 3
    split_ratio: 0.8
    dataset_path: "Crop_recommendation.csv"
    trainer: "SoftmaxRegression"
    server_entity { hostname: "0.0.0.0" port: 50052 }
    coordinator_entity { hostname: "127.0.0.1" port: 8080 }
  )pb");
}

absl::Status ValidateWorkerParams(const WorkerParams &params) {
  if (params.worker_count() < 1)
    return absl::InvalidArgumentError("worker_count must be at least 1.");
  if (params.worker_ordinal() >= params.worker_count())
    return absl::InvalidArgumentError(
        "worker_ordinal must be smaller than worker_count.");
  if (!(params.split_ratio() > 0 && params.split_ratio() < 1))
    return absl::InvalidArgumentError("split_ratio must be in (0, 1).");
  if (params.dataset_path().empty())
    return absl::InvalidArgumentError("dataset_path cannot be empty.");
  if (params.server_entity().hostname().empty() ||
      params.server_entity().port() == 0)
    return absl::InvalidArgumentError("Worker endpoint is incomplete.");
  if (params.coordinator_entity().hostname().empty() ||
      params.coordinator_entity().port() == 0)
    return absl::InvalidArgumentError("Coordinator endpoint is incomplete.");
  return absl::OkStatus();
}

}  // namespace cropfl::worker
