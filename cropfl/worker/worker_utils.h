#ifndef CROPFL_CROPFL_WORKER_WORKER_UTILS_H_
#define CROPFL_CROPFL_WORKER_WORKER_UTILS_H_

#include <memory>
#include <string>

#include "absl/status/statusor.h"
#include "cropfl/common/dataset.h"
#include "cropfl/proto/params.pb.h"
#include "cropfl/worker/training/training.h"

namespace cropfl::worker {

absl::StatusOr<std::unique_ptr<ModelTrainer>> CreateTrainer(
    const std::string &trainer, const ClassTable &class_table,
    int num_features);

WorkerParams DefaultWorkerParams();

absl::Status ValidateWorkerParams(const WorkerParams &params);

}  // namespace cropfl::worker

#endif  // CROPFL_CROPFL_WORKER_WORKER_UTILS_H_
