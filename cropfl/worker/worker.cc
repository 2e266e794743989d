#include "cropfl/worker/worker.h"

#include <glog/logging.h>

#include <utility>

#include "absl/strings/str_cat.h"
#include "cropfl/common/errors.h"

namespace cropfl::worker {
namespace {

// Trainer failures other than the two the protocol knows about are reported
// as local training failures.
absl::Status AsWorkerError(const absl::Status &status) {
  if (IsErrorKind(status, LOCAL_TRAINING) ||
      IsErrorKind(status, SHAPE_MISMATCH))
    return status;
  return LocalTrainingError(status.message());
}

}  // namespace

Worker::Worker(Partition partition, std::unique_ptr<ModelTrainer> trainer)
    : partition_(std::move(partition)), trainer_(std::move(trainer)) {
  LOG(INFO) << "Worker " << partition_.worker_id << " initialized with "
            << partition_.train_rows.size() << " training and "
            << partition_.eval_rows.size() << " held-out rows ("
            << trainer_->Name() << ").";
}

ParameterVector Worker::GetParameters() const {
  return trainer_->InitialParameters();
}

absl::StatusOr<FitResult> Worker::Fit(const RoundConfig &config) const {
  VLOG(1) << "Worker " << worker_id() << " starting training for round "
          << config.round_number();

  auto trained = trainer_->Train(config.parameters(), partition_.train_rows,
                                 config.hyperparameters());
  if (!trained.ok()) {
    LOG(WARNING) << "Worker " << worker_id() << " failed to train in round "
                 << config.round_number() << ": " << trained.status();
    return AsWorkerError(trained.status());
  }

  auto train_accuracy = trainer_->Accuracy(*trained, partition_.train_rows);
  if (!train_accuracy.ok()) return AsWorkerError(train_accuracy.status());

  FitResult result;
  result.set_worker_id(worker_id());
  *result.mutable_parameters() = std::move(trained).value();
  result.set_sample_count(partition_.train_rows.size());
  result.set_train_metric(*train_accuracy);

  LOG(INFO) << "Worker " << worker_id() << " completed round "
            << config.round_number() << " training on "
            << result.sample_count()
            << " rows, train accuracy: " << result.train_metric();
  return result;
}

absl::StatusOr<EvalResult> Worker::Evaluate(
    uint32_t round_number, const ParameterVector &parameters) const {
  if (partition_.eval_rows.empty()) {
    return LocalTrainingError(
        absl::StrCat("Worker ", worker_id(), " holds no held-out rows."));
  }

  auto accuracy = trainer_->Accuracy(parameters, partition_.eval_rows);
  if (!accuracy.ok()) {
    LOG(WARNING) << "Worker " << worker_id() << " failed to evaluate round "
                 << round_number << ": " << accuracy.status();
    return AsWorkerError(accuracy.status());
  }

  EvalResult result;
  result.set_worker_id(worker_id());
  result.set_sample_count(partition_.eval_rows.size());
  result.set_eval_metric(*accuracy);
  result.set_loss(1.0 - *accuracy);

  LOG(INFO) << "Worker " << worker_id() << " evaluated round " << round_number
            << " on " << result.sample_count()
            << " rows, accuracy: " << result.eval_metric()
            << ", loss: " << result.loss();
  return result;
}

}  // namespace cropfl::worker
