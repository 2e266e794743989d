#ifndef CROPFL_CROPFL_WORKER_TRAINING_NEAREST_CENTROID_H_
#define CROPFL_CROPFL_WORKER_TRAINING_NEAREST_CENTROID_H_

#include "cropfl/worker/training/model_trainer.h"

namespace cropfl::worker {

// Predicts the class whose centroid is closest (squared Euclidean distance,
// ties to the lowest class index). The parameters are a single C x F table
// of centroids. Training replaces the centroid of every class present in the
// local rows with the local class mean; absent classes keep the incoming
// centroid.
class NearestCentroid : public ModelTrainer {
 public:
  using ModelTrainer::ModelTrainer;

  ParameterVector InitialParameters() const override;

  absl::StatusOr<ParameterVector> Train(
      const ParameterVector &parameters, const std::vector<Row> &rows,
      const Hyperparameters &hyperparameters) const override;

  absl::StatusOr<std::vector<int>> Predict(
      const ParameterVector &parameters,
      const std::vector<Row> &rows) const override;

  inline std::string Name() const override { return "NearestCentroid"; }
};

}  // namespace cropfl::worker

#endif  // CROPFL_CROPFL_WORKER_TRAINING_NEAREST_CENTROID_H_
