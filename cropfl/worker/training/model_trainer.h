#ifndef CROPFL_CROPFL_WORKER_TRAINING_MODEL_TRAINER_H_
#define CROPFL_CROPFL_WORKER_TRAINING_MODEL_TRAINER_H_

#include <string>
#include <utility>
#include <vector>

#include "absl/status/statusor.h"
#include "cropfl/common/dataset.h"
#include "cropfl/proto/model.pb.h"

namespace cropfl::worker {

// A local learning algorithm whose predictor is fully described by a
// fixed-shape parameter vector. Trainers hold no state between calls.
class ModelTrainer {
 public:
  ModelTrainer(ClassTable class_table, int num_features)
      : class_table_(std::move(class_table)), num_features_(num_features) {}

  virtual ~ModelTrainer() = default;

  // The parameters of an untrained model. Defines the shape every parameter
  // vector handed to this trainer must have.
  virtual ParameterVector InitialParameters() const = 0;

  // Trains starting from `parameters` on `rows` and returns the new
  // parameters. Fails with LocalTrainingError when the rows cannot be used
  // and with ShapeMismatchError when `parameters` has the wrong shape.
  virtual absl::StatusOr<ParameterVector> Train(
      const ParameterVector &parameters, const std::vector<Row> &rows,
      const Hyperparameters &hyperparameters) const = 0;

  // Predicted class index of every row.
  virtual absl::StatusOr<std::vector<int>> Predict(
      const ParameterVector &parameters,
      const std::vector<Row> &rows) const = 0;

  virtual std::string Name() const = 0;

  // Fraction of rows whose label is predicted correctly.
  absl::StatusOr<double> Accuracy(const ParameterVector &parameters,
                                  const std::vector<Row> &rows) const;

  const ClassTable &class_table() const { return class_table_; }

  int num_features() const { return num_features_; }

 protected:
  absl::Status CheckShape(const ParameterVector &parameters) const;

  // Class index of every row; LocalTrainingError for unknown labels or
  // malformed feature rows.
  absl::StatusOr<std::vector<int>> LabelIndices(
      const std::vector<Row> &rows) const;

  ClassTable class_table_;
  int num_features_;
};

}  // namespace cropfl::worker

#endif  // CROPFL_CROPFL_WORKER_TRAINING_MODEL_TRAINER_H_
