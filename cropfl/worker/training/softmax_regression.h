#ifndef CROPFL_CROPFL_WORKER_TRAINING_SOFTMAX_REGRESSION_H_
#define CROPFL_CROPFL_WORKER_TRAINING_SOFTMAX_REGRESSION_H_

#include "cropfl/worker/training/model_trainer.h"

namespace cropfl::worker {

// Multinomial logistic regression trained with full-batch gradient descent.
//
// Parameter layout (tensor index: contents):
//   0: weights, C x F, row-major
//   1: bias, C
//   2: feature means, F
//   3: feature scales, F
// Features are standardised with tensors 2 and 3. An all-zero scale tensor
// marks an untrained model, in which case the statistics of the local train
// rows are used and returned.
class SoftmaxRegression : public ModelTrainer {
 public:
  using ModelTrainer::ModelTrainer;

  ParameterVector InitialParameters() const override;

  absl::StatusOr<ParameterVector> Train(
      const ParameterVector &parameters, const std::vector<Row> &rows,
      const Hyperparameters &hyperparameters) const override;

  absl::StatusOr<std::vector<int>> Predict(
      const ParameterVector &parameters,
      const std::vector<Row> &rows) const override;

  inline std::string Name() const override { return "SoftmaxRegression"; }

 private:
  struct Model {
    std::vector<double> weights;
    std::vector<double> bias;
    std::vector<double> mean;
    std::vector<double> scale;
  };

  Model Unpack(const ParameterVector &parameters) const;

  ParameterVector Pack(const Model &model) const;

  std::vector<double> Standardize(const Model &model,
                                  const std::vector<double> &features) const;

  // Writes the class probabilities of `x` into `probabilities`.
  void Softmax(const Model &model, const std::vector<double> &x,
               std::vector<double> &probabilities) const;
};

}  // namespace cropfl::worker

#endif  // CROPFL_CROPFL_WORKER_TRAINING_SOFTMAX_REGRESSION_H_
