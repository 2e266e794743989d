#include "cropfl/worker/training/softmax_regression.h"

#include <algorithm>
#include <cmath>

#include "cropfl/common/errors.h"
#include "cropfl/common/macros.h"
#include "cropfl/common/proto_tensor_serde.h"

namespace cropfl::worker {

using cropfl::proto::TensorOps;

ParameterVector SoftmaxRegression::InitialParameters() const {
  const int C = class_table_.size();
  const int F = num_features_;
  Model model;
  model.weights.assign(C * F, 0.0);
  model.bias.assign(C, 0.0);
  model.mean.assign(F, 0.0);
  model.scale.assign(F, 0.0);
  return Pack(model);
}

absl::StatusOr<ParameterVector> SoftmaxRegression::Train(
    const ParameterVector &parameters, const std::vector<Row> &rows,
    const Hyperparameters &hyperparameters) const {
  RETURN_IF_ERROR(CheckShape(parameters));
  if (rows.empty()) return LocalTrainingError("No rows to train on.");
  ASSIGN_OR_RETURN(auto labels, LabelIndices(rows));

  const int C = class_table_.size();
  const int F = num_features_;
  const auto n = static_cast<double>(rows.size());
  auto model = Unpack(parameters);

  bool untrained = std::all_of(model.scale.begin(), model.scale.end(),
                               [](double s) { return s == 0.0; });
  if (untrained) {
    std::fill(model.mean.begin(), model.mean.end(), 0.0);
    std::fill(model.scale.begin(), model.scale.end(), 0.0);
    for (const auto &row : rows) {
      for (int j = 0; j < F; ++j) model.mean[j] += row.features[j] / n;
    }
    for (const auto &row : rows) {
      for (int j = 0; j < F; ++j) {
        double d = row.features[j] - model.mean[j];
        model.scale[j] += d * d / n;
      }
    }
    for (int j = 0; j < F; ++j) {
      model.scale[j] = std::sqrt(model.scale[j]);
      if (model.scale[j] == 0.0) model.scale[j] = 1.0;
    }
  }

  std::vector<std::vector<double>> inputs;
  inputs.reserve(rows.size());
  for (const auto &row : rows) inputs.push_back(Standardize(model, row.features));

  const double learning_rate = hyperparameters.learning_rate();
  const double l2 = hyperparameters.l2_regularization();
  std::vector<double> probabilities(C);
  std::vector<double> grad_weights(C * F);
  std::vector<double> grad_bias(C);

  for (uint32_t epoch = 0; epoch < hyperparameters.local_epochs(); ++epoch) {
    std::fill(grad_weights.begin(), grad_weights.end(), 0.0);
    std::fill(grad_bias.begin(), grad_bias.end(), 0.0);

    for (size_t i = 0; i < inputs.size(); ++i) {
      Softmax(model, inputs[i], probabilities);
      for (int c = 0; c < C; ++c) {
        double err = probabilities[c] - (labels[i] == c ? 1.0 : 0.0);
        grad_bias[c] += err / n;
        for (int j = 0; j < F; ++j)
          grad_weights[c * F + j] += err * inputs[i][j] / n;
      }
    }

    for (int k = 0; k < C * F; ++k) {
      model.weights[k] -=
          learning_rate * (grad_weights[k] + l2 * model.weights[k]);
    }
    for (int c = 0; c < C; ++c) model.bias[c] -= learning_rate * grad_bias[c];
  }

  auto trained = Pack(model);
  if (!TensorOps::AllFinite(trained))
    return LocalTrainingError("Gradient descent diverged.");
  return trained;
}

absl::StatusOr<std::vector<int>> SoftmaxRegression::Predict(
    const ParameterVector &parameters, const std::vector<Row> &rows) const {
  RETURN_IF_ERROR(CheckShape(parameters));
  auto model = Unpack(parameters);

  std::vector<int> predictions;
  predictions.reserve(rows.size());
  std::vector<double> probabilities(class_table_.size());
  for (const auto &row : rows) {
    if (static_cast<int>(row.features.size()) != num_features_)
      return LocalTrainingError("Row has the wrong number of features.");
    Softmax(model, Standardize(model, row.features), probabilities);
    // max_element keeps the first maximum, i.e., the lowest class index.
    predictions.push_back(static_cast<int>(
        std::max_element(probabilities.begin(), probabilities.end()) -
        probabilities.begin()));
  }
  return predictions;
}

SoftmaxRegression::Model SoftmaxRegression::Unpack(
    const ParameterVector &parameters) const {
  Model model;
  model.weights = TensorOps::DeserializeTensor(parameters.tensors(0));
  model.bias = TensorOps::DeserializeTensor(parameters.tensors(1));
  model.mean = TensorOps::DeserializeTensor(parameters.tensors(2));
  model.scale = TensorOps::DeserializeTensor(parameters.tensors(3));
  return model;
}

ParameterVector SoftmaxRegression::Pack(const Model &model) const {
  const int64_t C = class_table_.size();
  const int64_t F = num_features_;
  ParameterVector parameters;
  *parameters.add_tensors() = TensorOps::MakeTensor(model.weights, {C, F});
  *parameters.add_tensors() = TensorOps::MakeTensor(model.bias, {C});
  *parameters.add_tensors() = TensorOps::MakeTensor(model.mean, {F});
  *parameters.add_tensors() = TensorOps::MakeTensor(model.scale, {F});
  return parameters;
}

std::vector<double> SoftmaxRegression::Standardize(
    const Model &model, const std::vector<double> &features) const {
  std::vector<double> x(num_features_);
  for (int j = 0; j < num_features_; ++j) {
    double scale = model.scale[j] == 0.0 ? 1.0 : model.scale[j];
    x[j] = (features[j] - model.mean[j]) / scale;
  }
  return x;
}

void SoftmaxRegression::Softmax(const Model &model,
                                const std::vector<double> &x,
                                std::vector<double> &probabilities) const {
  const int C = class_table_.size();
  const int F = num_features_;
  double max_logit = -INFINITY;
  for (int c = 0; c < C; ++c) {
    double logit = model.bias[c];
    for (int j = 0; j < F; ++j) logit += model.weights[c * F + j] * x[j];
    probabilities[c] = logit;
    max_logit = std::max(max_logit, logit);
  }
  double total = 0.0;
  for (int c = 0; c < C; ++c) {
    probabilities[c] = std::exp(probabilities[c] - max_logit);
    total += probabilities[c];
  }
  for (int c = 0; c < C; ++c) probabilities[c] /= total;
}

}  // namespace cropfl::worker
