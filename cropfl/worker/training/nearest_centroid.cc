#include "cropfl/worker/training/nearest_centroid.h"

#include <limits>

#include "cropfl/common/errors.h"
#include "cropfl/common/macros.h"
#include "cropfl/common/proto_tensor_serde.h"

namespace cropfl::worker {

using cropfl::proto::TensorOps;

ParameterVector NearestCentroid::InitialParameters() const {
  const int64_t C = class_table_.size();
  const int64_t F = num_features_;
  ParameterVector parameters;
  *parameters.add_tensors() =
      TensorOps::MakeTensor(std::vector<double>(C * F, 0.0), {C, F});
  return parameters;
}

absl::StatusOr<ParameterVector> NearestCentroid::Train(
    const ParameterVector &parameters, const std::vector<Row> &rows,
    const Hyperparameters &hyperparameters) const {
  RETURN_IF_ERROR(CheckShape(parameters));
  if (rows.empty()) return LocalTrainingError("No rows to train on.");
  ASSIGN_OR_RETURN(auto labels, LabelIndices(rows));

  const int C = class_table_.size();
  const int F = num_features_;
  std::vector<double> sums(C * F, 0.0);
  std::vector<size_t> counts(C, 0);
  for (size_t i = 0; i < rows.size(); ++i) {
    ++counts[labels[i]];
    for (int j = 0; j < F; ++j)
      sums[labels[i] * F + j] += rows[i].features[j];
  }

  auto centroids = TensorOps::DeserializeTensor(parameters.tensors(0));
  for (int c = 0; c < C; ++c) {
    if (counts[c] == 0) continue;
    for (int j = 0; j < F; ++j)
      centroids[c * F + j] =
          sums[c * F + j] / static_cast<double>(counts[c]);
  }

  ParameterVector trained = parameters;
  TensorOps::SetTensorValues(trained.mutable_tensors(0), centroids);
  return trained;
}

absl::StatusOr<std::vector<int>> NearestCentroid::Predict(
    const ParameterVector &parameters, const std::vector<Row> &rows) const {
  RETURN_IF_ERROR(CheckShape(parameters));

  const int C = class_table_.size();
  const int F = num_features_;
  auto centroids = TensorOps::DeserializeTensor(parameters.tensors(0));

  std::vector<int> predictions;
  predictions.reserve(rows.size());
  for (const auto &row : rows) {
    if (static_cast<int>(row.features.size()) != F)
      return LocalTrainingError("Row has the wrong number of features.");
    int best = 0;
    double best_distance = std::numeric_limits<double>::infinity();
    for (int c = 0; c < C; ++c) {
      double distance = 0.0;
      for (int j = 0; j < F; ++j) {
        double d = row.features[j] - centroids[c * F + j];
        distance += d * d;
      }
      if (distance < best_distance) {
        best_distance = distance;
        best = c;
      }
    }
    predictions.push_back(best);
  }
  return predictions;
}

}  // namespace cropfl::worker
