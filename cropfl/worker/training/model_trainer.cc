#include "cropfl/worker/training/model_trainer.h"

#include <cmath>

#include "absl/strings/str_cat.h"
#include "cropfl/common/errors.h"
#include "cropfl/common/macros.h"
#include "cropfl/common/proto_tensor_serde.h"

namespace cropfl::worker {

using cropfl::proto::TensorOps;

absl::StatusOr<double> ModelTrainer::Accuracy(
    const ParameterVector &parameters, const std::vector<Row> &rows) const {
  if (rows.empty())
    return LocalTrainingError("Cannot compute accuracy over zero rows.");

  ASSIGN_OR_RETURN(auto labels, LabelIndices(rows));
  ASSIGN_OR_RETURN(auto predictions, Predict(parameters, rows));

  size_t correct = 0;
  for (size_t i = 0; i < rows.size(); ++i) {
    if (predictions[i] == labels[i]) ++correct;
  }
  return static_cast<double>(correct) / static_cast<double>(rows.size());
}

absl::Status ModelTrainer::CheckShape(const ParameterVector &parameters) const {
  auto expected = InitialParameters();
  if (!TensorOps::SameShape(parameters, expected)) {
    return ShapeMismatchError(absl::StrCat(
        Name(), " expects parameters of shape ",
        TensorOps::ShapeString(expected), ", got ",
        TensorOps::ShapeString(parameters), "."));
  }
  if (!TensorOps::IsWellFormed(parameters))
    return ShapeMismatchError("Parameter tensors are truncated.");
  return absl::OkStatus();
}

absl::StatusOr<std::vector<int>> ModelTrainer::LabelIndices(
    const std::vector<Row> &rows) const {
  std::vector<int> labels;
  labels.reserve(rows.size());
  for (const auto &row : rows) {
    if (static_cast<int>(row.features.size()) != num_features_) {
      return LocalTrainingError(absl::StrCat("Row has ", row.features.size(),
                                             " features, expected ",
                                             num_features_, "."));
    }
    for (auto value : row.features) {
      if (!std::isfinite(value))
        return LocalTrainingError("Row holds a non-finite feature value.");
    }
    auto idx = class_table_.IndexOf(row.label);
    if (idx < 0) {
      return LocalTrainingError(
          absl::StrCat("Label '", row.label, "' is not a known class."));
    }
    labels.push_back(idx);
  }
  return labels;
}

}  // namespace cropfl::worker
