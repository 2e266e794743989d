#include "cropfl/coordinator/aggregation/federated_average.h"

#include <algorithm>
#include <cmath>
#include <string>
#include <utility>

#include "absl/strings/str_cat.h"
#include "cropfl/common/errors.h"

namespace cropfl::coordinator {

absl::StatusOr<ParameterVector> FederatedAverage::Aggregate(
    const AggregationPairs &pairs) {
  if (pairs.empty()) {
    return absl::InvalidArgumentError("No parameter vectors to aggregate.");
  }

  double total_weight = 0;
  const auto *sample = pairs.front().first;
  for (const auto &[parameters, weight] : pairs) {
    if (parameters == nullptr) {
      return absl::InvalidArgumentError("Null parameter vector.");
    }
    if (weight == 0) {
      return absl::InvalidArgumentError(
          "Contributions must carry a positive weight.");
    }
    if (!TensorOps::SameShape(*sample, *parameters) ||
        !TensorOps::IsWellFormed(*parameters)) {
      return ShapeMismatchError(absl::StrCat(
          "Cannot aggregate parameter vectors of shape ",
          TensorOps::ShapeString(*sample), " and ",
          TensorOps::ShapeString(*parameters), "."));
    }
    if (!TensorOps::AllFinite(*parameters)) {
      return absl::InvalidArgumentError(
          "Cannot aggregate parameter vectors holding non-finite values.");
    }
    total_weight += static_cast<double>(weight);
  }

  ParameterVector aggregated;
  aggregated.mutable_tensors()->CopyFrom(sample->tensors());

  auto total_tensors = aggregated.tensors_size();

#pragma omp parallel for
  for (int var_idx = 0; var_idx < total_tensors; ++var_idx) {
    auto var_num_values = aggregated.tensors(var_idx).length();

    auto aggregated_tensor =
        AggregateTensorAtIndex(pairs, var_idx, var_num_values, total_weight);
    auto serialized_tensor = TensorOps::SerializeTensor(aggregated_tensor);

    std::string serialized_tensor_str(serialized_tensor.begin(),
                                      serialized_tensor.end());

    *aggregated.mutable_tensors(var_idx)->mutable_value() =
        serialized_tensor_str;
  }

  return aggregated;
}

std::vector<double> FederatedAverage::AggregateTensorAtIndex(
    const AggregationPairs &pairs, int var_idx, uint32_t var_num_values,
    double total_weight) const {
  std::vector<std::pair<uint64_t, std::vector<double>>> contributions;
  contributions.reserve(pairs.size());
  for (const auto &[parameters, weight] : pairs) {
    contributions.emplace_back(
        weight, TensorOps::DeserializeTensor(parameters->tensors(var_idx)));
  }
  std::sort(contributions.begin(), contributions.end());

  auto aggregated_tensor = std::vector<double>(var_num_values);
  for (const auto &[weight, values] : contributions) {
    const auto scaling_factor = static_cast<double>(weight);
    for (uint32_t i = 0; i < var_num_values; ++i) {
      aggregated_tensor[i] += values[i] * scaling_factor;
    }
  }
  for (auto &value : aggregated_tensor) value /= total_weight;
  return aggregated_tensor;
}

absl::StatusOr<double> FederatedAverage::AggregateMetric(
    const MetricPairs &pairs) {
  if (pairs.empty()) {
    return absl::InvalidArgumentError("No metrics to aggregate.");
  }

  for (const auto &[value, weight] : pairs) {
    if (weight == 0) {
      return absl::InvalidArgumentError(
          "Contributions must carry a positive weight.");
    }
    if (!std::isfinite(value)) {
      return absl::InvalidArgumentError("Cannot aggregate non-finite metrics.");
    }
  }

  auto sorted = pairs;
  std::sort(sorted.begin(), sorted.end(),
            [](const auto &left, const auto &right) {
              return std::make_pair(left.second, left.first) <
                     std::make_pair(right.second, right.first);
            });

  double weighted_sum = 0;
  double total_weight = 0;
  for (const auto &[value, weight] : sorted) {
    weighted_sum += value * static_cast<double>(weight);
    total_weight += static_cast<double>(weight);
  }
  return weighted_sum / total_weight;
}

}  // namespace cropfl::coordinator
