#include "cropfl/coordinator/core/coordinator_utils.h"

#include "absl/memory/memory.h"
#include "absl/strings/str_cat.h"
#include "cropfl/common/proto_tensor_serde.h"

namespace cropfl::coordinator {

using cropfl::proto::TensorOps;

absl::StatusOr<std::unique_ptr<AggregationFunction>> CreateAggregator(
    const std::string &aggregation_rule) {
  if (aggregation_rule == "FedAvg")
    return absl::make_unique<FederatedAverage>();

  return absl::InvalidArgumentError(
      absl::StrCat("Unsupported aggregation rule: ", aggregation_rule));
}

std::unique_ptr<Selector> CreateSelector(const RunParams &run_params) {
  return absl::make_unique<ParticipationRatio>(
      run_params.participation_ratio(), run_params.min_participants());
}

CoordinatorParams DefaultCoordinatorParams() {
  return TensorOps::ParseTextOrDie<CoordinatorParams>(R"pb(
    server_entity { hostname: "0.0.0.0" port: 8080 }
    run_params {
      total_rounds: 3
      min_participants: 2
      per_round_timeout_ms: 60000
      max_round_retries: 3
      participation_ratio: 1.0
      aggregation_rule: "FedAvg"
    }
    hyperparameters {
      learning_rate: 0.1
      local_epochs: 20
      l2_regularization: 0.0001
    }
    thread_pool_size: 8
  )pb");
}

absl::Status ValidateCoordinatorParams(const CoordinatorParams &params) {
  const auto &run_params = params.run_params();
  if (run_params.total_rounds() < 1)
    return absl::InvalidArgumentError("total_rounds must be positive.");
  if (run_params.min_participants() < 1)
    return absl::InvalidArgumentError("min_participants must be positive.");
  if (run_params.per_round_timeout_ms() == 0)
    return absl::InvalidArgumentError("per_round_timeout_ms must be positive.");
  if (!(run_params.participation_ratio() > 0 &&
        run_params.participation_ratio() <= 1))
    return absl::InvalidArgumentError(
        "participation_ratio must be in (0, 1].");
  if (run_params.aggregation_rule() != "FedAvg")
    return absl::InvalidArgumentError(absl::StrCat(
        "Unsupported aggregation rule: ", run_params.aggregation_rule()));
  if (params.hyperparameters().learning_rate() <= 0)
    return absl::InvalidArgumentError("learning_rate must be positive.");
  if (params.thread_pool_size() < 1)
    return absl::InvalidArgumentError("thread_pool_size must be positive.");
  if (!TensorOps::IsWellFormed(params.initial_parameters()))
    return absl::InvalidArgumentError("initial_parameters are malformed.");
  return absl::OkStatus();
}

}  // namespace cropfl::coordinator
