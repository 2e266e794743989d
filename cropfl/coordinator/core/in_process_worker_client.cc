#include "cropfl/coordinator/core/in_process_worker_client.h"

#include "absl/strings/str_cat.h"
#include "cropfl/common/macros.h"

namespace cropfl::coordinator {

absl::Status InProcessWorkerClient::CheckServing() const {
  if (shut_down_) {
    return absl::UnavailableError(
        absl::StrCat("Worker ", worker_->worker_id(), " was shut down."));
  }
  return absl::OkStatus();
}

absl::StatusOr<ParameterVector> InProcessWorkerClient::GetParameters(
    absl::Duration timeout) {
  RETURN_IF_ERROR(CheckServing());
  return worker_->GetParameters();
}

absl::StatusOr<FitResult> InProcessWorkerClient::Fit(const RoundConfig &config,
                                                     absl::Duration timeout) {
  RETURN_IF_ERROR(CheckServing());
  return worker_->Fit(config);
}

absl::StatusOr<EvalResult> InProcessWorkerClient::Evaluate(
    uint32_t round_number, const ParameterVector &parameters,
    absl::Duration timeout) {
  RETURN_IF_ERROR(CheckServing());
  return worker_->Evaluate(round_number, parameters);
}

absl::Status InProcessWorkerClient::ShutDown() {
  shut_down_ = true;
  return absl::OkStatus();
}

}  // namespace cropfl::coordinator
