#ifndef CROPFL_CROPFL_COORDINATOR_CORE_IN_PROCESS_WORKER_CLIENT_H_
#define CROPFL_CROPFL_COORDINATOR_CORE_IN_PROCESS_WORKER_CLIENT_H_

#include <atomic>
#include <memory>
#include <utility>

#include "cropfl/coordinator/core/worker_client.h"
#include "cropfl/worker/worker.h"

namespace cropfl::coordinator {

// Calls a worker living in the same process. The timeout is left to the
// coordinator's round barrier.
class InProcessWorkerClient : public WorkerClient {
 public:
  explicit InProcessWorkerClient(std::shared_ptr<const worker::Worker> worker)
      : worker_(std::move(worker)) {}

  absl::StatusOr<ParameterVector> GetParameters(
      absl::Duration timeout) override;

  absl::StatusOr<FitResult> Fit(const RoundConfig &config,
                                absl::Duration timeout) override;

  absl::StatusOr<EvalResult> Evaluate(uint32_t round_number,
                                      const ParameterVector &parameters,
                                      absl::Duration timeout) override;

  absl::Status ShutDown() override;

  bool shut_down() const { return shut_down_; }

 private:
  absl::Status CheckServing() const;

  std::shared_ptr<const worker::Worker> worker_;
  std::atomic<bool> shut_down_{false};
};

}  // namespace cropfl::coordinator

#endif  // CROPFL_CROPFL_COORDINATOR_CORE_IN_PROCESS_WORKER_CLIENT_H_
