#ifndef CROPFL_CROPFL_COORDINATOR_CORE_WORKER_CLIENT_H_
#define CROPFL_CROPFL_COORDINATOR_CORE_WORKER_CLIENT_H_

#include <cstdint>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/time/time.h"
#include "cropfl/proto/federation.pb.h"
#include "cropfl/proto/model.pb.h"

namespace cropfl::coordinator {

// The coordinator's handle on one registered worker. Errors reported by the
// worker itself carry their ErrorKind; delivery failures (unreachable
// worker, expired deadline) carry none. Implementations must be safe to call
// from several threads at once.
class WorkerClient {
 public:
  virtual ~WorkerClient() = default;

  // Parameters of the worker's untrained model.
  virtual absl::StatusOr<ParameterVector> GetParameters(
      absl::Duration timeout) = 0;

  virtual absl::StatusOr<FitResult> Fit(const RoundConfig &config,
                                        absl::Duration timeout) = 0;

  virtual absl::StatusOr<EvalResult> Evaluate(
      uint32_t round_number, const ParameterVector &parameters,
      absl::Duration timeout) = 0;

  // Asks the worker to stop serving.
  virtual absl::Status ShutDown() = 0;
};

}  // namespace cropfl::coordinator

#endif  // CROPFL_CROPFL_COORDINATOR_CORE_WORKER_CLIENT_H_
