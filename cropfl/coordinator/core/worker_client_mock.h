#ifndef CROPFL_CROPFL_COORDINATOR_CORE_WORKER_CLIENT_MOCK_H_
#define CROPFL_CROPFL_COORDINATOR_CORE_WORKER_CLIENT_MOCK_H_

#include <gmock/gmock.h>

#include "cropfl/coordinator/core/worker_client.h"

namespace cropfl::coordinator {

class MockWorkerClient : public WorkerClient {
 public:
  MOCK_METHOD(absl::StatusOr<ParameterVector>, GetParameters,
              (absl::Duration timeout), (override));
  MOCK_METHOD(absl::StatusOr<FitResult>, Fit,
              (const RoundConfig &config, absl::Duration timeout),
              (override));
  MOCK_METHOD(absl::StatusOr<EvalResult>, Evaluate,
              (uint32_t round_number, const ParameterVector &parameters,
               absl::Duration timeout),
              (override));
  MOCK_METHOD(absl::Status, ShutDown, (), (override));
};

}  // namespace cropfl::coordinator

#endif  // CROPFL_CROPFL_COORDINATOR_CORE_WORKER_CLIENT_MOCK_H_
