#ifndef CROPFL_CROPFL_COORDINATOR_CORE_COORDINATOR_MOCK_H_
#define CROPFL_CROPFL_COORDINATOR_CORE_COORDINATOR_MOCK_H_

#include <gmock/gmock.h>

#include "cropfl/coordinator/core/coordinator.h"

namespace cropfl::coordinator {

class MockCoordinator : public Coordinator {
 public:
  MOCK_METHOD(const CoordinatorParams &, GetParams, (), (const, override));
  MOCK_METHOD(absl::StatusOr<RegisterAck>, RegisterWorker,
              (const std::string &worker_id,
               std::shared_ptr<WorkerClient> client),
              (override));
  MOCK_METHOD(absl::Status, DeregisterWorker, (const std::string &worker_id),
              (override));
  MOCK_METHOD(absl::Status, SetInitialParameters,
              (const ParameterVector &parameters), (override));
  MOCK_METHOD(absl::Status, Step, (), (override));
  MOCK_METHOD(bool, AwaitQuorum, (absl::Duration timeout), (override));
  MOCK_METHOD(absl::Status, Run, (), (override));
  MOCK_METHOD(CoordinatorState, GetState, (), (const, override));
  MOCK_METHOD(uint32_t, GetCurrentRound, (), (const, override));
  MOCK_METHOD(ParameterVector, GetGlobalParameters, (), (const, override));
  MOCK_METHOD(std::vector<RoundSummary>, GetHistory, (), (const, override));
  MOCK_METHOD(RunOutcome, GetOutcome, (), (const, override));
  MOCK_METHOD(std::vector<std::string>, GetConnectedWorkers, (),
              (const, override));
  MOCK_METHOD(RunStatus, GetRunStatus, (), (const, override));
  MOCK_METHOD(void, Shutdown, (), (override));
};

}  // namespace cropfl::coordinator

#endif  // CROPFL_CROPFL_COORDINATOR_CORE_COORDINATOR_MOCK_H_
