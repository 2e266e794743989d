#ifndef CROPFL_CROPFL_COORDINATOR_CORE_COORDINATOR_H_
#define CROPFL_CROPFL_COORDINATOR_CORE_COORDINATOR_H_

#include <glog/logging.h>

#include <memory>
#include <string>
#include <vector>

#include "absl/status/statusor.h"
#include "absl/time/time.h"
#include "cropfl/coordinator/aggregation/aggregation_function.h"
#include "cropfl/coordinator/core/worker_client.h"
#include "cropfl/coordinator/selection/selector.h"
#include "cropfl/proto/coordinator.pb.h"
#include "cropfl/proto/params.pb.h"

namespace cropfl::coordinator {

// Drives a synchronous federated training run. Workers register at any time;
// once `min_participants` of them are connected the coordinator runs
// `total_rounds` rounds, each one fanning a RoundConfig out to the selected
// workers, averaging the returned parameters and evaluating the result on
// the same workers. A round whose fit or evaluation phase gathers fewer than
// `min_participants` results is retried at most `max_round_retries` times.
//
// The run moves through the CoordinatorState values:
//   AWAITING_QUORUM -> CONFIGURING_ROUND -> COLLECTING_FIT -> AGGREGATING ->
//   COLLECTING_EVAL -> ROUND_COMPLETE -> (CONFIGURING_ROUND | TERMINATED)
class Coordinator {
 public:
  virtual ~Coordinator() = default;

  // Returns the parameters with which the coordinator was initialized.
  ABSL_MUST_USE_RESULT
  virtual const CoordinatorParams &GetParams() const = 0;

  // Adds a worker to the federation. Fails with InvalidArgument for an empty
  // id, AlreadyExists for a duplicate id and FailedPrecondition once the run
  // has terminated.
  virtual absl::StatusOr<RegisterAck> RegisterWorker(
      const std::string &worker_id, std::shared_ptr<WorkerClient> client) = 0;

  // Removes a worker from the federation. Rounds already in flight record
  // the worker as failed.
  virtual absl::Status DeregisterWorker(const std::string &worker_id) = 0;

  // Replaces the parameters of the first round. Only allowed before the first
  // round is configured.
  virtual absl::Status SetInitialParameters(
      const ParameterVector &parameters) = 0;

  // Performs exactly one state transition, or none while waiting for quorum.
  // Returns the error that terminated the run, if this step did.
  virtual absl::Status Step() = 0;

  // Blocks until `min_participants` workers are connected. Returns false on
  // timeout or shutdown.
  virtual bool AwaitQuorum(absl::Duration timeout) = 0;

  // Steps until the run terminates. Returns OK for a completed run,
  // RunAbortedError or ShapeMismatchError for an aborted one, and Cancelled
  // when Shutdown() interrupted it.
  virtual absl::Status Run() = 0;

  // Getters
  ABSL_MUST_USE_RESULT
  virtual CoordinatorState GetState() const = 0;

  // Number of completed rounds.
  ABSL_MUST_USE_RESULT
  virtual uint32_t GetCurrentRound() const = 0;

  ABSL_MUST_USE_RESULT
  virtual ParameterVector GetGlobalParameters() const = 0;

  ABSL_MUST_USE_RESULT
  virtual std::vector<RoundSummary> GetHistory() const = 0;

  ABSL_MUST_USE_RESULT
  virtual RunOutcome GetOutcome() const = 0;

  ABSL_MUST_USE_RESULT
  virtual std::vector<std::string> GetConnectedWorkers() const = 0;

  ABSL_MUST_USE_RESULT
  virtual RunStatus GetRunStatus() const = 0;

  // Terminates the run if it is still going and asks the workers to shut
  // down.
  virtual void Shutdown() = 0;

 public:
  // Creates a new coordinator using the aggregation rule and selector named
  // by `params`.
  static absl::StatusOr<std::unique_ptr<Coordinator>> New(
      const CoordinatorParams &params);

  static std::unique_ptr<Coordinator> New(
      const CoordinatorParams &params,
      std::unique_ptr<AggregationFunction> aggregator,
      std::unique_ptr<Selector> selector);
};

}  // namespace cropfl::coordinator

#endif  // CROPFL_CROPFL_COORDINATOR_CORE_COORDINATOR_H_
