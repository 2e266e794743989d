#ifndef CROPFL_CROPFL_COORDINATOR_CORE_GRPC_WORKER_CLIENT_H_
#define CROPFL_CROPFL_COORDINATOR_CORE_GRPC_WORKER_CLIENT_H_

#include <grpcpp/channel.h>
#include <grpcpp/client_context.h>

#include <memory>
#include <string>

#include "cropfl/coordinator/core/types.h"
#include "cropfl/coordinator/core/worker_client.h"

namespace cropfl::coordinator {

// Calls a remote worker's WorkerService. Every call carries the given
// timeout as its gRPC deadline.
class GrpcWorkerClient : public WorkerClient {
 public:
  explicit GrpcWorkerClient(const ServerEntity &server_entity);

  // For tests: talks to the worker over an existing channel.
  GrpcWorkerClient(std::string target,
                   std::shared_ptr<grpc::ChannelInterface> channel);

  absl::StatusOr<ParameterVector> GetParameters(
      absl::Duration timeout) override;

  absl::StatusOr<FitResult> Fit(const RoundConfig &config,
                                absl::Duration timeout) override;

  absl::StatusOr<EvalResult> Evaluate(uint32_t round_number,
                                      const ParameterVector &parameters,
                                      absl::Duration timeout) override;

  absl::Status ShutDown() override;

  const std::string &target() const { return target_; }

 private:
  std::string target_;
  WorkerStub stub_;
};

}  // namespace cropfl::coordinator

#endif  // CROPFL_CROPFL_COORDINATOR_CORE_GRPC_WORKER_CLIENT_H_
