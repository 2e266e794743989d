#ifndef CROPFL_CROPFL_WORKER_COORDINATOR_CLIENT_H_
#define CROPFL_CROPFL_WORKER_COORDINATOR_CLIENT_H_

#include <grpcpp/grpcpp.h>

#include <memory>
#include <string>

#include "absl/status/statusor.h"
#include "absl/time/time.h"
#include "cropfl/proto/coordinator.grpc.pb.h"

namespace cropfl::worker {

// Registers a worker with the coordinator and removes it again.
class CoordinatorClient {
 public:
  explicit CoordinatorClient(const ServerEntity &coordinator_entity);

  CoordinatorClient(std::string target,
                    std::shared_ptr<grpc::ChannelInterface> channel);

  // Announces `server_entity` as the endpoint of `worker_id`. Waits for the
  // coordinator to come up until `timeout` expires.
  absl::StatusOr<RegisterAck> Register(const std::string &worker_id,
                                       const ServerEntity &server_entity,
                                       absl::Duration timeout);

  absl::Status Deregister(const std::string &worker_id,
                          absl::Duration timeout);

 private:
  std::string target_;
  std::unique_ptr<CoordinatorService::Stub> stub_;
};

}  // namespace cropfl::worker

#endif  // CROPFL_CROPFL_WORKER_COORDINATOR_CLIENT_H_
