#include "cropfl/worker/coordinator_client.h"

#include <grpcpp/create_channel.h>
#include <grpcpp/security/credentials.h>

#include <utility>

#include "absl/strings/str_cat.h"
#include "absl/time/clock.h"
#include "cropfl/common/grpc_status.h"

namespace cropfl::worker {

CoordinatorClient::CoordinatorClient(const ServerEntity &coordinator_entity)
    : CoordinatorClient(
          absl::StrCat(coordinator_entity.hostname(), ":",
                       coordinator_entity.port()),
          grpc::CreateChannel(absl::StrCat(coordinator_entity.hostname(), ":",
                                           coordinator_entity.port()),
                              grpc::InsecureChannelCredentials())) {}

CoordinatorClient::CoordinatorClient(
    std::string target, std::shared_ptr<grpc::ChannelInterface> channel)
    : target_(std::move(target)),
      stub_(CoordinatorService::NewStub(channel)) {}

absl::StatusOr<RegisterAck> CoordinatorClient::Register(
    const std::string &worker_id, const ServerEntity &server_entity,
    absl::Duration timeout) {
  grpc::ClientContext context;
  context.set_wait_for_ready(true);
  context.set_deadline(absl::ToChronoTime(absl::Now() + timeout));

  RegisterRequest request;
  request.set_worker_id(worker_id);
  *request.mutable_server_entity() = server_entity;
  RegisterResponse response;

  auto status = stub_->Register(&context, request, &response);
  if (!status.ok()) {
    auto register_status = FromGrpcStatus(status);
    return absl::Status(
        register_status.code(),
        absl::StrCat("Registration with coordinator ", target_,
                     " failed: ", register_status.message()));
  }
  return response.ack();
}

absl::Status CoordinatorClient::Deregister(const std::string &worker_id,
                                           absl::Duration timeout) {
  grpc::ClientContext context;
  context.set_deadline(absl::ToChronoTime(absl::Now() + timeout));

  DeregisterRequest request;
  request.set_worker_id(worker_id);
  Ack ack;

  return FromGrpcStatus(stub_->Deregister(&context, request, &ack));
}

}  // namespace cropfl::worker
