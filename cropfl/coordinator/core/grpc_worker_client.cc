#include "cropfl/coordinator/core/grpc_worker_client.h"

#include <grpcpp/create_channel.h>
#include <grpcpp/security/credentials.h>

#include <utility>

#include "absl/strings/str_cat.h"
#include "absl/time/clock.h"
#include "cropfl/common/errors.h"
#include "cropfl/common/grpc_status.h"

namespace cropfl::coordinator {
namespace {

constexpr absl::Duration kShutDownTimeout = absl::Seconds(5);

void SetDeadline(grpc::ClientContext *context, absl::Duration timeout) {
  context->set_deadline(absl::ToChronoTime(absl::Now() + timeout));
}

// Delivery failures are reported with the transport's code and no kind.
absl::Status DeliveryError(const std::string &target,
                           const grpc::Status &status) {
  auto delivery_status = FromGrpcStatus(status);
  return {delivery_status.code(),
          absl::StrCat("Worker ", target, " unreachable: ",
                       delivery_status.message())};
}

}  // namespace

GrpcWorkerClient::GrpcWorkerClient(const ServerEntity &server_entity)
    : GrpcWorkerClient(
          absl::StrCat(server_entity.hostname(), ":", server_entity.port()),
          grpc::CreateChannel(
              absl::StrCat(server_entity.hostname(), ":",
                           server_entity.port()),
              grpc::InsecureChannelCredentials())) {}

GrpcWorkerClient::GrpcWorkerClient(
    std::string target, std::shared_ptr<grpc::ChannelInterface> channel)
    : target_(std::move(target)), stub_(WorkerService::NewStub(channel)) {}

absl::StatusOr<ParameterVector> GrpcWorkerClient::GetParameters(
    absl::Duration timeout) {
  grpc::ClientContext context;
  SetDeadline(&context, timeout);

  GetParametersRequest request;
  GetParametersResponse response;
  auto status = stub_->GetParameters(&context, request, &response);
  if (!status.ok()) return DeliveryError(target_, status);

  if (response.has_error()) return FromProto(response.error());
  return response.parameters();
}

absl::StatusOr<FitResult> GrpcWorkerClient::Fit(const RoundConfig &config,
                                                absl::Duration timeout) {
  grpc::ClientContext context;
  SetDeadline(&context, timeout);

  FitRequest request;
  *request.mutable_config() = config;
  FitResponse response;
  auto status = stub_->Fit(&context, request, &response);
  if (!status.ok()) return DeliveryError(target_, status);

  if (response.has_error()) return FromProto(response.error());
  if (!response.has_result()) {
    return absl::InternalError(
        absl::StrCat("Worker ", target_, " sent an empty fit response."));
  }
  return response.result();
}

absl::StatusOr<EvalResult> GrpcWorkerClient::Evaluate(
    uint32_t round_number, const ParameterVector &parameters,
    absl::Duration timeout) {
  grpc::ClientContext context;
  SetDeadline(&context, timeout);

  EvalRequest request;
  request.set_round_number(round_number);
  *request.mutable_parameters() = parameters;
  EvalResponse response;
  auto status = stub_->Evaluate(&context, request, &response);
  if (!status.ok()) return DeliveryError(target_, status);

  if (response.has_error()) return FromProto(response.error());
  if (!response.has_result()) {
    return absl::InternalError(absl::StrCat(
        "Worker ", target_, " sent an empty evaluation response."));
  }
  return response.result();
}

absl::Status GrpcWorkerClient::ShutDown() {
  grpc::ClientContext context;
  SetDeadline(&context, kShutDownTimeout);

  Empty request;
  Ack response;
  auto status = stub_->ShutDown(&context, request, &response);
  if (!status.ok()) return DeliveryError(target_, status);
  return absl::OkStatus();
}

}  // namespace cropfl::coordinator
