#include "cropfl/coordinator/core/coordinator_servicer.h"

#include <glog/logging.h>

#include <climits>

#include "absl/strings/str_cat.h"
#include "cropfl/common/grpc_status.h"

namespace cropfl::coordinator {

void CoordinatorServicer::StartService() {
  grpc::EnableDefaultHealthCheckService(true);

  const auto server_address =
      absl::StrCat(server_entity_.hostname(), ":", server_entity_.port());

  ServerBuilder builder;
  builder.AddListeningPort(server_address, grpc::InsecureServerCredentials());
  builder.RegisterService(this);
  builder.SetMaxReceiveMessageSize(INT_MAX);
  server_ = builder.BuildAndStart();

  LOG(INFO) << "Coordinator listening on " << server_address << ".";
}

void CoordinatorServicer::WaitService() {
  if (server_ == nullptr) return;

  server_->Wait();
}

void CoordinatorServicer::StopService() {
  pool_.push_task([this] { coordinator_->Shutdown(); });
  pool_.push_task([this] { this->ShutdownServer(); });
}

void CoordinatorServicer::ShutdownServer() {
  if (server_ == nullptr) return;

  server_->Shutdown();
  LOG(INFO) << "Coordinator shut down.";
}

bool CoordinatorServicer::ShutdownRequestReceived() { return shutdown_; }

Status CoordinatorServicer::GetHealthStatus(ServerContext *context,
                                            const Empty *request, Ack *ack) {
  bool status = coordinator_ != nullptr;
  ack->set_status(status);
  return Status::OK;
}

Status CoordinatorServicer::Register(ServerContext *context,
                                     const RegisterRequest *request,
                                     RegisterResponse *response) {
  if (request->worker_id().empty() ||
      request->server_entity().hostname().empty() ||
      request->server_entity().port() == 0) {
    return {StatusCode::INVALID_ARGUMENT,
            "Must provide a worker id, hostname and port."};
  }

  auto ack = coordinator_->RegisterWorker(
      request->worker_id(), client_factory_(request->server_entity()));
  if (!ack.ok()) {
    LOG(WARNING) << "Rejected registration of worker " << request->worker_id()
                 << ": " << ack.status();
    return ToGrpcStatus(ack.status());
  }

  *response->mutable_ack() = *ack;
  return Status::OK;
}

Status CoordinatorServicer::Deregister(ServerContext *context,
                                       const DeregisterRequest *request,
                                       Ack *ack) {
  if (request->worker_id().empty()) {
    ack->set_status(false);
    return {StatusCode::INVALID_ARGUMENT, "Worker id cannot be empty."};
  }

  const auto del_status = coordinator_->DeregisterWorker(request->worker_id());
  ack->set_status(del_status.ok());
  return ToGrpcStatus(del_status);
}

Status CoordinatorServicer::GetRunStatus(ServerContext *context,
                                         const Empty *request,
                                         RunStatus *response) {
  *response = coordinator_->GetRunStatus();
  return Status::OK;
}

Status CoordinatorServicer::ShutDown(ServerContext *context,
                                     const Empty *request, Ack *ack) {
  shutdown_ = true;
  ack->set_status(true);
  this->StopService();
  return Status::OK;
}

}  // namespace cropfl::coordinator
