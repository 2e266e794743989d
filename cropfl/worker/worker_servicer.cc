#include "cropfl/worker/worker_servicer.h"

#include <glog/logging.h>

#include <climits>

#include "absl/strings/str_cat.h"
#include "cropfl/common/errors.h"

namespace cropfl::worker {

void WorkerServicer::StartService() {
  grpc::EnableDefaultHealthCheckService(true);

  const auto server_address =
      absl::StrCat(server_entity_.hostname(), ":", server_entity_.port());

  ServerBuilder builder;
  builder.AddListeningPort(server_address, grpc::InsecureServerCredentials());
  builder.RegisterService(this);
  builder.SetMaxReceiveMessageSize(INT_MAX);
  server_ = builder.BuildAndStart();

  LOG(INFO) << "Worker " << worker_->worker_id() << " listening on "
            << server_address << ".";
}

void WorkerServicer::WaitService() {
  if (server_ == nullptr) return;

  server_->Wait();
}

void WorkerServicer::StopService() {
  pool_.push_task([this] { this->ShutdownServer(); });
}

void WorkerServicer::ShutdownServer() {
  if (server_ == nullptr) return;

  server_->Shutdown();
  LOG(INFO) << "Worker " << worker_->worker_id() << " shut down.";
}

bool WorkerServicer::ShutdownRequestReceived() { return shutdown_; }

Status WorkerServicer::GetHealthStatus(ServerContext *context,
                                       const Empty *request, Ack *ack) {
  ack->set_status(worker_ != nullptr);
  return Status::OK;
}

Status WorkerServicer::GetParameters(ServerContext *context,
                                     const GetParametersRequest *request,
                                     GetParametersResponse *response) {
  *response->mutable_parameters() = worker_->GetParameters();
  return Status::OK;
}

Status WorkerServicer::Fit(ServerContext *context, const FitRequest *request,
                           FitResponse *response) {
  if (!request->has_config()) {
    return {StatusCode::INVALID_ARGUMENT, "Fit request carries no config."};
  }

  auto result = worker_->Fit(request->config());
  if (result.ok()) {
    *response->mutable_result() = std::move(result).value();
  } else {
    *response->mutable_error() = ToProto(result.status());
  }
  return Status::OK;
}

Status WorkerServicer::Evaluate(ServerContext *context,
                                const EvalRequest *request,
                                EvalResponse *response) {
  auto result =
      worker_->Evaluate(request->round_number(), request->parameters());
  if (result.ok()) {
    *response->mutable_result() = std::move(result).value();
  } else {
    *response->mutable_error() = ToProto(result.status());
  }
  return Status::OK;
}

Status WorkerServicer::ShutDown(ServerContext *context, const Empty *request,
                                Ack *ack) {
  LOG(INFO) << "Worker " << worker_->worker_id()
            << " received shutdown request.";
  shutdown_ = true;
  ack->set_status(true);
  this->StopService();
  return Status::OK;
}

}  // namespace cropfl::worker
