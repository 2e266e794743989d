#ifndef CROPFL_CROPFL_WORKER_WORKER_SERVICER_H_
#define CROPFL_CROPFL_WORKER_WORKER_SERVICER_H_

#include <grpcpp/grpcpp.h>
#include <grpcpp/health_check_service_interface.h>

#include <atomic>
#include <memory>

#include "BS_thread_pool.hpp"
#include "cropfl/proto/worker.grpc.pb.h"
#include "cropfl/worker/worker.h"

using ::grpc::Server;
using ::grpc::ServerBuilder;
using ::grpc::ServerContext;
using ::grpc::Status;
using ::grpc::StatusCode;

namespace cropfl::worker {
class WorkerServicer final : public WorkerService::Service {
  std::unique_ptr<Server> server_;
  ServerEntity server_entity_;
  BS::thread_pool pool_;
  Worker *worker_;
  std::atomic<bool> shutdown_{false};

 public:
  WorkerServicer(const ServerEntity &server_entity, Worker *worker)
      : server_entity_(server_entity), pool_(1), worker_(worker){};

  void StartService();

  void WaitService();

  void StopService();

  void ShutdownServer();

  bool ShutdownRequestReceived();

  Status GetHealthStatus(ServerContext *context, const cropfl::Empty *request,
                         cropfl::Ack *response) override;
  Status GetParameters(ServerContext *context,
                       const cropfl::GetParametersRequest *request,
                       cropfl::GetParametersResponse *response) override;
  Status Fit(ServerContext *context, const cropfl::FitRequest *request,
             cropfl::FitResponse *response) override;
  Status Evaluate(ServerContext *context, const cropfl::EvalRequest *request,
                  cropfl::EvalResponse *response) override;
  Status ShutDown(ServerContext *context, const cropfl::Empty *request,
                  cropfl::Ack *response) override;
};
}  // namespace cropfl::worker

#endif  // CROPFL_CROPFL_WORKER_WORKER_SERVICER_H_
