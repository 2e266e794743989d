#ifndef CROPFL_CROPFL_COORDINATOR_CORE_COORDINATOR_SERVICER_H_
#define CROPFL_CROPFL_COORDINATOR_CORE_COORDINATOR_SERVICER_H_

#include <grpcpp/grpcpp.h>
#include <grpcpp/health_check_service_interface.h>

#include <atomic>
#include <functional>
#include <memory>
#include <utility>

#include "BS_thread_pool.hpp"
#include "cropfl/coordinator/core/coordinator.h"
#include "cropfl/coordinator/core/grpc_worker_client.h"
#include "cropfl/coordinator/core/types.h"
#include "cropfl/proto/coordinator.grpc.pb.h"

using ::grpc::Server;
using ::grpc::ServerBuilder;
using ::grpc::ServerContext;
using ::grpc::Status;
using ::grpc::StatusCode;

namespace cropfl::coordinator {

// Creates the client through which the coordinator reaches a registering
// worker.
typedef std::function<std::shared_ptr<WorkerClient>(const ServerEntity &)>
    WorkerClientFactory;

class CoordinatorServicer final : public CoordinatorService::Service {
  std::unique_ptr<Server> server_;
  ServerEntity server_entity_;
  BS::thread_pool pool_;
  Coordinator *coordinator_;
  WorkerClientFactory client_factory_;
  std::atomic<bool> shutdown_{false};

 public:
  CoordinatorServicer(const ServerEntity &server_entity,
                      Coordinator *coordinator,
                      WorkerClientFactory client_factory =
                          [](const ServerEntity &worker_entity) {
                            return std::make_shared<GrpcWorkerClient>(
                                worker_entity);
                          })
      : server_entity_(server_entity),
        pool_(1),
        coordinator_(coordinator),
        client_factory_(std::move(client_factory)){};

  void StartService();

  void WaitService();

  void StopService();

  void ShutdownServer();

  bool ShutdownRequestReceived();

  Status GetHealthStatus(ServerContext *context, const cropfl::Empty *request,
                         cropfl::Ack *response) override;
  Status Register(ServerContext *context,
                  const cropfl::RegisterRequest *request,
                  cropfl::RegisterResponse *response) override;
  Status Deregister(ServerContext *context,
                    const cropfl::DeregisterRequest *request,
                    cropfl::Ack *response) override;
  Status GetRunStatus(ServerContext *context, const cropfl::Empty *request,
                      cropfl::RunStatus *response) override;
  Status ShutDown(ServerContext *context, const cropfl::Empty *request,
                  cropfl::Ack *response) override;
};
}  // namespace cropfl::coordinator

#endif  // CROPFL_CROPFL_COORDINATOR_CORE_COORDINATOR_SERVICER_H_
