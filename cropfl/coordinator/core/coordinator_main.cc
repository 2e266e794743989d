/**
 * A standalone coordinator instance, by default running at port 8080. The
 * coordinator parameters are read from the text-format file given as the
 * first argument.
 */

#include <glog/logging.h>
#include <signal.h>

#include <memory>
#include <thread>

#include "cropfl/common/params_utils.h"
#include "cropfl/common/proto_tensor_serde.h"
#include "cropfl/coordinator/core/coordinator.h"
#include "cropfl/coordinator/core/coordinator_servicer.h"
#include "cropfl/coordinator/core/coordinator_utils.h"

using cropfl::coordinator::Coordinator;
using cropfl::coordinator::CoordinatorServicer;
using cropfl::proto::TensorOps;

std::unique_ptr<CoordinatorServicer> servicer;

void sigint_handler(int code) {
  LOG(INFO) << "Received SIGINT (code " << code << ")";
  if (servicer != nullptr) {
    servicer->StopService();
  }
}

int main(int argc, char **argv) {
  FLAGS_log_dir = "/tmp";
  FLAGS_alsologtostderr = true;
  google::InitGoogleLogging(argv[0]);

  auto params = cropfl::coordinator::DefaultCoordinatorParams();
  if (argc > 1) {
    auto loaded = cropfl::LoadParamsFromFile(argv[1], params);
    if (!loaded.ok()) LOG(FATAL) << loaded.status();
    params = *loaded;
  }

  LOG(INFO) << "Starting coordinator with params: ";
  LOG(INFO) << params.DebugString();

  auto coordinator = Coordinator::New(params);
  if (!coordinator.ok()) LOG(FATAL) << coordinator.status();

  signal(SIGINT, sigint_handler);

  servicer = std::make_unique<CoordinatorServicer>(params.server_entity(),
                                                   coordinator->get());
  servicer->StartService();

  absl::Status run_status;
  std::thread runner([&coordinator, &run_status] {
    run_status = (*coordinator)->Run();
    servicer->StopService();
  });

  servicer->WaitService();
  runner.join();
  servicer.reset();

  const auto global_parameters = (*coordinator)->GetGlobalParameters();
  for (int i = 0; i < global_parameters.tensors_size(); ++i) {
    LOG(INFO) << "Global tensor " << i << ": "
              << global_parameters.tensors(i).length() << " values.";
    if (VLOG_IS_ON(1)) {
      TensorOps::PrintSerializedTensor(global_parameters.tensors(i).value(),
                                       global_parameters.tensors(i).length());
    }
  }
  LOG(INFO) << "Run outcome: " << (*coordinator)->GetOutcome().DebugString();

  LOG(INFO) << "Exiting... Bye!";

  return run_status.ok() ? 0 : 1;
}
