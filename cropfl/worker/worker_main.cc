/**
 * A standalone worker serving one partition of the dataset. The worker
 * parameters are read from the text-format file given as the first argument.
 */

#include <glog/logging.h>
#include <signal.h>

#include <memory>

#include "cropfl/common/dataset.h"
#include "cropfl/common/params_utils.h"
#include "cropfl/worker/coordinator_client.h"
#include "cropfl/worker/partitioner.h"
#include "cropfl/worker/worker.h"
#include "cropfl/worker/worker_servicer.h"
#include "cropfl/worker/worker_utils.h"

using cropfl::ServerEntity;
using cropfl::WorkerParams;
using cropfl::worker::CoordinatorClient;
using cropfl::worker::Worker;
using cropfl::worker::WorkerServicer;

std::unique_ptr<WorkerServicer> servicer;

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

  auto params = cropfl::worker::DefaultWorkerParams();
  if (argc > 1) {
    auto loaded = cropfl::LoadParamsFromFile(argv[1], params);
    if (!loaded.ok()) LOG(FATAL) << loaded.status();
    params = *loaded;
  }
  auto valid = cropfl::worker::ValidateWorkerParams(params);
  if (!valid.ok()) LOG(FATAL) << valid;

  LOG(INFO) << "Starting worker with params: ";
  LOG(INFO) << params.DebugString();

  auto dataset = cropfl::LoadCsvDataset(params.dataset_path());
  if (!dataset.ok()) LOG(FATAL) << dataset.status();

  auto partition = cropfl::worker::CreatePartition(
      **dataset, params.worker_ordinal(), params.worker_count(),
      params.split_ratio());
  if (!partition.ok()) LOG(FATAL) << partition.status();

  auto trainer = cropfl::worker::CreateTrainer(
      params.trainer(), (*dataset)->class_table(), (*dataset)->num_features());
  if (!trainer.ok()) LOG(FATAL) << trainer.status();

  Worker worker(std::move(partition).value(), std::move(trainer).value());

  signal(SIGINT, sigint_handler);

  servicer =
      std::make_unique<WorkerServicer>(params.server_entity(), &worker);
  servicer->StartService();

  // A wildcard listening address cannot be dialed back.
  ServerEntity advertised = params.server_entity();
  if (advertised.hostname() == "0.0.0.0") advertised.set_hostname("localhost");

  CoordinatorClient coordinator(params.coordinator_entity());
  auto ack =
      coordinator.Register(worker.worker_id(), advertised, absl::Seconds(60));
  if (!ack.ok()) {
    LOG(ERROR) << ack.status();
    servicer->StopService();
  } else {
    LOG(INFO) << "Registered with the coordinator, joining from round "
              << ack->accepted_round_start() << ".";
  }

  servicer->WaitService();

  // Stopped locally, so the coordinator still counts this worker as connected.
  if (ack.ok() && !servicer->ShutdownRequestReceived()) {
    auto left = coordinator.Deregister(worker.worker_id(), absl::Seconds(5));
    if (left.ok()) {
      LOG(INFO) << "Left the federation.";
    } else {
      LOG(WARNING) << "Could not leave the federation: " << left;
    }
  }
  servicer.reset();

  LOG(INFO) << "Exiting... Bye!";

  return ack.ok() ? 0 : 1;
}
