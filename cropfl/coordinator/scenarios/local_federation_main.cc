/**
 * Runs a whole federation inside one process: the dataset is partitioned
 * across in-process workers which the coordinator reaches without a network.
 *
 *   cropfl_local_federation <dataset.csv> [num-workers] [trainer] [rounds]
 */

#include <glog/logging.h>

#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "absl/strings/str_format.h"
#include "cropfl/common/dataset.h"
#include "cropfl/coordinator/core/coordinator.h"
#include "cropfl/coordinator/core/coordinator_utils.h"
#include "cropfl/coordinator/core/in_process_worker_client.h"
#include "cropfl/worker/partitioner.h"
#include "cropfl/worker/worker.h"
#include "cropfl/worker/worker_utils.h"

using namespace cropfl;

int main(int argc, char *argv[]) {
  if (argc < 2) {
    throw std::runtime_error(
        "Insufficient input arguments. Need to provide values for:\n"
        "Dataset-Path [Num-Of-Workers] [Trainer] [Rounds]");
  }

  // Set flags picked up by glog before initialization.
  FLAGS_log_dir = "/tmp";
  FLAGS_alsologtostderr = true;
  google::InitGoogleLogging(argv[0]);

  const std::string dataset_path = argv[1];
  auto worker_params = worker::DefaultWorkerParams();
  auto params = coordinator::DefaultCoordinatorParams();
  uint32_t num_workers = worker_params.worker_count();
  if (argc > 2) num_workers = std::stoi(argv[2], nullptr, 10);
  std::string trainer = worker_params.trainer();
  if (argc > 3) trainer = argv[3];
  if (argc > 4) {
    params.mutable_run_params()->set_total_rounds(
        std::stoi(argv[4], nullptr, 10));
  }

  if (params.run_params().min_participants() > num_workers) {
    params.mutable_run_params()->set_min_participants(num_workers);
  }

  LOG(INFO) << "Dataset: " << dataset_path;
  LOG(INFO) << "Number of workers: " << num_workers;
  LOG(INFO) << "Trainer: " << trainer;

  auto dataset = LoadCsvDataset(dataset_path);
  if (!dataset.ok()) LOG(FATAL) << dataset.status();

  auto created = coordinator::Coordinator::New(params);
  if (!created.ok()) LOG(FATAL) << created.status();
  auto &federation = *created;

  for (uint32_t ordinal = 0; ordinal < num_workers; ++ordinal) {
    auto partition = worker::CreatePartition(**dataset, ordinal, num_workers,
                                             worker_params.split_ratio());
    if (!partition.ok()) LOG(FATAL) << partition.status();
    auto model_trainer = worker::CreateTrainer(
        trainer, (*dataset)->class_table(), (*dataset)->num_features());
    if (!model_trainer.ok()) LOG(FATAL) << model_trainer.status();

    auto local_worker = std::make_shared<const worker::Worker>(
        std::move(partition).value(), std::move(model_trainer).value());
    auto ack = federation->RegisterWorker(
        local_worker->worker_id(),
        std::make_shared<coordinator::InProcessWorkerClient>(local_worker));
    if (!ack.ok()) LOG(FATAL) << ack.status();
  }

  auto status = federation->Run();
  if (!status.ok()) LOG(ERROR) << "Run failed: " << status;

  std::cout << "round,participants,train_accuracy,loss,accuracy" << std::endl;
  for (const auto &summary : federation->GetHistory()) {
    std::cout << absl::StrFormat("%d,%d,%.6f,%.6f,%.6f",
                                 summary.round_number(),
                                 summary.participant_count(),
                                 summary.aggregated_train_metric(),
                                 summary.aggregated_loss(),
                                 summary.aggregated_eval_metric())
              << std::endl;
  }

  return status.ok() ? 0 : 1;
}
