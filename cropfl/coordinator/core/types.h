#ifndef CROPFL_CROPFL_COORDINATOR_CORE_TYPES_H_
#define CROPFL_CROPFL_COORDINATOR_CORE_TYPES_H_

#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "absl/status/status.h"
#include "cropfl/proto/coordinator.grpc.pb.h"
#include "cropfl/proto/worker.grpc.pb.h"

using namespace cropfl;

typedef std::unique_ptr<cropfl::WorkerService::Stub> WorkerStub;

// (worker_id, error) of the workers that failed a phase of a round.
typedef std::vector<std::pair<std::string, absl::Status>> WorkerFailures;

#endif  // CROPFL_CROPFL_COORDINATOR_CORE_TYPES_H_
