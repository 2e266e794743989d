#ifndef CROPFL_CROPFL_COORDINATOR_CORE_COORDINATOR_UTILS_H_
#define CROPFL_CROPFL_COORDINATOR_CORE_COORDINATOR_UTILS_H_

#include <memory>
#include <string>

#include "absl/status/statusor.h"
#include "cropfl/coordinator/aggregation/aggregation.h"
#include "cropfl/coordinator/selection/selection.h"
#include "cropfl/proto/params.pb.h"

namespace cropfl::coordinator {

absl::StatusOr<std::unique_ptr<AggregationFunction>> CreateAggregator(
    const std::string &aggregation_rule);

std::unique_ptr<Selector> CreateSelector(const RunParams &run_params);

CoordinatorParams DefaultCoordinatorParams();

absl::Status ValidateCoordinatorParams(const CoordinatorParams &params);

}  // namespace cropfl::coordinator

#endif  // CROPFL_CROPFL_COORDINATOR_CORE_COORDINATOR_UTILS_H_
