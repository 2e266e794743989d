#ifndef CROPFL_CROPFL_COORDINATOR_AGGREGATION_AGGREGATION_FUNCTION_H_
#define CROPFL_CROPFL_COORDINATOR_AGGREGATION_AGGREGATION_FUNCTION_H_

#include <omp.h>

#include <string>

#include "absl/status/statusor.h"
#include "cropfl/coordinator/aggregation/types.h"
#include "cropfl/proto/model.pb.h"

namespace cropfl::coordinator {

class AggregationFunction {
 public:
  virtual ~AggregationFunction() = default;

  virtual absl::StatusOr<ParameterVector> Aggregate(
      const AggregationPairs &pairs) = 0;

  virtual absl::StatusOr<double> AggregateMetric(const MetricPairs &pairs) = 0;

  virtual std::string Name() const = 0;
};

}  // namespace cropfl::coordinator

#endif  // CROPFL_CROPFL_COORDINATOR_AGGREGATION_AGGREGATION_FUNCTION_H_
