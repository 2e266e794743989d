#ifndef CROPFL_CROPFL_COORDINATOR_AGGREGATION_TYPES_H_
#define CROPFL_CROPFL_COORDINATOR_AGGREGATION_TYPES_H_

#include <cstdint>
#include <utility>
#include <vector>

#include "cropfl/proto/model.pb.h"

// (parameter vector, weight) contributions of the participants of a round.
typedef std::vector<std::pair<const cropfl::ParameterVector *, uint64_t>>
    AggregationPairs;

// (metric value, weight) contributions of the participants of a round.
typedef std::vector<std::pair<double, uint64_t>> MetricPairs;

#endif  // CROPFL_CROPFL_COORDINATOR_AGGREGATION_TYPES_H_
