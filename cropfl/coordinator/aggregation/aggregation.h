#ifndef CROPFL_CROPFL_COORDINATOR_AGGREGATION_AGGREGATION_H_
#define CROPFL_CROPFL_COORDINATOR_AGGREGATION_AGGREGATION_H_

#include "cropfl/coordinator/aggregation/federated_average.h"

#endif  // CROPFL_CROPFL_COORDINATOR_AGGREGATION_AGGREGATION_H_
