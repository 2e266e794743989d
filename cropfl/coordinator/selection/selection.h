#ifndef CROPFL_CROPFL_COORDINATOR_SELECTION_SELECTION_H_
#define CROPFL_CROPFL_COORDINATOR_SELECTION_SELECTION_H_

#include "cropfl/coordinator/selection/participation_ratio.h"

#endif  // CROPFL_CROPFL_COORDINATOR_SELECTION_SELECTION_H_
