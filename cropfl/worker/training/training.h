#ifndef CROPFL_CROPFL_WORKER_TRAINING_TRAINING_H_
#define CROPFL_CROPFL_WORKER_TRAINING_TRAINING_H_

#include "cropfl/worker/training/model_trainer.h"
#include "cropfl/worker/training/nearest_centroid.h"
#include "cropfl/worker/training/softmax_regression.h"

#endif  // CROPFL_CROPFL_WORKER_TRAINING_TRAINING_H_
