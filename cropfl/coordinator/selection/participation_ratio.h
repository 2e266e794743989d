#ifndef CROPFL_CROPFL_COORDINATOR_SELECTION_PARTICIPATION_RATIO_H_
#define CROPFL_CROPFL_COORDINATOR_SELECTION_PARTICIPATION_RATIO_H_

#include "cropfl/coordinator/selection/selector.h"

namespace cropfl::coordinator {

// Selects max(ceil(ratio * |connected|), min_participants) workers, at least
// one and at most all of them. The connected workers are ordered by id and
// every round starts where the previous one stopped, so with a ratio below 1
// all workers take turns.
class ParticipationRatio : public Selector {
 public:
  explicit ParticipationRatio(float participation_ratio,
                              uint32_t min_participants = 1)
      : participation_ratio_(participation_ratio),
        min_participants_(min_participants) {}

  std::vector<std::string> Select(
      const std::vector<std::string> &connected_workers,
      uint32_t round_number) override;

  std::string name() override { return "ParticipationRatio"; };

 private:
  float participation_ratio_;
  uint32_t min_participants_;
};

}  // namespace cropfl::coordinator

#endif  // CROPFL_CROPFL_COORDINATOR_SELECTION_PARTICIPATION_RATIO_H_
