#ifndef CROPFL_CROPFL_COORDINATOR_SELECTION_SELECTOR_H_
#define CROPFL_CROPFL_COORDINATOR_SELECTION_SELECTOR_H_

#include <cstdint>
#include <string>
#include <vector>

namespace cropfl::coordinator {

// A selector picks the workers that take part in a round.
class Selector {
 public:
  virtual ~Selector() = default;

  // Returns the ids of the workers selected for `round_number` out of the
  // currently connected workers. The result is sorted and free of duplicates.
  virtual std::vector<std::string> Select(
      const std::vector<std::string> &connected_workers,
      uint32_t round_number) = 0;

  virtual std::string name() = 0;
};

}  // namespace cropfl::coordinator

#endif  // CROPFL_CROPFL_COORDINATOR_SELECTION_SELECTOR_H_
