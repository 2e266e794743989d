#include "cropfl/coordinator/selection/participation_ratio.h"

#include <algorithm>
#include <cmath>

namespace cropfl::coordinator {

std::vector<std::string> ParticipationRatio::Select(
    const std::vector<std::string> &connected_workers, uint32_t round_number) {
  std::vector<std::string> workers(connected_workers);
  std::sort(workers.begin(), workers.end());
  workers.erase(std::unique(workers.begin(), workers.end()), workers.end());

  const size_t total = workers.size();
  if (total == 0 || participation_ratio_ >= 1.0f) return workers;

  auto selected_num = static_cast<size_t>(
      std::ceil(static_cast<double>(participation_ratio_) * total));
  selected_num = std::max<size_t>(selected_num, min_participants_);
  selected_num = std::clamp<size_t>(selected_num, 1, total);

  const size_t offset =
      (static_cast<size_t>(round_number > 0 ? round_number - 1 : 0) *
       selected_num) %
      total;

  std::vector<std::string> selected;
  selected.reserve(selected_num);
  for (size_t i = 0; i < selected_num; ++i) {
    selected.push_back(workers[(offset + i) % total]);
  }
  std::sort(selected.begin(), selected.end());
  return selected;
}

}  // namespace cropfl::coordinator
