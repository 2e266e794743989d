#ifndef CROPFL_CROPFL_COORDINATOR_CORE_RUN_STATE_H_
#define CROPFL_CROPFL_COORDINATOR_CORE_RUN_STATE_H_

#include <cstdint>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

#include "cropfl/proto/federation.pb.h"
#include "cropfl/proto/model.pb.h"

namespace cropfl::coordinator {

// Progress of one run. Written only by the coordinator loop; every accessor
// returns a copy so status readers never observe a half-applied update.
class RunState {
  mutable std::mutex state_mutex_;
  RunStatus status_;

 public:
  explicit RunState(uint32_t total_rounds);

  CoordinatorState state() const;
  void set_state(CoordinatorState state);

  uint32_t current_round() const;
  void AdvanceRound();

  // State and current round read together.
  std::pair<CoordinatorState, uint32_t> Progress() const;

  ParameterVector global_parameters() const;
  bool has_global_parameters() const;
  void set_global_parameters(const ParameterVector &parameters);

  std::vector<RoundSummary> history() const;
  void AppendHistory(const RoundSummary &summary);
  // Updates the most recent history entry.
  void RecordEvaluation(double aggregated_loss, double aggregated_eval_metric,
                        uint32_t eval_participant_count);
  void RecordAttempts(uint32_t attempts);

  RunOutcome outcome() const;
  void CountRetry();
  void Finish(RunOutcome::Status status, const std::string &reason);

  bool terminated() const;

  // Everything but the connected workers.
  RunStatus Snapshot() const;
};

}  // namespace cropfl::coordinator

#endif  // CROPFL_CROPFL_COORDINATOR_CORE_RUN_STATE_H_
