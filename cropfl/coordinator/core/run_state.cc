#include "cropfl/coordinator/core/run_state.h"

namespace cropfl::coordinator {

RunState::RunState(uint32_t total_rounds) {
  status_.set_state(AWAITING_QUORUM);
  status_.set_total_rounds(total_rounds);
  status_.mutable_outcome()->set_status(RunOutcome::RUNNING);
}

CoordinatorState RunState::state() const {
  std::lock_guard<std::mutex> state_guard(state_mutex_);
  return status_.state();
}

void RunState::set_state(CoordinatorState state) {
  std::lock_guard<std::mutex> state_guard(state_mutex_);
  status_.set_state(state);
}

uint32_t RunState::current_round() const {
  std::lock_guard<std::mutex> state_guard(state_mutex_);
  return status_.current_round();
}

void RunState::AdvanceRound() {
  std::lock_guard<std::mutex> state_guard(state_mutex_);
  status_.set_current_round(status_.current_round() + 1);
}

std::pair<CoordinatorState, uint32_t> RunState::Progress() const {
  std::lock_guard<std::mutex> state_guard(state_mutex_);
  return {status_.state(), status_.current_round()};
}

ParameterVector RunState::global_parameters() const {
  std::lock_guard<std::mutex> state_guard(state_mutex_);
  return status_.global_parameters();
}

bool RunState::has_global_parameters() const {
  std::lock_guard<std::mutex> state_guard(state_mutex_);
  return status_.global_parameters().tensors_size() > 0;
}

void RunState::set_global_parameters(const ParameterVector &parameters) {
  std::lock_guard<std::mutex> state_guard(state_mutex_);
  *status_.mutable_global_parameters() = parameters;
}

std::vector<RoundSummary> RunState::history() const {
  std::lock_guard<std::mutex> state_guard(state_mutex_);
  return {status_.history().begin(), status_.history().end()};
}

void RunState::AppendHistory(const RoundSummary &summary) {
  std::lock_guard<std::mutex> state_guard(state_mutex_);
  *status_.add_history() = summary;
}

void RunState::RecordEvaluation(double aggregated_loss,
                                double aggregated_eval_metric,
                                uint32_t eval_participant_count) {
  std::lock_guard<std::mutex> state_guard(state_mutex_);
  if (status_.history().empty()) return;

  auto *summary = status_.mutable_history(status_.history_size() - 1);
  summary->set_aggregated_loss(aggregated_loss);
  summary->set_aggregated_eval_metric(aggregated_eval_metric);
  summary->set_eval_participant_count(eval_participant_count);
}

void RunState::RecordAttempts(uint32_t attempts) {
  std::lock_guard<std::mutex> state_guard(state_mutex_);
  if (status_.history().empty()) return;
  status_.mutable_history(status_.history_size() - 1)->set_attempts(attempts);
}

RunOutcome RunState::outcome() const {
  std::lock_guard<std::mutex> state_guard(state_mutex_);
  return status_.outcome();
}

void RunState::CountRetry() {
  std::lock_guard<std::mutex> state_guard(state_mutex_);
  auto *outcome = status_.mutable_outcome();
  outcome->set_retries_used(outcome->retries_used() + 1);
}

void RunState::Finish(RunOutcome::Status status, const std::string &reason) {
  std::lock_guard<std::mutex> state_guard(state_mutex_);
  status_.set_state(TERMINATED);
  status_.mutable_outcome()->set_status(status);
  status_.mutable_outcome()->set_reason(reason);
}

bool RunState::terminated() const {
  std::lock_guard<std::mutex> state_guard(state_mutex_);
  return status_.state() == TERMINATED;
}

RunStatus RunState::Snapshot() const {
  std::lock_guard<std::mutex> state_guard(state_mutex_);
  return status_;
}

}  // namespace cropfl::coordinator
