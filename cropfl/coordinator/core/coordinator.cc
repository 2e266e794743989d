#include "cropfl/coordinator/core/coordinator.h"

#include <cmath>
#include <future>
#include <mutex>
#include <utility>

#include "BS_thread_pool.hpp"
#include "absl/memory/memory.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_format.h"
#include "absl/time/clock.h"
#include "cropfl/common/errors.h"
#include "cropfl/common/macros.h"
#include "cropfl/common/proto_tensor_serde.h"
#include "cropfl/coordinator/core/coordinator_utils.h"
#include "cropfl/coordinator/core/run_state.h"
#include "cropfl/coordinator/core/types.h"
#include "cropfl/coordinator/core/worker_registry.h"

namespace cropfl::coordinator {
namespace {

using cropfl::proto::TensorOps;

// How long Run() blocks on the registry before checking for shutdown again.
constexpr absl::Duration kQuorumPollInterval = absl::Milliseconds(100);

template <typename T>
using WorkerOutcomes = std::vector<std::pair<std::string, absl::StatusOr<T>>>;

class CoordinatorDefaultImpl : public Coordinator {
 public:
  CoordinatorDefaultImpl(const CoordinatorParams &params,
                         std::unique_ptr<AggregationFunction> aggregator,
                         std::unique_ptr<Selector> selector)
      : params_(params),
        aggregator_(std::move(aggregator)),
        selector_(std::move(selector)),
        registry_(),
        run_state_(params.run_params().total_rounds()),
        step_mutex_(),
        pool_(params.thread_pool_size() > 0 ? params.thread_pool_size() : 1) {
    if (params_.initial_parameters().tensors_size() > 0) {
      run_state_.set_global_parameters(params_.initial_parameters());
    }
  }

  const CoordinatorParams &GetParams() const override { return params_; }

  absl::StatusOr<RegisterAck> RegisterWorker(
      const std::string &worker_id,
      std::shared_ptr<WorkerClient> client) override {
    if (worker_id.empty()) {
      return absl::InvalidArgumentError("Worker id cannot be empty.");
    }
    if (run_state_.terminated()) {
      return absl::FailedPreconditionError(
          "The run has terminated, registrations are closed.");
    }
    RETURN_IF_ERROR(registry_.AddWorker(worker_id, std::move(client)));

    RegisterAck ack;
    ack.set_accepted_round_start(NextJoinableRound());

    LOG(INFO) << "Worker " << worker_id << " registered ("
              << registry_.size() << " connected), joining from round "
              << ack.accepted_round_start() << ".";
    return ack;
  }

  absl::Status DeregisterWorker(const std::string &worker_id) override {
    RETURN_IF_ERROR(registry_.RemoveWorker(worker_id));
    LOG(INFO) << "Worker " << worker_id << " left the federation ("
              << registry_.size() << " connected).";
    return absl::OkStatus();
  }

  absl::Status SetInitialParameters(
      const ParameterVector &parameters) override {
    std::lock_guard<std::mutex> step_guard(step_mutex_);

    if (run_state_.state() != AWAITING_QUORUM ||
        run_state_.current_round() > 0 || round_config_ != nullptr) {
      return absl::FailedPreconditionError(
          "Initial parameters can only be set before the first round.");
    }
    if (parameters.tensors_size() == 0 ||
        !TensorOps::IsWellFormed(parameters)) {
      return absl::InvalidArgumentError(
          "Initial parameters must hold well-formed tensors.");
    }
    run_state_.set_global_parameters(parameters);
    LOG(INFO) << "Received initial parameters of shape "
              << TensorOps::ShapeString(parameters) << ".";
    return absl::OkStatus();
  }

  absl::Status Step() override {
    std::lock_guard<std::mutex> step_guard(step_mutex_);

    switch (run_state_.state()) {
      case AWAITING_QUORUM:
        return AwaitingQuorum();
      case CONFIGURING_ROUND:
        return ConfigureRound();
      case COLLECTING_FIT:
        return CollectFit();
      case AGGREGATING:
        return Aggregate();
      case COLLECTING_EVAL:
        return CollectEval();
      case ROUND_COMPLETE:
        return CompleteRound();
      case TERMINATED:
        return absl::FailedPreconditionError("The run has terminated.");
      default:
        return absl::InternalError("Unknown coordinator state.");
    }
  }

  bool AwaitQuorum(absl::Duration timeout) override {
    return registry_.AwaitSize(min_participants(), timeout);
  }

  absl::Status Run() override {
    LOG(INFO) << "Waiting for " << min_participants()
              << " workers to connect.";
    while (true) {
      {
        std::lock_guard<std::mutex> step_guard(step_mutex_);
        if (run_state_.terminated()) return terminal_status_;
      }
      if (run_state_.state() == AWAITING_QUORUM &&
          !AwaitQuorum(kQuorumPollInterval))
        continue;

      auto status = Step();
      if (!status.ok()) VLOG(1) << "Step ended with: " << status;
    }
  }

  CoordinatorState GetState() const override { return run_state_.state(); }

  uint32_t GetCurrentRound() const override {
    return run_state_.current_round();
  }

  ParameterVector GetGlobalParameters() const override {
    return run_state_.global_parameters();
  }

  std::vector<RoundSummary> GetHistory() const override {
    return run_state_.history();
  }

  RunOutcome GetOutcome() const override { return run_state_.outcome(); }

  std::vector<std::string> GetConnectedWorkers() const override {
    return registry_.GetWorkerIds();
  }

  RunStatus GetRunStatus() const override {
    auto status = run_state_.Snapshot();
    for (const auto &worker_id : registry_.GetWorkerIds()) {
      *status.add_connected_workers() = worker_id;
    }
    return status;
  }

  void Shutdown() override {
    registry_.Close();

    std::lock_guard<std::mutex> step_guard(step_mutex_);
    if (run_state_.terminated()) return;

    auto status = Terminate(RunOutcome::ABORTED,
                            absl::CancelledError("Run cancelled by shutdown."));
    LOG(INFO) << "Run stopped: " << status;
  }

 private:
  uint32_t min_participants() const {
    return params_.run_params().min_participants();
  }

  uint32_t total_rounds() const { return params_.run_params().total_rounds(); }

  absl::Duration RoundTimeout() const {
    return absl::Milliseconds(params_.run_params().per_round_timeout_ms());
  }

  uint32_t NextJoinableRound() const {
    auto [state, current_round] = run_state_.Progress();
    if (state == AWAITING_QUORUM || state == CONFIGURING_ROUND)
      return current_round + 1;
    return current_round + 2;
  }

  absl::Status AwaitingQuorum() {
    const auto connected = registry_.size();
    if (connected < min_participants()) {
      VLOG(1) << "Waiting for quorum: " << connected << "/"
              << min_participants() << " workers connected.";
      return absl::OkStatus();
    }

    LOG(INFO) << "Quorum reached with " << connected << " connected workers.";
    run_state_.set_state(CONFIGURING_ROUND);
    return absl::OkStatus();
  }

  absl::Status ConfigureRound() {
    const uint32_t round_number = run_state_.current_round() + 1;

    auto participants =
        selector_->Select(registry_.GetWorkerIds(), round_number);
    if (participants.size() < min_participants()) {
      LOG(WARNING) << "Only " << participants.size()
                   << " workers selected for round " << round_number
                   << ", waiting for quorum again.";
      run_state_.set_state(AWAITING_QUORUM);
      return absl::OkStatus();
    }

    if (!run_state_.has_global_parameters()) {
      auto parameters = FetchInitialParameters(participants);
      if (!parameters.ok()) {
        return RetryOrAbort(round_number, parameters.status(),
                            CONFIGURING_ROUND);
      }
      run_state_.set_global_parameters(*parameters);
    }

    RoundConfig config;
    config.set_round_number(round_number);
    *config.mutable_parameters() = run_state_.global_parameters();
    *config.mutable_hyperparameters() = params_.hyperparameters();
    round_config_ = std::make_shared<const RoundConfig>(std::move(config));

    participants_ = std::move(participants);
    fit_results_.clear();
    fit_failures_.clear();

    LOG(INFO) << "Starting round " << round_number << "/" << total_rounds()
              << " with " << participants_.size() << " workers (attempt "
              << round_retries_ + 1 << ").";
    run_state_.set_state(COLLECTING_FIT);
    return absl::OkStatus();
  }

  absl::Status CollectFit() {
    const uint32_t round_number = round_config_->round_number();
    const auto timeout = RoundTimeout();
    auto config = round_config_;

    auto outcomes = FanOut<FitResult>(
        participants_, [config, timeout](WorkerClient &client) {
          return client.Fit(*config, timeout);
        });

    std::vector<FitResult> successes;
    for (auto &[worker_id, result] : outcomes) {
      if (result.ok() && result->sample_count() == 0) {
        result = absl::StatusOr<FitResult>(
            LocalTrainingError("Worker trained on zero rows."));
      } else if (result.ok() &&
                 (!TensorOps::AllFinite(result->parameters()) ||
                  !std::isfinite(result->train_metric()))) {
        result = absl::StatusOr<FitResult>(
            LocalTrainingError("Worker returned non-finite values."));
      }
      if (result.ok()) {
        result->set_worker_id(worker_id);
        successes.push_back(std::move(result).value());
        continue;
      }
      if (IsErrorKind(result.status(), SHAPE_MISMATCH)) {
        return Terminate(
            RunOutcome::ABORTED,
            ShapeMismatchError(absl::StrCat("Worker ", worker_id,
                                            " rejected the round parameters: ",
                                            result.status().message())));
      }
      LOG(WARNING) << "Worker " << worker_id << " failed training in round "
                   << round_number << ": " << result.status();
      fit_failures_.emplace_back(worker_id, result.status());
    }

    if (successes.size() < min_participants()) {
      return RetryOrAbort(
          round_number,
          QuorumTimeoutError(absl::StrCat(
              "Round ", round_number, " gathered ", successes.size(), " of ",
              min_participants(), " required training results.")),
          CONFIGURING_ROUND);
    }

    fit_results_ = std::move(successes);
    run_state_.set_state(AGGREGATING);
    return absl::OkStatus();
  }

  absl::Status Aggregate() {
    const uint32_t round_number = round_config_->round_number();
    const auto &global_parameters = round_config_->parameters();

    AggregationPairs to_aggregate;
    MetricPairs train_metrics;
    for (const auto &result : fit_results_) {
      if (!TensorOps::SameShape(global_parameters, result.parameters())) {
        return Terminate(
            RunOutcome::ABORTED,
            ShapeMismatchError(absl::StrCat(
                "Worker ", result.worker_id(), " returned parameters of shape ",
                TensorOps::ShapeString(result.parameters()), ", expected ",
                TensorOps::ShapeString(global_parameters), ".")));
      }
      to_aggregate.emplace_back(&result.parameters(), result.sample_count());
      train_metrics.emplace_back(result.train_metric(), result.sample_count());
    }

    auto aggregated = aggregator_->Aggregate(to_aggregate);
    if (!aggregated.ok()) {
      return Terminate(RunOutcome::ABORTED, aggregated.status());
    }
    auto train_metric = aggregator_->AggregateMetric(train_metrics);
    if (!train_metric.ok()) {
      return Terminate(RunOutcome::ABORTED, train_metric.status());
    }

    run_state_.set_global_parameters(*aggregated);

    RoundSummary summary;
    summary.set_round_number(round_number);
    summary.set_aggregated_train_metric(*train_metric);
    summary.set_participant_count(fit_results_.size());
    summary.set_attempts(round_retries_ + 1);
    for (const auto &[worker_id, status] : fit_failures_) {
      *summary.add_failed_workers() = worker_id;
    }
    run_state_.AppendHistory(summary);

    LOG(INFO) << "Round " << round_number << ": aggregated "
              << fit_results_.size() << " models with " << aggregator_->Name()
              << ", train accuracy: " << *train_metric;
    run_state_.set_state(COLLECTING_EVAL);
    return absl::OkStatus();
  }

  absl::Status CollectEval() {
    const uint32_t round_number = round_config_->round_number();
    const auto timeout = RoundTimeout();
    auto parameters =
        std::make_shared<const ParameterVector>(run_state_.global_parameters());

    std::vector<std::string> evaluators;
    evaluators.reserve(fit_results_.size());
    for (const auto &result : fit_results_) {
      evaluators.push_back(result.worker_id());
    }

    auto outcomes = FanOut<EvalResult>(
        evaluators,
        [round_number, parameters, timeout](WorkerClient &client) {
          return client.Evaluate(round_number, *parameters, timeout);
        });

    MetricPairs losses;
    MetricPairs eval_metrics;
    for (auto &[worker_id, result] : outcomes) {
      if (result.ok() && (!std::isfinite(result->loss()) ||
                          !std::isfinite(result->eval_metric()))) {
        result = absl::StatusOr<EvalResult>(
            LocalTrainingError("Worker reported a non-finite loss."));
      }
      if (result.ok() && result->sample_count() > 0) {
        losses.emplace_back(result->loss(), result->sample_count());
        eval_metrics.emplace_back(result->eval_metric(),
                                  result->sample_count());
        continue;
      }
      if (IsErrorKind(result.status(), SHAPE_MISMATCH)) {
        return Terminate(
            RunOutcome::ABORTED,
            ShapeMismatchError(absl::StrCat("Worker ", worker_id,
                                            " rejected the global parameters: ",
                                            result.status().message())));
      }
      LOG(WARNING) << "Worker " << worker_id << " failed evaluation in round "
                   << round_number << ": "
                   << (result.ok() ? absl::InternalError("No held-out rows.")
                                   : result.status());
    }

    if (losses.size() < min_participants()) {
      return RetryOrAbort(
          round_number,
          QuorumTimeoutError(absl::StrCat(
              "Round ", round_number, " gathered ", losses.size(), " of ",
              min_participants(), " required evaluation results.")),
          COLLECTING_EVAL);
    }

    auto loss = aggregator_->AggregateMetric(losses);
    if (!loss.ok()) return Terminate(RunOutcome::ABORTED, loss.status());
    auto eval_metric = aggregator_->AggregateMetric(eval_metrics);
    if (!eval_metric.ok()) {
      return Terminate(RunOutcome::ABORTED, eval_metric.status());
    }

    run_state_.RecordEvaluation(*loss, *eval_metric, losses.size());
    LOG(INFO) << "Round " << round_number << ": evaluated on "
              << losses.size() << " workers, loss: " << *loss
              << ", accuracy: " << *eval_metric;
    run_state_.set_state(ROUND_COMPLETE);
    return absl::OkStatus();
  }

  absl::Status CompleteRound() {
    run_state_.RecordAttempts(round_retries_ + 1);
    run_state_.AdvanceRound();
    round_retries_ = 0;

    const auto completed_rounds = run_state_.current_round();
    LOG(INFO) << "Round " << completed_rounds << "/" << total_rounds()
              << " complete.";
    if (completed_rounds >= total_rounds()) {
      return Terminate(RunOutcome::COMPLETED, absl::OkStatus());
    }

    run_state_.set_state(CONFIGURING_ROUND);
    return absl::OkStatus();
  }

  absl::StatusOr<ParameterVector> FetchInitialParameters(
      const std::vector<std::string> &worker_ids) {
    for (const auto &worker_id : worker_ids) {
      auto client = registry_.GetClient(worker_id);
      if (client == nullptr) continue;

      auto parameters = client->GetParameters(RoundTimeout());
      if (parameters.ok() && parameters->tensors_size() > 0 &&
          TensorOps::IsWellFormed(*parameters)) {
        LOG(INFO) << "Initial parameters of shape "
                  << TensorOps::ShapeString(*parameters)
                  << " received from worker " << worker_id << ".";
        return parameters;
      }
      LOG(WARNING) << "Worker " << worker_id
                   << " did not provide initial parameters: "
                   << (parameters.ok()
                           ? absl::InvalidArgumentError("Malformed tensors.")
                           : parameters.status());
    }
    return QuorumTimeoutError("No worker provided initial parameters.");
  }

  // Sends one request per worker and waits for the replies until the round
  // deadline. Replies arriving later are discarded.
  template <typename T, typename Call>
  WorkerOutcomes<T> FanOut(const std::vector<std::string> &worker_ids,
                           Call call) {
    WorkerOutcomes<T> outcomes;
    std::vector<std::pair<std::string, std::future<absl::StatusOr<T>>>>
        pending;
    for (const auto &worker_id : worker_ids) {
      auto client = registry_.GetClient(worker_id);
      if (client == nullptr) {
        outcomes.emplace_back(
            worker_id, absl::NotFoundError(absl::StrCat(
                           "Worker ", worker_id, " is no longer connected.")));
        continue;
      }
      pending.emplace_back(
          worker_id, pool_.submit([client, call] { return call(*client); }));
    }

    const auto deadline = absl::ToChronoTime(absl::Now() + RoundTimeout());
    for (auto &[worker_id, future] : pending) {
      if (future.wait_until(deadline) == std::future_status::ready) {
        outcomes.emplace_back(worker_id, future.get());
      } else {
        outcomes.emplace_back(
            worker_id,
            absl::DeadlineExceededError(absl::StrCat(
                "Worker ", worker_id, " did not reply within ",
                absl::FormatDuration(RoundTimeout()), ".")));
      }
    }
    return outcomes;
  }

  // Retries the round from `retry_state` while the round's retry budget
  // lasts and aborts the run afterwards.
  absl::Status RetryOrAbort(uint32_t round_number, const absl::Status &status,
                            CoordinatorState retry_state) {
    const auto max_round_retries = params_.run_params().max_round_retries();
    if (round_retries_ < max_round_retries) {
      ++round_retries_;
      run_state_.CountRetry();
      LOG(WARNING) << status.message() << " Retrying round " << round_number
                   << " (" << round_retries_ << "/" << max_round_retries
                   << ").";
      run_state_.set_state(retry_state);
      return absl::OkStatus();
    }

    return Terminate(RunOutcome::ABORTED,
                     RunAbortedError(absl::StrCat(
                         "Round ", round_number, " aborted after ",
                         round_retries_, " retries: ", status.message())));
  }

  absl::Status Terminate(RunOutcome::Status outcome,
                         const absl::Status &status) {
    terminal_status_ = status;
    run_state_.Finish(outcome, status.ok() ? "All rounds completed."
                                           : std::string(status.message()));
    registry_.Close();

    if (outcome == RunOutcome::COMPLETED) {
      LOG(INFO) << "Run completed after " << run_state_.current_round()
                << " rounds.";
    } else {
      LOG(ERROR) << "Run aborted after " << run_state_.current_round()
                 << " completed rounds: " << status;
    }
    LogHistory();
    ShutDownWorkers();
    return status;
  }

  void LogHistory() const {
    const auto history = run_state_.history();
    if (history.empty()) return;

    LOG(INFO) << "Round | Participants | Train accuracy |   Loss | Accuracy";
    for (const auto &summary : history) {
      LOG(INFO) << absl::StrFormat(
          "%5d | %12d | %14.4f | %6.4f | %8.4f", summary.round_number(),
          summary.participant_count(), summary.aggregated_train_metric(),
          summary.aggregated_loss(), summary.aggregated_eval_metric());
    }
  }

  void ShutDownWorkers() {
    for (const auto &worker_id : registry_.GetWorkerIds()) {
      auto client = registry_.GetClient(worker_id);
      if (client == nullptr) continue;

      auto status = client->ShutDown();
      if (!status.ok()) {
        LOG(WARNING) << "Could not shut down worker " << worker_id << ": "
                     << status;
      }
    }
  }

  CoordinatorParams params_;
  std::unique_ptr<AggregationFunction> aggregator_;
  std::unique_ptr<Selector> selector_;
  WorkerRegistry registry_;
  RunState run_state_;

  // Serializes the steps of the run. Everything below is only touched while
  // holding it.
  std::mutex step_mutex_;
  std::shared_ptr<const RoundConfig> round_config_;
  std::vector<std::string> participants_;
  std::vector<FitResult> fit_results_;
  WorkerFailures fit_failures_;
  uint32_t round_retries_ = 0;
  absl::Status terminal_status_;

  BS::thread_pool pool_;
};

}  // namespace

absl::StatusOr<std::unique_ptr<Coordinator>> Coordinator::New(
    const CoordinatorParams &params) {
  RETURN_IF_ERROR(ValidateCoordinatorParams(params));
  ASSIGN_OR_RETURN(auto aggregator,
                   CreateAggregator(params.run_params().aggregation_rule()));
  return New(params, std::move(aggregator),
             CreateSelector(params.run_params()));
}

std::unique_ptr<Coordinator> Coordinator::New(
    const CoordinatorParams &params,
    std::unique_ptr<AggregationFunction> aggregator,
    std::unique_ptr<Selector> selector) {
  return absl::make_unique<CoordinatorDefaultImpl>(
      params, std::move(aggregator), std::move(selector));
}

}  // namespace cropfl::coordinator
