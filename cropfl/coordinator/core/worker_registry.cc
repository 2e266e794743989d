#include "cropfl/coordinator/core/worker_registry.h"

#include <algorithm>
#include <utility>

#include "absl/strings/str_cat.h"

namespace cropfl::coordinator {

absl::Status WorkerRegistry::AddWorker(const std::string &worker_id,
                                       std::shared_ptr<WorkerClient> client) {
  if (worker_id.empty()) {
    return absl::InvalidArgumentError("Worker id cannot be empty.");
  }
  if (client == nullptr) {
    return absl::InvalidArgumentError("Worker client cannot be null.");
  }

  {
    std::lock_guard<std::mutex> workers_guard(workers_mutex_);
    if (closed_) {
      return absl::FailedPreconditionError(
          "The run has terminated, registrations are closed.");
    }
    if (workers_.contains(worker_id)) {
      return absl::AlreadyExistsError(
          absl::StrCat("Worker ", worker_id, " has already registered."));
    }
    workers_[worker_id] = std::move(client);
  }
  workers_cv_.notify_all();
  return absl::OkStatus();
}

absl::Status WorkerRegistry::RemoveWorker(const std::string &worker_id) {
  std::lock_guard<std::mutex> workers_guard(workers_mutex_);

  if (!workers_.contains(worker_id)) {
    return absl::NotFoundError(
        absl::StrCat("Worker ", worker_id, " is not connected."));
  }
  workers_.erase(worker_id);
  return absl::OkStatus();
}

std::vector<std::string> WorkerRegistry::GetWorkerIds() const {
  std::lock_guard<std::mutex> workers_guard(workers_mutex_);

  std::vector<std::string> worker_ids;
  worker_ids.reserve(workers_.size());
  for (const auto &[worker_id, client] : workers_) {
    worker_ids.push_back(worker_id);
  }
  std::sort(worker_ids.begin(), worker_ids.end());
  return worker_ids;
}

std::shared_ptr<WorkerClient> WorkerRegistry::GetClient(
    const std::string &worker_id) const {
  std::lock_guard<std::mutex> workers_guard(workers_mutex_);

  auto it = workers_.find(worker_id);
  if (it == workers_.end()) return nullptr;
  return it->second;
}

size_t WorkerRegistry::size() const {
  std::lock_guard<std::mutex> workers_guard(workers_mutex_);
  return workers_.size();
}

bool WorkerRegistry::AwaitSize(size_t num_workers, absl::Duration timeout) {
  std::unique_lock<std::mutex> workers_lock(workers_mutex_);

  auto ready = [this, num_workers] {
    return closed_ || workers_.size() >= num_workers;
  };
  if (timeout == absl::InfiniteDuration()) {
    workers_cv_.wait(workers_lock, ready);
  } else {
    workers_cv_.wait_for(workers_lock, absl::ToChronoNanoseconds(timeout),
                         ready);
  }
  return !closed_ && workers_.size() >= num_workers;
}

void WorkerRegistry::Close() {
  {
    std::lock_guard<std::mutex> workers_guard(workers_mutex_);
    closed_ = true;
  }
  workers_cv_.notify_all();
}

bool WorkerRegistry::closed() const {
  std::lock_guard<std::mutex> workers_guard(workers_mutex_);
  return closed_;
}

}  // namespace cropfl::coordinator
