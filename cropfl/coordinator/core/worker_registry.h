#ifndef CROPFL_CROPFL_COORDINATOR_CORE_WORKER_REGISTRY_H_
#define CROPFL_CROPFL_COORDINATOR_CORE_WORKER_REGISTRY_H_

#include <condition_variable>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "absl/container/flat_hash_map.h"
#include "absl/status/status.h"
#include "absl/time/time.h"
#include "cropfl/coordinator/core/worker_client.h"

namespace cropfl::coordinator {

// The set of connected workers. Mutated by service threads, read by the
// coordinator loop.
class WorkerRegistry {
  mutable std::mutex workers_mutex_;
  std::condition_variable workers_cv_;

  // worker_id -> client
  absl::flat_hash_map<std::string, std::shared_ptr<WorkerClient>> workers_;
  bool closed_ = false;

 public:
  WorkerRegistry() = default;

  ~WorkerRegistry() = default;

  absl::Status AddWorker(const std::string &worker_id,
                         std::shared_ptr<WorkerClient> client);

  absl::Status RemoveWorker(const std::string &worker_id);

  // Sorted ids of the connected workers.
  std::vector<std::string> GetWorkerIds() const;

  // Returns nullptr when the worker is not connected.
  std::shared_ptr<WorkerClient> GetClient(const std::string &worker_id) const;

  size_t size() const;

  // Blocks until at least `num_workers` are connected. Returns false when
  // the timeout expires first or the registry gets closed.
  bool AwaitSize(size_t num_workers, absl::Duration timeout);

  // Rejects further registrations and wakes up all waiters.
  void Close();

  bool closed() const;
};

}  // namespace cropfl::coordinator

#endif  // CROPFL_CROPFL_COORDINATOR_CORE_WORKER_REGISTRY_H_
