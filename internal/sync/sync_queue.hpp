#pragma once

#include <atomic>
#include <cstdint>
#include <memory>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/sync/delivery.hpp"
#include "internal/util/time.hpp"

namespace offline::sync {

constexpr uint32_t kDefaultMaxRetries = 3;
constexpr int32_t  kDefaultPriority   = 1;

/*
  Durable queue of actions captured while offline.

  Replay order: priority descending, then enqueue order.

  Per item:
    Pending --ok--------------------------> removed (succeeded)
    Pending --fail, retry_count+1 < max---> Pending (retried)
    Pending --fail, retry_count+1 >= max--> removed (permanently_failed)

  Each transition commits on its own, so a crash mid-drain replays at most
  the item that was in flight. A transition that fails to commit is
  reported in store_errors and the drain moves on to the next item; that
  item stays as it was. Only one Drain runs at a time; a second
  caller gets util::QueueError(kDrainInProgress).
*/
class SyncQueue {
 public:
  SyncQueue(std::shared_ptr<db::Repository> repository, std::shared_ptr<const util::ClockSource> clock);

  // Persists before returning. Throws util::StoreError if it cannot.
  uint64_t Enqueue(const offline::cache::v1::SyncAction& action, int32_t priority = kDefaultPriority,
                   uint32_t max_retries = kDefaultMaxRetries);

  DrainReport Drain(const Transport& transport);

  std::vector<offline::cache::v1::SyncItem> Pending();

  size_t Size();

 private:
  void Transition(const db::model::SyncItemRecord& item, bool delete_item);

  std::shared_ptr<db::Repository>          repository_;
  std::shared_ptr<const util::ClockSource> clock_;
  std::atomic<bool>                        draining_{false};
};

} // namespace offline::sync
