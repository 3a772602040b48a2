#include "sync_queue.hpp"

#include <exception>
#include <string>

#include "internal/observability/logging.hpp"
#include "internal/observability/metrics.hpp"
#include "internal/util/errors.hpp"

namespace offline::sync {

namespace {

using util::StoreError;

void ThrowIfDbError(const db::Result& result, const std::string& context) {
  if (result) {
    return;
  }
  const auto message = result.message.empty() ? context : context + ": " + result.message;
  throw StoreError(result.code == db::ErrorCode::Busy ? StoreError::Kind::kUnavailable : StoreError::Kind::kWriteFailed, message);
}

/*
  Clears the drain flag on every exit path.
*/
class DrainGuard {
 public:
  explicit DrainGuard(std::atomic<bool>& flag) : flag_(flag) {
    bool expected = false;
    if (!flag_.compare_exchange_strong(expected, true)) {
      throw util::QueueError(util::QueueError::Kind::kDrainInProgress, "sync queue drain already in progress");
    }
  }
  ~DrainGuard() {
    flag_.store(false);
  }

  DrainGuard(const DrainGuard&)            = delete;
  DrainGuard& operator=(const DrainGuard&) = delete;

 private:
  std::atomic<bool>& flag_;
};

DeliveryResult Deliver(const Transport& transport, const offline::cache::v1::SyncAction& action) {
  try {
    return transport(action);
  } catch (const std::exception& e) {
    return DeliveryResult::Failed(e.what());
  }
}

offline::cache::v1::SyncItem ToSyncItem(const db::model::SyncItemRecord& record) {
  offline::cache::v1::SyncItem item;
  item.set_id(record.id);
  if (!item.mutable_action()->ParseFromString(record.action)) {
    OFFLINE_LOG_WARN("sync item has undecodable action", {observability::IntField("id", static_cast<int64_t>(record.id))});
  }
  item.set_priority(record.priority);
  item.set_retry_count(record.retry_count);
  item.set_max_retries(record.max_retries);
  item.set_enqueued_at_ms(record.enqueued_at_ms);
  return item;
}

} // namespace

SyncQueue::SyncQueue(std::shared_ptr<db::Repository> repository, std::shared_ptr<const util::ClockSource> clock)
    : repository_(std::move(repository)), clock_(std::move(clock)) {
  if (!repository_) {
    throw StoreError(StoreError::Kind::kUnavailable, "sync queue requires a repository");
  }
  if (!clock_) clock_ = util::DefaultClock();
}

uint64_t SyncQueue::Enqueue(const offline::cache::v1::SyncAction& action, int32_t priority, uint32_t max_retries) {
  if (max_retries == 0) {
    throw util::InvalidArgument("max_retries must be at least 1");
  }

  db::model::SyncItemRecord item;
  if (!action.SerializeToString(&item.action)) {
    throw util::InvalidArgument("sync action could not be serialized");
  }
  item.priority       = priority;
  item.retry_count    = 0;
  item.max_retries    = max_retries;
  item.enqueued_at_ms = clock_->NowMs();

  try {
    auto tx = repository_->Begin();
    ThrowIfDbError(repository_->InsertSyncItem(*tx, item), "enqueue sync action");
    tx->Commit();
  } catch (const StoreError&) {
    throw;
  } catch (const std::exception& e) {
    throw StoreError(StoreError::Kind::kWriteFailed, std::string("enqueue sync action: ") + e.what());
  }

  OFFLINE_LOG_DEBUG("sync action queued", {observability::IntField("id", static_cast<int64_t>(item.id)),
                    observability::StringField("target", action.target()), observability::IntField("priority", priority)});
  return item.id;
}

void SyncQueue::Transition(const db::model::SyncItemRecord& item, bool delete_item) {
  try {
    auto tx = repository_->Begin();
    if (delete_item) {
      ThrowIfDbError(repository_->DeleteSyncItem(*tx, item.id), "remove sync item");
    } else {
      ThrowIfDbError(repository_->UpdateSyncItem(*tx, item), "update sync item");
    }
    tx->Commit();
  } catch (const StoreError&) {
    throw;
  } catch (const std::exception& e) {
    throw StoreError(StoreError::Kind::kWriteFailed, std::string("sync item transition: ") + e.what());
  }
}

DrainReport SyncQueue::Drain(const Transport& transport) {
  if (!transport) {
    throw util::InvalidArgument("drain requires a transport");
  }

  DrainGuard guard(draining_);

  std::vector<db::model::SyncItemRecord> items;
  try {
    auto tx = repository_->BeginRead();
    items   = repository_->ListSyncItems(*tx);
    tx->Commit();
  } catch (const std::exception& e) {
    throw StoreError(StoreError::Kind::kReadFailed, std::string("list sync items: ") + e.what());
  }

  DrainReport report;

  for (auto& item : items) {
    // a failed store write leaves the item pending for the next drain
    auto transition = [&](bool delete_item) {
      try {
        Transition(item, delete_item);
        return true;
      } catch (const StoreError& e) {
        report.store_errors.push_back(StoreFailure{item.id, e.what()});
        OFFLINE_LOG_WARN("sync item left pending", {observability::IntField("id", static_cast<int64_t>(item.id)),
                         observability::StringField("error", e.what())});
        return false;
      }
    };

    offline::cache::v1::SyncAction action;
    DeliveryResult                 result;
    if (action.ParseFromString(item.action)) {
      result = Deliver(transport, action);
    } else {
      // an unreadable action can never succeed; burn its remaining attempts
      item.retry_count = item.max_retries - 1;
      result           = DeliveryResult::Failed("undecodable action");
    }

    if (result.ok) {
      if (transition(/*delete_item=*/true)) report.succeeded.push_back(item.id);
      continue;
    }

    item.retry_count++;
    if (item.retry_count >= item.max_retries) {
      if (!transition(/*delete_item=*/true)) continue;

      FailedItem failed;
      failed.id         = item.id;
      failed.action     = std::move(action);
      failed.attempts   = item.retry_count;
      failed.last_error = result.error;

      OFFLINE_LOG_ERROR("sync action permanently failed", {observability::IntField("id", static_cast<int64_t>(item.id)),
                        observability::StringField("target", failed.action.target()),
                        observability::IntField("attempts", item.retry_count), observability::StringField("error", result.error)});
      report.permanently_failed.push_back(std::move(failed));
    } else {
      if (!transition(/*delete_item=*/false)) continue;
      report.retried.push_back(item.id);

      OFFLINE_LOG_WARN("sync action failed, will retry", {observability::IntField("id", static_cast<int64_t>(item.id)),
                       observability::IntField("retry_count", item.retry_count),
                       observability::IntField("max_retries", item.max_retries), observability::StringField("error", result.error)});
    }
  }

  observability::Metrics::Instance().RecordDrain(report.succeeded.size(), report.retried.size(), report.permanently_failed.size());

  OFFLINE_LOG_INFO("sync queue drained", {observability::IntField("succeeded", static_cast<int64_t>(report.succeeded.size())),
                   observability::IntField("retried", static_cast<int64_t>(report.retried.size())),
                   observability::IntField("failed", static_cast<int64_t>(report.permanently_failed.size())),
                   observability::IntField("store_errors", static_cast<int64_t>(report.store_errors.size()))});
  return report;
}

std::vector<offline::cache::v1::SyncItem> SyncQueue::Pending() {
  std::vector<db::model::SyncItemRecord> items;
  try {
    auto tx = repository_->BeginRead();
    items   = repository_->ListSyncItems(*tx);
    tx->Commit();
  } catch (const std::exception& e) {
    throw StoreError(StoreError::Kind::kReadFailed, std::string("list sync items: ") + e.what());
  }

  std::vector<offline::cache::v1::SyncItem> out;
  out.reserve(items.size());
  for (const auto& item : items) {
    out.push_back(ToSyncItem(item));
  }
  return out;
}

size_t SyncQueue::Size() {
  return Pending().size();
}

} // namespace offline::sync
