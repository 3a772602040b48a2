#include "expiry_sweeper.hpp"

#include "internal/cache/offline_cache.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace offline::cache {

ExpirySweeper::ExpirySweeper(std::shared_ptr<OfflineCache> cache, std::chrono::milliseconds interval)
    : cache_(std::move(cache)), interval_(interval) {
  if (!cache_) throw util::InvalidArgument("expiry sweeper requires a cache");
  if (interval_.count() <= 0) throw util::InvalidArgument("expiry sweep interval must be positive");
}

ExpirySweeper::~ExpirySweeper() {
  Stop();
}

void ExpirySweeper::Start() {
  if (running_.exchange(true)) return;
  thread_ = std::thread(&ExpirySweeper::Loop, this);
  OFFLINE_LOG_INFO("expiry sweeper started", {observability::IntField("interval_ms", interval_.count())});
}

void ExpirySweeper::Stop() {
  {
    std::lock_guard lock(wake_mutex_);
    running_ = false;
  }
  wake_.notify_all();
  if (thread_.joinable()) thread_.join();
}

void ExpirySweeper::Loop() {
  std::unique_lock lock(wake_mutex_);
  while (running_) {
    wake_.wait_for(lock, interval_, [this] { return !running_; });
    if (!running_) break;

    lock.unlock();
    // PurgeExpired never throws
    cache_->PurgeExpired();
    lock.lock();
  }
}

} // namespace offline::cache
