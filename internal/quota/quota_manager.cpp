#include "quota_manager.hpp"

#include <algorithm>
#include <string>
#include <vector>

#include "internal/observability/logging.hpp"
#include "internal/observability/metrics.hpp"
#include "internal/util/errors.hpp"

namespace offline::quota {

namespace {

// 25% by count, never less than one record.
size_t SliceSize(size_t live_count) {
  return std::max<size_t>(1, live_count / 4);
}

} // namespace

QuotaManager::QuotaManager(uint64_t limit_bytes, std::shared_ptr<const util::ClockSource> clock)
    : limit_bytes_(limit_bytes), clock_(std::move(clock)) {
  if (limit_bytes_ == 0) throw util::InvalidArgument("quota limit must be positive");
  if (!clock_) clock_ = util::DefaultClock();
}

UsageSnapshot QuotaManager::Usage(store::RecordStore& store) const {
  const uint64_t now = clock_->NowMs();

  UsageSnapshot usage;
  for (const auto& record : store.ScanAll()) {
    if (db::model::IsExpired(record, now)) continue;
    usage.total_bytes += record.size_bytes;
    usage.record_count++;
  }
  return usage;
}

EvictionReport QuotaManager::CheckAndEvict(store::RecordStore& store) {
  std::lock_guard lock(evict_mutex_);

  const uint64_t now = clock_->NowMs();

  std::vector<db::model::CacheRecord> live;
  uint64_t                            total = 0;
  for (auto& record : store.ScanAll()) {
    if (db::model::IsExpired(record, now)) continue;
    total += record.size_bytes;
    live.push_back(std::move(record));
  }

  EvictionReport report;
  report.bytes_before = total;
  report.bytes_after  = total;

  if (total <= limit_bytes_) {
    observability::Metrics::Instance().SetCacheOccupancyBytes(total);
    return report;
  }

  std::sort(live.begin(), live.end(), [](const auto& a, const auto& b) {
    if (a.created_at_ms != b.created_at_ms) return a.created_at_ms < b.created_at_ms;
    return a.write_seq < b.write_seq;
  });

  size_t next = 0;
  while (total > limit_bytes_ && next < live.size()) {
    const size_t slice_end = next + SliceSize(live.size() - next);

    std::vector<std::string> victims;
    for (; next < slice_end && total > limit_bytes_; ++next) {
      victims.push_back(live[next].key);
      total -= live[next].size_bytes;
    }

    store.DeleteMany(victims);

    report.evicted_records += victims.size();
    report.passes++;
  }

  report.bytes_after = total;

  observability::Metrics::Instance().RecordEvictions(report.evicted_records);
  observability::Metrics::Instance().SetCacheOccupancyBytes(total);

  OFFLINE_LOG_INFO("quota eviction", {observability::IntField("bytes_before", static_cast<int64_t>(report.bytes_before)),
                   observability::IntField("bytes_after", static_cast<int64_t>(report.bytes_after)),
                   observability::IntField("evicted", static_cast<int64_t>(report.evicted_records)),
                   observability::IntField("passes", static_cast<int64_t>(report.passes)),
                   observability::IntField("limit", static_cast<int64_t>(limit_bytes_))});
  return report;
}

} // namespace offline::quota
