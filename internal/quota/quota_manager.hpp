#pragma once

#include <cstdint>
#include <memory>
#include <mutex>

#include "internal/store/record_store.hpp"
#include "internal/util/time.hpp"

namespace offline::quota {

constexpr uint64_t kDefaultQuotaBytes = 50ull * 1024 * 1024;

struct UsageSnapshot {
  uint64_t total_bytes  = 0;
  uint64_t record_count = 0;
};

struct EvictionReport {
  uint64_t bytes_before    = 0;
  uint64_t bytes_after     = 0;
  uint64_t evicted_records = 0;
  uint32_t passes          = 0;
};

/*
  Byte ceiling over live (unexpired) cache records.

  Eviction policy: oldest created_at first, in slices of 25% of the live
  record count (at least one record). Within a slice, records are deleted
  oldest-first only until usage fits; if the whole slice is gone and usage
  still exceeds the limit, the next slice is cut from what remains.

  Expired records are neither counted nor chosen; lazy expiry owns them.
  CheckAndEvict is single-flight.
*/
class QuotaManager {
 public:
  QuotaManager(uint64_t limit_bytes, std::shared_ptr<const util::ClockSource> clock);

  UsageSnapshot Usage(store::RecordStore& store) const;

  EvictionReport CheckAndEvict(store::RecordStore& store);

  uint64_t LimitBytes() const {
    return limit_bytes_;
  }

 private:
  uint64_t                                 limit_bytes_;
  std::shared_ptr<const util::ClockSource> clock_;
  std::mutex                               evict_mutex_;
};

} // namespace offline::quota
