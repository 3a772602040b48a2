#pragma once

#include <cstdint>
#include <string>

namespace offline::db::model {

struct SyncItemRecord {
  uint64_t id = 0; // assigned by the backend on insert

  // serialized offline.cache.v1.SyncAction
  std::string action;

  int32_t  priority       = 1;
  uint32_t retry_count    = 0;
  uint32_t max_retries    = 3;
  uint64_t enqueued_at_ms = 0;
};

} // namespace offline::db::model
