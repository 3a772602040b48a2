#pragma once

#include <arrow/buffer.h>

#include <cstdint>
#include <memory>
#include <string>

namespace offline::db::model {

/*
  Persistent cache row.

  - payload holds the bytes after the codec pipeline ran
  - compressed/encrypted describe how to reverse it and never change
  - size_bytes is fixed at write time; quota accounting sums it
  - write_seq is assigned by the repository on every put and grows
    monotonically, so it orders writes that share a created_at_ms
*/

struct CacheRecord {
  std::string key;

  std::shared_ptr<arrow::Buffer> payload;

  uint64_t created_at_ms = 0;
  uint64_t ttl_ms        = 3'600'000;

  std::string type_tag = "generic";

  bool compressed = false;
  bool encrypted  = false;

  uint64_t size_bytes = 0;
  uint64_t write_seq  = 0;
};

// Expired once ttl_ms has fully elapsed. A clock that moved backwards keeps the record live.
inline bool IsExpired(const CacheRecord& record, uint64_t now_ms) {
  return now_ms >= record.created_at_ms && now_ms - record.created_at_ms >= record.ttl_ms;
}

} // namespace offline::db::model
