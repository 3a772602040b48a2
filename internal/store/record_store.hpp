#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/db/model/cache_record.hpp"

namespace offline::store {

/*
  Durable key -> record map.

  Knows nothing about TTL, codecs or quota. Every write is one
  transaction; readers see either the old or the new record, never a mix.
  Backend failures surface as util::StoreError.
*/
class RecordStore {
 public:
  explicit RecordStore(std::shared_ptr<db::Repository> repository);

  void Put(const db::model::CacheRecord& record);

  std::optional<db::model::CacheRecord> Get(const std::string& key);

  // Missing keys are not an error.
  void Delete(const std::string& key);
  void DeleteMany(const std::vector<std::string>& keys);

  std::vector<db::model::CacheRecord> ScanAll();

  void Clear();

  // Clear and insert in one transaction; on failure the old contents stay.
  void ReplaceAll(const std::vector<db::model::CacheRecord>& records);

  std::vector<std::string> Keys();

 private:
  std::shared_ptr<db::Repository> repository_;
};

} // namespace offline::store
