#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/db/model/cache_record.hpp"
#include "internal/db/model/sync_item_record.hpp"

namespace offline::db {

/*
  Repository abstraction.

  CRITICAL GUARANTEES:

  - All writes require a transaction from Begin()
  - Reads inside a transaction see its writes
  - A read transaction from BeginRead() sees one committed snapshot
  - PutRecord replaces the whole row; readers never observe a torn record

  The DB is the source of truth for:
    cached records
    pending sync actions

  Read methods throw std::runtime_error on backend failure; write methods
  return a Result.
*/

class Repository {
 public:
  virtual ~Repository() = default;

  // ---------------------------------------------------------------------
  // Transactions
  // ---------------------------------------------------------------------

  virtual std::unique_ptr<Transaction> Begin() = 0;

  virtual std::unique_ptr<Transaction> BeginRead() = 0;

  // ---------------------------------------------------------------------
  // Cache records
  // ---------------------------------------------------------------------

  // Insert or overwrite by key.
  virtual Result PutRecord(Transaction&, const model::CacheRecord&) = 0;

  virtual std::optional<model::CacheRecord> GetRecord(Transaction&, const std::string& key) = 0;

  virtual std::vector<model::CacheRecord> ListRecords(Transaction&) = 0;

  // Deleting a missing key is OK.
  virtual Result DeleteRecord(Transaction&, const std::string& key) = 0;

  virtual Result DeleteAllRecords(Transaction&) = 0;

  // ---------------------------------------------------------------------
  // Sync queue
  // ---------------------------------------------------------------------

  // Assigns item.id (strictly increasing, never reused).
  virtual Result InsertSyncItem(Transaction&, model::SyncItemRecord& item) = 0;

  // Replay order: priority descending, then id ascending.
  virtual std::vector<model::SyncItemRecord> ListSyncItems(Transaction&) = 0;

  virtual Result UpdateSyncItem(Transaction&, const model::SyncItemRecord&) = 0;

  virtual Result DeleteSyncItem(Transaction&, uint64_t id) = 0;
};

} // namespace offline::db
