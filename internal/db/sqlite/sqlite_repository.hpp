#pragma once

#include <memory>

#include "internal/db/api/repository.hpp"
#include "sqlite_db.hpp"
#include "sqlite_tx.hpp"

namespace offline::db::sqlite {

/*
  Tables (see BootstrapSchema):
    cache_records(key PK, payload BLOB, created_at_ms, ttl_ms, type_tag, compressed, encrypted, size_bytes, write_seq)
    sync_queue(id AUTOINCREMENT, action BLOB, priority, retry_count, max_retries, enqueued_at_ms)
*/
class SqliteRepository final : public db::Repository {
 public:
  explicit SqliteRepository(std::shared_ptr<SqliteDB> db);

  // Creates tables and indexes if missing.
  static void BootstrapSchema(SqliteDB& db);

  std::unique_ptr<Transaction> Begin() override;
  std::unique_ptr<Transaction> BeginRead() override;

  Result                            PutRecord(Transaction&, const model::CacheRecord&) override;
  std::optional<model::CacheRecord> GetRecord(Transaction&, const std::string&) override;
  std::vector<model::CacheRecord>   ListRecords(Transaction&) override;
  Result                            DeleteRecord(Transaction&, const std::string&) override;
  Result                            DeleteAllRecords(Transaction&) override;

  Result                             InsertSyncItem(Transaction&, model::SyncItemRecord&) override;
  std::vector<model::SyncItemRecord> ListSyncItems(Transaction&) override;
  Result                             UpdateSyncItem(Transaction&, const model::SyncItemRecord&) override;
  Result                             DeleteSyncItem(Transaction&, uint64_t id) override;

 private:
  std::shared_ptr<SqliteDB> db_;

  static SqliteTransaction& TX(Transaction& t);
  static Result             Translate(sqlite3* db, int rc);
};

} // namespace offline::db::sqlite
