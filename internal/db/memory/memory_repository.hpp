#pragma once

#include <map>
#include <memory>
#include <mutex>
#include <string>

#include "internal/db/api/repository.hpp"

namespace offline::db::memory {

class MemoryTransaction;

/*
  In-process backend.

  Committed state is an immutable snapshot behind a shared_ptr:
    - read transactions pin the current snapshot (no copy, never block)
    - write transactions are serialized, work on a private copy and
      publish it atomically on Commit()
*/
class MemoryRepository final : public db::Repository {
 public:
  MemoryRepository();

  std::unique_ptr<Transaction> Begin() override;
  std::unique_ptr<Transaction> BeginRead() override;

  Result                             PutRecord(Transaction&, const model::CacheRecord&) override;
  std::optional<model::CacheRecord>  GetRecord(Transaction&, const std::string&) override;
  std::vector<model::CacheRecord>    ListRecords(Transaction&) override;
  Result                             DeleteRecord(Transaction&, const std::string&) override;
  Result                             DeleteAllRecords(Transaction&) override;

  Result                              InsertSyncItem(Transaction&, model::SyncItemRecord&) override;
  std::vector<model::SyncItemRecord>  ListSyncItems(Transaction&) override;
  Result                              UpdateSyncItem(Transaction&, const model::SyncItemRecord&) override;
  Result                              DeleteSyncItem(Transaction&, uint64_t id) override;

 private:
  friend class MemoryTransaction;

  struct State {
    std::map<std::string, model::CacheRecord>  records;
    std::map<uint64_t, model::SyncItemRecord>  sync_items;
    uint64_t                                   next_sync_id   = 1;
    uint64_t                                   next_write_seq = 1;
  };

  std::shared_ptr<const State> Snapshot() const;
  void                         Publish(std::shared_ptr<const State> state);

  mutable std::mutex           state_mutex_;
  std::shared_ptr<const State> committed_;

  // held by the one active write transaction
  std::mutex writer_mutex_;
};

} // namespace offline::db::memory
