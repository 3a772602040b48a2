#include <arrow/buffer.h>

#include <cassert>
#include <chrono>
#include <filesystem>
#include <functional>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/db/model/cache_record.hpp"
#include "internal/db/model/sync_item_record.hpp"

#if OFFLINE_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#endif

namespace {

using offline::db::ErrorCode;
using offline::db::Repository;
using offline::db::memory::MemoryRepository;
using offline::db::model::CacheRecord;
using offline::db::model::SyncItemRecord;

uint64_t NowMs() {
  return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::system_clock::now().time_since_epoch()).count();
}

struct BackendFactory {
  std::string                                       name;
  std::function<std::shared_ptr<Repository>()>      make_repository;
  std::function<bool()>                             supports_restart;
  std::function<void(std::shared_ptr<Repository>&)> restart;
  std::function<void()>                             cleanup;
  bool                                              supports_parallel_transactions = true;
};

CacheRecord MakeRecord(const std::string& key, const std::string& payload, uint64_t created_at_ms = 1000) {
  CacheRecord record;
  record.key           = key;
  record.payload       = arrow::Buffer::FromString(payload);
  record.created_at_ms = created_at_ms;
  record.ttl_ms        = 60'000;
  record.type_tag      = "weather";
  record.compressed    = true;
  record.encrypted     = false;
  record.size_bytes    = payload.size();
  return record;
}

SyncItemRecord MakeSyncItem(const std::string& action, int32_t priority) {
  SyncItemRecord item;
  item.action         = action;
  item.priority       = priority;
  item.max_retries    = 3;
  item.enqueued_at_ms = NowMs();
  return item;
}

void ClearSyncItems(Repository& repo) {
  auto tx = repo.Begin();
  for (const auto& item : repo.ListSyncItems(*tx)) {
    assert(repo.DeleteSyncItem(*tx, item.id));
  }
  tx->Commit();
}

void VerifyRecordPutGetOverwriteDelete(Repository& repo, const std::string& key) {
  {
    auto tx = repo.Begin();
    assert(repo.PutRecord(*tx, MakeRecord(key, "first")));

    // own writes are visible before commit
    auto inside = repo.GetRecord(*tx, key);
    assert(inside.has_value());
    assert(inside->payload->ToString() == "first");
    tx->Commit();
    assert(tx->IsCommitted());
  }

  {
    auto tx = repo.BeginRead();
    auto read = repo.GetRecord(*tx, key);
    assert(read.has_value());
    assert(read->payload->ToString() == "first");
    assert(read->created_at_ms == 1000);
    assert(read->ttl_ms == 60'000);
    assert(read->type_tag == "weather");
    assert(read->compressed);
    assert(!read->encrypted);
    assert(read->size_bytes == 5);
    tx->Commit();
  }

  {
    auto tx = repo.Begin();
    auto replacement = MakeRecord(key, "second-value", 2000);
    replacement.type_tag  = "forecast";
    replacement.encrypted = true;
    assert(repo.PutRecord(*tx, replacement));
    tx->Commit();
  }

  {
    auto tx = repo.BeginRead();
    auto read = repo.GetRecord(*tx, key);
    assert(read.has_value());
    assert(read->payload->ToString() == "second-value");
    assert(read->created_at_ms == 2000);
    assert(read->type_tag == "forecast");
    assert(read->encrypted);
    assert(read->size_bytes == 12);
    tx->Commit();
  }

  {
    auto tx = repo.Begin();
    assert(repo.DeleteRecord(*tx, key));
    // missing keys are not an error
    assert(repo.DeleteRecord(*tx, key));
    assert(!repo.GetRecord(*tx, key).has_value());
    tx->Commit();
  }
}

void VerifyEmptyKeyRejected(Repository& repo) {
  auto tx     = repo.Begin();
  auto result = repo.PutRecord(*tx, MakeRecord("", "value"));
  assert(!result);
  assert(result.code == ErrorCode::ConstraintViolation);
  tx->Rollback();
}

void VerifyBinaryAndEmptyPayloads(Repository& repo, const std::string& prefix) {
  std::string binary("\x00\x01\xff\x00tail", 8);

  {
    auto tx = repo.Begin();
    assert(repo.PutRecord(*tx, MakeRecord(prefix + "-binary", binary)));
    assert(repo.PutRecord(*tx, MakeRecord(prefix + "-empty", "")));
    tx->Commit();
  }

  {
    auto tx = repo.BeginRead();
    auto b  = repo.GetRecord(*tx, prefix + "-binary");
    assert(b.has_value());
    assert(b->payload->ToString() == binary);

    auto e = repo.GetRecord(*tx, prefix + "-empty");
    assert(e.has_value());
    assert(e->payload);
    assert(e->payload->size() == 0);
    tx->Commit();
  }
}

void VerifyRollbackDiscardsWrites(Repository& repo, const std::string& key) {
  {
    auto tx = repo.Begin();
    assert(repo.PutRecord(*tx, MakeRecord(key, "discarded")));
    tx->Rollback();
  }

  {
    // destructor without commit rolls back too
    auto tx = repo.Begin();
    assert(repo.PutRecord(*tx, MakeRecord(key, "discarded")));
  }

  auto tx = repo.BeginRead();
  assert(!repo.GetRecord(*tx, key).has_value());
  tx->Commit();
}

void VerifyListAndDeleteAll(Repository& repo) {
  {
    auto tx = repo.Begin();
    assert(repo.DeleteAllRecords(*tx));
    for (int i = 0; i < 5; ++i) {
      assert(repo.PutRecord(*tx, MakeRecord("list-" + std::to_string(i), "v" + std::to_string(i))));
    }
    tx->Commit();
  }

  {
    auto tx      = repo.BeginRead();
    auto records = repo.ListRecords(*tx);
    assert(records.size() == 5);
    tx->Commit();
  }

  {
    auto tx = repo.Begin();
    assert(repo.DeleteAllRecords(*tx));
    tx->Commit();
  }

  auto tx = repo.BeginRead();
  assert(repo.ListRecords(*tx).empty());
  tx->Commit();
}

void VerifyWriteSequenceGrowsOnEveryPut(Repository& repo, const std::string& prefix) {
  const std::string a = prefix + "-seq-a";
  const std::string b = prefix + "-seq-b";

  auto seq_of = [&](const std::string& key) {
    auto tx     = repo.BeginRead();
    auto record = repo.GetRecord(*tx, key);
    tx->Commit();
    assert(record.has_value());
    return record->write_seq;
  };

  {
    auto tx = repo.Begin();
    assert(repo.PutRecord(*tx, MakeRecord(a, "one")));
    assert(repo.PutRecord(*tx, MakeRecord(b, "two")));
    tx->Commit();
  }
  const uint64_t first_a = seq_of(a);
  const uint64_t first_b = seq_of(b);
  assert(first_a > 0);
  assert(first_b > first_a);

  // same created_at_ms, overwrite still moves a past b
  {
    auto tx = repo.Begin();
    assert(repo.PutRecord(*tx, MakeRecord(a, "three")));
    tx->Commit();
  }
  assert(seq_of(a) > first_b);
  assert(seq_of(b) == first_b);

  auto tx = repo.Begin();
  assert(repo.DeleteRecord(*tx, a));
  assert(repo.DeleteRecord(*tx, b));
  tx->Commit();
}

void VerifySyncReplayOrder(Repository& repo) {
  ClearSyncItems(repo);

  uint64_t a = 0;
  uint64_t b = 0;
  uint64_t c = 0;
  {
    auto tx = repo.Begin();
    auto item_a = MakeSyncItem("A", 1);
    auto item_b = MakeSyncItem("B", 5);
    auto item_c = MakeSyncItem("C", 1);
    assert(repo.InsertSyncItem(*tx, item_a));
    assert(repo.InsertSyncItem(*tx, item_b));
    assert(repo.InsertSyncItem(*tx, item_c));
    a = item_a.id;
    b = item_b.id;
    c = item_c.id;
    tx->Commit();
  }

  assert(a > 0);
  assert(a < b);
  assert(b < c);

  auto tx    = repo.BeginRead();
  auto items = repo.ListSyncItems(*tx);
  tx->Commit();

  assert(items.size() == 3);
  assert(items[0].action == "B" && items[0].id == b);
  assert(items[1].action == "A" && items[1].id == a);
  assert(items[2].action == "C" && items[2].id == c);
}

void VerifySyncUpdateAndDelete(Repository& repo) {
  ClearSyncItems(repo);

  SyncItemRecord item = MakeSyncItem(std::string("\x08\x01payload", 9), 2);
  {
    auto tx = repo.Begin();
    assert(repo.InsertSyncItem(*tx, item));
    tx->Commit();
  }

  {
    auto tx = repo.Begin();
    item.retry_count = 2;
    assert(repo.UpdateSyncItem(*tx, item));
    tx->Commit();
  }

  {
    auto tx    = repo.BeginRead();
    auto items = repo.ListSyncItems(*tx);
    assert(items.size() == 1);
    assert(items[0].retry_count == 2);
    assert(items[0].max_retries == 3);
    assert(items[0].priority == 2);
    assert(items[0].action == item.action);
    tx->Commit();
  }

  const uint64_t deleted_id = item.id;
  {
    auto tx = repo.Begin();
    assert(repo.DeleteSyncItem(*tx, item.id));

    auto missing = repo.UpdateSyncItem(*tx, item);
    assert(!missing);
    assert(missing.code == ErrorCode::NotFound);
    tx->Commit();
  }

  // ids are never reused
  auto tx   = repo.Begin();
  auto next = MakeSyncItem("next", 1);
  assert(repo.InsertSyncItem(*tx, next));
  assert(next.id > deleted_id);
  tx->Commit();

  ClearSyncItems(repo);
}

void VerifyReadSnapshotIsolation(Repository& repo, const std::string& key, bool supports_parallel_transactions) {
  if (!supports_parallel_transactions) {
    return;
  }

  {
    auto tx = repo.Begin();
    assert(repo.PutRecord(*tx, MakeRecord(key, "old")));
    tx->Commit();
  }

  auto reader = repo.BeginRead();

  {
    auto writer = repo.Begin();
    assert(repo.PutRecord(*writer, MakeRecord(key, "new")));
    writer->Commit();
  }

  auto pinned = repo.GetRecord(*reader, key);
  assert(pinned.has_value());
  assert(pinned->payload->ToString() == "old");
  reader->Commit();

  auto fresh = repo.BeginRead();
  assert(repo.GetRecord(*fresh, key)->payload->ToString() == "new");
  fresh->Commit();
}

void VerifyRestartDurability(BackendFactory& backend, std::shared_ptr<Repository>& repo) {
  if (!backend.supports_restart()) {
    return;
  }

  ClearSyncItems(*repo);
  {
    auto tx   = repo->Begin();
    auto item = MakeSyncItem("durable", 4);
    assert(repo->PutRecord(*tx, MakeRecord("restart-key", "survives")));
    assert(repo->InsertSyncItem(*tx, item));
    tx->Commit();
  }

  backend.restart(repo);

  auto tx     = repo->BeginRead();
  auto record = repo->GetRecord(*tx, "restart-key");
  assert(record.has_value());
  assert(record->payload->ToString() == "survives");

  auto items = repo->ListSyncItems(*tx);
  assert(items.size() == 1);
  assert(items[0].action == "durable");
  assert(items[0].priority == 4);
  tx->Commit();
}

BackendFactory MakeMemoryFactory() {
  return BackendFactory{
      .name                           = "memory",
      .make_repository                = []() { return std::make_shared<MemoryRepository>(); },
      .supports_restart               = []() { return false; },
      .restart                        = [](std::shared_ptr<Repository>&) {},
      .cleanup                        = []() {},
      .supports_parallel_transactions = true,
  };
}

#if OFFLINE_DB_SQLITE
BackendFactory MakeSqliteFactory() {
  auto db_path = (std::filesystem::temp_directory_path() / ("offline_cache_integration_sqlite_" + std::to_string(NowMs()) + ".db")).string();

  auto make_repo = [db_path]() -> std::shared_ptr<Repository> {
    auto db = std::make_shared<offline::db::sqlite::SqliteDB>(db_path);
    offline::db::sqlite::SqliteRepository::BootstrapSchema(*db);
    return std::make_shared<offline::db::sqlite::SqliteRepository>(std::move(db));
  };

  return BackendFactory{
      .name                           = "sqlite",
      .make_repository                = make_repo,
      .supports_restart               = []() { return true; },
      .restart                        = [make_repo](std::shared_ptr<Repository>& repo) {
        repo.reset();
        repo = make_repo();
      },
      .cleanup = [db_path]() {
        std::filesystem::remove(db_path);
        std::filesystem::remove(db_path + "-wal");
        std::filesystem::remove(db_path + "-shm");
      },
      .supports_parallel_transactions = false,
  };
}
#endif

void RunBackendSuite(BackendFactory& backend) {
  auto repo = backend.make_repository();

  VerifyRecordPutGetOverwriteDelete(*repo, backend.name + "-record");
  VerifyEmptyKeyRejected(*repo);
  VerifyBinaryAndEmptyPayloads(*repo, backend.name);
  VerifyRollbackDiscardsWrites(*repo, backend.name + "-rollback");
  VerifyListAndDeleteAll(*repo);
  VerifyWriteSequenceGrowsOnEveryPut(*repo, backend.name);
  VerifySyncReplayOrder(*repo);
  VerifySyncUpdateAndDelete(*repo);
  VerifyReadSnapshotIsolation(*repo, backend.name + "-snapshot", backend.supports_parallel_transactions);
  VerifyRestartDurability(backend, repo);

  repo.reset();
  backend.cleanup();
}

} // namespace

int main() {
  std::vector<BackendFactory> backends;
  backends.push_back(MakeMemoryFactory());

#if OFFLINE_DB_SQLITE
  backends.push_back(MakeSqliteFactory());
#endif

  for (auto& backend : backends) {
    RunBackendSuite(backend);
  }

  std::cout << "offline_integration_repository_parity: pass\n";
  return 0;
}
