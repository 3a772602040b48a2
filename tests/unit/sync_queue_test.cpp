#include "internal/sync/sync_queue.hpp"

#include <cassert>
#include <chrono>
#include <filesystem>
#include <future>
#include <iostream>
#include <map>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/util/errors.hpp"

#if OFFLINE_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#endif

namespace {

using offline::cache::v1::SyncAction;
using offline::db::ErrorCode;
using offline::db::Repository;
using offline::db::Result;
using offline::db::Transaction;
using offline::db::memory::MemoryRepository;
using offline::db::model::CacheRecord;
using offline::db::model::SyncItemRecord;
using offline::sync::DeliveryResult;
using offline::sync::SyncQueue;
using offline::util::ManualClock;
using offline::util::QueueError;

SyncAction MakeAction(const std::string& target) {
  SyncAction action;
  action.set_type("api_call");
  action.set_target(target);
  action.set_method("POST");
  (*action.mutable_headers())["Content-Type"] = "application/json";
  action.set_body("{\"target\":\"" + target + "\"}");
  return action;
}

SyncQueue MakeQueue() {
  return SyncQueue(std::make_shared<MemoryRepository>(), std::make_shared<ManualClock>(1'000));
}

/*
  Memory backend whose Nth DeleteSyncItem reports a disk error.
*/
class FailingDeleteRepository final : public Repository {
 public:
  explicit FailingDeleteRepository(int fail_on_call) : fail_on_call_(fail_on_call) {}

  std::unique_ptr<Transaction> Begin() override { return inner_.Begin(); }
  std::unique_ptr<Transaction> BeginRead() override { return inner_.BeginRead(); }

  Result PutRecord(Transaction& t, const CacheRecord& r) override { return inner_.PutRecord(t, r); }
  std::optional<CacheRecord> GetRecord(Transaction& t, const std::string& key) override { return inner_.GetRecord(t, key); }
  std::vector<CacheRecord> ListRecords(Transaction& t) override { return inner_.ListRecords(t); }
  Result DeleteRecord(Transaction& t, const std::string& key) override { return inner_.DeleteRecord(t, key); }
  Result DeleteAllRecords(Transaction& t) override { return inner_.DeleteAllRecords(t); }

  Result InsertSyncItem(Transaction& t, SyncItemRecord& item) override { return inner_.InsertSyncItem(t, item); }
  std::vector<SyncItemRecord> ListSyncItems(Transaction& t) override { return inner_.ListSyncItems(t); }
  Result UpdateSyncItem(Transaction& t, const SyncItemRecord& item) override { return inner_.UpdateSyncItem(t, item); }

  Result DeleteSyncItem(Transaction& t, uint64_t id) override {
    if (++delete_calls_ == fail_on_call_) return Result::Err(ErrorCode::IOError, "disk full");
    return inner_.DeleteSyncItem(t, id);
  }

 private:
  MemoryRepository inner_;
  int              fail_on_call_;
  int              delete_calls_ = 0;
};

void TestReplayOrderIsPriorityThenFifo() {
  auto queue = MakeQueue();

  queue.Enqueue(MakeAction("A"), 1);
  queue.Enqueue(MakeAction("B"), 5);
  queue.Enqueue(MakeAction("C"), 1);

  std::vector<std::string> delivered;
  auto report = queue.Drain([&](const SyncAction& action) {
    delivered.push_back(action.target());
    return DeliveryResult::Ok();
  });

  assert((delivered == std::vector<std::string>{"B", "A", "C"}));
  assert(report.succeeded.size() == 3);
  assert(report.retried.empty());
  assert(report.permanently_failed.empty());
  assert(queue.Size() == 0);
}

void TestActionSurvivesRoundTrip() {
  auto queue = MakeQueue();
  auto sent  = MakeAction("/api/reports");
  queue.Enqueue(sent, 2, 4);

  auto pending = queue.Pending();
  assert(pending.size() == 1);
  assert(pending[0].priority() == 2);
  assert(pending[0].max_retries() == 4);
  assert(pending[0].retry_count() == 0);
  assert(pending[0].enqueued_at_ms() == 1'000);
  assert(pending[0].action().target() == "/api/reports");
  assert(pending[0].action().headers().at("Content-Type") == "application/json");
  assert(pending[0].action().body() == sent.body());
}

void TestRetriesExhaustAfterMaxAttempts() {
  auto queue = MakeQueue();
  const auto id = queue.Enqueue(MakeAction("flaky"));

  int attempts = 0;
  auto failing = [&](const SyncAction&) {
    ++attempts;
    return DeliveryResult::Failed("503");
  };

  auto first = queue.Drain(failing);
  assert((first.retried == std::vector<uint64_t>{id}));
  assert(queue.Pending()[0].retry_count() == 1);

  auto second = queue.Drain(failing);
  assert((second.retried == std::vector<uint64_t>{id}));
  assert(queue.Pending()[0].retry_count() == 2);

  auto third = queue.Drain(failing);
  assert(third.retried.empty());
  assert(third.permanently_failed.size() == 1);
  assert(third.permanently_failed[0].id == id);
  assert(third.permanently_failed[0].attempts == 3);
  assert(third.permanently_failed[0].last_error == "503");
  assert(third.permanently_failed[0].action.target() == "flaky");

  assert(attempts == 3);
  assert(queue.Size() == 0);
}

void TestThrowingTransportCountsAsFailure() {
  auto queue = MakeQueue();
  queue.Enqueue(MakeAction("boom"), 1, 1);

  auto report = queue.Drain([](const SyncAction&) -> DeliveryResult { throw std::runtime_error("connection reset"); });

  assert(report.permanently_failed.size() == 1);
  assert(report.permanently_failed[0].last_error == "connection reset");
  assert(queue.Size() == 0);
}

void TestMixedOutcomesInOneDrain() {
  auto queue = MakeQueue();
  const auto ok_id    = queue.Enqueue(MakeAction("ok"));
  const auto retry_id = queue.Enqueue(MakeAction("retry"));

  auto report = queue.Drain([](const SyncAction& action) {
    return action.target() == "ok" ? DeliveryResult::Ok() : DeliveryResult::Failed("timeout");
  });

  assert((report.succeeded == std::vector<uint64_t>{ok_id}));
  assert((report.retried == std::vector<uint64_t>{retry_id}));

  auto pending = queue.Pending();
  assert(pending.size() == 1);
  assert(pending[0].id() == retry_id);
}

void TestUndecodableActionFailsPermanently() {
  auto repo  = std::make_shared<MemoryRepository>();
  SyncQueue queue(repo, std::make_shared<ManualClock>(1'000));

  offline::db::model::SyncItemRecord garbage;
  garbage.action      = std::string("\xff\xff\xff", 3);
  garbage.max_retries = 5;
  {
    auto tx = repo->Begin();
    assert(repo->InsertSyncItem(*tx, garbage));
    tx->Commit();
  }

  bool called = false;
  auto report = queue.Drain([&](const SyncAction&) {
    called = true;
    return DeliveryResult::Ok();
  });

  assert(!called);
  assert(report.permanently_failed.size() == 1);
  assert(report.permanently_failed[0].id == garbage.id);
  assert(queue.Size() == 0);
}

void TestStoreFailureLeavesItemPendingAndDrainContinues() {
  SyncQueue queue(std::make_shared<FailingDeleteRepository>(2), std::make_shared<ManualClock>(1'000));

  const uint64_t a = queue.Enqueue(MakeAction("A"), 1, 1);
  const uint64_t b = queue.Enqueue(MakeAction("B"), 1, 1);
  const uint64_t c = queue.Enqueue(MakeAction("C"), 1, 1);

  std::vector<std::string> delivered;
  auto report = queue.Drain([&](const SyncAction& action) {
    delivered.push_back(action.target());
    return DeliveryResult::Failed("offline");
  });

  // B's removal failed; C was still attempted
  assert((delivered == std::vector<std::string>{"A", "B", "C"}));
  assert(report.permanently_failed.size() == 2);
  assert(report.permanently_failed[0].id == a);
  assert(report.permanently_failed[1].id == c);
  assert(report.store_errors.size() == 1);
  assert(report.store_errors[0].id == b);
  assert(report.store_errors[0].error.find("disk full") != std::string::npos);
  assert(report.succeeded.empty());
  assert(report.retried.empty());

  auto pending = queue.Pending();
  assert(pending.size() == 1);
  assert(pending[0].id() == b);
  assert(pending[0].retry_count() == 0);

  auto retry = queue.Drain([](const SyncAction&) { return DeliveryResult::Ok(); });
  assert((retry.succeeded == std::vector<uint64_t>{b}));
  assert(retry.store_errors.empty());
  assert(queue.Size() == 0);
}

void TestConcurrentDrainRejected() {
  auto queue = MakeQueue();
  queue.Enqueue(MakeAction("slow"));

  std::promise<void> entered;
  std::promise<void> release;
  auto               release_future = release.get_future().share();

  std::thread first([&] {
    auto report = queue.Drain([&](const SyncAction&) {
      entered.set_value();
      release_future.wait();
      return DeliveryResult::Ok();
    });
    assert(report.succeeded.size() == 1);
  });

  entered.get_future().wait();

  bool rejected = false;
  try {
    (void)queue.Drain([](const SyncAction&) { return DeliveryResult::Ok(); });
  } catch (const QueueError& e) {
    rejected = e.kind() == QueueError::Kind::kDrainInProgress;
  }
  assert(rejected);

  release.set_value();
  first.join();

  // flag is cleared once the first drain returns
  auto report = queue.Drain([](const SyncAction&) { return DeliveryResult::Ok(); });
  assert(report.succeeded.empty());
}

void TestInvalidArguments() {
  auto queue = MakeQueue();

  bool rejected = false;
  try {
    queue.Enqueue(MakeAction("x"), 1, 0);
  } catch (const offline::util::InvalidArgument&) {
    rejected = true;
  }
  assert(rejected);

  rejected = false;
  try {
    (void)queue.Drain(nullptr);
  } catch (const offline::util::InvalidArgument&) {
    rejected = true;
  }
  assert(rejected);
  assert(queue.Size() == 0);
}

#if OFFLINE_DB_SQLITE
void TestQueueSurvivesReopen() {
  const auto path =
      (std::filesystem::temp_directory_path() /
       ("offline_cache_sync_queue_" + std::to_string(std::chrono::steady_clock::now().time_since_epoch().count()) + ".db"))
          .string();

  auto open = [&] {
    auto db = std::make_shared<offline::db::sqlite::SqliteDB>(path);
    offline::db::sqlite::SqliteRepository::BootstrapSchema(*db);
    return std::make_shared<offline::db::sqlite::SqliteRepository>(std::move(db));
  };

  {
    SyncQueue queue(open(), std::make_shared<ManualClock>(5));
    queue.Enqueue(MakeAction("low"), 1);
    queue.Enqueue(MakeAction("high"), 9);
    auto report = queue.Drain([](const SyncAction& action) {
      return action.target() == "high" ? DeliveryResult::Ok() : DeliveryResult::Failed("offline");
    });
    assert(report.succeeded.size() == 1);
  }

  {
    SyncQueue queue(open(), std::make_shared<ManualClock>(5));
    auto      pending = queue.Pending();
    assert(pending.size() == 1);
    assert(pending[0].action().target() == "low");
    assert(pending[0].retry_count() == 1);
  }

  std::filesystem::remove(path);
  std::filesystem::remove(path + "-wal");
  std::filesystem::remove(path + "-shm");
}
#endif

} // namespace

int main() {
  TestReplayOrderIsPriorityThenFifo();
  TestActionSurvivesRoundTrip();
  TestRetriesExhaustAfterMaxAttempts();
  TestThrowingTransportCountsAsFailure();
  TestMixedOutcomesInOneDrain();
  TestUndecodableActionFailsPermanently();
  TestStoreFailureLeavesItemPendingAndDrainContinues();
  TestConcurrentDrainRejected();
  TestInvalidArguments();
#if OFFLINE_DB_SQLITE
  TestQueueSurvivesReopen();
#endif

  std::cout << "offline_unit_sync_queue: pass\n";
  return 0;
}
