#include "memory_repository.hpp"

#include <algorithm>
#include <utility>

#include "memory_tx.hpp"

namespace offline::db::memory {

MemoryRepository::MemoryRepository() : committed_(std::make_shared<const State>()) {
}

std::shared_ptr<const MemoryRepository::State> MemoryRepository::Snapshot() const {
  std::scoped_lock lock(state_mutex_);
  return committed_;
}

void MemoryRepository::Publish(std::shared_ptr<const State> state) {
  std::scoped_lock lock(state_mutex_);
  committed_ = std::move(state);
}

std::unique_ptr<db::Transaction> MemoryRepository::Begin() {
  return std::make_unique<MemoryTransaction>(*this, std::unique_lock<std::mutex>(writer_mutex_));
}

std::unique_ptr<db::Transaction> MemoryRepository::BeginRead() {
  return std::make_unique<MemoryTransaction>(*this);
}

static MemoryTransaction& TX(db::Transaction& tx) {
  return static_cast<MemoryTransaction&>(tx);
}

// ------------------------------------------------------------------
// Cache records
// ------------------------------------------------------------------

Result MemoryRepository::PutRecord(Transaction& t, const model::CacheRecord& r) {
  if (r.key.empty()) return Result::Err(ErrorCode::ConstraintViolation, "empty key");
  auto& s          = TX(t).Mutable();
  auto  stored     = r;
  stored.write_seq = s.next_write_seq++;
  s.records[r.key] = std::move(stored);
  return Result::Ok();
}

std::optional<model::CacheRecord> MemoryRepository::GetRecord(Transaction& t, const std::string& key) {
  const auto& s  = TX(t).View();
  auto        it = s.records.find(key);
  if (it == s.records.end()) return std::nullopt;
  return it->second;
}

std::vector<model::CacheRecord> MemoryRepository::ListRecords(Transaction& t) {
  const auto&                     s = TX(t).View();
  std::vector<model::CacheRecord> records;
  records.reserve(s.records.size());
  for (const auto& [_, record] : s.records) {
    records.push_back(record);
  }
  return records;
}

Result MemoryRepository::DeleteRecord(Transaction& t, const std::string& key) {
  TX(t).Mutable().records.erase(key);
  return Result::Ok();
}

Result MemoryRepository::DeleteAllRecords(Transaction& t) {
  TX(t).Mutable().records.clear();
  return Result::Ok();
}

// ------------------------------------------------------------------
// Sync queue
// ------------------------------------------------------------------

Result MemoryRepository::InsertSyncItem(Transaction& t, model::SyncItemRecord& item) {
  auto& s = TX(t).Mutable();
  item.id = s.next_sync_id++;
  s.sync_items[item.id] = item;
  return Result::Ok();
}

std::vector<model::SyncItemRecord> MemoryRepository::ListSyncItems(Transaction& t) {
  const auto&                        s = TX(t).View();
  std::vector<model::SyncItemRecord> items;
  items.reserve(s.sync_items.size());
  for (const auto& [_, item] : s.sync_items) {
    items.push_back(item);
  }
  // map iteration is id ascending; stable sort keeps FIFO within a priority
  std::stable_sort(items.begin(), items.end(), [](const auto& a, const auto& b) { return a.priority > b.priority; });
  return items;
}

Result MemoryRepository::UpdateSyncItem(Transaction& t, const model::SyncItemRecord& item) {
  auto& s  = TX(t).Mutable();
  auto  it = s.sync_items.find(item.id);
  if (it == s.sync_items.end()) return Result::Err(ErrorCode::NotFound);
  it->second = item;
  return Result::Ok();
}

Result MemoryRepository::DeleteSyncItem(Transaction& t, uint64_t id) {
  TX(t).Mutable().sync_items.erase(id);
  return Result::Ok();
}

} // namespace offline::db::memory
