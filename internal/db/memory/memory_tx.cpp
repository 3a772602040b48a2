#include "memory_tx.hpp"

#include <stdexcept>

namespace offline::db::memory {

MemoryTransaction::MemoryTransaction(MemoryRepository& repo) : repo_(repo), snapshot_(repo.Snapshot()) {
}

MemoryTransaction::MemoryTransaction(MemoryRepository& repo, std::unique_lock<std::mutex> writer_lock)
    : repo_(repo), writer_lock_(std::move(writer_lock)) {
  snapshot_ = repo_.Snapshot();
  working_  = std::make_shared<MemoryRepository::State>(*snapshot_); // snapshot copy
}

MemoryTransaction::~MemoryTransaction() {
  if (!committed_ && !rolled_back_) Rollback();
}

MemoryRepository::State& MemoryTransaction::Mutable() {
  if (!working_) {
    throw std::logic_error("write attempted in a read-only memory transaction");
  }
  if (committed_ || rolled_back_) {
    throw std::logic_error("memory transaction already finished");
  }
  return *working_;
}

const MemoryRepository::State& MemoryTransaction::View() const {
  return working_ ? *working_ : *snapshot_;
}

void MemoryTransaction::Commit() {
  if (committed_ || rolled_back_) return;
  if (working_) {
    repo_.Publish(std::move(working_));
    working_.reset();
  }
  committed_ = true;
  if (writer_lock_.owns_lock()) writer_lock_.unlock();
}

void MemoryTransaction::Rollback() {
  working_.reset();
  rolled_back_ = true;
  if (writer_lock_.owns_lock()) writer_lock_.unlock();
}

} // namespace offline::db::memory
