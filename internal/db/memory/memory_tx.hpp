#pragma once

#include <memory>
#include <mutex>

#include "internal/db/api/transaction.hpp"
#include "memory_repository.hpp"

namespace offline::db::memory {

/*
  Transaction = pinned snapshot (+ private write copy for writers)
*/

class MemoryTransaction final : public db::Transaction {
 public:
  // Read-only transaction over the current snapshot.
  explicit MemoryTransaction(MemoryRepository& repo);

  // Write transaction; holds the repository writer lock until finished.
  MemoryTransaction(MemoryRepository& repo, std::unique_lock<std::mutex> writer_lock);

  ~MemoryTransaction();

  void Commit() override;
  void Rollback() override;
  bool IsCommitted() const override {
    return committed_;
  }

  MemoryRepository::State&       Mutable();
  const MemoryRepository::State& View() const;

 private:
  MemoryRepository&                              repo_;
  std::shared_ptr<const MemoryRepository::State> snapshot_;
  std::shared_ptr<MemoryRepository::State>       working_;
  std::unique_lock<std::mutex>                   writer_lock_;
  bool                                           committed_   = false;
  bool                                           rolled_back_ = false;
};

} // namespace offline::db::memory
