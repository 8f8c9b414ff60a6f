#pragma once

#include <mutex>

#include "internal/db/api/transaction.hpp"
#include "memory_repository.hpp"

namespace chronicle::db::memory {

/*
  Transaction = repository write lock + snapshot copy

  The lock is taken for the whole transaction, like SQLite's
  BEGIN IMMEDIATE, so a second transaction on another thread waits
  for this one to finish (or times out with a runtime_error).
*/

class MemoryTransaction final : public db::Transaction {
 public:
  explicit MemoryTransaction(MemoryRepository& repo);
  ~MemoryTransaction();

  void Commit() override;
  void Rollback() override;
  bool IsCommitted() const override {
    return committed_;
  }

  MemoryRepository::State& Mutable() {
    return working_;
  }
  const MemoryRepository::State& View() const {
    return working_;
  }

 private:
  void EnsureOpen() const;

  MemoryRepository&                    repo_;
  std::unique_lock<std::timed_mutex>   lock_;
  MemoryRepository::State              working_;
  bool                                 committed_   = false;
  bool                                 rolled_back_ = false;
};

} // namespace chronicle::db::memory
