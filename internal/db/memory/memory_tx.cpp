#include "memory_tx.hpp"

#include <stdexcept>

namespace chronicle::db::memory {

MemoryTransaction::MemoryTransaction(MemoryRepository& repo) : repo_(repo), lock_(repo.write_mutex_, std::defer_lock) {
  if (!lock_.try_lock_for(repo_.busy_timeout_)) {
    throw std::runtime_error("memory repository busy: timed out waiting for the write lock");
  }
  working_ = repo_.committed_; // snapshot copy
}

MemoryTransaction::~MemoryTransaction() {
  if (!committed_ && !rolled_back_) Rollback();
}

void MemoryTransaction::EnsureOpen() const {
  if (committed_ || rolled_back_) {
    throw std::logic_error("memory transaction already finished");
  }
}

void MemoryTransaction::Commit() {
  EnsureOpen();
  repo_.committed_ = std::move(working_);
  committed_       = true;
  lock_.unlock();
}

void MemoryTransaction::Rollback() {
  if (committed_ || rolled_back_) return;
  rolled_back_ = true;
  lock_.unlock();
}

} // namespace chronicle::db::memory
