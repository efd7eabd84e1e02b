#include "internal/db/memory/memory_tx.hpp"

#include <stdexcept>

namespace pulse::db::memory {

MemoryTransaction::MemoryTransaction(MemoryRepository& repo) : repo_(repo), writer_lock_(repo.writer_mutex_) {
  std::scoped_lock lock(repo_.state_mutex_);
  working_ = repo_.committed_; // snapshot copy
}

MemoryTransaction::~MemoryTransaction() {
  if (!committed_ && !rolled_back_) Rollback();
}

void MemoryTransaction::Commit() {
  if (committed_ || rolled_back_) {
    throw std::runtime_error("transaction already finished");
  }
  {
    std::scoped_lock lock(repo_.state_mutex_);
    repo_.committed_ = std::move(working_);
  }
  committed_ = true;
  writer_lock_.unlock();
}

void MemoryTransaction::Rollback() {
  if (committed_ || rolled_back_) {
    return;
  }
  rolled_back_ = true;
  writer_lock_.unlock();
}

} // namespace pulse::db::memory
