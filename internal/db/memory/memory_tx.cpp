#include "memory_tx.hpp"

#include "internal/util/errors.hpp"

namespace waterfall::db::memory {

MemoryTransaction::MemoryTransaction(MemoryRepository& repo) : repo_(repo) {
  std::scoped_lock lock(repo_.mutex_);
  if (repo_.locked_) {
    throw util::LockContention("schedule is locked by another run");
  }
  repo_.locked_ = true;
  working_      = repo_.committed_; // snapshot copy
}

MemoryTransaction::~MemoryTransaction() {
  if (!committed_ && !rolled_back_) Rollback();
  Release();
}

void MemoryTransaction::Commit() {
  {
    std::scoped_lock lock(repo_.mutex_);
    repo_.committed_ = working_;
  }
  committed_ = true;
  Release();
}

void MemoryTransaction::Rollback() {
  rolled_back_ = true;
  Release();
}

void MemoryTransaction::Release() {
  if (released_) return;
  std::scoped_lock lock(repo_.mutex_);
  repo_.locked_ = false;
  released_     = true;
}

} // namespace waterfall::db::memory
