#pragma once

#include <optional>

#include "internal/db/api/transaction.hpp"
#include "memory_repository.hpp"

namespace waterfall::db::memory {

/*
  Transaction = lock + snapshot copy
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

  std::optional<waterfall::model::Schedule>& Mutable() {
    return working_;
  }
  const std::optional<waterfall::model::Schedule>& View() const {
    return working_;
  }

 private:
  void Release();

  MemoryRepository&                         repo_;
  std::optional<waterfall::model::Schedule> working_;
  bool                                      committed_   = false;
  bool                                      rolled_back_ = false;
  bool                                      released_    = false;
};

} // namespace waterfall::db::memory
