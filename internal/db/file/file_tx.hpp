#pragma once

#include <optional>

#include "internal/db/api/transaction.hpp"
#include "file_repository.hpp"

namespace waterfall::db::file {

/*
  Transaction = flock on the lock file + staged record.

  flock() locks belong to the open file description, so two transactions
  conflict even inside one process.
*/
class FileTransaction final : public db::Transaction {
public:
  explicit FileTransaction(const FileRepository& repo);
  ~FileTransaction();

  FileTransaction(const FileTransaction&)            = delete;
  FileTransaction& operator=(const FileTransaction&) = delete;

  void Commit() override;
  void Rollback() override;
  bool IsCommitted() const override { return committed_; }

  std::optional<waterfall::model::Schedule> Read() const;
  void Stage(const waterfall::model::Schedule& schedule) { staged_ = schedule; }

private:
  void Unlock();

  const FileRepository& repo_;
  int lock_fd_ = -1;
  std::optional<waterfall::model::Schedule> staged_;
  bool committed_ = false;
};

} // namespace waterfall::db::file
