#pragma once

#include <mutex>
#include <optional>

#include "internal/db/api/schedule_repository.hpp"

namespace waterfall::db::memory {

class MemoryTransaction;

/*
  Process-local schedule store for tests and sandbox runs.

  A second Begin() while a transaction is open throws LockContention, from
  any thread, including the one holding it.
*/
class MemoryRepository final : public db::ScheduleRepository {
public:
  MemoryRepository();
  explicit MemoryRepository(waterfall::model::Schedule initial);

  std::unique_ptr<Transaction> Begin() override;

  std::optional<waterfall::model::Schedule> Load(Transaction&) override;
  Result Save(Transaction&, const waterfall::model::Schedule&) override;

private:
  friend class MemoryTransaction;

  std::mutex mutex_;
  bool locked_ = false;
  std::optional<waterfall::model::Schedule> committed_;
};

} // namespace waterfall::db::memory
