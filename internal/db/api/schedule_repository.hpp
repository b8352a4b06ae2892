#pragma once

#include <memory>
#include <optional>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/model/schedule.hpp"

namespace waterfall::db {

/*
  Durable home of the Schedule record.

  CRITICAL GUARANTEES:

  - Begin() never blocks: if another run holds the schedule it throws
    util::LockContention immediately
  - Load() inside a transaction sees that transaction's Save()
  - Nothing reaches storage before Commit()

  The record is passed in and out explicitly; there is no process-wide
  "current schedule".
*/

class ScheduleRepository {
 public:
  virtual ~ScheduleRepository() = default;

  virtual std::unique_ptr<Transaction> Begin() = 0;

  // nullopt when nothing was ever stored
  virtual std::optional<model::Schedule> Load(Transaction&) = 0;

  virtual Result Save(Transaction&, const model::Schedule&) = 0;
};

} // namespace waterfall::db
