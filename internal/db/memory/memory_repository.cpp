#include "memory_repository.hpp"

#include "memory_tx.hpp"

namespace waterfall::db::memory {

MemoryRepository::MemoryRepository() = default;

MemoryRepository::MemoryRepository(waterfall::model::Schedule initial) : committed_(std::move(initial)) {
}

std::unique_ptr<db::Transaction> MemoryRepository::Begin() {
  return std::make_unique<MemoryTransaction>(*this);
}

static MemoryTransaction& TX(db::Transaction& tx) {
  return static_cast<MemoryTransaction&>(tx);
}

std::optional<waterfall::model::Schedule> MemoryRepository::Load(Transaction& t) {
  return TX(t).View();
}

Result MemoryRepository::Save(Transaction& t, const waterfall::model::Schedule& schedule) {
  TX(t).Mutable() = schedule;
  return Result::Ok();
}

} // namespace waterfall::db::memory
