#pragma once

#include <filesystem>

#include "internal/db/api/schedule_repository.hpp"

namespace waterfall::db::file {

class FileTransaction;

/*
  Schedule stored as a JSON ScheduleRecord in a single file.

  <path>.lock carries an exclusive flock() for the lifetime of a
  transaction. Commit writes <path>.tmp, fsyncs it, renames it over <path>
  and fsyncs the directory, so a crash leaves either the old or the new
  record.
*/
class FileRepository final : public db::ScheduleRepository {
public:
  explicit FileRepository(std::filesystem::path path);

  std::unique_ptr<Transaction> Begin() override;

  std::optional<waterfall::model::Schedule> Load(Transaction&) override;
  Result Save(Transaction&, const waterfall::model::Schedule&) override;

  const std::filesystem::path& Path() const { return path_; }
  std::filesystem::path LockPath() const;

private:
  friend class FileTransaction;

  std::optional<waterfall::model::Schedule> ReadCommitted() const;
  void WriteAtomically(const waterfall::model::Schedule& schedule) const;

  std::filesystem::path path_;
};

} // namespace waterfall::db::file
