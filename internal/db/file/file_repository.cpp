#include "file_repository.hpp"

#include <stdexcept>
#include <string>

#include "file_tx.hpp"
#include "internal/db/model/schedule_record.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/atomic_file.hpp"

namespace waterfall::db::file {

FileRepository::FileRepository(std::filesystem::path path) : path_(std::move(path)) {
  if (path_.has_parent_path()) {
    std::filesystem::create_directories(path_.parent_path());
  }
}

std::filesystem::path FileRepository::LockPath() const {
  return path_.string() + ".lock";
}

std::unique_ptr<db::Transaction> FileRepository::Begin() {
  return std::make_unique<FileTransaction>(*this);
}

static FileTransaction& TX(db::Transaction& tx) {
  return static_cast<FileTransaction&>(tx);
}

std::optional<waterfall::model::Schedule> FileRepository::Load(Transaction& t) {
  return TX(t).Read();
}

Result FileRepository::Save(Transaction& t, const waterfall::model::Schedule& schedule) {
  TX(t).Stage(schedule);
  return Result::Ok();
}

std::optional<waterfall::model::Schedule> FileRepository::ReadCommitted() const {
  if (!std::filesystem::exists(path_)) {
    return std::nullopt;
  }

  const auto content = util::ReadFile(path_);

  // A torn or hand-edited file must stop the run rather than re-initialize.
  try {
    return model::FromJson(content);
  } catch (const std::exception& e) {
    throw std::runtime_error("corrupt schedule " + path_.string() + ": " + e.what());
  }
}

void FileRepository::WriteAtomically(const waterfall::model::Schedule& schedule) const {
  util::WriteFileAtomically(path_, model::ToJson(schedule));
  WATERFALL_LOG_DEBUG("Schedule written", {observability::StringField("path", path_.string())});
}

} // namespace waterfall::db::file
