#include "file_tx.hpp"

#include <fcntl.h>
#include <sys/file.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <stdexcept>

#include "internal/util/errors.hpp"

namespace waterfall::db::file {

FileTransaction::FileTransaction(const FileRepository& repo) : repo_(repo) {
  const auto lock_path = repo_.LockPath();

  lock_fd_ = ::open(lock_path.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0644);
  if (lock_fd_ < 0) {
    throw std::runtime_error("open " + lock_path.string() + ": " + std::strerror(errno));
  }

  if (::flock(lock_fd_, LOCK_EX | LOCK_NB) != 0) {
    const int err = errno;
    ::close(lock_fd_);
    lock_fd_ = -1;
    if (err == EWOULDBLOCK) {
      throw util::LockContention("schedule " + repo_.Path().string() + " is locked by another run");
    }
    throw std::runtime_error("flock " + lock_path.string() + ": " + std::strerror(err));
  }
}

FileTransaction::~FileTransaction() {
  Unlock();
}

std::optional<waterfall::model::Schedule> FileTransaction::Read() const {
  if (staged_) return staged_;
  return repo_.ReadCommitted();
}

void FileTransaction::Commit() {
  if (staged_) {
    repo_.WriteAtomically(*staged_);
  }
  committed_ = true;
  Unlock();
}

void FileTransaction::Rollback() {
  staged_.reset();
  Unlock();
}

void FileTransaction::Unlock() {
  if (lock_fd_ < 0) return;
  // closing the descriptor drops the flock
  ::close(lock_fd_);
  lock_fd_ = -1;
}

} // namespace waterfall::db::file
