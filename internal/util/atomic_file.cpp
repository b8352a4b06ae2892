#include "atomic_file.hpp"

#include <fcntl.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <fstream>
#include <sstream>
#include <stdexcept>

#include "internal/observability/logging.hpp"

namespace waterfall::util {

namespace {

[[noreturn]] void ThrowErrno(const std::string& what, const std::filesystem::path& path) {
  throw std::runtime_error(what + " " + path.string() + ": " + std::strerror(errno));
}

void WriteAll(int fd, const std::string& data, const std::filesystem::path& path) {
  const char* cursor    = data.data();
  std::size_t remaining = data.size();
  while (remaining > 0) {
    const ssize_t written = ::write(fd, cursor, remaining);
    if (written < 0) {
      if (errno == EINTR) continue;
      ThrowErrno("write", path);
    }
    cursor += written;
    remaining -= static_cast<std::size_t>(written);
  }
}

void FsyncDirectory(const std::filesystem::path& dir) {
  const std::filesystem::path target = dir.empty() ? std::filesystem::path(".") : dir;

  const int fd = ::open(target.c_str(), O_RDONLY | O_DIRECTORY | O_CLOEXEC);
  if (fd < 0) ThrowErrno("open directory", target);
  const int rc = ::fsync(fd);
  ::close(fd);
  if (rc != 0) ThrowErrno("fsync directory", target);
}

} // namespace

void WriteFileAtomically(const std::filesystem::path& path, const std::string& content) {
  const auto tmp_path = std::filesystem::path(path.string() + ".tmp");

  const int fd = ::open(tmp_path.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
  if (fd < 0) ThrowErrno("open", tmp_path);

  try {
    WriteAll(fd, content, tmp_path);
    if (::fsync(fd) != 0) ThrowErrno("fsync", tmp_path);
  } catch (...) {
    ::close(fd);
    std::error_code ignored;
    std::filesystem::remove(tmp_path, ignored);
    throw;
  }
  if (::close(fd) != 0) ThrowErrno("close", tmp_path);

  std::filesystem::rename(tmp_path, path);

  // The replace has happened; a failed directory sync only weakens durability.
  try {
    FsyncDirectory(path.parent_path());
  } catch (const std::runtime_error& e) {
    WATERFALL_LOG_WARN("Directory sync failed after replace",
                       {observability::StringField("path", path.string()), observability::StringField("error", e.what())});
  }
}

std::string ReadFile(const std::filesystem::path& path) {
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    throw std::runtime_error("cannot read " + path.string());
  }
  std::ostringstream content;
  content << in.rdbuf();
  return content.str();
}

} // namespace waterfall::util
