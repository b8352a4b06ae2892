#pragma once

#include <filesystem>
#include <string>

namespace waterfall::util {

/*
  Replaces path with content so that a crash at any point leaves either the
  old file or the new one:
      write <path>.tmp → fsync → rename → fsync parent directory

  Throws std::runtime_error / std::filesystem::filesystem_error if the old
  file is still in place. A failed directory sync after the rename is only
  logged.
*/
void WriteFileAtomically(const std::filesystem::path& path, const std::string& content);

// Whole file as a string; throws std::runtime_error if it cannot be read.
std::string ReadFile(const std::filesystem::path& path);

} // namespace waterfall::util
