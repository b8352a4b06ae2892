#pragma once

#include <string>
#include <string_view>

namespace waterfall::db {

/*
  Outcome of a schedule write.

  Backends translate their own failures (sqlite codes, errno) into these so
  the orchestrator can report them without knowing which store is in use.
*/
enum class ErrorCode {
  OK = 0,
  Busy,
  IOError,
  Corruption,
  InternalError
};

constexpr std::string_view ToString(ErrorCode code) {
  switch (code) {
    case ErrorCode::OK:
      return "ok";
    case ErrorCode::Busy:
      return "busy";
    case ErrorCode::IOError:
      return "io error";
    case ErrorCode::Corruption:
      return "corruption";
    case ErrorCode::InternalError:
      return "internal error";
  }
  return "unknown";
}

struct Result {
  ErrorCode   code = ErrorCode::OK;
  std::string message;

  static Result Ok() {
    return {};
  }

  static Result Err(ErrorCode c, std::string msg = {}) {
    return {c, std::move(msg)};
  }

  explicit operator bool() const {
    return code == ErrorCode::OK;
  }

  std::string Describe() const {
    return message.empty() ? std::string(ToString(code)) : std::string(ToString(code)) + ": " + message;
  }
};

} // namespace waterfall::db
