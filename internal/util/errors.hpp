#pragma once

#include <stdexcept>
#include <string>

namespace waterfall::util {

/*
  Central error types.

  These get translated later to process exit codes (see internal/cli/exit_codes).

  ConfigError and CalendarError are raised before any gateway call is made.
  GatewayError covers network/auth/timeout failures talking to the bank.
*/

class ConfigError : public std::runtime_error {
 public:
  explicit ConfigError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class CalendarError : public std::runtime_error {
 public:
  explicit CalendarError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class GatewayError : public std::runtime_error {
 public:
  explicit GatewayError(const std::string& msg, bool timeout = false) : std::runtime_error(msg), timeout_(timeout) {
  }

  bool Timeout() const {
    return timeout_;
  }

 private:
  bool timeout_;
};

class LockContention : public std::runtime_error {
 public:
  explicit LockContention(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidState : public std::runtime_error {
 public:
  explicit InvalidState(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace waterfall::util
