#pragma once

#include <cstdint>
#include <string>

#include "internal/util/money.hpp"
#include "internal/util/time.hpp"

namespace waterfall::model {

/*
  Savings sub-account as reported by the banking gateway.

  Lower priority value is filled first. Priorities must form a strict total
  order across a plan; target and balance must be non-negative.
*/
struct Pot {
  std::string  id;
  std::string  name;
  util::Amount balance  = 0;
  util::Amount target   = 0;
  std::int32_t priority = 0;

  util::Amount Need() const {
    return target > balance ? target - balance : 0;
  }
};

struct MainAccountSnapshot {
  util::Amount balance = 0;
  util::Date   taken_on{};
};

} // namespace waterfall::model
