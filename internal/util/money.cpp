#include "money.hpp"

#include <spdlog/fmt/fmt.h>

namespace waterfall::util {

std::string FormatAmount(Amount amount, std::string_view currency) {
  const bool     negative  = amount < 0;
  const uint64_t magnitude = negative ? static_cast<uint64_t>(-(amount + 1)) + 1 : static_cast<uint64_t>(amount);
  return fmt::format("{} {}{}.{:02}", currency, negative ? "-" : "", magnitude / 100, magnitude % 100);
}

} // namespace waterfall::util
