#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace waterfall::util {

/*
  Amounts are integer minor currency units (pence, cents). The engine never
  converts between currencies; the code is carried through for display only.
*/
using Amount = std::int64_t;

inline constexpr std::string_view kDefaultCurrency = "GBP";

// 123456 -> "GBP 1234.56", -5 -> "GBP -0.05"
std::string FormatAmount(Amount amount, std::string_view currency = kDefaultCurrency);

} // namespace waterfall::util
