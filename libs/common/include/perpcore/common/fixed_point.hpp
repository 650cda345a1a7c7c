#pragma once

#include <cstdint>
#include <limits>

#include "perpcore/common/types.hpp"

namespace perpcore {
namespace common {

using U128 = unsigned __int128;

inline constexpr std::uint64_t kU64Max = std::numeric_limits<std::uint64_t>::max();

inline constexpr std::uint64_t saturate(U128 value) noexcept {
  return value > static_cast<U128>(kU64Max) ? kU64Max : static_cast<std::uint64_t>(value);
}

inline constexpr std::uint64_t saturating_add(std::uint64_t a, std::uint64_t b) noexcept {
  return a > kU64Max - b ? kU64Max : a + b;
}

inline constexpr std::uint64_t saturating_sub(std::uint64_t a, std::uint64_t b) noexcept {
  return a > b ? a - b : 0;
}

inline constexpr std::uint64_t saturating_mul(std::uint64_t a, std::uint64_t b) noexcept {
  return saturate(static_cast<U128>(a) * b);
}

// a * b / c with a 128-bit intermediate. Division by zero yields zero.
inline constexpr std::uint64_t mul_div(std::uint64_t a, std::uint64_t b, std::uint64_t c) noexcept {
  if (c == 0) {
    return 0;
  }
  return saturate(static_cast<U128>(a) * b / c);
}

inline constexpr U128 pow10(std::uint64_t exponent) noexcept {
  U128 result = 1;
  for (std::uint64_t i = 0; i < exponent && i < 38; ++i) {
    result *= 10;
  }
  return result;
}

// (numerator * 10^up) / (denominator * 10^down) computed without overflowing the
// 128-bit intermediate for the decimal ranges tokens use (<= 18 each).
inline constexpr std::uint64_t scale_ratio(U128 numerator, std::uint64_t up, U128 denominator, std::uint64_t down) noexcept {
  if (denominator == 0) {
    return 0;
  }
  const std::uint64_t common_exp = up < down ? up : down;
  up -= common_exp;
  down -= common_exp;
  const U128 up_factor = pow10(up);
  if (up > 0 && numerator > std::numeric_limits<U128>::max() / up_factor) {
    return kU64Max;
  }
  numerator *= up_factor;
  const U128 down_factor = pow10(down);
  if (down > 0 && denominator > std::numeric_limits<U128>::max() / down_factor) {
    return 0;
  }
  denominator *= down_factor;
  return saturate(numerator / denominator);
}

// USD value (kUsdDecimal decimals) of `amount` priced at `price`.
inline constexpr std::uint64_t amount_to_usd(std::uint64_t amount, std::uint64_t amount_decimal,
                                             std::uint64_t price, std::uint64_t price_decimal) noexcept {
  return scale_ratio(static_cast<U128>(amount) * price, kUsdDecimal, 1, amount_decimal + price_decimal);
}

// Token amount (amount_decimal decimals) worth `usd` at `price`.
inline constexpr std::uint64_t usd_to_amount(std::uint64_t usd, std::uint64_t amount_decimal,
                                             std::uint64_t price, std::uint64_t price_decimal) noexcept {
  return scale_ratio(usd, amount_decimal + price_decimal, price, kUsdDecimal);
}

inline constexpr std::uint64_t apply_bp(std::uint64_t amount, std::uint64_t bp) noexcept {
  return mul_div(amount, bp, kBpScale);
}

inline constexpr std::uint64_t apply_mbp(std::uint64_t amount, std::uint64_t mbp) noexcept {
  return mul_div(amount, mbp, kMbpScale);
}

}  // namespace common
}  // namespace perpcore
