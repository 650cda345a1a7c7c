#pragma once

#include <cstdint>
#include <limits>

#include "perpcore/common/error.hpp"

namespace perpcore {
namespace common {

// Sign + magnitude quantity. Zero is always stored as non-negative so that equal
// values compare equal.
class SignedAmount {
 public:
  constexpr SignedAmount() noexcept = default;
  constexpr SignedAmount(std::uint64_t magnitude, bool negative) noexcept
      : magnitude_(magnitude), negative_(negative && magnitude != 0) {}

  static constexpr SignedAmount positive(std::uint64_t magnitude) noexcept { return {magnitude, false}; }
  static constexpr SignedAmount negative(std::uint64_t magnitude) noexcept { return {magnitude, true}; }

  [[nodiscard]] constexpr std::uint64_t magnitude() const noexcept { return magnitude_; }
  [[nodiscard]] constexpr bool is_negative() const noexcept { return negative_; }
  [[nodiscard]] constexpr bool is_zero() const noexcept { return magnitude_ == 0; }

  [[nodiscard]] SignedAmount operator+(const SignedAmount& other) const {
    if (negative_ == other.negative_) {
      if (magnitude_ > std::numeric_limits<std::uint64_t>::max() - other.magnitude_) {
        throw EngineError(ErrorCode::kArithmeticOverflow, "signed amount magnitude");
      }
      return {magnitude_ + other.magnitude_, negative_};
    }
    // Opposite signs: the larger magnitude wins the sign; crossing zero flips it.
    if (magnitude_ >= other.magnitude_) {
      return {magnitude_ - other.magnitude_, negative_};
    }
    return {other.magnitude_ - magnitude_, other.negative_};
  }

  [[nodiscard]] constexpr SignedAmount operator-() const noexcept { return {magnitude_, !negative_}; }

  [[nodiscard]] SignedAmount operator-(const SignedAmount& other) const { return *this + (-other); }

  SignedAmount& operator+=(const SignedAmount& other) {
    *this = *this + other;
    return *this;
  }

  SignedAmount& operator-=(const SignedAmount& other) {
    *this = *this - other;
    return *this;
  }

  constexpr bool operator==(const SignedAmount& other) const noexcept = default;

  // Strict ordering on the signed value.
  [[nodiscard]] constexpr bool less_than(const SignedAmount& other) const noexcept {
    if (negative_ != other.negative_) {
      return negative_;
    }
    return negative_ ? magnitude_ > other.magnitude_ : magnitude_ < other.magnitude_;
  }

 private:
  std::uint64_t magnitude_{0};
  bool negative_{false};
};

}  // namespace common
}  // namespace perpcore
