#pragma once

#include <chrono>
#include <cstdint>

#include "perpcore/common/types.hpp"

namespace perpcore {
namespace common {

inline TimestampMs now_ms() noexcept {
  return static_cast<TimestampMs>(
      std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::system_clock::now().time_since_epoch())
          .count());
}

inline std::chrono::nanoseconds now_steady() noexcept {
  return std::chrono::steady_clock::now().time_since_epoch();
}

inline constexpr TimestampMs align_down(TimestampMs ts, std::uint64_t interval_ms) noexcept {
  return interval_ms == 0 ? ts : ts - (ts % interval_ms);
}

}  // namespace common
}  // namespace perpcore
