#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace perpcore {
namespace common {

using AccountId = std::uint64_t;
using OrderId = std::uint64_t;
using PositionId = std::uint64_t;
using OracleId = std::uint64_t;
using ReceiptId = std::uint64_t;
using MarketIndex = std::uint64_t;
using TimestampMs = std::uint64_t;

// Fully qualified token type name, e.g. "0x2::sui::SUI".
using TokenType = std::string;

inline constexpr std::uint64_t kBpScale = 10'000;
inline constexpr std::uint64_t kMbpScale = 10'000'000;
inline constexpr std::uint64_t kUsdDecimal = 9;
inline constexpr std::uint64_t kRateScale = 1'000'000'000;

enum class Side : std::uint8_t {
  kLong,
  kShort,
};

inline constexpr Side opposite(Side side) noexcept {
  return side == Side::kLong ? Side::kShort : Side::kLong;
}

inline constexpr const char* to_string(Side side) noexcept {
  return side == Side::kLong ? "long" : "short";
}

struct PriceQuote {
  std::uint64_t price{0};
  std::uint64_t decimal{0};
};

struct BidReceipt {
  ReceiptId id{0};
  std::uint64_t vault_index{0};
  std::uint64_t shares{0};
};

// Funds released by an operation to a user. Receipts are always handed back
// directly; token amounts may be routed to the user's custody account instead.
struct Payout {
  AccountId user{0};
  TokenType token;
  std::uint64_t amount{0};
  std::vector<BidReceipt> receipts{};
};

}  // namespace common
}  // namespace perpcore
