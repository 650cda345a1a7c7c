#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

#include "perpcore/common/types.hpp"

namespace perpcore {
namespace market {

enum class CollateralMode : std::uint8_t {
  kToken,
  kOption,
};

// One bucket per (collateral mode, side, limit/stop).
enum class OrderBucket : std::uint8_t {
  kTokenLongLimit,
  kTokenShortLimit,
  kTokenLongStop,
  kTokenShortStop,
  kOptionLongLimit,
  kOptionShortLimit,
  kOptionLongStop,
  kOptionShortStop,
};

inline constexpr std::size_t kBucketCount = 8;

inline constexpr std::array<OrderBucket, kBucketCount> kAllBuckets{
    OrderBucket::kTokenLongLimit,   OrderBucket::kTokenShortLimit,  OrderBucket::kTokenLongStop,
    OrderBucket::kTokenShortStop,   OrderBucket::kOptionLongLimit,  OrderBucket::kOptionShortLimit,
    OrderBucket::kOptionLongStop,   OrderBucket::kOptionShortStop,
};

inline constexpr OrderBucket bucket_for(CollateralMode mode, common::Side side, bool is_stop) noexcept {
  const auto index = (mode == CollateralMode::kOption ? 4 : 0) + (is_stop ? 2 : 0) +
                     (side == common::Side::kShort ? 1 : 0);
  return static_cast<OrderBucket>(index);
}

inline constexpr std::size_t index_of(OrderBucket bucket) noexcept { return static_cast<std::size_t>(bucket); }
inline constexpr CollateralMode mode_of(OrderBucket bucket) noexcept {
  return index_of(bucket) >= 4 ? CollateralMode::kOption : CollateralMode::kToken;
}
inline constexpr common::Side side_of(OrderBucket bucket) noexcept {
  return index_of(bucket) % 2 == 1 ? common::Side::kShort : common::Side::kLong;
}
inline constexpr bool is_stop(OrderBucket bucket) noexcept { return (index_of(bucket) / 2) % 2 == 1; }

inline constexpr const char* bucket_tag(OrderBucket bucket) noexcept {
  switch (bucket) {
    case OrderBucket::kTokenLongLimit: return "token_long_limit";
    case OrderBucket::kTokenShortLimit: return "token_short_limit";
    case OrderBucket::kTokenLongStop: return "token_long_stop";
    case OrderBucket::kTokenShortStop: return "token_short_stop";
    case OrderBucket::kOptionLongLimit: return "option_long_limit";
    case OrderBucket::kOptionShortLimit: return "option_short_limit";
    case OrderBucket::kOptionLongStop: return "option_long_stop";
    case OrderBucket::kOptionShortStop: return "option_short_stop";
  }
  return "unknown";
}

// Limit orders trigger when the price moves in the trader's favour, stop orders
// when it moves against them.
inline constexpr bool is_triggered(common::Side side, bool stop, std::uint64_t trigger_price,
                                   std::uint64_t oracle_price) noexcept {
  const bool buy_below = (side == common::Side::kLong) != stop;
  return buy_below ? oracle_price <= trigger_price : oracle_price >= trigger_price;
}

struct OptionCollateral {
  std::uint64_t vault_index{0};
  common::TokenType bid_token;
  std::vector<common::BidReceipt> receipts{};
};

struct TradingOrder {
  common::OrderId id{0};
  common::AccountId user{0};
  common::Side side{common::Side::kLong};
  std::uint64_t size{0};
  std::uint64_t size_decimal{0};
  std::uint64_t trigger_price{0};
  bool reduce_only{false};
  bool is_stop{false};
  common::TokenType collateral_token;
  std::uint64_t collateral_amount{0};
  std::optional<OptionCollateral> option_collateral{};
  std::uint64_t leverage_mbp{0};
  std::optional<common::PositionId> linked_position_id{};
  std::uint64_t filled_price{0};
  common::TimestampMs created_ms{0};

  [[nodiscard]] CollateralMode mode() const noexcept {
    return option_collateral ? CollateralMode::kOption : CollateralMode::kToken;
  }
  [[nodiscard]] OrderBucket bucket() const noexcept { return bucket_for(mode(), side, is_stop); }
};

}  // namespace market
}  // namespace perpcore
