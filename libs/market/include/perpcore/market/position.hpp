#pragma once

#include <cstdint>
#include <optional>
#include <vector>

#include "perpcore/common/signed_amount.hpp"
#include "perpcore/common/types.hpp"
#include "perpcore/market/order.hpp"

namespace perpcore {
namespace market {

struct LinkedOrder {
  common::OrderId order_id{0};
  std::uint64_t trigger_price{0};
};

struct Position {
  common::PositionId id{0};
  common::AccountId user{0};
  common::Side side{common::Side::kLong};
  std::uint64_t size{0};
  std::uint64_t size_decimal{0};

  common::TokenType collateral_token;
  std::uint64_t collateral_decimal{0};
  std::uint64_t collateral_amount{0};
  std::optional<OptionCollateral> option_collateral{};
  std::uint64_t unsettled_cost{0};  // fees and losses owed by receipt-collateralized positions

  std::uint64_t entry_price{0};
  std::uint64_t entry_price_decimal{0};
  std::uint64_t leverage_mbp{0};
  std::uint64_t entry_borrow_index{0};
  common::SignedAmount entry_funding_index{};
  std::uint64_t reserve_amount{0};

  std::vector<LinkedOrder> linked_orders{};
  common::TimestampMs opened_ms{0};
  common::TimestampMs updated_ms{0};

  [[nodiscard]] CollateralMode mode() const noexcept {
    return option_collateral ? CollateralMode::kOption : CollateralMode::kToken;
  }
};

}  // namespace market
}  // namespace perpcore
