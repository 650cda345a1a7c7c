#pragma once

#include <cstdint>

#include "perpcore/common/signed_amount.hpp"

namespace perpcore {
namespace risk {

// All amounts in collateral-token units.
struct MarginInputs {
  std::uint64_t collateral_amount{0};
  common::SignedAmount unrealized_pnl{};
  std::uint64_t trading_fee{0};  // fee to close at the current price
  std::uint64_t borrow_fee{0};
  common::SignedAmount funding_owed{};  // positive when the position pays
  std::uint64_t notional_amount{0};
  std::uint64_t maintenance_margin_bp{0};
};

struct MarginHealth {
  bool liquidated{false};
  common::SignedAmount remaining_collateral{};
  std::uint64_t maintenance_requirement{0};
};

// Liquidated when collateral after PnL, fees and funding falls below
// maintenance_margin_bp of the notional.
[[nodiscard]] MarginHealth check_position_liquidated(const MarginInputs& inputs);

}  // namespace risk
}  // namespace perpcore
