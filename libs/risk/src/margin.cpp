#include "perpcore/risk/margin.hpp"

#include "perpcore/common/fixed_point.hpp"

namespace perpcore {
namespace risk {

MarginHealth check_position_liquidated(const MarginInputs& inputs) {
  auto remaining = common::SignedAmount::positive(inputs.collateral_amount);
  remaining += inputs.unrealized_pnl;
  remaining -= common::SignedAmount::positive(inputs.trading_fee);
  remaining -= common::SignedAmount::positive(inputs.borrow_fee);
  remaining -= inputs.funding_owed;

  const auto requirement = common::apply_bp(inputs.notional_amount, inputs.maintenance_margin_bp);
  return MarginHealth{
      .liquidated = remaining.less_than(common::SignedAmount::positive(requirement)),
      .remaining_collateral = remaining,
      .maintenance_requirement = requirement,
  };
}

}  // namespace risk
}  // namespace perpcore
