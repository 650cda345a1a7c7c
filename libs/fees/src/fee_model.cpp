#include "perpcore/fees/fee_model.hpp"

#include <algorithm>
#include <limits>

#include "perpcore/common/fixed_point.hpp"

namespace perpcore {
namespace fees {

Imbalance apply_order(Imbalance original, common::Side order_side, std::uint64_t order_size) noexcept {
  if (original.size == 0) {
    return Imbalance{.size = order_size, .long_dominant = order_side == common::Side::kLong};
  }

  const bool reinforces = (order_side == common::Side::kLong) == original.long_dominant;
  if (reinforces) {
    return Imbalance{.size = common::saturating_add(original.size, order_size),
                     .long_dominant = original.long_dominant};
  }
  if (order_size <= original.size) {
    return Imbalance{.size = original.size - order_size, .long_dominant = original.long_dominant};
  }
  return Imbalance{.size = order_size - original.size, .long_dominant = !original.long_dominant};
}

std::uint64_t fee_rate_mbp(const ExposureInput& exposure,
                           common::Side order_side,
                           std::uint64_t order_size,
                           const TradingFeeConfig& config) noexcept {
  const std::uint64_t base = config.base_fee_mbp;
  const std::uint64_t max = std::max(config.base_fee_mbp, config.max_fee_mbp);

  const Imbalance original{
      .size = exposure.long_size >= exposure.short_size ? exposure.long_size - exposure.short_size
                                                        : exposure.short_size - exposure.long_size,
      .long_dominant = exposure.long_size >= exposure.short_size,
  };
  const Imbalance next = apply_order(original, order_side, order_size);
  if (next.size <= original.size) {
    return base;
  }

  const std::uint64_t budget_usd = common::apply_mbp(exposure.pool_tvl_usd, config.allocated_exposure_mbp);
  if (budget_usd == 0) {
    return base;
  }

  const std::uint64_t delta_usd = common::amount_to_usd(next.size - original.size, exposure.size_decimal,
                                                        exposure.price.price, exposure.price.decimal);
  const std::uint64_t increment = common::mul_div(max - base, delta_usd, budget_usd);
  return std::min(common::saturating_add(base, increment), max);
}

std::uint64_t trading_fee_amount(std::uint64_t size,
                                 std::uint64_t size_decimal,
                                 common::PriceQuote trading_price,
                                 std::uint64_t fee_mbp,
                                 std::uint64_t collateral_decimal,
                                 common::PriceQuote collateral_price) noexcept {
  const std::uint64_t notional_usd = common::amount_to_usd(size, size_decimal, trading_price.price, trading_price.decimal);
  const std::uint64_t fee_usd = common::apply_mbp(notional_usd, fee_mbp);
  return common::usd_to_amount(fee_usd, collateral_decimal, collateral_price.price, collateral_price.decimal);
}

std::uint64_t leverage_mbp(std::uint64_t notional_usd, std::uint64_t collateral_usd) noexcept {
  if (collateral_usd == 0) {
    return std::numeric_limits<std::uint64_t>::max();
  }
  return common::mul_div(notional_usd, common::kMbpScale, collateral_usd);
}

bool can_cover_fee_when_adding(std::uint64_t order_collateral,
                               std::uint64_t linked_collateral,
                               std::uint64_t fee_amount) noexcept {
  return common::saturating_add(order_collateral, linked_collateral) > fee_amount;
}

bool can_cover_fee_when_reducing(std::uint64_t order_collateral,
                                 std::uint64_t linked_collateral,
                                 std::uint64_t unrealized_profit,
                                 std::uint64_t fee_amount) noexcept {
  const std::uint64_t available =
      common::saturating_add(common::saturating_add(order_collateral, linked_collateral), unrealized_profit);
  return available > fee_amount;
}

}  // namespace fees
}  // namespace perpcore
