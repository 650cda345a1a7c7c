#include "perpcore/market/position_math.hpp"

#include "perpcore/common/fixed_point.hpp"

namespace perpcore {
namespace market {

std::uint64_t rescale_price(std::uint64_t price, std::uint64_t from_decimal, std::uint64_t to_decimal) noexcept {
  if (from_decimal == to_decimal) {
    return price;
  }
  return common::scale_ratio(price, to_decimal, 1, from_decimal);
}

std::uint64_t notional_usd(std::uint64_t size, std::uint64_t size_decimal, common::PriceQuote price) noexcept {
  return common::amount_to_usd(size, size_decimal, price.price, price.decimal);
}

std::uint64_t usd_in_collateral(std::uint64_t usd, std::uint64_t collateral_decimal,
                                common::PriceQuote collateral_price) noexcept {
  return common::usd_to_amount(usd, collateral_decimal, collateral_price.price, collateral_price.decimal);
}

std::uint64_t collateral_in_usd(std::uint64_t amount, std::uint64_t collateral_decimal,
                                common::PriceQuote collateral_price) noexcept {
  return common::amount_to_usd(amount, collateral_decimal, collateral_price.price, collateral_price.decimal);
}

std::uint64_t reserve_for(std::uint64_t size, std::uint64_t size_decimal, common::PriceQuote entry_price,
                          std::uint64_t collateral_decimal, common::PriceQuote collateral_price) noexcept {
  return usd_in_collateral(notional_usd(size, size_decimal, entry_price), collateral_decimal, collateral_price);
}

common::SignedAmount pnl_usd(common::Side side, std::uint64_t size, std::uint64_t size_decimal,
                             common::PriceQuote entry, common::PriceQuote current) noexcept {
  const auto entry_price = rescale_price(entry.price, entry.decimal, current.decimal);
  const bool price_up = current.price >= entry_price;
  const auto move = price_up ? current.price - entry_price : entry_price - current.price;
  const auto usd = common::amount_to_usd(size, size_decimal, move, current.decimal);
  const bool profit = (side == common::Side::kLong) == price_up;
  return common::SignedAmount(usd, !profit);
}

std::uint64_t borrow_fee(const Position& position, std::uint64_t cumulative_borrow_rate) noexcept {
  const auto delta = common::saturating_sub(cumulative_borrow_rate, position.entry_borrow_index);
  return common::mul_div(position.reserve_amount, delta, common::kRateScale);
}

common::SignedAmount funding_owed_usd(const Position& position, const common::SignedAmount& funding_index,
                                      common::PriceQuote trading_price) {
  const auto delta = funding_index - position.entry_funding_index;
  const auto size_usd = notional_usd(position.size, position.size_decimal, trading_price);
  const auto amount = common::mul_div(size_usd, delta.magnitude(), common::kRateScale);
  const bool pays = (position.side == common::Side::kLong) != delta.is_negative();
  return common::SignedAmount(amount, !pays);
}

common::SignedAmount signed_usd_in_collateral(const common::SignedAmount& usd, std::uint64_t collateral_decimal,
                                              common::PriceQuote collateral_price) noexcept {
  return common::SignedAmount(usd_in_collateral(usd.magnitude(), collateral_decimal, collateral_price), usd.is_negative());
}

}  // namespace market
}  // namespace perpcore
