#pragma once

#include <cstdint>

#include "perpcore/common/signed_amount.hpp"
#include "perpcore/common/types.hpp"
#include "perpcore/market/position.hpp"

namespace perpcore {
namespace market {

// Prices moving between decimal scales (oracle decimals may differ from the
// decimals recorded at entry).
[[nodiscard]] std::uint64_t rescale_price(std::uint64_t price, std::uint64_t from_decimal, std::uint64_t to_decimal) noexcept;

[[nodiscard]] std::uint64_t notional_usd(std::uint64_t size, std::uint64_t size_decimal, common::PriceQuote price) noexcept;

// USD value converted into collateral-token units.
[[nodiscard]] std::uint64_t usd_in_collateral(std::uint64_t usd, std::uint64_t collateral_decimal,
                                              common::PriceQuote collateral_price) noexcept;
[[nodiscard]] std::uint64_t collateral_in_usd(std::uint64_t amount, std::uint64_t collateral_decimal,
                                              common::PriceQuote collateral_price) noexcept;

// Pool liquidity reserved for `size` opened at `entry_price`.
[[nodiscard]] std::uint64_t reserve_for(std::uint64_t size, std::uint64_t size_decimal, common::PriceQuote entry_price,
                                        std::uint64_t collateral_decimal, common::PriceQuote collateral_price) noexcept;

// Signed USD PnL of `size` entered at `entry` and marked at `current`.
[[nodiscard]] common::SignedAmount pnl_usd(common::Side side, std::uint64_t size, std::uint64_t size_decimal,
                                           common::PriceQuote entry, common::PriceQuote current) noexcept;

[[nodiscard]] std::uint64_t borrow_fee(const Position& position, std::uint64_t cumulative_borrow_rate) noexcept;

// Funding owed since the position's last snapshot in USD, positive when the
// position pays. A rising index makes longs pay.
[[nodiscard]] common::SignedAmount funding_owed_usd(const Position& position, const common::SignedAmount& funding_index,
                                                    common::PriceQuote trading_price);

[[nodiscard]] inline common::PriceQuote entry_quote(const Position& position) noexcept {
  return common::PriceQuote{.price = position.entry_price, .decimal = position.entry_price_decimal};
}

// Converts a signed USD amount to collateral units keeping the sign.
[[nodiscard]] common::SignedAmount signed_usd_in_collateral(const common::SignedAmount& usd, std::uint64_t collateral_decimal,
                                                            common::PriceQuote collateral_price) noexcept;

}  // namespace market
}  // namespace perpcore
