#pragma once

#include <cstdint>

#include "perpcore/common/types.hpp"

namespace perpcore {
namespace fees {

struct TradingFeeConfig {
  std::uint64_t base_fee_mbp{0};
  std::uint64_t max_fee_mbp{0};
  std::uint64_t allocated_exposure_mbp{0};  // share of pool TVL the symbol may be net exposed to
};

struct ExposureInput {
  std::uint64_t long_size{0};
  std::uint64_t short_size{0};
  std::uint64_t pool_tvl_usd{0};
  std::uint64_t size_decimal{0};
  common::PriceQuote price{};
};

struct Imbalance {
  std::uint64_t size{0};
  bool long_dominant{true};
};

// Imbalance after applying `order_size` on `order_side` to `original`.
[[nodiscard]] Imbalance apply_order(Imbalance original, common::Side order_side, std::uint64_t order_size) noexcept;

// Dynamic trading fee rate. Always within [base_fee_mbp, max_fee_mbp].
[[nodiscard]] std::uint64_t fee_rate_mbp(const ExposureInput& exposure,
                                         common::Side order_side,
                                         std::uint64_t order_size,
                                         const TradingFeeConfig& config) noexcept;

// Trading fee owed in collateral units for filling `size` at `trading_price`.
[[nodiscard]] std::uint64_t trading_fee_amount(std::uint64_t size,
                                               std::uint64_t size_decimal,
                                               common::PriceQuote trading_price,
                                               std::uint64_t fee_mbp,
                                               std::uint64_t collateral_decimal,
                                               common::PriceQuote collateral_price) noexcept;

// Notional / collateral value in mbp. Zero collateral yields u64 max.
[[nodiscard]] std::uint64_t leverage_mbp(std::uint64_t notional_usd, std::uint64_t collateral_usd) noexcept;

// All-or-nothing feasibility of a fill. Adding: order collateral plus the linked
// position's collateral must exceed the fee. Reducing: unrealized profit counts too.
[[nodiscard]] bool can_cover_fee_when_adding(std::uint64_t order_collateral,
                                             std::uint64_t linked_collateral,
                                             std::uint64_t fee_amount) noexcept;

[[nodiscard]] bool can_cover_fee_when_reducing(std::uint64_t order_collateral,
                                               std::uint64_t linked_collateral,
                                               std::uint64_t unrealized_profit,
                                               std::uint64_t fee_amount) noexcept;

}  // namespace fees
}  // namespace perpcore
