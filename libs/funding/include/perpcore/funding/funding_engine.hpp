#pragma once

#include <cstdint>

#include "perpcore/common/signed_amount.hpp"
#include "perpcore/common/types.hpp"
#include "perpcore/market/symbol_market.hpp"

namespace perpcore {
namespace funding {

struct FundingUpdate {
  bool updated{false};
  std::uint64_t intervals{0};
  std::uint64_t increment{0};
  common::SignedAmount previous_index{};
  common::SignedAmount index{};
  common::TimestampMs funding_ts{0};
};

// Cumulative funding index of one symbol. The dominant side pays: a long-heavy
// book pushes the index up, a short-heavy one pushes it down.
class FundingEngine {
 public:
  explicit FundingEngine(market::SymbolMarket& market) noexcept : market_(market) {}

  // Starts the funding clock on the interval boundary at or before `now_ms`.
  void initialize(common::TimestampMs now_ms) noexcept;

  // No-op until at least one full interval has passed since the last update.
  FundingUpdate update_funding_rate(common::TimestampMs now_ms, common::PriceQuote trading_price,
                                    std::uint64_t pool_tvl_usd);

  [[nodiscard]] static std::uint64_t funding_increment(std::uint64_t basic_funding_rate, std::uint64_t exposure_usd,
                                                       std::uint64_t pool_tvl_usd, std::uint64_t intervals) noexcept;

 private:
  market::SymbolMarket& market_;
};

}  // namespace funding
}  // namespace perpcore
