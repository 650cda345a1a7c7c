#include "perpcore/funding/funding_engine.hpp"

#include "perpcore/common/fixed_point.hpp"
#include "perpcore/common/time_utils.hpp"
#include "perpcore/market/position_math.hpp"

namespace perpcore {
namespace funding {

void FundingEngine::initialize(common::TimestampMs now_ms) noexcept {
  auto& state = market_.info.funding;
  state.last_funding_ts = common::align_down(now_ms, market_.config.funding.funding_interval_ms);
  state.previous_funding_ts = state.last_funding_ts;
}

std::uint64_t FundingEngine::funding_increment(std::uint64_t basic_funding_rate, std::uint64_t exposure_usd,
                                               std::uint64_t pool_tvl_usd, std::uint64_t intervals) noexcept {
  if (pool_tvl_usd == 0) {
    return 0;
  }
  return common::saturating_mul(common::mul_div(basic_funding_rate, exposure_usd, pool_tvl_usd), intervals);
}

FundingUpdate FundingEngine::update_funding_rate(common::TimestampMs now_ms, common::PriceQuote trading_price,
                                                 std::uint64_t pool_tvl_usd) {
  auto& state = market_.info.funding;
  const auto interval = market_.config.funding.funding_interval_ms;
  const auto aligned = common::align_down(now_ms, interval);

  FundingUpdate update{.previous_index = state.index, .index = state.index, .funding_ts = state.last_funding_ts};
  if (interval == 0 || aligned <= state.last_funding_ts) {
    return update;
  }

  const auto long_size = market_.info.user_long_position_size;
  const auto short_size = market_.info.user_short_position_size;
  const bool long_dominant = long_size >= short_size;
  const auto exposure = long_dominant ? long_size - short_size : short_size - long_size;
  const auto exposure_usd = market::notional_usd(exposure, market_.info.size_decimal, trading_price);

  update.intervals = (aligned - state.last_funding_ts) / interval;
  update.increment =
      funding_increment(market_.config.funding.basic_funding_rate, exposure_usd, pool_tvl_usd, update.intervals);
  update.index = state.index + common::SignedAmount(update.increment, !long_dominant);
  update.funding_ts = aligned;
  update.updated = true;

  state.previous_funding_ts = state.last_funding_ts;
  state.previous_index = state.index;
  state.last_funding_ts = aligned;
  state.index = update.index;
  return update;
}

}  // namespace funding
}  // namespace perpcore
