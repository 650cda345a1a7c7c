#pragma once

#include <cstdint>

#include "perpcore/common/signed_amount.hpp"
#include "perpcore/common/types.hpp"
#include "perpcore/fees/fee_model.hpp"

namespace perpcore {
namespace market {

struct FundingConfig {
  std::uint64_t basic_funding_rate{0};  // kRateScale per interval at 100% exposure/TVL
  std::uint64_t funding_interval_ms{3'600'000};
};

struct MarketConfig {
  common::OracleId oracle_id{0};
  std::uint64_t max_staleness_ms{60'000};
  std::uint64_t max_leverage_mbp{0};
  std::uint64_t option_max_leverage_mbp{0};
  std::uint64_t min_size{0};
  std::uint64_t lot_size{1};
  fees::TradingFeeConfig trading_fee{};
  FundingConfig funding{};
  std::uint64_t maintenance_margin_bp{0};
  std::uint64_t option_maintenance_margin_bp{0};
  std::uint64_t max_long_open_interest{0};
  std::uint64_t max_short_open_interest{0};
};

struct FundingState {
  common::TimestampMs last_funding_ts{0};
  common::SignedAmount index{};
  common::TimestampMs previous_funding_ts{0};
  common::SignedAmount previous_index{};
};

struct MarketInfo {
  bool active{true};
  std::uint64_t size_decimal{0};
  std::uint64_t user_long_position_size{0};
  std::uint64_t user_short_position_size{0};
  std::uint64_t user_long_order_size{0};
  std::uint64_t user_short_order_size{0};
  common::PositionId next_position_id{1};
  common::OrderId next_order_id{1};
  FundingState funding{};
};

// Rejects configurations the engine cannot operate under.
void validate_config(const MarketConfig& config);

}  // namespace market
}  // namespace perpcore
