#include "perpcore/market/market_state.hpp"

#include "perpcore/common/error.hpp"

namespace perpcore {
namespace market {

void validate_config(const MarketConfig& config) {
  using common::ErrorCode;
  if (config.lot_size == 0) {
    throw common::EngineError(ErrorCode::kInvalidConfig, "lot_size must be positive");
  }
  if (config.max_leverage_mbp == 0 || config.option_max_leverage_mbp == 0) {
    throw common::EngineError(ErrorCode::kInvalidConfig, "leverage caps must be positive");
  }
  if (config.trading_fee.max_fee_mbp < config.trading_fee.base_fee_mbp ||
      config.trading_fee.max_fee_mbp > common::kMbpScale) {
    throw common::EngineError(ErrorCode::kInvalidConfig, "fee curve out of range");
  }
  if (config.funding.funding_interval_ms == 0) {
    throw common::EngineError(ErrorCode::kInvalidConfig, "funding_interval_ms must be positive");
  }
  if (config.maintenance_margin_bp > common::kBpScale || config.option_maintenance_margin_bp > common::kBpScale) {
    throw common::EngineError(ErrorCode::kInvalidConfig, "maintenance margin above 100%");
  }
}

}  // namespace market
}  // namespace perpcore
