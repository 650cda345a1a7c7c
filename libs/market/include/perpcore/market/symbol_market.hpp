#pragma once

#include <cstdint>

#include "perpcore/common/types.hpp"
#include "perpcore/events/events.hpp"
#include "perpcore/market/market_state.hpp"
#include "perpcore/market/order_book.hpp"
#include "perpcore/market/position_store.hpp"

namespace perpcore {
namespace market {

struct TradingContext;

// The unit of trading for one base token: counters, parameters, the resting
// order book and the open positions.
struct SymbolMarket {
  common::TokenType base_token;
  MarketInfo info{};
  MarketConfig config{};
  OrderBook book{};
  PositionStore positions{};

  [[nodiscard]] std::uint64_t position_size(common::Side side) const noexcept {
    return side == common::Side::kLong ? info.user_long_position_size : info.user_short_position_size;
  }
  [[nodiscard]] std::uint64_t order_size(common::Side side) const noexcept {
    return side == common::Side::kLong ? info.user_long_order_size : info.user_short_order_size;
  }
  [[nodiscard]] std::uint64_t open_interest_cap(common::Side side) const noexcept {
    return side == common::Side::kLong ? config.max_long_open_interest : config.max_short_open_interest;
  }
  [[nodiscard]] std::uint64_t max_leverage_mbp(CollateralMode mode) const noexcept {
    return mode == CollateralMode::kOption ? config.option_max_leverage_mbp : config.max_leverage_mbp;
  }
  [[nodiscard]] std::uint64_t maintenance_margin_bp(CollateralMode mode) const noexcept {
    return mode == CollateralMode::kOption ? config.option_maintenance_margin_bp : config.maintenance_margin_bp;
  }

  void add_position_size(common::Side side, std::uint64_t size);
  void sub_position_size(common::Side side, std::uint64_t size);

  // Book access that keeps the resting-order counters in step.
  void add_resting(TradingOrder order);
  void order_left_book(const TradingOrder& order);

  // Drops the back-reference a position keeps to one of its resting orders.
  void unlink(const TradingOrder& order) noexcept;
};

// Cancels a resting order: removes it from the book, unlinks it, refunds it and
// records why.
TradingOrder cancel_resting_order(SymbolMarket& market, TradingContext& ctx, std::uint64_t trigger_price,
                                  common::OrderId order_id, events::CancelReason reason);

// Same for an order already taken off the book.
void release_order(SymbolMarket& market, TradingContext& ctx, const TradingOrder& order, events::CancelReason reason);

}  // namespace market
}  // namespace perpcore
