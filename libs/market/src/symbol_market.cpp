#include "perpcore/market/symbol_market.hpp"

#include <algorithm>
#include <string>

#include "perpcore/common/error.hpp"
#include "perpcore/common/fixed_point.hpp"
#include "perpcore/market/trading_context.hpp"

namespace perpcore {
namespace market {

namespace {

std::uint64_t& order_counter(MarketInfo& info, common::Side side) noexcept {
  return side == common::Side::kLong ? info.user_long_order_size : info.user_short_order_size;
}

std::uint64_t& position_counter(MarketInfo& info, common::Side side) noexcept {
  return side == common::Side::kLong ? info.user_long_position_size : info.user_short_position_size;
}

void add_checked(std::uint64_t& counter, std::uint64_t amount) {
  common::ensure(amount <= common::kU64Max - counter, common::ErrorCode::kArithmeticOverflow);
  counter += amount;
}

void sub_checked(std::uint64_t& counter, std::uint64_t amount) {
  common::ensure(amount <= counter, common::ErrorCode::kArithmeticOverflow);
  counter -= amount;
}

}  // namespace

void SymbolMarket::add_position_size(common::Side side, std::uint64_t size) {
  add_checked(position_counter(info, side), size);
}

void SymbolMarket::sub_position_size(common::Side side, std::uint64_t size) {
  sub_checked(position_counter(info, side), size);
}

void SymbolMarket::add_resting(TradingOrder order) {
  add_checked(order_counter(info, order.side), order.size);
  if (order.linked_position_id) {
    if (auto* position = positions.find(*order.linked_position_id)) {
      position->linked_orders.push_back(LinkedOrder{.order_id = order.id, .trigger_price = order.trigger_price});
    }
  }
  book.insert(std::move(order));
}

void SymbolMarket::order_left_book(const TradingOrder& order) {
  sub_checked(order_counter(info, order.side), order.size);
  unlink(order);
}

void SymbolMarket::unlink(const TradingOrder& order) noexcept {
  if (!order.linked_position_id) {
    return;
  }
  auto* position = positions.find(*order.linked_position_id);
  if (position == nullptr) {
    return;
  }
  std::erase_if(position->linked_orders, [&order](const LinkedOrder& link) { return link.order_id == order.id; });
}

TradingOrder cancel_resting_order(SymbolMarket& market, TradingContext& ctx, std::uint64_t trigger_price,
                                  common::OrderId order_id, events::CancelReason reason) {
  auto located = market.book.remove(trigger_price, order_id);
  if (!located) {
    throw common::EngineError(common::ErrorCode::kOrderNotFound, std::to_string(order_id));
  }
  release_order(market, ctx, located->order, reason);
  return std::move(located->order);
}

void release_order(SymbolMarket& market, TradingContext& ctx, const TradingOrder& order, events::CancelReason reason) {
  market.order_left_book(order);
  ctx.refund(order);
  ctx.events.emit(events::OrderCanceled{
      .market = ctx.market,
      .symbol = ctx.symbol,
      .order_id = order.id,
      .user = order.user,
      .reason = reason,
      .size = order.size,
      .refunded_amount = order.option_collateral ? 0 : order.collateral_amount,
      .refunded_receipts = order.option_collateral
                               ? static_cast<std::uint32_t>(order.option_collateral->receipts.size())
                               : 0u,
  });
}

}  // namespace market
}  // namespace perpcore
