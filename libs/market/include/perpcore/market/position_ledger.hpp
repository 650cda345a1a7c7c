#pragma once

#include <cstdint>
#include <vector>

#include "perpcore/common/signed_amount.hpp"
#include "perpcore/common/types.hpp"
#include "perpcore/events/events.hpp"
#include "perpcore/market/order.hpp"
#include "perpcore/market/position.hpp"
#include "perpcore/market/symbol_market.hpp"
#include "perpcore/market/trading_context.hpp"
#include "perpcore/risk/margin.hpp"

namespace perpcore {
namespace market {

// Mark-to-market view of a position. Amounts in collateral units.
struct PositionValuation {
  common::SignedAmount pnl{};  // profit capped at the position's reserve
  std::uint64_t borrow_fee{0};
  common::SignedAmount funding_owed{};
  std::uint64_t notional_usd{0};
  std::uint64_t notional_amount{0};
};

struct FillOutcome {
  common::PositionId position_id{0};
  std::uint64_t trading_fee{0};
  std::uint64_t position_size{0};
  bool position_closed{false};
};

class PositionLedger {
 public:
  PositionLedger(SymbolMarket& market, TradingContext& ctx) noexcept : market_(market), ctx_(ctx) {}

  // Applies a triggered order: opens a position, or merges into, reduces, closes
  // or flips the linked one.
  FillOutcome order_filled(const TradingOrder& order, std::uint64_t fee_mbp);

  void increase_collateral(common::AccountId user, common::PositionId id, std::uint64_t amount);
  void release_collateral(common::AccountId user, common::PositionId id, std::uint64_t amount);
  void increase_option_collateral(common::AccountId user, common::PositionId id,
                                  std::vector<common::BidReceipt> receipts);
  void release_option_collateral(common::AccountId user, common::PositionId id,
                                 const std::vector<common::ReceiptId>& receipt_ids);

  [[nodiscard]] PositionValuation valuation(const Position& position) const;
  [[nodiscard]] std::uint64_t collateral_value(const Position& position) const;
  [[nodiscard]] std::uint64_t close_fee_mbp(const Position& position) const;
  [[nodiscard]] risk::MarginHealth health(const Position& position) const;
  // Profit realizable by closing `size` of the position now, capped at its reserve.
  [[nodiscard]] std::uint64_t unrealized_profit(const Position& position, std::uint64_t size) const;

  // Removes a position from the book without settling its collateral: releases
  // its reserve, updates open interest and cancels its resting linked orders.
  Position detach(common::PositionId id);

  [[nodiscard]] std::uint64_t fee_rate(common::Side side, std::uint64_t size) const;
  [[nodiscard]] std::uint64_t order_collateral_value(const TradingOrder& order) const;

 private:
  struct Accrual {
    std::uint64_t borrow_fee{0};
    common::SignedAmount funding{};
  };

  SymbolMarket& market_;
  TradingContext& ctx_;

  FillOutcome open_position(const TradingOrder& order, std::uint64_t fee, std::uint64_t fee_mbp);
  FillOutcome increase_position(Position& position, const TradingOrder& order, std::uint64_t fee, std::uint64_t fee_mbp);
  FillOutcome reduce_position(Position& position, const TradingOrder& order, std::uint64_t fee, std::uint64_t fee_mbp);

  Position& owned(common::AccountId user, common::PositionId id);
  void add_order_collateral(Position& position, const TradingOrder& order);
  Accrual accrue(Position& position);
  std::uint64_t charge(Position& position, std::uint64_t amount);
  void credit(Position& position, std::uint64_t amount);
  std::uint64_t charge_trading_fee(Position& position, std::uint64_t fee);
  void sync_reserve(Position& position);
  void release_reserve(Position& position);
  void ensure_solvent(const Position& position) const;
  void ensure_leverage(const Position& position) const;
  void settle_and_remove(common::PositionId id);
  void settle_option_collateral(const Position& position);
  void emit_filled(const TradingOrder& order, const FillOutcome& outcome, std::uint64_t fee_mbp,
                   const Accrual& accrual, common::SignedAmount realized_pnl);
  void emit_collateral_changed(const Position& position, common::SignedAmount delta, const Accrual& accrual);
};

}  // namespace market
}  // namespace perpcore
