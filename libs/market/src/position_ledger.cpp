#include "perpcore/market/position_ledger.hpp"

#include <algorithm>
#include <string>
#include <utility>

#include "perpcore/common/error.hpp"
#include "perpcore/common/fixed_point.hpp"
#include "perpcore/fees/fee_model.hpp"
#include "perpcore/market/position_math.hpp"

namespace perpcore {
namespace market {

using common::ErrorCode;
using common::SignedAmount;

namespace {

std::uint64_t blended_entry(std::uint64_t entry_price, std::uint64_t size, std::uint64_t fill_price,
                            std::uint64_t fill_size) noexcept {
  const auto total = static_cast<common::U128>(size) + fill_size;
  if (total == 0) {
    return fill_price;
  }
  const auto weighted =
      static_cast<common::U128>(entry_price) * size + static_cast<common::U128>(fill_price) * fill_size;
  return common::saturate(weighted / total);
}

}  // namespace

std::uint64_t PositionLedger::fee_rate(common::Side side, std::uint64_t size) const {
  const fees::ExposureInput exposure{
      .long_size = market_.info.user_long_position_size,
      .short_size = market_.info.user_short_position_size,
      .pool_tvl_usd = ctx_.pool.tvl_usd(),
      .size_decimal = market_.info.size_decimal,
      .price = ctx_.trading_price,
  };
  return fees::fee_rate_mbp(exposure, side, size, market_.config.trading_fee);
}

std::uint64_t PositionLedger::order_collateral_value(const TradingOrder& order) const {
  if (order.option_collateral) {
    return ctx_.vaults.intrinsic_value(order.option_collateral->receipts);
  }
  return order.collateral_amount;
}

std::uint64_t PositionLedger::collateral_value(const Position& position) const {
  if (position.option_collateral) {
    return common::saturating_sub(ctx_.vaults.intrinsic_value(position.option_collateral->receipts),
                                  position.unsettled_cost);
  }
  return position.collateral_amount;
}

std::uint64_t PositionLedger::close_fee_mbp(const Position& position) const {
  return fee_rate(common::opposite(position.side), position.size);
}

PositionValuation PositionLedger::valuation(const Position& position) const {
  PositionValuation value;
  auto pnl = signed_usd_in_collateral(
      pnl_usd(position.side, position.size, position.size_decimal, entry_quote(position), ctx_.trading_price),
      position.collateral_decimal, ctx_.collateral_price);
  if (!pnl.is_negative() && pnl.magnitude() > position.reserve_amount) {
    pnl = SignedAmount::positive(position.reserve_amount);
  }
  value.pnl = pnl;
  value.borrow_fee = borrow_fee(position, ctx_.pool.cumulative_borrow_rate(position.collateral_token));
  value.funding_owed = signed_usd_in_collateral(
      funding_owed_usd(position, market_.info.funding.index, ctx_.trading_price), position.collateral_decimal,
      ctx_.collateral_price);
  value.notional_usd = notional_usd(position.size, position.size_decimal, ctx_.trading_price);
  value.notional_amount = usd_in_collateral(value.notional_usd, position.collateral_decimal, ctx_.collateral_price);
  return value;
}

std::uint64_t PositionLedger::unrealized_profit(const Position& position, std::uint64_t size) const {
  const auto pnl = pnl_usd(position.side, std::min(size, position.size), position.size_decimal, entry_quote(position),
                           ctx_.trading_price);
  if (pnl.is_negative()) {
    return 0;
  }
  return std::min(usd_in_collateral(pnl.magnitude(), position.collateral_decimal, ctx_.collateral_price),
                  position.reserve_amount);
}

risk::MarginHealth PositionLedger::health(const Position& position) const {
  const auto value = valuation(position);
  const auto closing_fee =
      fees::trading_fee_amount(position.size, position.size_decimal, ctx_.trading_price, close_fee_mbp(position),
                               position.collateral_decimal, ctx_.collateral_price);
  return risk::check_position_liquidated(risk::MarginInputs{
      .collateral_amount = collateral_value(position),
      .unrealized_pnl = value.pnl,
      .trading_fee = closing_fee,
      .borrow_fee = value.borrow_fee,
      .funding_owed = value.funding_owed,
      .notional_amount = value.notional_amount,
      .maintenance_margin_bp = market_.maintenance_margin_bp(position.mode()),
  });
}

FillOutcome PositionLedger::order_filled(const TradingOrder& order, std::uint64_t fee_mbp) {
  if (!order.linked_position_id) {
    const auto fee = fees::trading_fee_amount(order.size, order.size_decimal, ctx_.trading_price, fee_mbp,
                                              ctx_.collateral_decimal, ctx_.collateral_price);
    return open_position(order, fee, fee_mbp);
  }

  auto& position = market_.positions.at(*order.linked_position_id);
  common::ensure(position.mode() == order.mode(), ErrorCode::kCollateralModeMismatch);
  if (position.side == order.side) {
    const auto fee = fees::trading_fee_amount(order.size, order.size_decimal, ctx_.trading_price, fee_mbp,
                                              ctx_.collateral_decimal, ctx_.collateral_price);
    return increase_position(position, order, fee, fee_mbp);
  }

  // A reduce-only order never takes more than what is left of its position.
  TradingOrder fill = order;
  if (fill.reduce_only) {
    fill.size = std::min(fill.size, position.size);
  }
  const auto fee = fees::trading_fee_amount(fill.size, fill.size_decimal, ctx_.trading_price, fee_mbp,
                                            ctx_.collateral_decimal, ctx_.collateral_price);
  return reduce_position(position, fill, fee, fee_mbp);
}

FillOutcome PositionLedger::open_position(const TradingOrder& order, std::uint64_t fee, std::uint64_t fee_mbp) {
  common::ensure(fees::can_cover_fee_when_adding(order_collateral_value(order), 0, fee),
                 ErrorCode::kInsufficientCollateral);

  Position position{
      .id = market_.info.next_position_id++,
      .user = order.user,
      .side = order.side,
      .size = order.size,
      .size_decimal = order.size_decimal,
      .collateral_token = ctx_.collateral_token,
      .collateral_decimal = ctx_.collateral_decimal,
      .option_collateral = order.option_collateral,
      .entry_price = ctx_.trading_price.price,
      .entry_price_decimal = ctx_.trading_price.decimal,
      .leverage_mbp = order.leverage_mbp,
      .entry_borrow_index = ctx_.pool.cumulative_borrow_rate(ctx_.collateral_token),
      .entry_funding_index = market_.info.funding.index,
      .opened_ms = ctx_.now_ms,
      .updated_ms = ctx_.now_ms,
  };
  if (!order.option_collateral) {
    ctx_.pool.put_collateral(position.collateral_token, order.collateral_amount);
    position.collateral_amount = order.collateral_amount;
  }

  const auto charged = charge_trading_fee(position, fee);
  market_.add_position_size(position.side, position.size);
  sync_reserve(position);

  const FillOutcome outcome{
      .position_id = position.id,
      .trading_fee = charged,
      .position_size = position.size,
      .position_closed = false,
  };
  market_.positions.insert(std::move(position));
  emit_filled(order, outcome, fee_mbp, Accrual{}, SignedAmount{});
  return outcome;
}

FillOutcome PositionLedger::increase_position(Position& position, const TradingOrder& order, std::uint64_t fee,
                                              std::uint64_t fee_mbp) {
  common::ensure(fees::can_cover_fee_when_adding(order_collateral_value(order), collateral_value(position), fee),
                 ErrorCode::kInsufficientCollateral);

  add_order_collateral(position, order);
  const auto accrual = accrue(position);

  const auto current_entry = rescale_price(position.entry_price, position.entry_price_decimal, ctx_.trading_price.decimal);
  common::ensure(order.size <= common::kU64Max - position.size, ErrorCode::kArithmeticOverflow);
  position.entry_price = blended_entry(current_entry, position.size, ctx_.trading_price.price, order.size);
  position.entry_price_decimal = ctx_.trading_price.decimal;
  position.size += order.size;
  position.updated_ms = ctx_.now_ms;

  const auto charged = charge_trading_fee(position, fee);
  market_.add_position_size(position.side, order.size);
  sync_reserve(position);

  const FillOutcome outcome{
      .position_id = position.id,
      .trading_fee = charged,
      .position_size = position.size,
      .position_closed = false,
  };
  emit_filled(order, outcome, fee_mbp, accrual, SignedAmount{});
  return outcome;
}

FillOutcome PositionLedger::reduce_position(Position& position, const TradingOrder& order, std::uint64_t fee,
                                            std::uint64_t fee_mbp) {
  const auto closing = std::min(order.size, position.size);
  const auto overshoot = order.size - closing;

  auto pnl = signed_usd_in_collateral(
      pnl_usd(position.side, closing, position.size_decimal, entry_quote(position), ctx_.trading_price),
      position.collateral_decimal, ctx_.collateral_price);
  if (!pnl.is_negative() && pnl.magnitude() > position.reserve_amount) {
    pnl = SignedAmount::positive(position.reserve_amount);
  }
  const auto profit = pnl.is_negative() ? 0 : pnl.magnitude();
  common::ensure(
      fees::can_cover_fee_when_reducing(order_collateral_value(order), collateral_value(position), profit, fee),
      ErrorCode::kInsufficientCollateral);

  add_order_collateral(position, order);
  const auto accrual = accrue(position);

  SignedAmount realized{};
  if (pnl.is_negative()) {
    realized = SignedAmount::negative(charge(position, pnl.magnitude()));
  }

  market_.sub_position_size(position.side, closing);
  position.size -= closing;
  position.updated_ms = ctx_.now_ms;
  if (position.size > 0) {
    sync_reserve(position);
  } else {
    release_reserve(position);
  }

  if (profit > 0) {
    credit(position, profit);
    realized = SignedAmount::positive(profit);
  }
  const auto charged = charge_trading_fee(position, fee);

  FillOutcome outcome{
      .position_id = position.id,
      .trading_fee = charged,
      .position_size = position.size,
      .position_closed = false,
  };

  if (position.size == 0 && overshoot == 0) {
    outcome.position_closed = true;
    const auto id = position.id;
    emit_filled(order, outcome, fee_mbp, accrual, realized);
    settle_and_remove(id);
    return outcome;
  }

  if (position.size == 0) {
    // The order went through zero: what is left opens the other side at the fill price.
    position.side = common::opposite(position.side);
    position.size = overshoot;
    position.entry_price = ctx_.trading_price.price;
    position.entry_price_decimal = ctx_.trading_price.decimal;
    market_.add_position_size(position.side, overshoot);
    sync_reserve(position);
    outcome.position_size = position.size;
  }

  emit_filled(order, outcome, fee_mbp, accrual, realized);
  return outcome;
}

void PositionLedger::increase_collateral(common::AccountId user, common::PositionId id, std::uint64_t amount) {
  common::ensure(amount > 0, ErrorCode::kZeroSize);
  auto& position = owned(user, id);
  common::ensure(position.mode() == CollateralMode::kToken, ErrorCode::kCollateralModeMismatch);
  common::ensure(amount <= common::kU64Max - position.collateral_amount, ErrorCode::kArithmeticOverflow);

  ctx_.pool.put_collateral(position.collateral_token, amount);
  position.collateral_amount += amount;
  const auto accrual = accrue(position);
  sync_reserve(position);
  ensure_solvent(position);
  position.updated_ms = ctx_.now_ms;
  emit_collateral_changed(position, SignedAmount::positive(amount), accrual);
}

void PositionLedger::release_collateral(common::AccountId user, common::PositionId id, std::uint64_t amount) {
  common::ensure(amount > 0, ErrorCode::kZeroSize);
  auto& position = owned(user, id);
  common::ensure(position.mode() == CollateralMode::kToken, ErrorCode::kCollateralModeMismatch);

  const auto accrual = accrue(position);
  common::ensure(amount <= position.collateral_amount, ErrorCode::kInsufficientCollateral);
  ctx_.pool.request_collateral(position.collateral_token, amount);
  position.collateral_amount -= amount;
  ctx_.pay(position.user, position.collateral_token, amount);

  sync_reserve(position);
  ensure_leverage(position);
  ensure_solvent(position);
  position.updated_ms = ctx_.now_ms;
  emit_collateral_changed(position, SignedAmount::negative(amount), accrual);
}

void PositionLedger::increase_option_collateral(common::AccountId user, common::PositionId id,
                                                std::vector<common::BidReceipt> receipts) {
  common::ensure(!receipts.empty(), ErrorCode::kZeroSize);
  auto& position = owned(user, id);
  common::ensure(position.mode() == CollateralMode::kOption, ErrorCode::kCollateralModeMismatch);

  auto& held = position.option_collateral->receipts;
  auto merged = held;
  merged.insert(merged.end(), receipts.begin(), receipts.end());
  ctx_.vaults.validate(merged, position.option_collateral->vault_index, position.option_collateral->bid_token);
  const auto added_value = ctx_.vaults.intrinsic_value(receipts);
  held = std::move(merged);

  const auto accrual = accrue(position);
  sync_reserve(position);
  ensure_solvent(position);
  position.updated_ms = ctx_.now_ms;
  emit_collateral_changed(position, SignedAmount::positive(added_value), accrual);
}

void PositionLedger::release_option_collateral(common::AccountId user, common::PositionId id,
                                               const std::vector<common::ReceiptId>& receipt_ids) {
  common::ensure(!receipt_ids.empty(), ErrorCode::kZeroSize);
  auto& position = owned(user, id);
  common::ensure(position.mode() == CollateralMode::kOption, ErrorCode::kCollateralModeMismatch);

  auto& held = position.option_collateral->receipts;
  std::vector<common::BidReceipt> released;
  for (const auto receipt_id : receipt_ids) {
    auto it = std::find_if(held.begin(), held.end(),
                           [receipt_id](const common::BidReceipt& receipt) { return receipt.id == receipt_id; });
    common::ensure(it != held.end(), ErrorCode::kInsufficientCollateral);
    released.push_back(*it);
    held.erase(it);
  }
  common::ensure(!held.empty(), ErrorCode::kInsufficientCollateral);

  const auto accrual = accrue(position);
  sync_reserve(position);
  ensure_leverage(position);
  ensure_solvent(position);
  position.updated_ms = ctx_.now_ms;

  const auto released_value = ctx_.vaults.intrinsic_value(released);
  ctx_.return_receipts(position.user, position.option_collateral->bid_token, std::move(released));
  emit_collateral_changed(position, SignedAmount::negative(released_value), accrual);
}

Position PositionLedger::detach(common::PositionId id) {
  Position removed = market_.positions.remove(id);
  release_reserve(removed);
  market_.sub_position_size(removed.side, removed.size);
  for (const auto& link : removed.linked_orders) {
    cancel_resting_order(market_, ctx_, link.trigger_price, link.order_id, events::CancelReason::kLinkedPositionClosed);
  }
  removed.linked_orders.clear();
  return removed;
}

Position& PositionLedger::owned(common::AccountId user, common::PositionId id) {
  auto& position = market_.positions.at(id);
  common::ensure(position.user == user, ErrorCode::kNotPositionOwner);
  common::ensure(position.collateral_token == ctx_.collateral_token, ErrorCode::kCollateralTokenMismatch);
  return position;
}

void PositionLedger::add_order_collateral(Position& position, const TradingOrder& order) {
  if (order.option_collateral) {
    auto& held = position.option_collateral->receipts;
    auto merged = held;
    merged.insert(merged.end(), order.option_collateral->receipts.begin(), order.option_collateral->receipts.end());
    ctx_.vaults.validate(merged, position.option_collateral->vault_index, position.option_collateral->bid_token);
    held = std::move(merged);
    return;
  }
  common::ensure(order.collateral_amount <= common::kU64Max - position.collateral_amount,
                 ErrorCode::kArithmeticOverflow);
  ctx_.pool.put_collateral(position.collateral_token, order.collateral_amount);
  position.collateral_amount += order.collateral_amount;
}

PositionLedger::Accrual PositionLedger::accrue(Position& position) {
  const auto borrow_index = ctx_.pool.cumulative_borrow_rate(position.collateral_token);
  const auto owed_borrow = borrow_fee(position, borrow_index);
  const auto owed_funding = signed_usd_in_collateral(
      funding_owed_usd(position, market_.info.funding.index, ctx_.trading_price), position.collateral_decimal,
      ctx_.collateral_price);
  position.entry_borrow_index = borrow_index;
  position.entry_funding_index = market_.info.funding.index;

  Accrual accrual;
  accrual.borrow_fee = charge(position, owed_borrow);
  ctx_.pool.order_filled(position.collateral_token, 0, accrual.borrow_fee);
  if (owed_funding.is_negative()) {
    credit(position, owed_funding.magnitude());
    accrual.funding = owed_funding;
  } else {
    accrual.funding = SignedAmount::positive(charge(position, owed_funding.magnitude()));
  }
  return accrual;
}

std::uint64_t PositionLedger::charge(Position& position, std::uint64_t amount) {
  if (amount == 0) {
    return 0;
  }
  if (position.option_collateral) {
    position.unsettled_cost = common::saturating_add(position.unsettled_cost, amount);
    return amount;
  }
  const auto charged = std::min(amount, position.collateral_amount);
  ctx_.pool.realize_from_collateral(position.collateral_token, charged);
  position.collateral_amount -= charged;
  return charged;
}

void PositionLedger::credit(Position& position, std::uint64_t amount) {
  if (amount == 0) {
    return;
  }
  if (position.option_collateral) {
    // Receipts cannot absorb tokens: settle against what the position owes, pay the rest out.
    const auto offset = std::min(amount, position.unsettled_cost);
    position.unsettled_cost -= offset;
    const auto rest = amount - offset;
    if (rest > 0) {
      ctx_.pool.pay_out(position.collateral_token, rest);
      ctx_.pay(position.user, position.collateral_token, rest);
    }
    return;
  }
  common::ensure(amount <= common::kU64Max - position.collateral_amount, ErrorCode::kArithmeticOverflow);
  ctx_.pool.pay_to_collateral(position.collateral_token, amount);
  position.collateral_amount += amount;
}

std::uint64_t PositionLedger::charge_trading_fee(Position& position, std::uint64_t fee) {
  const auto charged = charge(position, fee);
  if (!position.option_collateral) {
    ctx_.credit_protocol_fee(position.collateral_token, charged);
  }
  ctx_.pool.order_filled(position.collateral_token, charged, 0);
  return charged;
}

void PositionLedger::sync_reserve(Position& position) {
  const auto target = reserve_for(position.size, position.size_decimal, entry_quote(position),
                                  position.collateral_decimal, ctx_.collateral_price);
  if (target == position.reserve_amount) {
    return;
  }
  const bool release = target < position.reserve_amount;
  const auto delta = release ? position.reserve_amount - target : target - position.reserve_amount;
  ctx_.pool.update_reserve_amount(position.collateral_token, SignedAmount(delta, release));
  position.reserve_amount = target;
}

void PositionLedger::release_reserve(Position& position) {
  if (position.reserve_amount == 0) {
    return;
  }
  ctx_.pool.update_reserve_amount(position.collateral_token, SignedAmount::negative(position.reserve_amount));
  position.reserve_amount = 0;
}

void PositionLedger::ensure_solvent(const Position& position) const {
  common::ensure(!health(position).liquidated, ErrorCode::kPositionLiquidatable);
}

void PositionLedger::ensure_leverage(const Position& position) const {
  const auto leverage = fees::leverage_mbp(
      notional_usd(position.size, position.size_decimal, ctx_.trading_price),
      collateral_in_usd(collateral_value(position), position.collateral_decimal, ctx_.collateral_price));
  common::ensure(leverage <= market_.max_leverage_mbp(position.mode()), ErrorCode::kLeverageExceeded);
}

void PositionLedger::settle_and_remove(common::PositionId id) {
  Position closed = detach(id);
  if (closed.option_collateral) {
    settle_option_collateral(closed);
    return;
  }
  ctx_.pool.request_collateral(closed.collateral_token, closed.collateral_amount);
  ctx_.pay(closed.user, closed.collateral_token, closed.collateral_amount);
}

void PositionLedger::settle_option_collateral(const Position& position) {
  const auto& collateral = *position.option_collateral;
  std::vector<common::BidReceipt> expired;
  std::vector<common::BidReceipt> live;
  for (const auto& receipt : collateral.receipts) {
    (ctx_.vaults.is_expired(receipt, ctx_.now_ms) ? expired : live).push_back(receipt);
  }

  auto proceeds = expired.empty() ? 0 : ctx_.vaults.exercise(expired, ctx_.now_ms);
  auto owed = position.unsettled_cost;
  const auto to_pool = std::min(proceeds, owed);
  ctx_.pool.receive(position.collateral_token, to_pool);
  proceeds -= to_pool;
  owed -= to_pool;
  ctx_.pay(position.user, position.collateral_token, proceeds);

  if (owed > 0 && !live.empty()) {
    const auto receipt_count = static_cast<std::uint32_t>(live.size());
    const auto escrow_id = ctx_.escrow.add(vault::UnsettledReceipt{
        .market = ctx_.market,
        .symbol = ctx_.symbol,
        .position_id = position.id,
        .user = position.user,
        .collateral_token = position.collateral_token,
        .vault_index = collateral.vault_index,
        .receipts = std::move(live),
        .pool_owed = owed,
        .residual_to_user = true,
    });
    ctx_.events.emit(events::ReceiptsEscrowed{
        .escrow_id = escrow_id,
        .market = ctx_.market,
        .symbol = ctx_.symbol,
        .position_id = position.id,
        .user = position.user,
        .receipt_count = receipt_count,
        .pool_owed = owed,
    });
    return;
  }
  // Without live receipts any shortfall stays with the pool.
  ctx_.return_receipts(position.user, collateral.bid_token, std::move(live));
}

void PositionLedger::emit_filled(const TradingOrder& order, const FillOutcome& outcome, std::uint64_t fee_mbp,
                                 const Accrual& accrual, common::SignedAmount realized_pnl) {
  ctx_.events.emit(events::OrderFilled{
      .market = ctx_.market,
      .symbol = ctx_.symbol,
      .order_id = order.id,
      .user = order.user,
      .position_id = outcome.position_id,
      .side = order.side,
      .size = order.size,
      .fill_price = ctx_.trading_price.price,
      .fee_mbp = fee_mbp,
      .trading_fee = outcome.trading_fee,
      .borrow_fee = accrual.borrow_fee,
      .funding_paid = accrual.funding,
      .realized_pnl = realized_pnl,
      .position_size = outcome.position_size,
      .position_closed = outcome.position_closed,
  });
}

void PositionLedger::emit_collateral_changed(const Position& position, common::SignedAmount delta,
                                             const Accrual& accrual) {
  ctx_.events.emit(events::CollateralChanged{
      .market = ctx_.market,
      .symbol = ctx_.symbol,
      .position_id = position.id,
      .user = position.user,
      .delta = delta,
      .collateral_after = collateral_value(position),
      .borrow_fee = accrual.borrow_fee,
      .funding_paid = accrual.funding,
  });
}

}  // namespace market
}  // namespace perpcore
