#include "perpcore/market/order_engine.hpp"

#include <algorithm>
#include <string>
#include <utility>
#include <vector>

#include "perpcore/common/fixed_point.hpp"
#include "perpcore/fees/fee_model.hpp"
#include "perpcore/market/position_math.hpp"

namespace perpcore {
namespace market {

using common::ErrorCode;

CreateOutcome OrderEngine::create(const OrderRequest& request) {
  const auto leverage = validate(request);

  TradingOrder order{
      .id = market_.info.next_order_id++,
      .user = request.user,
      .side = request.side,
      .size = request.size,
      .size_decimal = market_.info.size_decimal,
      .trigger_price = request.trigger_price,
      .reduce_only = request.reduce_only,
      .is_stop = request.is_stop,
      .collateral_token = ctx_.collateral_token,
      .collateral_amount = request.option_collateral ? 0 : request.collateral_amount,
      .option_collateral = request.option_collateral,
      .leverage_mbp = leverage,
      .linked_position_id = request.linked_position_id,
      .created_ms = ctx_.now_ms,
  };

  const bool fill_now = triggered(order);
  ctx_.events.emit(events::OrderCreated{
      .market = ctx_.market,
      .symbol = ctx_.symbol,
      .order_id = order.id,
      .user = order.user,
      .side = order.side,
      .is_stop = order.is_stop,
      .reduce_only = order.reduce_only,
      .size = order.size,
      .trigger_price = order.trigger_price,
      .collateral_token = order.collateral_token,
      .collateral_amount = ledger_.order_collateral_value(order),
      .linked_position_id = order.linked_position_id.value_or(0),
      .filled = fill_now,
  });

  CreateOutcome outcome{.order_id = order.id};
  if (!fill_now) {
    market_.add_resting(std::move(order));
    return outcome;
  }

  if (const auto blocker = fill_blocker(order)) {
    throw common::EngineError(*blocker, "order " + std::to_string(order.id));
  }
  const auto filled = fill(std::move(order), outcome.fee_mbp);
  outcome.filled = true;
  outcome.position_id = filled.position_id;
  outcome.trading_fee = filled.trading_fee;
  return outcome;
}

TradingOrder OrderEngine::cancel(common::AccountId user, std::uint64_t trigger_price, common::OrderId order_id) {
  const auto* order = market_.book.find(trigger_price, order_id);
  common::ensure(order != nullptr && order->user == user, ErrorCode::kOrderNotFound);
  return cancel_resting_order(market_, ctx_, trigger_price, order_id, events::CancelReason::kUser);
}

MatchOutcome OrderEngine::match(OrderBucket bucket, std::uint64_t trigger_price, std::size_t budget) {
  MatchOutcome outcome;
  // Orders stay in the book while the level is worked, so a fill that closes a
  // position can still cancel its linked siblings at this price.
  const auto ids = market_.book.level_ids(bucket, trigger_price);
  std::vector<common::OrderId> held;

  // Newest first: there is no time priority within a price level.
  for (auto it = ids.rbegin(); it != ids.rend() && outcome.processed < budget; ++it) {
    const auto* resting = market_.book.find(trigger_price, *it);
    if (resting == nullptr) {
      continue;
    }
    ++outcome.processed;

    if (resting->linked_position_id && !market_.positions.contains(*resting->linked_position_id)) {
      cancel_resting_order(market_, ctx_, trigger_price, *it, events::CancelReason::kLinkedPositionMissing);
      ++outcome.released;
      continue;
    }
    if (!triggered(*resting) || fill_blocker(*resting)) {
      held.push_back(*it);
      ++outcome.requeued;
      continue;
    }

    auto located = market_.book.remove(trigger_price, *it);
    market_.order_left_book(located->order);
    std::uint64_t fee_mbp = 0;
    fill(std::move(located->order), fee_mbp);
    ++outcome.filled;
  }

  // Untouched orders keep their place; inspected ones go behind them in arrival order.
  for (auto it = held.rbegin(); it != held.rend(); ++it) {
    if (auto located = market_.book.remove(trigger_price, *it)) {
      market_.book.requeue(bucket, trigger_price, OrderBook::Level{std::move(located->order)});
    }
  }
  return outcome;
}

OpenInterestSweep OrderEngine::cancel_by_open_interest(std::size_t cursor, std::size_t budget) {
  struct Victim {
    std::uint64_t trigger_price;
    common::OrderId order_id;
  };
  std::vector<Victim> victims;
  OpenInterestSweep sweep;
  std::size_t position = 0;
  bool exhausted = true;

  for (const auto bucket : kAllBuckets) {
    for (const auto& [price, level] : market_.book.bucket(bucket)) {
      for (const auto& order : level) {
        if (position++ < cursor) {
          continue;
        }
        if (sweep.inspected == budget) {
          exhausted = false;
          break;
        }
        ++sweep.inspected;
        if (order.reduce_only || order.linked_position_id) {
          continue;
        }
        const auto projected = common::saturating_add(market_.position_size(order.side), order.size);
        if (projected > market_.open_interest_cap(order.side)) {
          victims.push_back(Victim{.trigger_price = price, .order_id = order.id});
        }
      }
      if (!exhausted) {
        break;
      }
    }
    if (!exhausted) {
      break;
    }
  }

  for (const auto& victim : victims) {
    cancel_resting_order(market_, ctx_, victim.trigger_price, victim.order_id, events::CancelReason::kOpenInterest);
  }
  sweep.canceled = victims.size();
  sweep.done = exhausted;
  // Canceled orders vanish from the walk, so the survivors shift down.
  sweep.next_cursor = exhausted ? 0 : cursor + sweep.inspected - sweep.canceled;
  return sweep;
}

std::uint64_t OrderEngine::validate(const OrderRequest& request) const {
  if (!request.reduce_only) {
    common::ensure(ctx_.market_active, ErrorCode::kMarketInactive);
    common::ensure(market_.info.active, ErrorCode::kSymbolInactive);
    common::ensure(ctx_.pool.is_active() && ctx_.pool.is_token_active(ctx_.collateral_token), ErrorCode::kPoolInactive);
  }
  common::ensure(request.size > 0, ErrorCode::kZeroSize);
  common::ensure(request.size % market_.config.lot_size == 0, ErrorCode::kNotLotAligned);
  const bool linked_reduce = request.reduce_only && request.linked_position_id.has_value();
  common::ensure(request.size >= market_.config.min_size || linked_reduce, ErrorCode::kBelowMinSize);
  common::ensure(request.trigger_price > 0, ErrorCode::kInvalidPrice);

  const auto mode = request.option_collateral ? CollateralMode::kOption : CollateralMode::kToken;
  std::uint64_t collateral_value = request.collateral_amount;
  if (request.option_collateral) {
    const auto& collateral = *request.option_collateral;
    common::ensure(!collateral.receipts.empty() || request.reduce_only, ErrorCode::kInsufficientCollateral);
    ctx_.vaults.validate(collateral.receipts, collateral.vault_index, collateral.bid_token);
    common::ensure(ctx_.vaults.vault(collateral.vault_index).settlement_token == ctx_.collateral_token,
                   ErrorCode::kCollateralTokenMismatch);
    collateral_value = ctx_.vaults.intrinsic_value(collateral.receipts);
  }

  std::uint64_t linked_value = 0;
  if (request.linked_position_id) {
    const auto* position = market_.positions.find(*request.linked_position_id);
    common::ensure(position != nullptr, ErrorCode::kPositionNotFound);
    common::ensure(position->user == request.user, ErrorCode::kNotPositionOwner);
    common::ensure(position->collateral_token == ctx_.collateral_token, ErrorCode::kCollateralTokenMismatch);
    common::ensure(position->mode() == mode, ErrorCode::kCollateralModeMismatch);
    if (request.option_collateral) {
      common::ensure(position->option_collateral->vault_index == request.option_collateral->vault_index &&
                         position->option_collateral->bid_token == request.option_collateral->bid_token,
                     ErrorCode::kBidTokenMismatch);
    }
    if (request.reduce_only) {
      common::ensure(request.side != position->side, ErrorCode::kInvalidLinkedPosition);
      common::ensure(request.size <= position->size, ErrorCode::kReduceOnlyExceedsPosition);
    }
    linked_value = ledger_.collateral_value(*position);
  } else {
    common::ensure(!request.reduce_only, ErrorCode::kInvalidLinkedPosition);
  }

  const common::PriceQuote trigger{.price = request.trigger_price, .decimal = ctx_.trading_price.decimal};
  const auto leverage = fees::leverage_mbp(
      notional_usd(request.size, market_.info.size_decimal, trigger),
      collateral_in_usd(common::saturating_add(collateral_value, linked_value), ctx_.collateral_decimal,
                        ctx_.collateral_price));
  if (request.reduce_only) {
    return leverage;
  }

  common::ensure(leverage <= market_.max_leverage_mbp(mode), ErrorCode::kLeverageExceeded);
  if (!request.linked_position_id) {
    const auto projected = common::saturating_add(market_.position_size(request.side), request.size);
    common::ensure(projected <= market_.open_interest_cap(request.side), ErrorCode::kOpenInterestExceeded);
  }
  const auto needed = reserve_for(request.size, market_.info.size_decimal, trigger, ctx_.collateral_decimal,
                                  ctx_.collateral_price);
  common::ensure(needed <= ctx_.pool.available_reserve(ctx_.collateral_token), ErrorCode::kInsufficientPoolReserve);
  return leverage;
}

bool OrderEngine::triggered(const TradingOrder& order) const noexcept {
  return is_triggered(order.side, order.is_stop, order.trigger_price, ctx_.trading_price.price);
}

std::uint64_t OrderEngine::fill_size(const TradingOrder& order) const {
  if (!order.reduce_only || !order.linked_position_id) {
    return order.size;
  }
  const auto* position = market_.positions.find(*order.linked_position_id);
  return position == nullptr ? order.size : std::min(order.size, position->size);
}

std::optional<ErrorCode> OrderEngine::fill_blocker(const TradingOrder& order) const {
  if (order.collateral_token != ctx_.collateral_token) {
    return ErrorCode::kCollateralTokenMismatch;
  }
  const Position* position = nullptr;
  if (order.linked_position_id) {
    position = market_.positions.find(*order.linked_position_id);
    if (position == nullptr) {
      return ErrorCode::kPositionNotFound;
    }
  }
  if (order.reduce_only && (position == nullptr || position->side == order.side)) {
    return ErrorCode::kInvalidLinkedPosition;
  }

  if (!order.reduce_only) {
    if (!ctx_.pool.is_active() || !ctx_.pool.is_token_active(order.collateral_token)) {
      return ErrorCode::kPoolInactive;
    }
    const auto needed = reserve_for(order.size, order.size_decimal, ctx_.trading_price, ctx_.collateral_decimal,
                                    ctx_.collateral_price);
    if (needed > ctx_.pool.available_reserve(order.collateral_token)) {
      return ErrorCode::kInsufficientPoolReserve;
    }
    if (position == nullptr &&
        common::saturating_add(market_.position_size(order.side), order.size) > market_.open_interest_cap(order.side)) {
      return ErrorCode::kOpenInterestExceeded;
    }
  }

  const auto size = fill_size(order);
  const auto fee = fees::trading_fee_amount(size, order.size_decimal, ctx_.trading_price,
                                            ledger_.fee_rate(order.side, size), ctx_.collateral_decimal,
                                            ctx_.collateral_price);
  const auto order_value = ledger_.order_collateral_value(order);
  bool covered = false;
  if (position == nullptr) {
    covered = fees::can_cover_fee_when_adding(order_value, 0, fee);
  } else if (position->side == order.side) {
    covered = fees::can_cover_fee_when_adding(order_value, ledger_.collateral_value(*position), fee);
  } else {
    covered = fees::can_cover_fee_when_reducing(order_value, ledger_.collateral_value(*position),
                                                ledger_.unrealized_profit(*position, size), fee);
  }
  if (!covered) {
    return ErrorCode::kInsufficientCollateral;
  }
  return std::nullopt;
}

FillOutcome OrderEngine::fill(TradingOrder order, std::uint64_t& fee_mbp) {
  fee_mbp = ledger_.fee_rate(order.side, fill_size(order));
  order.filled_price = ctx_.trading_price.price;
  return ledger_.order_filled(order, fee_mbp);
}

}  // namespace market
}  // namespace perpcore
