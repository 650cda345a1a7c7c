#include "perpcore/liquidation/liquidation_engine.hpp"

#include <algorithm>
#include <string>

#include "perpcore/common/error.hpp"
#include "perpcore/common/fixed_point.hpp"
#include "perpcore/market/position_math.hpp"

namespace perpcore {
namespace liquidation {

using common::ErrorCode;

bool LiquidationEngine::is_liquidatable(const market::Position& position) const {
  return ledger_.health(position).liquidated;
}

LiquidationResult LiquidationEngine::liquidate(common::PositionId id, common::AccountId liquidator) {
  const auto* position = market_.positions.find(id);
  if (position == nullptr) {
    throw common::EngineError(ErrorCode::kPositionNotFound, std::to_string(id));
  }
  common::ensure(position->collateral_token == ctx_.collateral_token, ErrorCode::kCollateralTokenMismatch);
  common::ensure(is_liquidatable(*position), ErrorCode::kPositionHealthy);

  const auto notional = market::notional_usd(position->size, position->size_decimal, ctx_.trading_price);
  const auto fee_due = market::usd_in_collateral(common::apply_bp(notional, kLiquidatorFeeBp),
                                                 position->collateral_decimal, ctx_.collateral_price);

  const auto removed = ledger_.detach(id);
  const auto& token = removed.collateral_token;
  LiquidationResult result{.position_id = id};

  if (!removed.option_collateral) {
    result.collateral_seized = removed.collateral_amount;
    result.liquidator_fee = std::min(fee_due, removed.collateral_amount);
    result.pool_share = removed.collateral_amount - result.liquidator_fee;
    ctx_.pool.request_collateral(token, result.liquidator_fee);
    ctx_.pay(liquidator, token, result.liquidator_fee);
    ctx_.pool.realize_from_collateral(token, result.pool_share);
  } else {
    std::vector<common::BidReceipt> expired;
    std::vector<common::BidReceipt> live;
    for (const auto& receipt : removed.option_collateral->receipts) {
      (ctx_.vaults.is_expired(receipt, ctx_.now_ms) ? expired : live).push_back(receipt);
    }
    const auto proceeds = expired.empty() ? 0 : ctx_.vaults.exercise(expired, ctx_.now_ms);
    result.collateral_seized = proceeds;
    result.liquidator_fee = std::min(fee_due, proceeds);
    result.pool_share = proceeds - result.liquidator_fee;
    ctx_.pay(liquidator, token, result.liquidator_fee);
    ctx_.pool.receive(token, result.pool_share);

    if (!live.empty()) {
      const auto receipt_count = static_cast<std::uint32_t>(live.size());
      const auto fee_owed = fee_due - result.liquidator_fee;
      const auto pool_owed = common::saturating_sub(removed.unsettled_cost, result.pool_share);
      result.escrow_id = ctx_.escrow.add(vault::UnsettledReceipt{
          .market = ctx_.market,
          .symbol = ctx_.symbol,
          .position_id = removed.id,
          .user = removed.user,
          .collateral_token = token,
          .vault_index = removed.option_collateral->vault_index,
          .receipts = std::move(live),
          .liquidator = liquidator,
          .liquidator_fee_owed = fee_owed,
          .pool_owed = pool_owed,
          .residual_to_user = false,
      });
      ctx_.events.emit(events::ReceiptsEscrowed{
          .escrow_id = *result.escrow_id,
          .market = ctx_.market,
          .symbol = ctx_.symbol,
          .position_id = removed.id,
          .user = removed.user,
          .receipt_count = receipt_count,
          .liquidator_fee_owed = fee_owed,
          .pool_owed = pool_owed,
      });
    }
  }

  ctx_.events.emit(events::PositionLiquidated{
      .market = ctx_.market,
      .symbol = ctx_.symbol,
      .position_id = removed.id,
      .user = removed.user,
      .liquidator = liquidator,
      .side = removed.side,
      .size = removed.size,
      .price = ctx_.trading_price.price,
      .collateral_seized = result.collateral_seized,
      .liquidator_fee = result.liquidator_fee,
      .pool_share = result.pool_share,
      .escrow_id = result.escrow_id.value_or(0),
  });
  return result;
}

LiquidationInfo LiquidationEngine::get_liquidation_info(bool include_all, std::size_t cursor,
                                                        std::size_t budget) const {
  LiquidationInfo info;
  const auto total = market_.positions.size();
  const auto end = std::min(total, cursor + std::min(budget, total));
  for (auto slot = cursor; slot < end; ++slot) {
    const auto& position = market_.positions.slot(slot);
    if (position.collateral_token != ctx_.collateral_token) {
      continue;
    }
    if (include_all || is_liquidatable(position)) {
      info.position_ids.push_back(position.id);
    }
  }
  info.next_cursor = std::max(cursor, end);
  info.done = info.next_cursor >= total;
  return info;
}

SettleResult settle_unsettled_receipts(vault::ReceiptEscrow& escrow, vault::OptionVaults& vaults,
                                       const PoolResolver& pools, events::EventBuffer& events,
                                       std::vector<common::Payout>& payouts, common::TimestampMs now_ms,
                                       std::uint64_t cursor, std::size_t budget) {
  SettleResult result;
  std::vector<std::uint64_t> ready;
  const auto& records = escrow.records();
  auto it = records.lower_bound(cursor);
  for (; it != records.end() && result.inspected < budget; ++it) {
    const auto& [id, record] = *it;
    ++result.inspected;
    const bool all_expired = std::all_of(record.receipts.begin(), record.receipts.end(),
                                         [&](const common::BidReceipt& receipt) {
                                           return vaults.is_expired(receipt, now_ms);
                                         });
    if (all_expired) {
      ready.push_back(id);
    }
  }
  result.done = it == records.end();
  result.next_cursor = result.done ? 0 : it->first;

  for (const auto id : ready) {
    const auto record = *escrow.find(id);
    auto& pool = pools(record.market);
    auto proceeds = vaults.exercise(record.receipts, now_ms);
    const auto total = proceeds;

    const auto to_liquidator = std::min(record.liquidator_fee_owed, proceeds);
    proceeds -= to_liquidator;
    auto to_pool = std::min(record.pool_owed, proceeds);
    proceeds -= to_pool;
    std::uint64_t to_user = 0;
    if (record.residual_to_user) {
      to_user = proceeds;
    } else {
      to_pool += proceeds;
    }

    if (to_liquidator > 0) {
      payouts.push_back(common::Payout{.user = record.liquidator, .token = record.collateral_token, .amount = to_liquidator});
    }
    if (to_user > 0) {
      payouts.push_back(common::Payout{.user = record.user, .token = record.collateral_token, .amount = to_user});
    }
    pool.receive(record.collateral_token, to_pool);
    escrow.remove(id);
    ++result.settled;

    events.emit(events::ReceiptsSettled{
        .escrow_id = id,
        .market = record.market,
        .symbol = record.symbol,
        .position_id = record.position_id,
        .proceeds = total,
        .to_liquidator = to_liquidator,
        .to_pool = to_pool,
        .to_user = to_user,
    });
  }
  return result;
}

}  // namespace liquidation
}  // namespace perpcore
