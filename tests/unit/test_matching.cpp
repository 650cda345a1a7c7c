#include "test_matching.hpp"

#include <cassert>
#include <map>
#include <variant>
#include <vector>

#include "perpcore/events/events.hpp"
#include "perpcore/market/order_engine.hpp"
#include "perpcore/market/symbol_market.hpp"
#include "perpcore/market/trading_context.hpp"
#include "perpcore/vault/option_vault.hpp"
#include "perpcore/vault/receipt_escrow.hpp"
#include "test_desk.hpp"

namespace perpcore::tests {

namespace {

void assert_counters_match(const TestDesk& desk) {
  const auto& symbol = desk.symbol();
  assert(symbol.info.user_long_order_size == symbol.book.resting_size(common::Side::kLong));
  assert(symbol.info.user_short_order_size == symbol.book.resting_size(common::Side::kShort));
}

common::OrderId rest_long(TestDesk& desk, common::AccountId user, std::uint64_t size) {
  return desk.engine
      .create_trading_order(user, desk.key,
                            registry::TokenOrderRequest{
                                .side = common::Side::kLong,
                                .size = size,
                                .trigger_price = 95,
                                .collateral_token = kUsdc,
                                .collateral_amount = 50 * kUsdcUnit,
                            },
                            desk.prices(), desk.now)
      .value.order_id;
}

market::MatchOutcome match_at(TestDesk& desk, market::OrderBucket bucket, std::uint64_t price, std::size_t budget) {
  return desk.engine.match_trading_orders(kOperator, desk.key, bucket, price, kUsdc, budget, desk.prices(), desk.now)
      .value;
}

std::vector<common::OrderId> long_level(const TestDesk& desk) {
  return desk.symbol().book.level_ids(market::OrderBucket::kTokenLongLimit, 95);
}

}  // namespace

void test_linked_orders_share_a_level() {
  TestDesk desk;
  const auto id = *desk.open(kAlice, common::Side::kLong, 10, 200 * kUsdcUnit).value.position_id;

  auto take_profit = [&] {
    return desk.engine
        .create_trading_order(kAlice, desk.key,
                              registry::TokenOrderRequest{
                                  .side = common::Side::kShort,
                                  .size = 10,
                                  .trigger_price = 110,
                                  .reduce_only = true,
                                  .linked_position_id = id,
                                  .collateral_token = kUsdc,
                              },
                              desk.prices(), desk.now)
        .value.order_id;
  };
  const auto older = take_profit();
  const auto newer = take_profit();
  assert(desk.engine.position(desk.key, id).linked_orders.size() == 2);
  assert(desk.symbol().info.user_short_order_size == 20);
  assert_counters_match(desk);

  // The newer order closes the whole position, which cancels its sibling out of
  // the level being matched.
  desk.set_price(110);
  [[maybe_unused]] const auto before = desk.sink.drain();
  const auto outcome = match_at(desk, market::OrderBucket::kTokenShortLimit, 110, 8);
  assert(outcome.processed == 1);
  assert(outcome.filled == 1);
  assert(outcome.released == 0);
  assert(!desk.symbol().positions.contains(id));
  assert(desk.symbol().book.order_count() == 0);
  assert(desk.symbol().info.user_short_order_size == 0);
  assert_counters_match(desk);

  bool newer_filled = false;
  bool older_canceled = false;
  for (const auto& entry : desk.sink.drain()) {
    if (const auto* filled = std::get_if<events::OrderFilled>(&entry.event)) {
      newer_filled = newer_filled || filled->order_id == newer;
    }
    if (const auto* canceled = std::get_if<events::OrderCanceled>(&entry.event)) {
      older_canceled = older_canceled || (canceled->order_id == older &&
                                          canceled->reason == events::CancelReason::kLinkedPositionClosed);
    }
  }
  assert(newer_filled);
  assert(older_canceled);

  // The level is clean for whoever matches it next.
  assert(match_at(desk, market::OrderBucket::kTokenShortLimit, 110, 8).processed == 0);
}

void test_match_level_order() {
  TestDesk desk;
  const auto a = rest_long(desk, kAlice, 1);
  const auto b = rest_long(desk, kBob, 2);
  const auto c = rest_long(desk, kAlice, 3);
  const auto d = rest_long(desk, kBob, 4);
  assert((long_level(desk) == std::vector<common::OrderId>{a, b, c, d}));
  assert(desk.symbol().info.user_long_order_size == 10);
  assert_counters_match(desk);

  const auto hedge = desk.engine
                         .create_trading_order(kBob, desk.key,
                                               registry::TokenOrderRequest{
                                                   .side = common::Side::kShort,
                                                   .size = 2,
                                                   .trigger_price = 105,
                                                   .collateral_token = kUsdc,
                                                   .collateral_amount = 50 * kUsdcUnit,
                                               },
                                               desk.prices(), desk.now)
                         .value.order_id;
  assert(desk.symbol().info.user_short_order_size == 2);
  assert_counters_match(desk);
  desk.engine.cancel_trading_order(kBob, desk.key, 105, hedge, desk.now);
  assert(desk.symbol().info.user_short_order_size == 0);
  assert_counters_match(desk);

  // Nothing is triggered at 100: every order is looked at and stays put.
  auto outcome = match_at(desk, market::OrderBucket::kTokenLongLimit, 95, 8);
  assert(outcome.processed == 4);
  assert(outcome.requeued == 4);
  assert(outcome.filled == 0);
  assert((long_level(desk) == std::vector<common::OrderId>{a, b, c, d}));
  assert_counters_match(desk);

  // Newest first, and a small budget leaves the rest of the level alone.
  desk.set_price(95);
  outcome = match_at(desk, market::OrderBucket::kTokenLongLimit, 95, 1);
  assert(outcome.processed == 1);
  assert(outcome.filled == 1);
  assert((long_level(desk) == std::vector<common::OrderId>{a, b, c}));
  assert(desk.symbol().position_size(common::Side::kLong) == 4);
  assert(desk.symbol().info.user_long_order_size == 6);
  assert_counters_match(desk);

  // Leave 150 USDC of reserve: enough for a (95) but not for b (190) or c (285).
  const auto state = desk.usdc_state();
  desk.engine.withdraw_liquidity(kAdmin, kLp, kUsdc,
                                 state.liquidity_amount - state.reserved_amount - 150 * kUsdcUnit);

  outcome = match_at(desk, market::OrderBucket::kTokenLongLimit, 95, 2);
  assert(outcome.processed == 2);
  assert(outcome.requeued == 2);
  assert(outcome.filled == 0);
  assert((long_level(desk) == std::vector<common::OrderId>{a, b, c}));
  assert_counters_match(desk);

  // Blocked orders go behind the one they were skipped over for.
  outcome = match_at(desk, market::OrderBucket::kTokenLongLimit, 95, 8);
  assert(outcome.processed == 3);
  assert(outcome.requeued == 2);
  assert(outcome.filled == 1);
  assert((long_level(desk) == std::vector<common::OrderId>{b, c}));
  assert(desk.symbol().position_size(common::Side::kLong) == 5);
  assert_counters_match(desk);

  desk.engine.deposit_liquidity(kAdmin, kLp, kUsdc, 1'000 * kUsdcUnit);
  outcome = match_at(desk, market::OrderBucket::kTokenLongLimit, 95, 8);
  assert(outcome.processed == 2);
  assert(outcome.filled == 2);
  assert(long_level(desk).empty());
  assert(desk.symbol().book.order_count() == 0);
  assert(desk.symbol().position_size(common::Side::kLong) == 10);
  assert(desk.symbol().info.user_long_order_size == 0);
  assert_counters_match(desk);
}

void test_orphaned_linked_order_released() {
  market::SymbolMarket symbol{.base_token = kBtc, .config = test_market_config()};
  // Linked to a position this symbol never had.
  symbol.add_resting(market::TradingOrder{
      .id = 7,
      .user = kAlice,
      .side = common::Side::kShort,
      .size = 5,
      .trigger_price = 110,
      .collateral_token = kUsdc,
      .collateral_amount = 20 * kUsdcUnit,
      .linked_position_id = 42,
  });
  symbol.add_resting(market::TradingOrder{
      .id = 8,
      .user = kBob,
      .side = common::Side::kShort,
      .size = 3,
      .trigger_price = 110,
      .collateral_token = kUsdc,
      .collateral_amount = 20 * kUsdcUnit,
  });
  assert(symbol.info.user_short_order_size == 8);

  pool::LiquidityPool backing(kLp);
  backing.add_token(pool::TokenConfig{.token = kUsdc, .decimal = 6, .oracle_id = kUsdcOracle}, kStart);
  backing.deposit_liquidity(kUsdc, kPoolLiquidity);
  vault::OptionVaults vaults;
  vault::ReceiptEscrow escrow;
  std::map<common::TokenType, std::uint64_t> protocol_fees;
  events::EventBuffer buffer;
  std::vector<common::Payout> payouts;
  market::TradingContext ctx{
      .pool = backing,
      .vaults = vaults,
      .escrow = escrow,
      .protocol_fees = protocol_fees,
      .events = buffer,
      .payouts = payouts,
      .market = 1,
      .symbol = kBtc,
      .now_ms = kStart,
      .trading_price = {.price = 100, .decimal = 0},
      .collateral_token = kUsdc,
      .collateral_decimal = 6,
      .collateral_price = {.price = 1, .decimal = 0},
  };

  // Below the trigger, Bob's order waits while the orphan is released anyway.
  market::OrderEngine engine(symbol, ctx);
  const auto outcome = engine.match(market::OrderBucket::kTokenShortLimit, 110, 8);
  assert(outcome.processed == 2);
  assert(outcome.released == 1);
  assert(outcome.requeued == 1);
  assert(outcome.filled == 0);
  assert((symbol.book.level_ids(market::OrderBucket::kTokenShortLimit, 110) == std::vector<common::OrderId>{8}));
  assert(symbol.info.user_short_order_size == 3);
  assert(symbol.info.user_short_order_size == symbol.book.resting_size(common::Side::kShort));

  assert(payouts.size() == 1);
  assert(payouts[0].user == kAlice);
  assert(payouts[0].amount == 20 * kUsdcUnit);
  assert(buffer.size() == 1);
  const auto* canceled = std::get_if<events::OrderCanceled>(&buffer.events()[0]);
  assert(canceled != nullptr);
  assert(canceled->order_id == 7);
  assert(canceled->reason == events::CancelReason::kLinkedPositionMissing);
}

}  // namespace perpcore::tests
