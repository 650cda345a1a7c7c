#include "test_registry.hpp"

#include <cassert>
#include <stdexcept>
#include <type_traits>

#include "perpcore/registry/transaction.hpp"
#include "perpcore/telemetry/telemetry_sink.hpp"
#include "test_desk.hpp"

namespace perpcore::tests {

namespace {

template <typename Fn>
bool publish_failed(Fn&& fn) {
  try {
    fn();
  } catch (const std::runtime_error&) {
    return true;
  }
  return false;
}

}  // namespace

void test_failed_operation_is_atomic() {
  TestDesk desk;
  telemetry::TelemetrySink telemetry;
  desk.engine.attach_telemetry(&telemetry);
  desk.engine.custody().open_account(kAlice);

  const auto id = *desk.open(kAlice, common::Side::kLong, 10, 200 * kUsdcUnit).value.position_id;
  const auto published = desk.sink.size();
  const auto pool_before = desk.usdc_state();
  const auto position_before = desk.engine.position(desk.key, id);

  // The collateral has already left the position when the leverage check fails.
  assert(thrown([&] {
           desk.engine.release_collateral(kAlice, desk.key, id, 100 * kUsdcUnit, desk.prices(), desk.now);
         }) == common::ErrorCode::kLeverageExceeded);

  const auto& position = desk.engine.position(desk.key, id);
  assert(position.collateral_amount == position_before.collateral_amount);
  assert(position.reserve_amount == position_before.reserve_amount);
  assert(desk.usdc_state().collateral_amount == pool_before.collateral_amount);
  assert(desk.usdc_state().liquidity_amount == pool_before.liquidity_amount);
  assert(desk.usdc_state().reserved_amount == pool_before.reserved_amount);
  assert(desk.engine.custody().balance(kAlice, kUsdc) == 0);
  assert(desk.sink.size() == published);
  assert(telemetry.total(telemetry::Metric::kOperationsReverted) == 1);
  assert(telemetry.total(telemetry::Metric::kOrdersFilled) == 1);

  // A release within limits still goes through afterwards.
  desk.engine.release_collateral(kAlice, desk.key, id, 50 * kUsdcUnit, desk.prices(), desk.now);
  assert(desk.engine.custody().balance(kAlice, kUsdc) == 50 * kUsdcUnit);
  assert(desk.sink.size() == published + 1);
}

void test_authorization() {
  TestDesk desk;

  assert(thrown([&] { desk.engine.create_market(kAlice, kLp, "0x2::eur::EUR", 0); }) ==
         common::ErrorCode::kUnauthorized);
  assert(thrown([&] { desk.engine.grant_role(kAlice, kAlice, auth::Role::kAdmin); }) ==
         common::ErrorCode::kUnauthorized);
  assert(thrown([&] {
           desk.engine.add_symbol(kOperator, desk.key.market, "0x2::eth::ETH", 0, test_market_config(), desk.now);
         }) == common::ErrorCode::kUnauthorized);
  assert(thrown([&] { desk.engine.cancel_orders_by_open_interest(kAlice, desk.key, 0, 16, desk.now); }) ==
         common::ErrorCode::kUnauthorized);
  assert(thrown([&] { desk.engine.set_symbol_active(kOperator, desk.key, false); }) ==
         common::ErrorCode::kUnauthorized);

  desk.engine.grant_role(kAdmin, kBob, auth::Role::kOperator);
  assert(desk.engine.access().has_role(kBob, auth::Role::kOperator));
  assert(!desk.engine.access().has_role(kBob, auth::Role::kAdmin));
  assert(desk.engine.settle_unsettled_receipts(kBob, 0, 4, desk.now).value.settled == 0);

  desk.engine.revoke_role(kAdmin, kBob, auth::Role::kOperator);
  assert(thrown([&] { desk.engine.settle_unsettled_receipts(kBob, 0, 4, desk.now); }) ==
         common::ErrorCode::kUnauthorized);
}

void test_admin_validation() {
  TestDesk desk;

  assert(thrown([&] { desk.engine.create_market(kAdmin, kLp, kQuote, 0); }) == common::ErrorCode::kInvalidConfig);
  assert(thrown([&] { desk.engine.create_market(kAdmin, "0x2::nope::LP", kQuote, 0); }) ==
         common::ErrorCode::kInvalidConfig);
  assert(thrown([&] { desk.engine.add_symbol(kAdmin, desk.key.market, kBtc, 0, test_market_config(), desk.now); }) ==
         common::ErrorCode::kSymbolAlreadyExists);
  assert(thrown([&] { desk.engine.add_symbol(kAdmin, 99, kBtc, 0, test_market_config(), desk.now); }) ==
         common::ErrorCode::kMarketNotFound);
  assert(thrown([&] { [[maybe_unused]] const auto& missing = desk.engine.symbol({desk.key.market, "0x2::eth::ETH"}); }) ==
         common::ErrorCode::kSymbolNotFound);

  auto bad = test_market_config();
  bad.lot_size = 0;
  assert(thrown([&] { desk.engine.add_symbol(kAdmin, desk.key.market, "0x2::eth::ETH", 0, bad, desk.now); }) ==
         common::ErrorCode::kInvalidConfig);
  bad = test_market_config();
  bad.trading_fee.max_fee_mbp = bad.trading_fee.base_fee_mbp - 1;
  assert(thrown([&] { desk.engine.update_market_config(kAdmin, desk.key, bad); }) ==
         common::ErrorCode::kInvalidConfig);

  desk.engine.set_market_active(kAdmin, desk.key.market, false);
  assert(thrown([&] { desk.open(kAlice, common::Side::kLong, 10, 200 * kUsdcUnit); }) ==
         common::ErrorCode::kMarketInactive);
  desk.engine.set_market_active(kAdmin, desk.key.market, true);

  desk.engine.set_pool_active(kAdmin, kLp, false);
  assert(thrown([&] { desk.open(kAlice, common::Side::kLong, 10, 200 * kUsdcUnit); }) ==
         common::ErrorCode::kPoolInactive);
  desk.engine.set_pool_active(kAdmin, kLp, true);

  const auto withdrawn = desk.engine.withdraw_liquidity(kAdmin, kLp, kUsdc, 1'000 * kUsdcUnit);
  assert(withdrawn.value == 1'000 * kUsdcUnit);
  assert(desk.usdc_state().liquidity_amount == kPoolLiquidity - 1'000 * kUsdcUnit);
  assert(thrown([&] { desk.engine.withdraw_liquidity(kAdmin, kLp, kUsdc, kPoolLiquidity); }) ==
         common::ErrorCode::kInsufficientLiquidity);
}

void test_open_interest_cleanup() {
  TestDesk desk;
  desk.engine.create_trading_order(kAlice, desk.key,
                                   registry::TokenOrderRequest{
                                       .side = common::Side::kLong,
                                       .size = 10,
                                       .trigger_price = 90,
                                       .collateral_token = kUsdc,
                                       .collateral_amount = 200 * kUsdcUnit,
                                   },
                                   desk.prices(), desk.now);
  desk.engine.create_trading_order(kBob, desk.key,
                                   registry::TokenOrderRequest{
                                       .side = common::Side::kShort,
                                       .size = 4,
                                       .trigger_price = 110,
                                       .collateral_token = kUsdc,
                                       .collateral_amount = 100 * kUsdcUnit,
                                   },
                                   desk.prices(), desk.now);

  auto tighter = test_market_config();
  tighter.max_long_open_interest = 5;
  desk.engine.update_market_config(kAdmin, desk.key, tighter);

  // Only the long order no longer fits; the feed is not consulted.
  desk.now += 10 * kHourMs;
  const auto canceled = desk.engine.cancel_orders_by_open_interest(kOperator, desk.key, 0, 16, desk.now);
  assert(canceled.value.canceled == 1);
  assert(canceled.value.done);
  assert(canceled.payouts.size() == 1);
  assert(canceled.payouts[0].user == kAlice);
  assert(canceled.payouts[0].amount == 200 * kUsdcUnit);
  assert(desk.symbol().info.user_long_order_size == 0);
  assert(desk.symbol().info.user_short_order_size == 4);
}

void test_open_interest_sweep_resumes() {
  TestDesk desk;
  const auto id = *desk.open(kAlice, common::Side::kShort, 10, 200 * kUsdcUnit).value.position_id;
  // Linked orders are never swept, but they still sit ahead of Bob's order.
  const auto take_profit = desk.engine
                               .create_trading_order(kAlice, desk.key,
                                                     registry::TokenOrderRequest{
                                                         .side = common::Side::kLong,
                                                         .size = 10,
                                                         .trigger_price = 90,
                                                         .reduce_only = true,
                                                         .linked_position_id = id,
                                                         .collateral_token = kUsdc,
                                                     },
                                                     desk.prices(), desk.now)
                               .value.order_id;
  const auto oversized = desk.engine
                             .create_trading_order(kBob, desk.key,
                                                   registry::TokenOrderRequest{
                                                       .side = common::Side::kLong,
                                                       .size = 100,
                                                       .trigger_price = 95,
                                                       .collateral_token = kUsdc,
                                                       .collateral_amount = 2'000 * kUsdcUnit,
                                                   },
                                                   desk.prices(), desk.now)
                             .value.order_id;

  auto tighter = test_market_config();
  tighter.max_long_open_interest = 50;
  desk.engine.update_market_config(kAdmin, desk.key, tighter);

  std::size_t cursor = 0;
  std::size_t calls = 0;
  std::size_t canceled = 0;
  bool done = false;
  while (!done) {
    const auto sweep = desk.engine.cancel_orders_by_open_interest(kOperator, desk.key, cursor, 1, desk.now).value;
    assert(sweep.inspected == 1);
    canceled += sweep.canceled;
    cursor = sweep.next_cursor;
    done = sweep.done;
    assert(++calls <= 2);
  }
  assert(canceled == 1);
  assert(desk.symbol().book.find(95, oversized) == nullptr);
  assert(desk.symbol().book.find(90, take_profit) != nullptr);
  assert(desk.symbol().info.user_long_order_size == 10);
  assert(desk.symbol().info.user_long_order_size == desk.symbol().book.resting_size(common::Side::kLong));

  // A cursor past the end finishes at once.
  const auto past = desk.engine.cancel_orders_by_open_interest(kOperator, desk.key, 5, 1, desk.now).value;
  assert(past.inspected == 0);
  assert(past.done);
  assert(past.next_cursor == 0);
}

void test_admin_publish_failure() {
  TestDesk desk;
  const auto market_index = desk.key.market;
  desk.engine.update_protocol_fee_share(kAdmin, market_index, 5'000);
  desk.open(kAlice, common::Side::kLong, 10, 200 * kUsdcUnit);
  assert(desk.engine.market(market_index).protocol_fees.at(kUsdc) == 500'000);

  const auto published = desk.sink.size();
  const auto liquidity = desk.usdc_state().liquidity_amount;
  const auto positions = desk.symbol().positions.size();
  desk.sink.failing = true;

  assert(publish_failed([&] { desk.engine.withdraw_protocol_fees(kAdmin, market_index, kUsdc); }));
  assert(desk.engine.market(market_index).protocol_fees.at(kUsdc) == 500'000);

  assert(publish_failed([&] { desk.engine.withdraw_liquidity(kAdmin, kLp, kUsdc, 1'000 * kUsdcUnit); }));
  assert(desk.usdc_state().liquidity_amount == liquidity);

  assert(publish_failed([&] { desk.engine.set_market_active(kAdmin, market_index, false); }));
  assert(desk.engine.market(market_index).active);

  assert(publish_failed([&] { desk.engine.grant_role(kAdmin, kBob, auth::Role::kOperator); }));
  assert(!desk.engine.access().has_role(kBob, auth::Role::kOperator));

  assert(publish_failed([&] {
    desk.engine.add_symbol(kAdmin, market_index, "0x2::eth::ETH", 0, test_market_config(), desk.now);
  }));
  assert(desk.engine.market(market_index).symbols.size() == 1);

  assert(publish_failed([&] { desk.engine.create_market(kAdmin, kLp, "0x2::eur::EUR", 0); }));
  assert(desk.engine.markets().size() == 1);

  assert(publish_failed([&] { desk.open(kBob, common::Side::kLong, 10, 200 * kUsdcUnit); }));
  assert(desk.symbol().positions.size() == positions);
  assert(desk.sink.size() == published);

  desk.sink.failing = false;
  const auto withdrawn = desk.engine.withdraw_protocol_fees(kAdmin, market_index, kUsdc);
  assert(withdrawn.value == 500'000);
  assert(withdrawn.payouts.size() == 1);
  assert(withdrawn.payouts[0].user == kAdmin);
  assert(desk.engine.market(market_index).protocol_fees.count(kUsdc) == 0);
  assert(desk.sink.size() == published + 1);

  // The failed create did not use up a market index.
  const auto index = desk.engine.create_market(kAdmin, kLp, "0x2::eur::EUR", 0);
  assert(index == market_index + 1);
}

void test_transaction_restore() {
  static_assert(std::is_nothrow_move_assignable_v<market::SymbolMarket>);
  static_assert(std::is_nothrow_destructible_v<registry::Transaction>);

  market::SymbolMarket symbol{.base_token = kBtc, .config = test_market_config()};
  auto resting = [](common::OrderId id) {
    return market::TradingOrder{
        .id = id,
        .user = kAlice,
        .side = common::Side::kLong,
        .size = 3,
        .trigger_price = 90,
        .collateral_token = kUsdc,
    };
  };
  symbol.add_resting(resting(1));

  {
    registry::Transaction tx;
    tx.track(symbol);
    symbol.add_resting(resting(2));
    symbol.info.active = false;
  }
  assert(symbol.book.order_count() == 1);
  assert(symbol.info.user_long_order_size == 3);
  assert(symbol.info.active);

  {
    registry::Transaction tx;
    tx.track(symbol);
    symbol.add_resting(resting(2));
    tx.commit();
    assert(tx.committed());
  }
  assert(symbol.book.order_count() == 2);
  assert(symbol.info.user_long_order_size == 6);
}

void test_custody_routing() {
  TestDesk desk;
  desk.engine.custody().open_account(kAlice);

  const auto id = *desk.open(kAlice, common::Side::kLong, 10, 200 * kUsdcUnit).value.position_id;
  const auto closed = desk.engine.close_position(kAlice, desk.key, id, desk.prices(), desk.now);
  assert(closed.payouts.empty());
  assert(desk.engine.custody().balance(kAlice, kUsdc) == 198 * kUsdcUnit);

  desk.engine.custody().withdraw(kAlice, kUsdc, 98 * kUsdcUnit);
  assert(desk.engine.custody().balance(kAlice, kUsdc) == 100 * kUsdcUnit);
  assert(thrown([&] { desk.engine.custody().withdraw(kAlice, kUsdc, 101 * kUsdcUnit); }) ==
         common::ErrorCode::kInsufficientBalance);
  assert(thrown([&] { desk.engine.custody().deposit(kBob, kUsdc, 1); }) == common::ErrorCode::kUnauthorized);
}

}  // namespace perpcore::tests
