#include "test_trading.hpp"

#include <cassert>
#include <variant>
#include <vector>

#include "perpcore/events/events.hpp"
#include "test_desk.hpp"

namespace perpcore::tests {

namespace {

std::vector<events::EventKind> kinds(const std::vector<events::PublishedEvent>& published) {
  std::vector<events::EventKind> result;
  for (const auto& entry : published) {
    result.push_back(events::kind_of(entry.event));
  }
  return result;
}

}  // namespace

void test_open_close_round_trip() {
  TestDesk desk;
  [[maybe_unused]] const auto setup = desk.sink.drain();

  const auto opened = desk.open(kAlice, common::Side::kLong, 10, 200 * kUsdcUnit);
  assert(opened.value.filled);
  assert(opened.value.trading_fee == kUsdcUnit);
  assert(opened.value.fee_mbp == 10'000);
  assert(opened.payouts.empty());

  const auto id = *opened.value.position_id;
  const auto& position = desk.engine.position(desk.key, id);
  assert(position.user == kAlice);
  assert(position.entry_price == 100);
  assert(position.collateral_amount == 199 * kUsdcUnit);
  assert(position.reserve_amount == 1'000 * kUsdcUnit);
  assert(desk.symbol().info.user_long_position_size == 10);
  assert(desk.usdc_state().reserved_amount == 1'000 * kUsdcUnit);
  assert(desk.usdc_state().collateral_amount == 199 * kUsdcUnit);
  assert(desk.usdc_state().liquidity_amount == kPoolLiquidity + kUsdcUnit);
  assert((kinds(desk.sink.drain()) ==
          std::vector<events::EventKind>{events::EventKind::kOrderCreated, events::EventKind::kOrderFilled}));

  // Same price: the trader gets the collateral back less both fees.
  const auto closed = desk.engine.close_position(kAlice, desk.key, id, desk.prices(), desk.now);
  assert(closed.value.filled);
  assert(closed.payouts.size() == 1);
  assert(closed.payouts[0].user == kAlice);
  assert(closed.payouts[0].token == kUsdc);
  assert(closed.payouts[0].amount == 198 * kUsdcUnit);

  assert(desk.symbol().positions.empty());
  assert(desk.symbol().info.user_long_position_size == 0);
  assert(desk.usdc_state().reserved_amount == 0);
  assert(desk.usdc_state().collateral_amount == 0);
  assert(desk.usdc_state().liquidity_amount == kPoolLiquidity + 2 * kUsdcUnit);
  assert(desk.usdc_state().total_trading_fee == 2 * kUsdcUnit);

  const auto published = desk.sink.drain();
  assert(published.size() == 2);
  const auto& filled = std::get<events::OrderFilled>(published[1].event);
  assert(filled.position_closed);
  assert(filled.position_size == 0);
  assert(filled.realized_pnl.is_zero());
  assert(published[0].sequence < published[1].sequence);

  assert(thrown([&] { desk.engine.close_position(kAlice, desk.key, id, desk.prices(), desk.now); }) ==
         common::ErrorCode::kPositionNotFound);
}

void test_close_in_profit() {
  TestDesk desk;
  const auto id = *desk.open(kAlice, common::Side::kLong, 10, 200 * kUsdcUnit).value.position_id;

  desk.set_price(110);
  [[maybe_unused]] const auto before = desk.sink.drain();
  const auto closed = desk.engine.close_position(kAlice, desk.key, id, desk.prices(), desk.now);

  // +$100 of profit, then 0.1% of the $1,100 exit notional.
  assert(closed.payouts.size() == 1);
  assert(closed.payouts[0].amount == 199 * kUsdcUnit + 100 * kUsdcUnit - 1'100'000);
  assert(desk.usdc_state().liquidity_amount == kPoolLiquidity + kUsdcUnit - 100 * kUsdcUnit + 1'100'000);

  const auto published = desk.sink.drain();
  const auto& filled = std::get<events::OrderFilled>(published.back().event);
  assert(filled.realized_pnl == common::SignedAmount::positive(100 * kUsdcUnit));
  assert(filled.fill_price == 110);
}

void test_resting_order_lifecycle() {
  TestDesk desk;
  const auto created = desk.engine.create_trading_order(kAlice, desk.key,
                                                        registry::TokenOrderRequest{
                                                            .side = common::Side::kLong,
                                                            .size = 10,
                                                            .trigger_price = 90,
                                                            .collateral_token = kUsdc,
                                                            .collateral_amount = 200 * kUsdcUnit,
                                                        },
                                                        desk.prices(), desk.now);
  assert(!created.value.filled);
  assert(!created.value.position_id.has_value());
  const auto second = desk.engine.create_trading_order(kAlice, desk.key,
                                                       registry::TokenOrderRequest{
                                                           .side = common::Side::kLong,
                                                           .size = 5,
                                                           .trigger_price = 80,
                                                           .collateral_token = kUsdc,
                                                           .collateral_amount = 100 * kUsdcUnit,
                                                       },
                                                       desk.prices(), desk.now);
  assert(desk.symbol().info.user_long_order_size == 15);
  assert(desk.engine.orders_of(desk.key, kAlice).size() == 2);

  assert(thrown([&] {
           desk.engine.cancel_trading_order(kBob, desk.key, 80, second.value.order_id, desk.now);
         }) == common::ErrorCode::kOrderNotFound);
  assert(thrown([&] {
           desk.engine.cancel_trading_order(kAlice, desk.key, 81, second.value.order_id, desk.now);
         }) == common::ErrorCode::kOrderNotFound);

  const auto canceled = desk.engine.cancel_trading_order(kAlice, desk.key, 80, second.value.order_id, desk.now);
  assert(canceled.value.id == second.value.order_id);
  assert(canceled.payouts.size() == 1);
  assert(canceled.payouts[0].amount == 100 * kUsdcUnit);
  assert(desk.symbol().info.user_long_order_size == 10);

  desk.set_price(95);
  assert(desk.engine.triggered_prices(desk.key, market::OrderBucket::kTokenLongLimit, desk.btc, desk.now).empty());
  desk.set_price(90);
  const auto triggered =
      desk.engine.triggered_prices(desk.key, market::OrderBucket::kTokenLongLimit, desk.btc, desk.now);
  assert((triggered == std::vector<std::uint64_t>{90}));

  assert(thrown([&] {
           desk.engine.match_trading_orders(kAlice, desk.key, market::OrderBucket::kTokenLongLimit, 90, kUsdc, 8,
                                            desk.prices(), desk.now);
         }) == common::ErrorCode::kUnauthorized);

  const auto matched = desk.engine.match_trading_orders(kOperator, desk.key, market::OrderBucket::kTokenLongLimit, 90,
                                                        kUsdc, 8, desk.prices(), desk.now);
  assert(matched.value.processed == 1);
  assert(matched.value.filled == 1);
  assert(matched.value.requeued == 0);
  assert(desk.symbol().info.user_long_order_size == 0);
  assert(desk.symbol().info.user_long_position_size == 10);
  assert(desk.symbol().book.order_count() == 0);

  const auto& position = desk.symbol().positions.slot(0);
  assert(position.entry_price == 90);
  assert(position.collateral_amount == 200 * kUsdcUnit - 900'000);
}

void test_order_validation() {
  TestDesk desk;
  const auto next_order_id = desk.symbol().info.next_order_id;

  assert(thrown([&] { desk.open(kAlice, common::Side::kLong, 0, 200 * kUsdcUnit); }) ==
         common::ErrorCode::kZeroSize);
  // $1,000 on $50 of collateral is 20x.
  assert(thrown([&] { desk.open(kAlice, common::Side::kLong, 10, 50 * kUsdcUnit); }) ==
         common::ErrorCode::kLeverageExceeded);
  assert(thrown([&] { desk.open(kAlice, common::Side::kShort, 2'000, 20'000 * kUsdcUnit); }) ==
         common::ErrorCode::kOpenInterestExceeded);
  assert(thrown([&] {
           desk.engine.create_trading_order(kAlice, desk.key,
                                            registry::TokenOrderRequest{
                                                .side = common::Side::kShort,
                                                .size = 10,
                                                .trigger_price = 100,
                                                .reduce_only = true,
                                                .collateral_token = kUsdc,
                                            },
                                            desk.prices(), desk.now);
         }) == common::ErrorCode::kInvalidLinkedPosition);
  assert(thrown([&] {
           desk.engine.create_trading_order(kAlice, desk.key,
                                            registry::TokenOrderRequest{
                                                .side = common::Side::kLong,
                                                .size = 10,
                                                .trigger_price = 100,
                                                .collateral_token = "0x2::sui::SUI",
                                                .collateral_amount = 200 * kUsdcUnit,
                                            },
                                            desk.prices(), desk.now);
         }) == common::ErrorCode::kTokenNotSupported);

  const registry::PriceSources swapped{.trading = desk.usdc, .collateral = desk.usdc};
  assert(thrown([&] {
           desk.engine.create_trading_order(kAlice, desk.key,
                                            registry::TokenOrderRequest{
                                                .side = common::Side::kLong,
                                                .size = 10,
                                                .trigger_price = 100,
                                                .collateral_token = kUsdc,
                                                .collateral_amount = 200 * kUsdcUnit,
                                            },
                                            swapped, desk.now);
         }) == common::ErrorCode::kOracleMismatch);

  // Nothing above consumed an order id.
  assert(desk.symbol().info.next_order_id == next_order_id);

  // Reduce-only closes stay possible on an inactive symbol.
  const auto id = *desk.open(kAlice, common::Side::kLong, 10, 200 * kUsdcUnit).value.position_id;
  desk.engine.set_symbol_active(kAdmin, desk.key, false);
  assert(thrown([&] { desk.open(kBob, common::Side::kLong, 10, 200 * kUsdcUnit); }) ==
         common::ErrorCode::kSymbolInactive);
  assert(thrown([&] { desk.engine.close_position(kBob, desk.key, id, desk.prices(), desk.now); }) ==
         common::ErrorCode::kNotPositionOwner);
  assert(desk.engine.close_position(kAlice, desk.key, id, desk.prices(), desk.now).value.filled);
  desk.engine.set_symbol_active(kAdmin, desk.key, true);

  // A minute of silence from the feed makes it stale.
  desk.now += 61'000;
  assert(thrown([&] { desk.open(kAlice, common::Side::kLong, 10, 200 * kUsdcUnit); }) ==
         common::ErrorCode::kOracleStale);
}

void test_linked_orders() {
  TestDesk desk;
  const auto id = *desk.open(kAlice, common::Side::kLong, 10, 200 * kUsdcUnit).value.position_id;

  auto take_profit = [&](std::uint64_t size) {
    return desk.engine.create_trading_order(kAlice, desk.key,
                                            registry::TokenOrderRequest{
                                                .side = common::Side::kShort,
                                                .size = size,
                                                .trigger_price = 120,
                                                .reduce_only = true,
                                                .linked_position_id = id,
                                                .collateral_token = kUsdc,
                                            },
                                            desk.prices(), desk.now);
  };
  assert(thrown([&] { take_profit(11); }) == common::ErrorCode::kReduceOnlyExceedsPosition);
  const auto resting = take_profit(10);
  assert(!resting.value.filled);
  assert(desk.engine.position(desk.key, id).linked_orders.size() == 1);
  assert(desk.symbol().info.user_short_order_size == 10);

  // Closing the position takes its resting orders with it.
  [[maybe_unused]] const auto before = desk.sink.drain();
  desk.engine.close_position(kAlice, desk.key, id, desk.prices(), desk.now);
  assert(desk.symbol().book.order_count() == 0);
  assert(desk.symbol().info.user_short_order_size == 0);

  bool linked_cancel = false;
  for (const auto& entry : desk.sink.drain()) {
    if (const auto* canceled = std::get_if<events::OrderCanceled>(&entry.event)) {
      linked_cancel = canceled->order_id == resting.value.order_id &&
                      canceled->reason == events::CancelReason::kLinkedPositionClosed;
    }
  }
  assert(linked_cancel);
}

void test_protocol_fee_share() {
  TestDesk desk;
  desk.engine.update_protocol_fee_share(kAdmin, desk.key.market, 5'000);
  desk.open(kAlice, common::Side::kLong, 10, 200 * kUsdcUnit);

  assert(desk.engine.market(desk.key.market).protocol_fees.at(kUsdc) == 500'000);
  assert(desk.usdc_state().liquidity_amount == kPoolLiquidity + 500'000);

  assert(thrown([&] { desk.engine.withdraw_protocol_fees(kAlice, desk.key.market, kUsdc); }) ==
         common::ErrorCode::kUnauthorized);
  const auto withdrawn = desk.engine.withdraw_protocol_fees(kAdmin, desk.key.market, kUsdc);
  assert(withdrawn.value == 500'000);
  assert(withdrawn.payouts.size() == 1);
  assert(withdrawn.payouts[0].user == kAdmin);
  assert(desk.engine.market(desk.key.market).protocol_fees.count(kUsdc) == 0);
  assert(desk.engine.withdraw_protocol_fees(kAdmin, desk.key.market, kUsdc).value == 0);

  assert(thrown([&] { desk.engine.update_protocol_fee_share(kAdmin, desk.key.market, 10'001); }) ==
         common::ErrorCode::kInvalidConfig);
}

void test_collateral_adjustments() {
  TestDesk desk;
  const auto id = *desk.open(kAlice, common::Side::kLong, 10, 200 * kUsdcUnit).value.position_id;

  desk.engine.increase_collateral(kAlice, desk.key, id, 50 * kUsdcUnit, desk.prices(), desk.now);
  assert(desk.engine.position(desk.key, id).collateral_amount == 249 * kUsdcUnit);
  assert(desk.usdc_state().collateral_amount == 249 * kUsdcUnit);

  const auto released =
      desk.engine.release_collateral(kAlice, desk.key, id, 100 * kUsdcUnit, desk.prices(), desk.now);
  assert(released.payouts.size() == 1);
  assert(released.payouts[0].amount == 100 * kUsdcUnit);
  assert(desk.engine.position(desk.key, id).collateral_amount == 149 * kUsdcUnit);

  assert(thrown([&] {
           desk.engine.increase_collateral(kBob, desk.key, id, kUsdcUnit, desk.prices(), desk.now);
         }) == common::ErrorCode::kNotPositionOwner);
  assert(thrown([&] { desk.engine.increase_collateral(kAlice, desk.key, id, 0, desk.prices(), desk.now); }) ==
         common::ErrorCode::kZeroSize);
  assert(thrown([&] {
           desk.engine.release_collateral(kAlice, desk.key, id, 500 * kUsdcUnit, desk.prices(), desk.now);
         }) == common::ErrorCode::kInsufficientCollateral);
  assert(thrown([&] {
           desk.engine.increase_collateral(kAlice, desk.key, id + 7, kUsdcUnit, desk.prices(), desk.now);
         }) == common::ErrorCode::kPositionNotFound);
}

}  // namespace perpcore::tests
