#include "test_funding.hpp"

#include <cassert>
#include <variant>

#include "perpcore/common/fixed_point.hpp"
#include "perpcore/funding/funding_engine.hpp"
#include "perpcore/market/position_math.hpp"
#include "test_desk.hpp"

namespace perpcore::tests {

namespace {

// Collateral units owed on `notional_usd` for an index move of `delta`.
std::uint64_t funding_amount(std::uint64_t notional_usd, std::uint64_t delta) {
  return common::usd_to_amount(common::mul_div(notional_usd, delta, common::kRateScale), 6, 1, 0);
}

}  // namespace

void test_funding_accrual() {
  TestDesk desk;
  const auto id = *desk.open(kAlice, common::Side::kLong, 10, 200 * kUsdcUnit).value.position_id;

  assert(!desk.engine.update_funding_rate(desk.key, desk.btc, desk.now).updated);

  desk.advance(kHourMs);
  const auto increment =
      funding::FundingEngine::funding_increment(1'000'000, 1'000'000'000'000, desk.engine.pool(kLp).tvl_usd(), 1);
  assert(increment > 0);

  const auto update = desk.engine.update_funding_rate(desk.key, desk.btc, desk.now);
  assert(update.updated);
  assert(update.intervals == 1);
  assert(update.previous_index.is_zero());
  assert(update.index == common::SignedAmount::positive(increment));
  assert(desk.symbol().info.funding.last_funding_ts == kStart + kHourMs);
  assert(!desk.engine.update_funding_rate(desk.key, desk.btc, desk.now).updated);

  // The long side dominated, so the long pays on its way out.
  const auto owed = funding_amount(1'000'000'000'000, increment);
  assert(owed > 0);
  [[maybe_unused]] const auto before = desk.sink.drain();
  const auto closed = desk.engine.close_position(kAlice, desk.key, id, desk.prices(), desk.now);
  assert(closed.payouts.size() == 1);
  assert(closed.payouts[0].amount == 198 * kUsdcUnit - owed);

  const auto published = desk.sink.drain();
  const auto& filled = std::get<events::OrderFilled>(published.back().event);
  assert(filled.funding_paid == common::SignedAmount::positive(owed));

  // Two idle intervals are applied at once.
  desk.advance(2 * kHourMs);
  assert(desk.engine.update_funding_rate(desk.key, desk.btc, desk.now).intervals == 2);
}

void test_funding_sign_flip() {
  TestDesk desk;
  const auto short_id = *desk.open(kAlice, common::Side::kShort, 10, 200 * kUsdcUnit).value.position_id;
  const auto long_id = *desk.open(kBob, common::Side::kLong, 4, 100 * kUsdcUnit).value.position_id;

  desk.advance(kHourMs);
  const auto increment =
      funding::FundingEngine::funding_increment(1'000'000, 600'000'000'000, desk.engine.pool(kLp).tvl_usd(), 1);
  const auto update = desk.engine.update_funding_rate(desk.key, desk.btc, desk.now);
  assert(update.index == common::SignedAmount::negative(increment));

  // Shorts dominate: the long collects, the short pays.
  const auto received = funding_amount(400'000'000'000, increment);
  const auto bob = desk.engine.close_position(kBob, desk.key, long_id, desk.prices(), desk.now);
  assert(bob.payouts[0].amount == 100 * kUsdcUnit - 800'000 + received);

  const auto paid = funding_amount(1'000'000'000'000, increment);
  const auto alice = desk.engine.close_position(kAlice, desk.key, short_id, desk.prices(), desk.now);
  assert(alice.payouts[0].amount == 198 * kUsdcUnit - paid);

  const market::Position sample{.side = common::Side::kLong, .size = 4, .size_decimal = 0};
  assert(market::funding_owed_usd(sample, common::SignedAmount::negative(500), {.price = 100, .decimal = 0}) ==
         common::SignedAmount::negative(200'000));
  assert(funding::FundingEngine::funding_increment(1'000'000, 600, 0, 1) == 0);
}

}  // namespace perpcore::tests
