#include "test_order_book.hpp"

#include <cassert>
#include <vector>

#include "perpcore/market/order_book.hpp"
#include "perpcore/market/position_store.hpp"
#include "test_desk.hpp"

namespace perpcore::tests {

namespace {

market::TradingOrder resting(common::OrderId id, common::AccountId user, common::Side side, bool stop,
                             std::uint64_t trigger_price) {
  return market::TradingOrder{
      .id = id,
      .user = user,
      .side = side,
      .size = 10,
      .trigger_price = trigger_price,
      .is_stop = stop,
      .collateral_token = kUsdc,
      .collateral_amount = 100,
  };
}

}  // namespace

void test_order_book_triggers() {
  market::OrderBook book;
  book.insert(resting(1, kAlice, common::Side::kLong, false, 100));
  book.insert(resting(2, kBob, common::Side::kLong, false, 100));
  book.insert(resting(3, kAlice, common::Side::kLong, false, 95));
  book.insert(resting(4, kAlice, common::Side::kShort, false, 105));
  book.insert(resting(5, kBob, common::Side::kShort, false, 110));
  book.insert(resting(6, kBob, common::Side::kLong, true, 120));

  assert(book.order_count() == 6);
  assert(book.resting_size(common::Side::kLong) == 40);
  assert(book.orders_of(kAlice).size() == 3);

  // Long limits fire once the price falls to them, short limits once it rises.
  assert((book.triggered_prices(market::OrderBucket::kTokenLongLimit, 97) == std::vector<std::uint64_t>{100}));
  assert((book.triggered_prices(market::OrderBucket::kTokenLongLimit, 95) == std::vector<std::uint64_t>{95, 100}));
  assert((book.triggered_prices(market::OrderBucket::kTokenShortLimit, 107) == std::vector<std::uint64_t>{105}));
  assert(book.triggered_prices(market::OrderBucket::kTokenLongStop, 119).empty());
  assert((book.triggered_prices(market::OrderBucket::kTokenLongStop, 121) == std::vector<std::uint64_t>{120}));

  assert(market::bucket_for(market::CollateralMode::kOption, common::Side::kShort, true) ==
         market::OrderBucket::kOptionShortStop);

  const auto removed = book.remove(100, 1);
  assert(removed.has_value());
  assert(removed->bucket == market::OrderBucket::kTokenLongLimit);
  assert(book.find(100, 1) == nullptr);
  assert(book.find(100, 2) != nullptr);
  assert(!book.remove(100, 1).has_value());

  assert((book.level_ids(market::OrderBucket::kTokenLongLimit, 100) == std::vector<common::OrderId>{2}));
  assert(book.level_ids(market::OrderBucket::kTokenLongLimit, 101).empty());
  auto moved = book.remove(100, 2);
  assert(moved.has_value());
  assert(book.bucket(market::OrderBucket::kTokenLongLimit).size() == 1);
  book.requeue(market::OrderBucket::kTokenLongLimit, 100, market::OrderBook::Level{std::move(moved->order)});
  assert(book.find(100, 2) != nullptr);
}

void test_position_store() {
  market::PositionStore store;
  for (common::PositionId id = 1; id <= 3; ++id) {
    store.insert(market::Position{.id = id, .user = kAlice, .side = common::Side::kLong, .size = id * 10});
  }
  assert(store.total_size(common::Side::kLong) == 60);

  // The last slot moves into the hole.
  const auto removed = store.remove(1);
  assert(removed.size == 10);
  assert(store.size() == 2);
  assert(store.slot(0).id == 3);
  assert(store.at(3).size == 30);
  assert(store.find(1) == nullptr);

  assert(thrown([&] { [[maybe_unused]] const auto gone = store.remove(1); }) ==
         common::ErrorCode::kPositionNotFound);
}

}  // namespace perpcore::tests
