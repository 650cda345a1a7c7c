#include "perpcore/market/order_book.hpp"

#include <algorithm>
#include <iterator>

namespace perpcore {
namespace market {

void OrderBook::insert(TradingOrder order) {
  auto& bucket = buckets_[index_of(order.bucket())];
  bucket[order.trigger_price].push_back(std::move(order));
}

std::vector<common::OrderId> OrderBook::level_ids(OrderBucket bucket, std::uint64_t trigger_price) const {
  const auto& orders = buckets_[index_of(bucket)];
  std::vector<common::OrderId> ids;
  auto it = orders.find(trigger_price);
  if (it == orders.end()) {
    return ids;
  }
  ids.reserve(it->second.size());
  for (const auto& order : it->second) {
    ids.push_back(order.id);
  }
  return ids;
}

void OrderBook::requeue(OrderBucket bucket, std::uint64_t trigger_price, Level orders) {
  if (orders.empty()) {
    return;
  }
  auto& level = buckets_[index_of(bucket)][trigger_price];
  level.insert(level.end(), std::make_move_iterator(orders.begin()), std::make_move_iterator(orders.end()));
}

std::optional<OrderBook::Located> OrderBook::remove(std::uint64_t trigger_price, common::OrderId order_id) {
  for (const auto bucket : kAllBuckets) {
    auto& orders = buckets_[index_of(bucket)];
    auto level_it = orders.find(trigger_price);
    if (level_it == orders.end()) {
      continue;
    }
    auto& level = level_it->second;
    auto it = std::find_if(level.begin(), level.end(), [order_id](const auto& order) { return order.id == order_id; });
    if (it == level.end()) {
      continue;
    }
    Located located{.bucket = bucket, .order = std::move(*it)};
    level.erase(it);
    if (level.empty()) {
      orders.erase(level_it);
    }
    return located;
  }
  return std::nullopt;
}

const TradingOrder* OrderBook::find(std::uint64_t trigger_price, common::OrderId order_id) const {
  for (const auto& orders : buckets_) {
    auto level_it = orders.find(trigger_price);
    if (level_it == orders.end()) {
      continue;
    }
    for (const auto& order : level_it->second) {
      if (order.id == order_id) {
        return &order;
      }
    }
  }
  return nullptr;
}

std::vector<std::uint64_t> OrderBook::triggered_prices(OrderBucket bucket, std::uint64_t oracle_price) const {
  const auto& orders = buckets_[index_of(bucket)];
  std::vector<std::uint64_t> prices;
  // Triggered levels form a contiguous range: everything at or above the oracle
  // price, or everything at or below it.
  const bool at_or_above = (side_of(bucket) == common::Side::kLong) != is_stop(bucket);
  auto first = at_or_above ? orders.lower_bound(oracle_price) : orders.begin();
  auto last = at_or_above ? orders.end() : orders.upper_bound(oracle_price);
  for (auto it = first; it != last; ++it) {
    prices.push_back(it->first);
  }
  return prices;
}

std::size_t OrderBook::order_count() const noexcept {
  std::size_t count = 0;
  for (const auto& orders : buckets_) {
    for (const auto& [price, level] : orders) {
      count += level.size();
    }
  }
  return count;
}

std::uint64_t OrderBook::resting_size(common::Side side) const noexcept {
  std::uint64_t total = 0;
  for (const auto bucket : kAllBuckets) {
    if (side_of(bucket) != side) {
      continue;
    }
    for (const auto& [price, level] : buckets_[index_of(bucket)]) {
      for (const auto& order : level) {
        total += order.size;
      }
    }
  }
  return total;
}

std::vector<TradingOrder> OrderBook::orders_of(common::AccountId user) const {
  std::vector<TradingOrder> result;
  for (const auto& orders : buckets_) {
    for (const auto& [price, level] : orders) {
      for (const auto& order : level) {
        if (order.user == user) {
          result.push_back(order);
        }
      }
    }
  }
  return result;
}

}  // namespace market
}  // namespace perpcore
