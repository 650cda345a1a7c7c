#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <vector>

#include "perpcore/common/types.hpp"
#include "perpcore/market/order.hpp"

namespace perpcore {
namespace market {

// Resting conditional orders of one symbol: eight buckets, each an ordered map
// from trigger price to the orders resting at that price in arrival order.
class OrderBook {
 public:
  using Level = std::vector<TradingOrder>;
  using Bucket = std::map<std::uint64_t, Level>;

  struct Located {
    OrderBucket bucket{OrderBucket::kTokenLongLimit};
    TradingOrder order;
  };

  void insert(TradingOrder order);

  // Ids resting at `trigger_price`, oldest first. The level itself is left alone.
  [[nodiscard]] std::vector<common::OrderId> level_ids(OrderBucket bucket, std::uint64_t trigger_price) const;

  // Appends `orders` back at `trigger_price`, after anything already resting there.
  void requeue(OrderBucket bucket, std::uint64_t trigger_price, Level orders);

  [[nodiscard]] std::optional<Located> remove(std::uint64_t trigger_price, common::OrderId order_id);
  [[nodiscard]] const TradingOrder* find(std::uint64_t trigger_price, common::OrderId order_id) const;

  // Trigger prices in `bucket` whose orders are triggered at `oracle_price`, ascending.
  [[nodiscard]] std::vector<std::uint64_t> triggered_prices(OrderBucket bucket, std::uint64_t oracle_price) const;

  [[nodiscard]] const Bucket& bucket(OrderBucket bucket) const noexcept { return buckets_[index_of(bucket)]; }
  [[nodiscard]] std::size_t order_count() const noexcept;
  [[nodiscard]] std::uint64_t resting_size(common::Side side) const noexcept;
  [[nodiscard]] std::vector<TradingOrder> orders_of(common::AccountId user) const;

 private:
  std::array<Bucket, kBucketCount> buckets_{};
};

}  // namespace market
}  // namespace perpcore
