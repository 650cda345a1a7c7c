#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>

#include "perpcore/common/error.hpp"
#include "perpcore/common/types.hpp"
#include "perpcore/market/order.hpp"
#include "perpcore/market/position_ledger.hpp"
#include "perpcore/market/symbol_market.hpp"
#include "perpcore/market/trading_context.hpp"

namespace perpcore {
namespace market {

struct OrderRequest {
  common::AccountId user{0};
  common::Side side{common::Side::kLong};
  std::uint64_t size{0};
  std::uint64_t trigger_price{0};
  bool is_stop{false};
  bool reduce_only{false};
  std::optional<common::PositionId> linked_position_id{};
  std::uint64_t collateral_amount{0};
  std::optional<OptionCollateral> option_collateral{};
};

struct CreateOutcome {
  common::OrderId order_id{0};
  bool filled{false};
  std::optional<common::PositionId> position_id{};
  std::uint64_t fee_mbp{0};
  std::uint64_t trading_fee{0};
};

struct MatchOutcome {
  std::size_t processed{0};
  std::size_t filled{0};
  std::size_t released{0};
  std::size_t requeued{0};
};

// Progress of one open-interest sweep call. `next_cursor` counts the orders
// still resting ahead of where the next call should resume.
struct OpenInterestSweep {
  std::size_t inspected{0};
  std::size_t canceled{0};
  std::size_t next_cursor{0};
  bool done{false};
};

class OrderEngine {
 public:
  OrderEngine(SymbolMarket& market, TradingContext& ctx) noexcept : market_(market), ctx_(ctx), ledger_(market, ctx) {}

  // Validates the order, then fills it at once if it is already triggered or
  // rests it in its bucket.
  CreateOutcome create(const OrderRequest& request);

  TradingOrder cancel(common::AccountId user, std::uint64_t trigger_price, common::OrderId order_id);

  // Works one price level newest-first, handling at most `budget` orders. Orders
  // that cannot fill yet move behind the ones this call did not reach.
  MatchOutcome match(OrderBucket bucket, std::uint64_t trigger_price, std::size_t budget);

  // Cancels resting opening orders that no longer fit under the open-interest cap.
  // Walks buckets, then prices ascending, then arrival order, skipping the first
  // `cursor` orders; pass the returned cursor back in until `done`.
  OpenInterestSweep cancel_by_open_interest(std::size_t cursor, std::size_t budget);

  [[nodiscard]] PositionLedger& ledger() noexcept { return ledger_; }

 private:
  SymbolMarket& market_;
  TradingContext& ctx_;
  PositionLedger ledger_;

  [[nodiscard]] std::optional<common::ErrorCode> fill_blocker(const TradingOrder& order) const;
  [[nodiscard]] bool triggered(const TradingOrder& order) const noexcept;
  [[nodiscard]] std::uint64_t fill_size(const TradingOrder& order) const;
  FillOutcome fill(TradingOrder order, std::uint64_t& fee_mbp);
  // Returns the order's leverage.
  std::uint64_t validate(const OrderRequest& request) const;
};

}  // namespace market
}  // namespace perpcore
