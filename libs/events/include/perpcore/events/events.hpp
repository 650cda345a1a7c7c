#pragma once

#include <cstdint>
#include <string>
#include <utility>
#include <variant>
#include <vector>

#include "perpcore/common/signed_amount.hpp"
#include "perpcore/common/types.hpp"

namespace perpcore {
namespace events {

enum class CancelReason : std::uint8_t {
  kUser = 0,
  kLinkedPositionClosed = 1,
  kLinkedPositionMissing = 2,
  kOpenInterest = 3,
};

inline constexpr const char* to_string(CancelReason reason) noexcept {
  switch (reason) {
    case CancelReason::kUser: return "user";
    case CancelReason::kLinkedPositionClosed: return "linked_position_closed";
    case CancelReason::kLinkedPositionMissing: return "linked_position_missing";
    case CancelReason::kOpenInterest: return "open_interest";
  }
  return "unknown";
}

struct OrderCreated {
  common::MarketIndex market{0};
  common::TokenType symbol;
  common::OrderId order_id{0};
  common::AccountId user{0};
  common::Side side{common::Side::kLong};
  bool is_stop{false};
  bool reduce_only{false};
  std::uint64_t size{0};
  std::uint64_t trigger_price{0};
  common::TokenType collateral_token;
  std::uint64_t collateral_amount{0};
  common::PositionId linked_position_id{0};  // 0 when unlinked
  bool filled{false};
};

struct OrderCanceled {
  common::MarketIndex market{0};
  common::TokenType symbol;
  common::OrderId order_id{0};
  common::AccountId user{0};
  CancelReason reason{CancelReason::kUser};
  std::uint64_t size{0};
  std::uint64_t refunded_amount{0};
  std::uint32_t refunded_receipts{0};
};

struct OrderFilled {
  common::MarketIndex market{0};
  common::TokenType symbol;
  common::OrderId order_id{0};
  common::AccountId user{0};
  common::PositionId position_id{0};
  common::Side side{common::Side::kLong};
  std::uint64_t size{0};
  std::uint64_t fill_price{0};
  std::uint64_t fee_mbp{0};
  std::uint64_t trading_fee{0};
  std::uint64_t borrow_fee{0};
  common::SignedAmount funding_paid{};  // positive when the position paid
  common::SignedAmount realized_pnl{};
  std::uint64_t position_size{0};
  bool position_closed{false};
};

struct CollateralChanged {
  common::MarketIndex market{0};
  common::TokenType symbol;
  common::PositionId position_id{0};
  common::AccountId user{0};
  common::SignedAmount delta{};
  std::uint64_t collateral_after{0};
  std::uint64_t borrow_fee{0};
  common::SignedAmount funding_paid{};
};

struct PositionLiquidated {
  common::MarketIndex market{0};
  common::TokenType symbol;
  common::PositionId position_id{0};
  common::AccountId user{0};
  common::AccountId liquidator{0};
  common::Side side{common::Side::kLong};
  std::uint64_t size{0};
  std::uint64_t price{0};
  std::uint64_t collateral_seized{0};
  std::uint64_t liquidator_fee{0};
  std::uint64_t pool_share{0};
  std::uint64_t escrow_id{0};  // 0 when nothing was escrowed
};

struct FundingUpdated {
  common::MarketIndex market{0};
  common::TokenType symbol;
  common::SignedAmount previous_index{};
  common::SignedAmount index{};
  std::uint64_t intervals{0};
  common::TimestampMs funding_ts{0};
};

struct ReceiptsEscrowed {
  std::uint64_t escrow_id{0};
  common::MarketIndex market{0};
  common::TokenType symbol;
  common::PositionId position_id{0};
  common::AccountId user{0};
  std::uint32_t receipt_count{0};
  std::uint64_t liquidator_fee_owed{0};
  std::uint64_t pool_owed{0};
};

struct ReceiptsSettled {
  std::uint64_t escrow_id{0};
  common::MarketIndex market{0};
  common::TokenType symbol;
  common::PositionId position_id{0};
  std::uint64_t proceeds{0};
  std::uint64_t to_liquidator{0};
  std::uint64_t to_pool{0};
  std::uint64_t to_user{0};
};

struct AdminAction {
  common::AccountId caller{0};
  std::string action;
  common::MarketIndex market{0};
  common::TokenType symbol;
};

using Event = std::variant<OrderCreated,
                           OrderCanceled,
                           OrderFilled,
                           CollateralChanged,
                           PositionLiquidated,
                           FundingUpdated,
                           ReceiptsEscrowed,
                           ReceiptsSettled,
                           AdminAction>;

// Journal record kinds. Values are persisted; append only.
enum class EventKind : std::uint16_t {
  kOrderCreated = 1,
  kOrderCanceled = 2,
  kOrderFilled = 3,
  kCollateralChanged = 4,
  kPositionLiquidated = 5,
  kFundingUpdated = 6,
  kReceiptsEscrowed = 7,
  kReceiptsSettled = 8,
  kAdminAction = 9,
};

[[nodiscard]] inline EventKind kind_of(const Event& event) noexcept {
  return static_cast<EventKind>(event.index() + 1);
}

[[nodiscard]] const char* to_string(EventKind kind) noexcept;

// Events raised by one operation. Discarded with the operation when it fails.
class EventBuffer {
 public:
  void emit(Event event) { events_.push_back(std::move(event)); }
  [[nodiscard]] const std::vector<Event>& events() const noexcept { return events_; }
  [[nodiscard]] bool empty() const noexcept { return events_.empty(); }
  [[nodiscard]] std::size_t size() const noexcept { return events_.size(); }
  void clear() noexcept { events_.clear(); }

 private:
  std::vector<Event> events_{};
};

}  // namespace events
}  // namespace perpcore
