#include "perpcore/market/trading_context.hpp"

#include "perpcore/common/error.hpp"
#include "perpcore/common/fixed_point.hpp"

namespace perpcore {
namespace market {

void TradingContext::pay(common::AccountId user, const common::TokenType& token, std::uint64_t amount) {
  if (amount == 0) {
    return;
  }
  payouts.push_back(common::Payout{.user = user, .token = token, .amount = amount});
}

void TradingContext::return_receipts(common::AccountId user, const common::TokenType& bid_token,
                                     std::vector<common::BidReceipt> receipts) {
  if (receipts.empty()) {
    return;
  }
  payouts.push_back(common::Payout{.user = user, .token = bid_token, .amount = 0, .receipts = std::move(receipts)});
}

void TradingContext::refund(const TradingOrder& order) {
  if (order.option_collateral) {
    return_receipts(order.user, order.option_collateral->bid_token, order.option_collateral->receipts);
    return;
  }
  pay(order.user, order.collateral_token, order.collateral_amount);
}

void TradingContext::credit_protocol_fee(const common::TokenType& token, std::uint64_t fee) {
  const auto share = common::apply_bp(fee, protocol_fee_share_bp);
  if (share == 0) {
    return;
  }
  pool.pay_out(token, share);
  auto& balance = protocol_fees[token];
  common::ensure(share <= common::kU64Max - balance, common::ErrorCode::kArithmeticOverflow);
  balance += share;
}

}  // namespace market
}  // namespace perpcore
