#pragma once

#include <cstdint>
#include <map>
#include <vector>

#include "perpcore/common/types.hpp"
#include "perpcore/events/events.hpp"
#include "perpcore/market/order.hpp"
#include "perpcore/pool/liquidity_pool.hpp"
#include "perpcore/vault/option_vault.hpp"
#include "perpcore/vault/receipt_escrow.hpp"

namespace perpcore {
namespace market {

// Everything one operation on a symbol needs beyond the symbol itself: checked
// prices, the collateral token in play, and the shared state it may touch.
struct TradingContext {
  pool::LiquidityPool& pool;
  vault::OptionVaults& vaults;
  vault::ReceiptEscrow& escrow;
  std::map<common::TokenType, std::uint64_t>& protocol_fees;
  events::EventBuffer& events;
  std::vector<common::Payout>& payouts;

  common::MarketIndex market{0};
  common::TokenType symbol;
  common::TimestampMs now_ms{0};
  common::PriceQuote trading_price{};
  common::TokenType collateral_token;
  std::uint64_t collateral_decimal{0};
  common::PriceQuote collateral_price{};
  std::uint64_t protocol_fee_share_bp{0};
  bool market_active{true};

  void pay(common::AccountId user, const common::TokenType& token, std::uint64_t amount);
  void return_receipts(common::AccountId user, const common::TokenType& bid_token,
                       std::vector<common::BidReceipt> receipts);
  // Hands an order's collateral back to its owner.
  void refund(const TradingOrder& order);
  // Splits a fee already realized into the pool between the pool and the market.
  void credit_protocol_fee(const common::TokenType& token, std::uint64_t fee);
};

}  // namespace market
}  // namespace perpcore
