#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "perpcore/auth/access_control.hpp"
#include "perpcore/common/types.hpp"
#include "perpcore/events/event_sink.hpp"
#include "perpcore/events/events.hpp"
#include "perpcore/funding/funding_engine.hpp"
#include "perpcore/ledger/custody_ledger.hpp"
#include "perpcore/liquidation/liquidation_engine.hpp"
#include "perpcore/market/market_state.hpp"
#include "perpcore/market/order.hpp"
#include "perpcore/market/order_engine.hpp"
#include "perpcore/market/symbol_market.hpp"
#include "perpcore/market/trading_context.hpp"
#include "perpcore/oracle/price_feed.hpp"
#include "perpcore/pool/liquidity_pool.hpp"
#include "perpcore/telemetry/telemetry_sink.hpp"
#include "perpcore/vault/option_vault.hpp"
#include "perpcore/vault/receipt_escrow.hpp"

namespace perpcore {
namespace registry {

class Transaction;

// One per (LP token, quote token) pair.
struct Market {
  common::MarketIndex index{0};
  common::TokenType lp_token;
  common::TokenType quote_token;
  bool active{true};
  std::uint64_t protocol_fee_share_bp{0};
  std::map<common::TokenType, market::SymbolMarket> symbols{};
  std::map<common::TokenType, std::uint64_t> protocol_fees{};
};

struct SymbolKey {
  common::MarketIndex market{0};
  common::TokenType base_token;
};

// Oracles an operation prices against: the symbol's feed and the feed of the
// collateral token in play. Both are checked against the configured ids.
struct PriceSources {
  const oracle::Oracle& trading;
  const oracle::Oracle& collateral;
};

// Funds an operation released that did not land in a custody account.
template <typename T>
struct Outcome {
  T value{};
  std::vector<common::Payout> payouts{};
};

struct TokenOrderRequest {
  common::Side side{common::Side::kLong};
  std::uint64_t size{0};
  std::uint64_t trigger_price{0};
  bool is_stop{false};
  bool reduce_only{false};
  std::optional<common::PositionId> linked_position_id{};
  common::TokenType collateral_token;
  std::uint64_t collateral_amount{0};
};

struct OptionOrderRequest {
  common::Side side{common::Side::kLong};
  std::uint64_t size{0};
  std::uint64_t trigger_price{0};
  bool is_stop{false};
  bool reduce_only{false};
  std::optional<common::PositionId> linked_position_id{};
  common::TokenType collateral_token;
  market::OptionCollateral collateral{};
};

// Entry point for every state transition. Each public mutator is atomic: state it
// touched is restored when it throws, and its events are published and its
// payouts routed only once it succeeds.
class MarketRegistry {
 public:
  MarketRegistry(common::AccountId admin, events::EventSink& sink);

  void attach_telemetry(telemetry::TelemetrySink* telemetry) noexcept { telemetry_ = telemetry; }

  // Administration

  void grant_role(common::AccountId caller, common::AccountId account, auth::Role role);
  void revoke_role(common::AccountId caller, common::AccountId account, auth::Role role);

  void add_pool(common::AccountId caller, const common::TokenType& lp_token);
  void add_pool_token(common::AccountId caller, const common::TokenType& lp_token, const pool::TokenConfig& config,
                      common::TimestampMs now_ms);
  void set_pool_active(common::AccountId caller, const common::TokenType& lp_token, bool active);
  void deposit_liquidity(common::AccountId caller, const common::TokenType& lp_token, const common::TokenType& token,
                         std::uint64_t amount);
  Outcome<std::uint64_t> withdraw_liquidity(common::AccountId caller, const common::TokenType& lp_token,
                                            const common::TokenType& token, std::uint64_t amount);

  void add_vault(common::AccountId caller, const vault::VaultInfo& info);
  void update_vault_value(common::AccountId caller, std::uint64_t vault_index, std::uint64_t value_per_share);
  common::BidReceipt issue_receipt(common::AccountId caller, std::uint64_t vault_index, std::uint64_t shares);

  common::MarketIndex create_market(common::AccountId caller, const common::TokenType& lp_token,
                                    const common::TokenType& quote_token, std::uint64_t protocol_fee_share_bp);
  void add_symbol(common::AccountId caller, common::MarketIndex market, const common::TokenType& base_token,
                  std::uint64_t size_decimal, const market::MarketConfig& config, common::TimestampMs now_ms);
  void update_market_config(common::AccountId caller, const SymbolKey& key, const market::MarketConfig& config);
  void set_market_active(common::AccountId caller, common::MarketIndex market, bool active);
  void set_symbol_active(common::AccountId caller, const SymbolKey& key, bool active);
  void update_protocol_fee_share(common::AccountId caller, common::MarketIndex market, std::uint64_t share_bp);
  Outcome<std::uint64_t> withdraw_protocol_fees(common::AccountId caller, common::MarketIndex market,
                                                const common::TokenType& token);

  // Trading

  Outcome<market::CreateOutcome> create_trading_order(common::AccountId user, const SymbolKey& key,
                                                      const TokenOrderRequest& request, const PriceSources& prices,
                                                      common::TimestampMs now_ms);
  Outcome<market::CreateOutcome> create_option_trading_order(common::AccountId user, const SymbolKey& key,
                                                             const OptionOrderRequest& request,
                                                             const PriceSources& prices, common::TimestampMs now_ms);
  // Needs no prices, so orders stay cancellable while a feed is stale.
  Outcome<market::TradingOrder> cancel_trading_order(common::AccountId user, const SymbolKey& key,
                                                     std::uint64_t trigger_price, common::OrderId order_id,
                                                     common::TimestampMs now_ms);
  // Reduce-only order for the whole position, filled at the current price.
  Outcome<market::CreateOutcome> close_position(common::AccountId user, const SymbolKey& key,
                                                common::PositionId position_id, const PriceSources& prices,
                                                common::TimestampMs now_ms);

  Outcome<std::monostate> increase_collateral(common::AccountId user, const SymbolKey& key,
                                              common::PositionId position_id, std::uint64_t amount,
                                              const PriceSources& prices, common::TimestampMs now_ms);
  Outcome<std::monostate> release_collateral(common::AccountId user, const SymbolKey& key,
                                             common::PositionId position_id, std::uint64_t amount,
                                             const PriceSources& prices, common::TimestampMs now_ms);
  Outcome<std::monostate> increase_option_collateral(common::AccountId user, const SymbolKey& key,
                                                     common::PositionId position_id,
                                                     std::vector<common::BidReceipt> receipts,
                                                     const PriceSources& prices, common::TimestampMs now_ms);
  Outcome<std::monostate> release_option_collateral(common::AccountId user, const SymbolKey& key,
                                                    common::PositionId position_id,
                                                    const std::vector<common::ReceiptId>& receipt_ids,
                                                    const PriceSources& prices, common::TimestampMs now_ms);

  // Maintenance

  Outcome<market::MatchOutcome> match_trading_orders(common::AccountId caller, const SymbolKey& key,
                                                     market::OrderBucket bucket, std::uint64_t trigger_price,
                                                     const common::TokenType& collateral_token, std::size_t budget,
                                                     const PriceSources& prices, common::TimestampMs now_ms);
  [[nodiscard]] std::vector<std::uint64_t> triggered_prices(const SymbolKey& key, market::OrderBucket bucket,
                                                            const oracle::Oracle& trading,
                                                            common::TimestampMs now_ms) const;
  funding::FundingUpdate update_funding_rate(const SymbolKey& key, const oracle::Oracle& trading,
                                             common::TimestampMs now_ms);
  // Refreshes one pool token's borrow index and USD value.
  void update_pool_value(const common::TokenType& lp_token, const common::TokenType& token,
                         const oracle::Oracle& oracle, common::TimestampMs now_ms);
  Outcome<liquidation::LiquidationResult> liquidate(common::AccountId liquidator, const SymbolKey& key,
                                                    common::PositionId position_id, const PriceSources& prices,
                                                    common::TimestampMs now_ms);
  // Also refreshes the pool's borrow index, like any other priced operation.
  liquidation::LiquidationInfo get_liquidation_info(const SymbolKey& key, const common::TokenType& collateral_token,
                                                    bool include_all, std::size_t cursor, std::size_t budget,
                                                    const PriceSources& prices, common::TimestampMs now_ms);
  // Both sweeps resume from `cursor`; feed back the returned cursor until done.
  Outcome<liquidation::SettleResult> settle_unsettled_receipts(common::AccountId caller, std::uint64_t cursor,
                                                               std::size_t budget, common::TimestampMs now_ms);
  Outcome<market::OpenInterestSweep> cancel_orders_by_open_interest(common::AccountId caller, const SymbolKey& key,
                                                                    std::size_t cursor, std::size_t budget,
                                                                    common::TimestampMs now_ms);

  // Queries

  [[nodiscard]] const Market& market(common::MarketIndex index) const;
  [[nodiscard]] const std::map<common::MarketIndex, Market>& markets() const noexcept { return markets_; }
  [[nodiscard]] const market::SymbolMarket& symbol(const SymbolKey& key) const;
  [[nodiscard]] const market::Position& position(const SymbolKey& key, common::PositionId id) const;
  [[nodiscard]] std::vector<market::TradingOrder> orders_of(const SymbolKey& key, common::AccountId user) const;
  [[nodiscard]] const pool::LiquidityPool& pool(const common::TokenType& lp_token) const;
  [[nodiscard]] const vault::OptionVaults& vaults() const noexcept { return vaults_; }
  [[nodiscard]] const vault::ReceiptEscrow& escrow() const noexcept { return escrow_; }
  [[nodiscard]] const auth::AccessControl& access() const noexcept { return access_; }
  [[nodiscard]] const ledger::CustodyLedger& custody() const noexcept { return custody_; }
  [[nodiscard]] ledger::CustodyLedger& custody() noexcept { return custody_; }

 private:
  events::EventSink& sink_;
  telemetry::TelemetrySink* telemetry_{nullptr};
  auth::AccessControl access_;
  ledger::CustodyLedger custody_{};
  vault::OptionVaults vaults_{};
  vault::ReceiptEscrow escrow_{};
  std::map<common::TokenType, pool::LiquidityPool> pools_{};
  std::map<common::MarketIndex, Market> markets_{};
  common::MarketIndex next_market_index_{1};

  Market& market_at(common::MarketIndex index);
  market::SymbolMarket& symbol_at(const SymbolKey& key);
  pool::LiquidityPool& pool_at(const common::TokenType& lp_token);
  [[nodiscard]] const market::Position& position_at(const SymbolKey& key, common::PositionId id) const;

  // Runs `body` against one symbol inside a transaction. Without `prices` the
  // context carries no oracle prices and the pool is left untouched.
  template <typename Fn>
  auto run_symbol(telemetry::Operation operation, const SymbolKey& key, const common::TokenType& collateral_token,
                  const PriceSources* prices, common::TimestampMs now_ms, Fn&& body);

  // Finishes a successful operation: publish, commit, route payouts, count.
  std::vector<common::Payout> finish(Transaction& tx, telemetry::Operation operation, common::TimestampMs now_ms,
                                     const events::EventBuffer& buffer, std::vector<common::Payout> payouts,
                                     std::chrono::nanoseconds started);
  void reverted();
  // Routes `payouts` and publishes the AdminAction event, then commits `tx`.
  std::vector<common::Payout> admin_commit(Transaction& tx, common::AccountId caller, const char* action,
                                           common::MarketIndex market = 0, const common::TokenType& symbol = {},
                                           std::vector<common::Payout> payouts = {});
};

}  // namespace registry
}  // namespace perpcore
