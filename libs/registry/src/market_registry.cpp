#include "perpcore/registry/market_registry.hpp"

#include <exception>
#include <string>
#include <type_traits>
#include <utility>

#include "perpcore/common/error.hpp"
#include "perpcore/common/fixed_point.hpp"
#include "perpcore/common/time_utils.hpp"
#include "perpcore/market/position_ledger.hpp"
#include "perpcore/registry/transaction.hpp"

namespace perpcore {
namespace registry {

using common::EngineError;
using common::ErrorCode;

namespace {

std::optional<telemetry::Metric> metric_for(events::EventKind kind) noexcept {
  switch (kind) {
    case events::EventKind::kOrderCreated: return telemetry::Metric::kOrdersCreated;
    case events::EventKind::kOrderFilled: return telemetry::Metric::kOrdersFilled;
    case events::EventKind::kOrderCanceled: return telemetry::Metric::kOrdersCanceled;
    case events::EventKind::kPositionLiquidated: return telemetry::Metric::kPositionsLiquidated;
    case events::EventKind::kFundingUpdated: return telemetry::Metric::kFundingUpdates;
    case events::EventKind::kReceiptsSettled: return telemetry::Metric::kReceiptsSettled;
    default: return std::nullopt;
  }
}

}  // namespace

MarketRegistry::MarketRegistry(common::AccountId admin, events::EventSink& sink) : sink_(sink), access_(admin) {}

// Internals

Market& MarketRegistry::market_at(common::MarketIndex index) {
  auto it = markets_.find(index);
  if (it == markets_.end()) {
    throw EngineError(ErrorCode::kMarketNotFound, std::to_string(index));
  }
  return it->second;
}

market::SymbolMarket& MarketRegistry::symbol_at(const SymbolKey& key) {
  auto& owner = market_at(key.market);
  auto it = owner.symbols.find(key.base_token);
  if (it == owner.symbols.end()) {
    throw EngineError(ErrorCode::kSymbolNotFound, key.base_token);
  }
  return it->second;
}

pool::LiquidityPool& MarketRegistry::pool_at(const common::TokenType& lp_token) {
  auto it = pools_.find(lp_token);
  if (it == pools_.end()) {
    throw EngineError(ErrorCode::kTokenNotSupported, lp_token);
  }
  return it->second;
}

const market::Position& MarketRegistry::position_at(const SymbolKey& key, common::PositionId id) const {
  const auto* found = symbol(key).positions.find(id);
  if (found == nullptr) {
    throw EngineError(ErrorCode::kPositionNotFound, std::to_string(id));
  }
  return *found;
}

template <typename Fn>
auto MarketRegistry::run_symbol(telemetry::Operation operation, const SymbolKey& key,
                                const common::TokenType& collateral_token, const PriceSources* prices,
                                common::TimestampMs now_ms, Fn&& body) {
  using Result = std::invoke_result_t<Fn&, market::SymbolMarket&, market::TradingContext&>;
  const auto started = common::now_steady();
  try {
    auto& owner = market_at(key.market);
    auto& target = symbol_at(key);
    auto& backing = pool_at(owner.lp_token);

    Transaction tx;
    tx.track(target);
    tx.track(owner.protocol_fees);
    tx.track(backing);
    tx.track(vaults_);
    tx.track(escrow_);

    events::EventBuffer buffer;
    std::vector<common::Payout> payouts;
    market::TradingContext ctx{
        .pool = backing,
        .vaults = vaults_,
        .escrow = escrow_,
        .protocol_fees = owner.protocol_fees,
        .events = buffer,
        .payouts = payouts,
        .market = owner.index,
        .symbol = key.base_token,
        .now_ms = now_ms,
        .collateral_token = collateral_token,
        .protocol_fee_share_bp = owner.protocol_fee_share_bp,
        .market_active = owner.active,
    };

    if (prices != nullptr) {
      const auto& token_config = backing.token_config(collateral_token);
      ctx.trading_price = oracle::checked_price(prices->trading, target.config.oracle_id, now_ms,
                                                target.config.max_staleness_ms);
      ctx.collateral_price = oracle::checked_price(prices->collateral, token_config.oracle_id, now_ms,
                                                   token_config.max_staleness_ms);
      ctx.collateral_decimal = token_config.decimal;
      backing.update_borrow_info(collateral_token, now_ms);
      backing.update_token_value(collateral_token, ctx.collateral_price, now_ms);
    } else if (backing.has_token(collateral_token)) {
      ctx.collateral_decimal = backing.token_config(collateral_token).decimal;
    }

    Outcome<Result> outcome{.value = body(target, ctx)};
    outcome.payouts = finish(tx, operation, now_ms, buffer, std::move(payouts), started);
    return outcome;
  } catch (const std::exception&) {
    reverted();
    throw;
  }
}

std::vector<common::Payout> MarketRegistry::finish(Transaction& tx, telemetry::Operation operation,
                                                   common::TimestampMs now_ms, const events::EventBuffer& buffer,
                                                   std::vector<common::Payout> payouts,
                                                   std::chrono::nanoseconds started) {
  tx.track(custody_);
  auto returned = custody_.route(std::move(payouts));
  if (!buffer.empty()) {
    sink_.publish(now_ms, buffer);
  }
  tx.commit();

  if (telemetry_ != nullptr) {
    for (const auto& event : buffer.events()) {
      if (const auto metric = metric_for(events::kind_of(event))) {
        telemetry_->increment(*metric);
      }
    }
    telemetry_->record_latency(operation, common::now_steady() - started);
  }
  return returned;
}

void MarketRegistry::reverted() {
  if (telemetry_ != nullptr) {
    telemetry_->increment(telemetry::Metric::kOperationsReverted);
  }
}

std::vector<common::Payout> MarketRegistry::admin_commit(Transaction& tx, common::AccountId caller, const char* action,
                                                         common::MarketIndex market_index,
                                                         const common::TokenType& symbol_token,
                                                         std::vector<common::Payout> payouts) {
  events::EventBuffer buffer;
  buffer.emit(events::AdminAction{
      .caller = caller,
      .action = action,
      .market = market_index,
      .symbol = symbol_token,
  });
  tx.track(custody_);
  auto returned = custody_.route(std::move(payouts));
  sink_.publish(common::now_ms(), buffer);
  tx.commit();
  return returned;
}

// Administration

void MarketRegistry::grant_role(common::AccountId caller, common::AccountId account, auth::Role role) {
  access_.require(caller, auth::Role::kAdmin);
  Transaction tx;
  tx.track(access_);
  access_.grant(account, role);
  admin_commit(tx, caller, "grant_role");
}

void MarketRegistry::revoke_role(common::AccountId caller, common::AccountId account, auth::Role role) {
  access_.require(caller, auth::Role::kAdmin);
  Transaction tx;
  tx.track(access_);
  access_.revoke(account, role);
  admin_commit(tx, caller, "revoke_role");
}

void MarketRegistry::add_pool(common::AccountId caller, const common::TokenType& lp_token) {
  access_.require(caller, auth::Role::kAdmin);
  Transaction tx;
  tx.track(pools_);
  auto [_, inserted] = pools_.try_emplace(lp_token, pool::LiquidityPool(lp_token));
  if (!inserted) {
    throw EngineError(ErrorCode::kTokenAlreadyExists, lp_token);
  }
  admin_commit(tx, caller, "add_pool");
}

void MarketRegistry::add_pool_token(common::AccountId caller, const common::TokenType& lp_token,
                                    const pool::TokenConfig& config, common::TimestampMs now_ms) {
  access_.require(caller, auth::Role::kAdmin);
  auto& target = pool_at(lp_token);
  Transaction tx;
  tx.track(target);
  target.add_token(config, now_ms);
  admin_commit(tx, caller, "add_pool_token");
}

void MarketRegistry::set_pool_active(common::AccountId caller, const common::TokenType& lp_token, bool active) {
  access_.require(caller, auth::Role::kAdmin);
  auto& target = pool_at(lp_token);
  Transaction tx;
  tx.track(target);
  target.set_active(active);
  admin_commit(tx, caller, active ? "activate_pool" : "deactivate_pool");
}

void MarketRegistry::deposit_liquidity(common::AccountId caller, const common::TokenType& lp_token,
                                       const common::TokenType& token, std::uint64_t amount) {
  access_.require(caller, auth::Role::kAdmin);
  auto& target = pool_at(lp_token);
  Transaction tx;
  tx.track(target);
  target.deposit_liquidity(token, amount);
  admin_commit(tx, caller, "deposit_liquidity");
}

Outcome<std::uint64_t> MarketRegistry::withdraw_liquidity(common::AccountId caller, const common::TokenType& lp_token,
                                                          const common::TokenType& token, std::uint64_t amount) {
  access_.require(caller, auth::Role::kAdmin);
  auto& target = pool_at(lp_token);
  Transaction tx;
  tx.track(target);
  target.withdraw_liquidity(token, amount);
  std::vector<common::Payout> payouts{common::Payout{.user = caller, .token = token, .amount = amount}};
  return Outcome<std::uint64_t>{
      .value = amount,
      .payouts = admin_commit(tx, caller, "withdraw_liquidity", 0, {}, std::move(payouts)),
  };
}

void MarketRegistry::add_vault(common::AccountId caller, const vault::VaultInfo& info) {
  access_.require(caller, auth::Role::kAdmin);
  Transaction tx;
  tx.track(vaults_);
  vaults_.add_vault(info);
  admin_commit(tx, caller, "add_vault");
}

void MarketRegistry::update_vault_value(common::AccountId caller, std::uint64_t vault_index,
                                        std::uint64_t value_per_share) {
  access_.require(caller, auth::Role::kAdmin);
  vaults_.update_intrinsic_value(vault_index, value_per_share);
}

common::BidReceipt MarketRegistry::issue_receipt(common::AccountId caller, std::uint64_t vault_index,
                                                 std::uint64_t shares) {
  access_.require(caller, auth::Role::kAdmin);
  return vaults_.issue_receipt(vault_index, shares);
}

common::MarketIndex MarketRegistry::create_market(common::AccountId caller, const common::TokenType& lp_token,
                                                  const common::TokenType& quote_token,
                                                  std::uint64_t protocol_fee_share_bp) {
  access_.require(caller, auth::Role::kAdmin);
  if (pools_.find(lp_token) == pools_.end()) {
    throw EngineError(ErrorCode::kInvalidConfig, "unknown pool " + lp_token);
  }
  common::ensure(protocol_fee_share_bp <= common::kBpScale, ErrorCode::kInvalidConfig);
  for (const auto& [_, existing] : markets_) {
    if (existing.lp_token == lp_token && existing.quote_token == quote_token) {
      throw EngineError(ErrorCode::kInvalidConfig, "market already exists for " + lp_token + "/" + quote_token);
    }
  }

  Transaction tx;
  tx.track(markets_);
  tx.track(next_market_index_);
  const auto index = next_market_index_++;
  markets_.emplace(index, Market{
                              .index = index,
                              .lp_token = lp_token,
                              .quote_token = quote_token,
                              .protocol_fee_share_bp = protocol_fee_share_bp,
                          });
  admin_commit(tx, caller, "create_market", index);
  return index;
}

void MarketRegistry::add_symbol(common::AccountId caller, common::MarketIndex market_index,
                                const common::TokenType& base_token, std::uint64_t size_decimal,
                                const market::MarketConfig& config, common::TimestampMs now_ms) {
  access_.require(caller, auth::Role::kAdmin);
  auto& owner = market_at(market_index);
  if (owner.symbols.find(base_token) != owner.symbols.end()) {
    throw EngineError(ErrorCode::kSymbolAlreadyExists, base_token);
  }
  market::validate_config(config);

  market::SymbolMarket symbol{
      .base_token = base_token,
      .info = market::MarketInfo{.size_decimal = size_decimal},
      .config = config,
  };
  funding::FundingEngine(symbol).initialize(now_ms);
  Transaction tx;
  tx.track(owner.symbols);
  owner.symbols.emplace(base_token, std::move(symbol));
  admin_commit(tx, caller, "add_symbol", market_index, base_token);
}

void MarketRegistry::update_market_config(common::AccountId caller, const SymbolKey& key,
                                          const market::MarketConfig& config) {
  access_.require(caller, auth::Role::kAdmin);
  auto& symbol = symbol_at(key);
  market::validate_config(config);
  Transaction tx;
  tx.track(symbol.config);
  symbol.config = config;
  admin_commit(tx, caller, "update_market_config", key.market, key.base_token);
}

void MarketRegistry::set_market_active(common::AccountId caller, common::MarketIndex market_index, bool active) {
  access_.require(caller, auth::Role::kAdmin);
  auto& owner = market_at(market_index);
  Transaction tx;
  tx.track(owner.active);
  owner.active = active;
  admin_commit(tx, caller, active ? "activate_market" : "deactivate_market", market_index);
}

void MarketRegistry::set_symbol_active(common::AccountId caller, const SymbolKey& key, bool active) {
  access_.require(caller, auth::Role::kAdmin);
  auto& symbol = symbol_at(key);
  Transaction tx;
  tx.track(symbol.info.active);
  symbol.info.active = active;
  admin_commit(tx, caller, active ? "activate_symbol" : "deactivate_symbol", key.market, key.base_token);
}

void MarketRegistry::update_protocol_fee_share(common::AccountId caller, common::MarketIndex market_index,
                                               std::uint64_t share_bp) {
  access_.require(caller, auth::Role::kAdmin);
  common::ensure(share_bp <= common::kBpScale, ErrorCode::kInvalidConfig);
  auto& owner = market_at(market_index);
  Transaction tx;
  tx.track(owner.protocol_fee_share_bp);
  owner.protocol_fee_share_bp = share_bp;
  admin_commit(tx, caller, "update_protocol_fee_share", market_index);
}

Outcome<std::uint64_t> MarketRegistry::withdraw_protocol_fees(common::AccountId caller,
                                                              common::MarketIndex market_index,
                                                              const common::TokenType& token) {
  access_.require(caller, auth::Role::kAdmin);
  auto& fees = market_at(market_index).protocol_fees;
  auto it = fees.find(token);
  if (it == fees.end() || it->second == 0) {
    return Outcome<std::uint64_t>{};
  }
  const auto amount = it->second;
  Transaction tx;
  tx.track(fees);
  fees.erase(it);
  std::vector<common::Payout> payouts{common::Payout{.user = caller, .token = token, .amount = amount}};
  return Outcome<std::uint64_t>{
      .value = amount,
      .payouts = admin_commit(tx, caller, "withdraw_protocol_fees", market_index, {}, std::move(payouts)),
  };
}

// Trading

Outcome<market::CreateOutcome> MarketRegistry::create_trading_order(common::AccountId user, const SymbolKey& key,
                                                                    const TokenOrderRequest& request,
                                                                    const PriceSources& prices,
                                                                    common::TimestampMs now_ms) {
  return run_symbol(telemetry::Operation::kCreateOrder, key, request.collateral_token, &prices, now_ms,
                    [&](market::SymbolMarket& symbol, market::TradingContext& ctx) {
                      market::OrderEngine engine(symbol, ctx);
                      return engine.create(market::OrderRequest{
                          .user = user,
                          .side = request.side,
                          .size = request.size,
                          .trigger_price = request.trigger_price,
                          .is_stop = request.is_stop,
                          .reduce_only = request.reduce_only,
                          .linked_position_id = request.linked_position_id,
                          .collateral_amount = request.collateral_amount,
                      });
                    });
}

Outcome<market::CreateOutcome> MarketRegistry::create_option_trading_order(common::AccountId user,
                                                                           const SymbolKey& key,
                                                                           const OptionOrderRequest& request,
                                                                           const PriceSources& prices,
                                                                           common::TimestampMs now_ms) {
  return run_symbol(telemetry::Operation::kCreateOrder, key, request.collateral_token, &prices, now_ms,
                    [&](market::SymbolMarket& symbol, market::TradingContext& ctx) {
                      market::OrderEngine engine(symbol, ctx);
                      return engine.create(market::OrderRequest{
                          .user = user,
                          .side = request.side,
                          .size = request.size,
                          .trigger_price = request.trigger_price,
                          .is_stop = request.is_stop,
                          .reduce_only = request.reduce_only,
                          .linked_position_id = request.linked_position_id,
                          .option_collateral = request.collateral,
                      });
                    });
}

Outcome<market::TradingOrder> MarketRegistry::cancel_trading_order(common::AccountId user, const SymbolKey& key,
                                                                   std::uint64_t trigger_price,
                                                                   common::OrderId order_id,
                                                                   common::TimestampMs now_ms) {
  const auto* order = symbol(key).book.find(trigger_price, order_id);
  common::ensure(order != nullptr && order->user == user, ErrorCode::kOrderNotFound);
  const auto collateral_token = order->collateral_token;

  return run_symbol(telemetry::Operation::kCancelOrder, key, collateral_token, nullptr, now_ms,
                    [&](market::SymbolMarket& symbol, market::TradingContext& ctx) {
                      market::OrderEngine engine(symbol, ctx);
                      return engine.cancel(user, trigger_price, order_id);
                    });
}

Outcome<market::CreateOutcome> MarketRegistry::close_position(common::AccountId user, const SymbolKey& key,
                                                              common::PositionId position_id,
                                                              const PriceSources& prices, common::TimestampMs now_ms) {
  const auto& target = position_at(key, position_id);
  common::ensure(target.user == user, ErrorCode::kNotPositionOwner);
  const auto collateral_token = target.collateral_token;

  return run_symbol(telemetry::Operation::kCreateOrder, key, collateral_token, &prices, now_ms,
                    [&](market::SymbolMarket& symbol, market::TradingContext& ctx) {
                      const auto& position = symbol.positions.at(position_id);
                      market::OrderRequest request{
                          .user = user,
                          .side = common::opposite(position.side),
                          .size = position.size,
                          .trigger_price = ctx.trading_price.price,
                          .reduce_only = true,
                          .linked_position_id = position_id,
                      };
                      if (position.option_collateral) {
                        request.option_collateral = market::OptionCollateral{
                            .vault_index = position.option_collateral->vault_index,
                            .bid_token = position.option_collateral->bid_token,
                        };
                      }
                      market::OrderEngine engine(symbol, ctx);
                      return engine.create(request);
                    });
}

Outcome<std::monostate> MarketRegistry::increase_collateral(common::AccountId user, const SymbolKey& key,
                                                            common::PositionId position_id, std::uint64_t amount,
                                                            const PriceSources& prices, common::TimestampMs now_ms) {
  const auto collateral_token = position_at(key, position_id).collateral_token;
  return run_symbol(telemetry::Operation::kCollateral, key, collateral_token, &prices, now_ms,
                    [&](market::SymbolMarket& symbol, market::TradingContext& ctx) {
                      market::PositionLedger(symbol, ctx).increase_collateral(user, position_id, amount);
                      return std::monostate{};
                    });
}

Outcome<std::monostate> MarketRegistry::release_collateral(common::AccountId user, const SymbolKey& key,
                                                           common::PositionId position_id, std::uint64_t amount,
                                                           const PriceSources& prices, common::TimestampMs now_ms) {
  const auto collateral_token = position_at(key, position_id).collateral_token;
  return run_symbol(telemetry::Operation::kCollateral, key, collateral_token, &prices, now_ms,
                    [&](market::SymbolMarket& symbol, market::TradingContext& ctx) {
                      market::PositionLedger(symbol, ctx).release_collateral(user, position_id, amount);
                      return std::monostate{};
                    });
}

Outcome<std::monostate> MarketRegistry::increase_option_collateral(common::AccountId user, const SymbolKey& key,
                                                                   common::PositionId position_id,
                                                                   std::vector<common::BidReceipt> receipts,
                                                                   const PriceSources& prices,
                                                                   common::TimestampMs now_ms) {
  const auto collateral_token = position_at(key, position_id).collateral_token;
  return run_symbol(telemetry::Operation::kCollateral, key, collateral_token, &prices, now_ms,
                    [&](market::SymbolMarket& symbol, market::TradingContext& ctx) {
                      market::PositionLedger(symbol, ctx).increase_option_collateral(user, position_id, receipts);
                      return std::monostate{};
                    });
}

Outcome<std::monostate> MarketRegistry::release_option_collateral(common::AccountId user, const SymbolKey& key,
                                                                  common::PositionId position_id,
                                                                  const std::vector<common::ReceiptId>& receipt_ids,
                                                                  const PriceSources& prices,
                                                                  common::TimestampMs now_ms) {
  const auto collateral_token = position_at(key, position_id).collateral_token;
  return run_symbol(telemetry::Operation::kCollateral, key, collateral_token, &prices, now_ms,
                    [&](market::SymbolMarket& symbol, market::TradingContext& ctx) {
                      market::PositionLedger(symbol, ctx).release_option_collateral(user, position_id, receipt_ids);
                      return std::monostate{};
                    });
}

// Maintenance

Outcome<market::MatchOutcome> MarketRegistry::match_trading_orders(common::AccountId caller, const SymbolKey& key,
                                                                   market::OrderBucket bucket,
                                                                   std::uint64_t trigger_price,
                                                                   const common::TokenType& collateral_token,
                                                                   std::size_t budget, const PriceSources& prices,
                                                                   common::TimestampMs now_ms) {
  access_.require(caller, auth::Role::kOperator);
  return run_symbol(telemetry::Operation::kMatchOrders, key, collateral_token, &prices, now_ms,
                    [&](market::SymbolMarket& symbol, market::TradingContext& ctx) {
                      market::OrderEngine engine(symbol, ctx);
                      return engine.match(bucket, trigger_price, budget);
                    });
}

std::vector<std::uint64_t> MarketRegistry::triggered_prices(const SymbolKey& key, market::OrderBucket bucket,
                                                            const oracle::Oracle& trading,
                                                            common::TimestampMs now_ms) const {
  const auto& target = symbol(key);
  const auto price =
      oracle::checked_price(trading, target.config.oracle_id, now_ms, target.config.max_staleness_ms);
  return target.book.triggered_prices(bucket, price.price);
}

funding::FundingUpdate MarketRegistry::update_funding_rate(const SymbolKey& key, const oracle::Oracle& trading,
                                                           common::TimestampMs now_ms) {
  const auto started = common::now_steady();
  try {
    auto& owner = market_at(key.market);
    auto& target = symbol_at(key);
    const auto& backing = pool_at(owner.lp_token);
    const auto price =
        oracle::checked_price(trading, target.config.oracle_id, now_ms, target.config.max_staleness_ms);

    Transaction tx;
    tx.track(target);
    events::EventBuffer buffer;
    const auto update = funding::FundingEngine(target).update_funding_rate(now_ms, price, backing.tvl_usd());
    if (update.updated) {
      buffer.emit(events::FundingUpdated{
          .market = owner.index,
          .symbol = key.base_token,
          .previous_index = update.previous_index,
          .index = update.index,
          .intervals = update.intervals,
          .funding_ts = update.funding_ts,
      });
    }
    [[maybe_unused]] const auto payouts = finish(tx, telemetry::Operation::kFunding, now_ms, buffer, {}, started);
    return update;
  } catch (const std::exception&) {
    reverted();
    throw;
  }
}

void MarketRegistry::update_pool_value(const common::TokenType& lp_token, const common::TokenType& token,
                                       const oracle::Oracle& oracle, common::TimestampMs now_ms) {
  auto& target = pool_at(lp_token);
  const auto& config = target.token_config(token);
  const auto price = oracle::checked_price(oracle, config.oracle_id, now_ms, config.max_staleness_ms);
  Transaction tx;
  tx.track(target);
  target.update_borrow_info(token, now_ms);
  target.update_token_value(token, price, now_ms);
  tx.commit();
}

Outcome<liquidation::LiquidationResult> MarketRegistry::liquidate(common::AccountId liquidator, const SymbolKey& key,
                                                                  common::PositionId position_id,
                                                                  const PriceSources& prices,
                                                                  common::TimestampMs now_ms) {
  const auto collateral_token = position_at(key, position_id).collateral_token;
  return run_symbol(telemetry::Operation::kLiquidate, key, collateral_token, &prices, now_ms,
                    [&](market::SymbolMarket& symbol, market::TradingContext& ctx) {
                      liquidation::LiquidationEngine engine(symbol, ctx);
                      return engine.liquidate(position_id, liquidator);
                    });
}

liquidation::LiquidationInfo MarketRegistry::get_liquidation_info(const SymbolKey& key,
                                                                  const common::TokenType& collateral_token,
                                                                  bool include_all, std::size_t cursor,
                                                                  std::size_t budget, const PriceSources& prices,
                                                                  common::TimestampMs now_ms) {
  auto outcome = run_symbol(telemetry::Operation::kLiquidate, key, collateral_token, &prices, now_ms,
                            [&](market::SymbolMarket& symbol, market::TradingContext& ctx) {
                              liquidation::LiquidationEngine engine(symbol, ctx);
                              return engine.get_liquidation_info(include_all, cursor, budget);
                            });
  return std::move(outcome.value);
}

Outcome<liquidation::SettleResult> MarketRegistry::settle_unsettled_receipts(common::AccountId caller,
                                                                             std::uint64_t cursor, std::size_t budget,
                                                                             common::TimestampMs now_ms) {
  access_.require(caller, auth::Role::kOperator);
  const auto started = common::now_steady();
  try {
    Transaction tx;
    tx.track(pools_);
    tx.track(vaults_);
    tx.track(escrow_);

    events::EventBuffer buffer;
    std::vector<common::Payout> payouts;
    const liquidation::PoolResolver resolver = [this](common::MarketIndex index) -> pool::LiquidityPool& {
      return pool_at(market_at(index).lp_token);
    };
    Outcome<liquidation::SettleResult> outcome{
        .value = liquidation::settle_unsettled_receipts(escrow_, vaults_, resolver, buffer, payouts, now_ms, cursor,
                                                        budget),
    };
    outcome.payouts =
        finish(tx, telemetry::Operation::kSettleReceipts, now_ms, buffer, std::move(payouts), started);
    return outcome;
  } catch (const std::exception&) {
    reverted();
    throw;
  }
}

Outcome<market::OpenInterestSweep> MarketRegistry::cancel_orders_by_open_interest(common::AccountId caller,
                                                                                  const SymbolKey& key,
                                                                                  std::size_t cursor,
                                                                                  std::size_t budget,
                                                                                  common::TimestampMs now_ms) {
  access_.require(caller, auth::Role::kOperator);
  return run_symbol(telemetry::Operation::kCancelOrder, key, common::TokenType{}, nullptr, now_ms,
                    [&](market::SymbolMarket& symbol, market::TradingContext& ctx) {
                      market::OrderEngine engine(symbol, ctx);
                      return engine.cancel_by_open_interest(cursor, budget);
                    });
}

// Queries

const Market& MarketRegistry::market(common::MarketIndex index) const {
  auto it = markets_.find(index);
  if (it == markets_.end()) {
    throw EngineError(ErrorCode::kMarketNotFound, std::to_string(index));
  }
  return it->second;
}

const market::SymbolMarket& MarketRegistry::symbol(const SymbolKey& key) const {
  const auto& owner = market(key.market);
  auto it = owner.symbols.find(key.base_token);
  if (it == owner.symbols.end()) {
    throw EngineError(ErrorCode::kSymbolNotFound, key.base_token);
  }
  return it->second;
}

const market::Position& MarketRegistry::position(const SymbolKey& key, common::PositionId id) const {
  return position_at(key, id);
}

std::vector<market::TradingOrder> MarketRegistry::orders_of(const SymbolKey& key, common::AccountId user) const {
  return symbol(key).book.orders_of(user);
}

const pool::LiquidityPool& MarketRegistry::pool(const common::TokenType& lp_token) const {
  auto it = pools_.find(lp_token);
  if (it == pools_.end()) {
    throw EngineError(ErrorCode::kTokenNotSupported, lp_token);
  }
  return it->second;
}

}  // namespace registry
}  // namespace perpcore
