#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <vector>

#include "perpcore/common/error.hpp"
#include "perpcore/common/types.hpp"
#include "perpcore/events/event_sink.hpp"
#include "perpcore/market/market_state.hpp"
#include "perpcore/oracle/price_feed.hpp"
#include "perpcore/pool/liquidity_pool.hpp"
#include "perpcore/registry/market_registry.hpp"

namespace perpcore::tests {

inline constexpr common::AccountId kAdmin = 1;
inline constexpr common::AccountId kOperator = 2;
inline constexpr common::AccountId kAlice = 100;
inline constexpr common::AccountId kBob = 101;

inline constexpr common::OracleId kBtcOracle = 1;
inline constexpr common::OracleId kUsdcOracle = 2;

// Hour aligned so funding and borrow intervals start on a boundary.
inline constexpr common::TimestampMs kStart = 7'200'000;
inline constexpr std::uint64_t kHourMs = 3'600'000;

// 6 decimals, priced at exactly 1 USD.
inline constexpr std::uint64_t kUsdcUnit = 1'000'000;
inline constexpr std::uint64_t kPoolLiquidity = 1'000'000 * kUsdcUnit;

inline const common::TokenType kLp{"0x2::plp::PLP"};
inline const common::TokenType kUsdc{"0x2::usdc::USDC"};
inline const common::TokenType kBtc{"0x2::btc::BTC"};
inline const common::TokenType kQuote{"0x2::usd::USD"};
inline const common::TokenType kBid{"0x2::bid::BID"};

// Whole-unit BTC sizes at a whole-dollar price, 10x max leverage, flat 0.1% fee,
// 5% maintenance margin.
inline market::MarketConfig test_market_config() {
  return market::MarketConfig{
      .oracle_id = kBtcOracle,
      .max_staleness_ms = 60'000,
      .max_leverage_mbp = 100'000'000,
      .option_max_leverage_mbp = 50'000'000,
      .min_size = 1,
      .lot_size = 1,
      .trading_fee = {.base_fee_mbp = 10'000, .max_fee_mbp = 10'000, .allocated_exposure_mbp = 5'000'000},
      .funding = {.basic_funding_rate = 1'000'000, .funding_interval_ms = kHourMs},
      .maintenance_margin_bp = 500,
      .option_maintenance_margin_bp = 1'000,
      .max_long_open_interest = 1'000,
      .max_short_open_interest = 1'000,
  };
}

// Keeps events in memory. With `failing` set it throws instead, the way a
// journal does when a write fails.
class TestSink final : public events::EventSink {
 public:
  void publish(common::TimestampMs timestamp_ms, const events::EventBuffer& events) override {
    if (failing) {
      throw std::runtime_error("event sink unavailable");
    }
    memory_.publish(timestamp_ms, events);
  }

  [[nodiscard]] std::vector<events::PublishedEvent> drain() { return memory_.drain(); }
  [[nodiscard]] std::size_t size() const { return memory_.size(); }

  bool failing{false};

 private:
  events::MemorySink memory_;
};

// Registry with one pool (USDC), one market and one BTC symbol.
struct TestDesk {
  TestSink sink;
  registry::MarketRegistry engine{kAdmin, sink};
  std::uint64_t btc_price{100};
  oracle::PriceFeed btc{kBtcOracle, 100, 0, kStart};
  oracle::PriceFeed usdc{kUsdcOracle, 1, 0, kStart};
  common::TimestampMs now{kStart};
  registry::SymbolKey key{};

  explicit TestDesk(std::uint64_t basic_borrow_rate = 0) {
    engine.grant_role(kAdmin, kOperator, auth::Role::kOperator);
    engine.add_pool(kAdmin, kLp);
    engine.add_pool_token(kAdmin, kLp,
                          pool::TokenConfig{
                              .token = kUsdc,
                              .decimal = 6,
                              .oracle_id = kUsdcOracle,
                              .max_staleness_ms = 60'000,
                              .basic_borrow_rate = basic_borrow_rate,
                              .borrow_interval_ms = kHourMs,
                          },
                          now);
    engine.deposit_liquidity(kAdmin, kLp, kUsdc, kPoolLiquidity);
    engine.update_pool_value(kLp, kUsdc, usdc, now);
    const auto index = engine.create_market(kAdmin, kLp, kQuote, 0);
    engine.add_symbol(kAdmin, index, kBtc, 0, test_market_config(), now);
    key = registry::SymbolKey{.market = index, .base_token = kBtc};
  }

  [[nodiscard]] registry::PriceSources prices() const {
    return registry::PriceSources{.trading = btc, .collateral = usdc};
  }

  void set_price(std::uint64_t price) {
    btc_price = price;
    btc.update(price, 0, now);
  }

  // Moves the clock and republishes both feeds.
  void advance(std::uint64_t ms) {
    now += ms;
    btc.update(btc_price, 0, now);
    usdc.update(1, 0, now);
  }

  registry::Outcome<market::CreateOutcome> open(common::AccountId user, common::Side side, std::uint64_t size,
                                                std::uint64_t collateral) {
    return engine.create_trading_order(user, key,
                                       registry::TokenOrderRequest{
                                           .side = side,
                                           .size = size,
                                           .trigger_price = btc_price,
                                           .collateral_token = kUsdc,
                                           .collateral_amount = collateral,
                                       },
                                       prices(), now);
  }

  [[nodiscard]] const market::SymbolMarket& symbol() const { return engine.symbol(key); }
  [[nodiscard]] const pool::TokenState& usdc_state() const { return engine.pool(kLp).token_state(kUsdc); }
};

// Code of the EngineError `fn` throws, if any.
template <typename Fn>
std::optional<common::ErrorCode> thrown(Fn&& fn) {
  try {
    fn();
  } catch (const common::EngineError& error) {
    return error.code();
  }
  return std::nullopt;
}

}  // namespace perpcore::tests
