#pragma once

#include <cstdint>
#include <map>
#include <vector>

#include "perpcore/common/signed_amount.hpp"
#include "perpcore/common/types.hpp"

namespace perpcore {
namespace pool {

struct TokenConfig {
  common::TokenType token;
  std::uint64_t decimal{0};
  common::OracleId oracle_id{0};
  std::uint64_t max_staleness_ms{60'000};
  std::uint64_t basic_borrow_rate{0};  // kRateScale per borrow interval at zero utilization
  std::uint64_t borrow_interval_ms{3'600'000};
};

struct TokenState {
  std::uint64_t liquidity_amount{0};
  std::uint64_t value_in_usd{0};
  std::uint64_t reserved_amount{0};
  std::uint64_t collateral_amount{0};  // position collateral held on behalf of traders
  std::uint64_t cumulative_borrow_rate{0};
  common::TimestampMs last_borrow_rate_ts{0};
  common::TimestampMs last_value_ts{0};
  std::uint64_t total_trading_fee{0};
  std::uint64_t total_borrow_fee{0};
  bool active{true};
};

// Liquidity pool backing one market. Traders' realized losses and fees flow into
// `liquidity_amount`; profits are paid out of it. Every position keeps part of the
// liquidity reserved for its notional.
class LiquidityPool {
 public:
  explicit LiquidityPool(common::TokenType lp_token);

  void add_token(const TokenConfig& config, common::TimestampMs now_ms);
  [[nodiscard]] bool has_token(const common::TokenType& token) const;
  [[nodiscard]] const TokenConfig& token_config(const common::TokenType& token) const;
  [[nodiscard]] const TokenState& token_state(const common::TokenType& token) const;
  [[nodiscard]] std::vector<common::TokenType> tokens() const;

  [[nodiscard]] const common::TokenType& lp_token() const noexcept { return lp_token_; }
  [[nodiscard]] bool is_active() const noexcept { return active_; }
  [[nodiscard]] bool is_token_active(const common::TokenType& token) const;
  void set_active(bool active) noexcept { active_ = active; }
  void set_token_active(const common::TokenType& token, bool active);

  void deposit_liquidity(const common::TokenType& token, std::uint64_t amount);
  void withdraw_liquidity(const common::TokenType& token, std::uint64_t amount);

  void update_token_value(const common::TokenType& token, common::PriceQuote price, common::TimestampMs now_ms);
  void update_borrow_info(const common::TokenType& token, common::TimestampMs now_ms);
  [[nodiscard]] std::uint64_t tvl_usd() const noexcept;
  [[nodiscard]] std::uint64_t cumulative_borrow_rate(const common::TokenType& token) const;
  [[nodiscard]] std::uint64_t available_reserve(const common::TokenType& token) const;

  // Positive delta reserves liquidity, negative releases it.
  void update_reserve_amount(const common::TokenType& token, common::SignedAmount delta);

  void put_collateral(const common::TokenType& token, std::uint64_t amount);
  void request_collateral(const common::TokenType& token, std::uint64_t amount);
  // Moves position collateral into pool liquidity (fees, losses, liquidation residue).
  void realize_from_collateral(const common::TokenType& token, std::uint64_t amount);
  // Moves pool liquidity into position collateral (profits, funding received).
  void pay_to_collateral(const common::TokenType& token, std::uint64_t amount);
  // Pays liquidity out of the pool entirely (profits on receipt-collateralized positions).
  void pay_out(const common::TokenType& token, std::uint64_t amount);
  // Credits tokens that arrive from outside the pool (exercised receipts, fees).
  void receive(const common::TokenType& token, std::uint64_t amount);

  void order_filled(const common::TokenType& token, std::uint64_t trading_fee, std::uint64_t borrow_fee);

 private:
  struct TokenEntry {
    TokenConfig config;
    TokenState state;
  };

  common::TokenType lp_token_;
  bool active_{true};
  std::map<common::TokenType, TokenEntry> tokens_{};

  TokenEntry& entry(const common::TokenType& token);
  const TokenEntry& entry(const common::TokenType& token) const;
};

}  // namespace pool
}  // namespace perpcore
