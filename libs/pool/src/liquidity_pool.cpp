#include "perpcore/pool/liquidity_pool.hpp"

#include <utility>

#include "perpcore/common/error.hpp"
#include "perpcore/common/fixed_point.hpp"
#include "perpcore/common/time_utils.hpp"

namespace perpcore {
namespace pool {

using common::EngineError;
using common::ErrorCode;

LiquidityPool::LiquidityPool(common::TokenType lp_token) : lp_token_(std::move(lp_token)) {}

void LiquidityPool::add_token(const TokenConfig& config, common::TimestampMs now_ms) {
  common::ensure(config.borrow_interval_ms > 0, ErrorCode::kInvalidConfig);
  TokenEntry token_entry{.config = config, .state = TokenState{}};
  token_entry.state.last_borrow_rate_ts = common::align_down(now_ms, config.borrow_interval_ms);
  auto [it, inserted] = tokens_.try_emplace(config.token, std::move(token_entry));
  if (!inserted) {
    throw EngineError(ErrorCode::kTokenAlreadyExists, config.token);
  }
}

bool LiquidityPool::has_token(const common::TokenType& token) const {
  return tokens_.find(token) != tokens_.end();
}

const TokenConfig& LiquidityPool::token_config(const common::TokenType& token) const {
  return entry(token).config;
}

const TokenState& LiquidityPool::token_state(const common::TokenType& token) const {
  return entry(token).state;
}

std::vector<common::TokenType> LiquidityPool::tokens() const {
  std::vector<common::TokenType> result;
  result.reserve(tokens_.size());
  for (const auto& [token, _] : tokens_) {
    result.push_back(token);
  }
  return result;
}

bool LiquidityPool::is_token_active(const common::TokenType& token) const {
  return active_ && entry(token).state.active;
}

void LiquidityPool::set_token_active(const common::TokenType& token, bool active) {
  entry(token).state.active = active;
}

void LiquidityPool::deposit_liquidity(const common::TokenType& token, std::uint64_t amount) {
  auto& state = entry(token).state;
  common::ensure(amount <= common::kU64Max - state.liquidity_amount, ErrorCode::kArithmeticOverflow);
  state.liquidity_amount += amount;
}

void LiquidityPool::withdraw_liquidity(const common::TokenType& token, std::uint64_t amount) {
  auto& state = entry(token).state;
  common::ensure(amount <= available_reserve(token), ErrorCode::kInsufficientLiquidity);
  state.liquidity_amount -= amount;
}

void LiquidityPool::update_token_value(const common::TokenType& token, common::PriceQuote price,
                                       common::TimestampMs now_ms) {
  auto& token_entry = entry(token);
  token_entry.state.value_in_usd = common::amount_to_usd(token_entry.state.liquidity_amount,
                                                         token_entry.config.decimal, price.price, price.decimal);
  token_entry.state.last_value_ts = now_ms;
}

void LiquidityPool::update_borrow_info(const common::TokenType& token, common::TimestampMs now_ms) {
  auto& token_entry = entry(token);
  auto& state = token_entry.state;
  const auto interval = token_entry.config.borrow_interval_ms;
  if (now_ms < state.last_borrow_rate_ts + interval) {
    return;
  }

  const std::uint64_t intervals = (now_ms - state.last_borrow_rate_ts) / interval;
  const std::uint64_t utilization = common::mul_div(state.reserved_amount, common::kRateScale, state.liquidity_amount);
  const std::uint64_t rate = common::saturating_add(
      token_entry.config.basic_borrow_rate,
      common::mul_div(token_entry.config.basic_borrow_rate, utilization, common::kRateScale));
  state.cumulative_borrow_rate =
      common::saturating_add(state.cumulative_borrow_rate, common::saturating_mul(rate, intervals));
  state.last_borrow_rate_ts += intervals * interval;
}

std::uint64_t LiquidityPool::tvl_usd() const noexcept {
  std::uint64_t total = 0;
  for (const auto& [_, token_entry] : tokens_) {
    total = common::saturating_add(total, token_entry.state.value_in_usd);
  }
  return total;
}

std::uint64_t LiquidityPool::cumulative_borrow_rate(const common::TokenType& token) const {
  return entry(token).state.cumulative_borrow_rate;
}

std::uint64_t LiquidityPool::available_reserve(const common::TokenType& token) const {
  const auto& state = entry(token).state;
  return common::saturating_sub(state.liquidity_amount, state.reserved_amount);
}

void LiquidityPool::update_reserve_amount(const common::TokenType& token, common::SignedAmount delta) {
  auto& state = entry(token).state;
  if (delta.is_negative()) {
    common::ensure(delta.magnitude() <= state.reserved_amount, ErrorCode::kArithmeticOverflow);
    state.reserved_amount -= delta.magnitude();
    return;
  }
  common::ensure(delta.magnitude() <= common::saturating_sub(state.liquidity_amount, state.reserved_amount),
                 ErrorCode::kInsufficientPoolReserve);
  state.reserved_amount += delta.magnitude();
}

void LiquidityPool::put_collateral(const common::TokenType& token, std::uint64_t amount) {
  auto& state = entry(token).state;
  common::ensure(amount <= common::kU64Max - state.collateral_amount, ErrorCode::kArithmeticOverflow);
  state.collateral_amount += amount;
}

void LiquidityPool::request_collateral(const common::TokenType& token, std::uint64_t amount) {
  auto& state = entry(token).state;
  common::ensure(amount <= state.collateral_amount, ErrorCode::kInsufficientBalance);
  state.collateral_amount -= amount;
}

void LiquidityPool::realize_from_collateral(const common::TokenType& token, std::uint64_t amount) {
  request_collateral(token, amount);
  receive(token, amount);
}

void LiquidityPool::pay_to_collateral(const common::TokenType& token, std::uint64_t amount) {
  pay_out(token, amount);
  put_collateral(token, amount);
}

void LiquidityPool::pay_out(const common::TokenType& token, std::uint64_t amount) {
  auto& state = entry(token).state;
  common::ensure(amount <= state.liquidity_amount, ErrorCode::kInsufficientLiquidity);
  state.liquidity_amount -= amount;
}

void LiquidityPool::receive(const common::TokenType& token, std::uint64_t amount) {
  auto& state = entry(token).state;
  common::ensure(amount <= common::kU64Max - state.liquidity_amount, ErrorCode::kArithmeticOverflow);
  state.liquidity_amount += amount;
}

void LiquidityPool::order_filled(const common::TokenType& token, std::uint64_t trading_fee, std::uint64_t borrow_fee) {
  auto& state = entry(token).state;
  state.total_trading_fee = common::saturating_add(state.total_trading_fee, trading_fee);
  state.total_borrow_fee = common::saturating_add(state.total_borrow_fee, borrow_fee);
}

LiquidityPool::TokenEntry& LiquidityPool::entry(const common::TokenType& token) {
  auto it = tokens_.find(token);
  if (it == tokens_.end()) {
    throw EngineError(ErrorCode::kTokenNotSupported, token);
  }
  return it->second;
}

const LiquidityPool::TokenEntry& LiquidityPool::entry(const common::TokenType& token) const {
  auto it = tokens_.find(token);
  if (it == tokens_.end()) {
    throw EngineError(ErrorCode::kTokenNotSupported, token);
  }
  return it->second;
}

}  // namespace pool
}  // namespace perpcore
