#include "test_config.hpp"

#include <algorithm>
#include <cassert>
#include <string>
#include <vector>

#include "perpcore/config/config_loader.hpp"

namespace perpcore::tests {

namespace {

bool has_error(const std::vector<config::ValidationError>& errors, const std::string& field) {
  return std::any_of(errors.begin(), errors.end(),
                     [&](const config::ValidationError& error) { return error.field == field; });
}

}  // namespace

void test_config_default() {
  const auto result = config::ConfigLoader::load_from_string(config::ConfigLoader::generate_default());
  assert(result.success);
  assert(result.errors.empty());

  const auto& cfg = result.config;
  assert(cfg.access.admin == 1);
  assert(cfg.access.operators.size() == 1 && cfg.access.operators[0] == 2);
  assert(cfg.oracles.size() == 2);
  assert(cfg.oracles[0].price == 6'500'000'000'000);
  assert(cfg.pools.size() == 1);
  assert(cfg.pools[0].tokens.size() == 1);
  assert(cfg.pools[0].tokens[0].token.decimal == 6);
  assert(cfg.pools[0].tokens[0].initial_liquidity == 10'000'000'000'000);
  assert(cfg.markets.size() == 1);
  assert(cfg.markets[0].protocol_fee_share_bp == 3'000);

  const auto& symbol = cfg.markets[0].symbols.at(0);
  assert(symbol.base_token == "0x2::btc::BTC");
  assert(symbol.market.max_leverage_mbp == 500'000'000);
  assert(symbol.market.trading_fee.max_fee_mbp == 10'000);
  assert(symbol.market.funding.funding_interval_ms == 3'600'000);
}

void test_config_validation() {
  auto result = config::ConfigLoader::load_from_string("[journal\npath = ");
  assert(!result.success);
  assert(!result.raw_error.empty());

  result = config::ConfigLoader::load_from_string(config::ConfigLoader::generate_default());
  auto cfg = result.config;
  cfg.access.admin = 0;
  cfg.markets[0].symbols[0].market.lot_size = 0;
  cfg.markets[0].symbols[0].market.oracle_id = 9;
  cfg.markets[0].symbols.push_back(cfg.markets[0].symbols[0]);
  cfg.pools[0].tokens[0].token.borrow_interval_ms = 0;
  cfg.markets[0].protocol_fee_share_bp = 10'001;

  const auto errors = config::ConfigLoader::validate(cfg);
  assert(has_error(errors, "access.admin"));
  assert(has_error(errors, "markets[0].symbols[0].lot_size"));
  assert(has_error(errors, "markets[0].symbols[0].oracle_id"));
  assert(has_error(errors, "markets[0].symbols[1].base_token"));
  assert(has_error(errors, "pools[0].tokens[0].borrow_interval_ms"));
  assert(has_error(errors, "markets[0].protocol_fee_share_bp"));
  assert(!has_error(errors, "journal.path"));

  // Symbols must reference a configured pool.
  cfg = result.config;
  cfg.markets[0].lp_token = "0x2::other::LP";
  assert(has_error(config::ConfigLoader::validate(cfg), "markets[0].lp_token"));
}

}  // namespace perpcore::tests
