#include "perpcore/config/config_loader.hpp"

#define TOML_EXCEPTIONS 0
#include <toml++/toml.hpp>

#include <set>
#include <sstream>

namespace perpcore {
namespace config {

namespace {

std::uint64_t get_uint_or(const toml::table& tbl, std::string_view key, std::uint64_t default_val) {
  if (auto val = tbl[key].value<std::int64_t>()) {
    return static_cast<std::uint64_t>(*val);
  }
  return default_val;
}

std::string get_str_or(const toml::table& tbl, std::string_view key, std::string_view default_val) {
  if (auto val = tbl[key].value<std::string_view>()) {
    return std::string(*val);
  }
  return std::string(default_val);
}

bool get_bool_or(const toml::table& tbl, std::string_view key, bool default_val) {
  if (auto val = tbl[key].value<bool>()) {
    return *val;
  }
  return default_val;
}

JournalConfig parse_journal(const toml::table& root) {
  JournalConfig cfg;
  if (auto* journal = root["journal"].as_table()) {
    cfg.enabled = get_bool_or(*journal, "enabled", cfg.enabled);
    cfg.path = get_str_or(*journal, "path", cfg.path.string());
    cfg.flush_threshold = static_cast<std::size_t>(get_uint_or(*journal, "flush_threshold", cfg.flush_threshold));
    cfg.fsync_on_publish = get_bool_or(*journal, "fsync_on_publish", cfg.fsync_on_publish);
  }
  return cfg;
}

TelemetryConfig parse_telemetry(const toml::table& root) {
  TelemetryConfig cfg;
  if (auto* telemetry = root["telemetry"].as_table()) {
    cfg.enabled = get_bool_or(*telemetry, "enabled", cfg.enabled);
    cfg.buffer_size = static_cast<std::size_t>(get_uint_or(*telemetry, "buffer_size", cfg.buffer_size));
  }
  return cfg;
}

AccessConfig parse_access(const toml::table& root) {
  AccessConfig cfg;
  if (auto* access = root["access"].as_table()) {
    cfg.admin = get_uint_or(*access, "admin", cfg.admin);
    if (auto* operators = (*access)["operators"].as_array()) {
      for (const auto& elem : *operators) {
        if (auto val = elem.value<std::int64_t>()) {
          cfg.operators.push_back(static_cast<common::AccountId>(*val));
        }
      }
    }
  }
  return cfg;
}

CrankConfig parse_crank(const toml::table& root) {
  CrankConfig cfg;
  if (auto* crank = root["crank"].as_table()) {
    cfg.cycles = static_cast<std::size_t>(get_uint_or(*crank, "cycles", cfg.cycles));
    cfg.step_ms = get_uint_or(*crank, "step_ms", cfg.step_ms);
    cfg.match_budget = static_cast<std::size_t>(get_uint_or(*crank, "match_budget", cfg.match_budget));
    cfg.liquidation_budget =
        static_cast<std::size_t>(get_uint_or(*crank, "liquidation_budget", cfg.liquidation_budget));
    cfg.settle_budget = static_cast<std::size_t>(get_uint_or(*crank, "settle_budget", cfg.settle_budget));
  }
  return cfg;
}

std::vector<OracleConfig> parse_oracles(const toml::table& root) {
  std::vector<OracleConfig> oracles;
  if (auto* arr = root["oracles"].as_array()) {
    for (const auto& elem : *arr) {
      if (auto* oracle_tbl = elem.as_table()) {
        OracleConfig oracle;
        oracle.id = get_uint_or(*oracle_tbl, "id", oracle.id);
        oracle.price = get_uint_or(*oracle_tbl, "price", oracle.price);
        oracle.decimal = get_uint_or(*oracle_tbl, "decimal", oracle.decimal);
        oracles.push_back(oracle);
      }
    }
  }
  return oracles;
}

std::vector<PoolConfig> parse_pools(const toml::table& root) {
  std::vector<PoolConfig> pools;
  if (auto* arr = root["pools"].as_array()) {
    for (const auto& elem : *arr) {
      auto* pool_tbl = elem.as_table();
      if (pool_tbl == nullptr) {
        continue;
      }
      PoolConfig pool_cfg;
      pool_cfg.lp_token = get_str_or(*pool_tbl, "lp_token", "");

      if (auto* tokens = (*pool_tbl)["tokens"].as_array()) {
        for (const auto& token_elem : *tokens) {
          if (auto* token_tbl = token_elem.as_table()) {
            PoolTokenConfig token;
            token.token.token = get_str_or(*token_tbl, "token", "");
            token.token.decimal = get_uint_or(*token_tbl, "decimal", token.token.decimal);
            token.token.oracle_id = get_uint_or(*token_tbl, "oracle_id", token.token.oracle_id);
            token.token.max_staleness_ms = get_uint_or(*token_tbl, "max_staleness_ms", token.token.max_staleness_ms);
            token.token.basic_borrow_rate =
                get_uint_or(*token_tbl, "basic_borrow_rate", token.token.basic_borrow_rate);
            token.token.borrow_interval_ms =
                get_uint_or(*token_tbl, "borrow_interval_ms", token.token.borrow_interval_ms);
            token.initial_liquidity = get_uint_or(*token_tbl, "initial_liquidity", token.initial_liquidity);
            pool_cfg.tokens.push_back(std::move(token));
          }
        }
      }

      pools.push_back(std::move(pool_cfg));
    }
  }
  return pools;
}

SymbolConfig parse_symbol(const toml::table& tbl) {
  SymbolConfig symbol;
  auto& cfg = symbol.market;
  symbol.base_token = get_str_or(tbl, "base_token", "");
  symbol.size_decimal = get_uint_or(tbl, "size_decimal", symbol.size_decimal);

  cfg.oracle_id = get_uint_or(tbl, "oracle_id", cfg.oracle_id);
  cfg.max_staleness_ms = get_uint_or(tbl, "max_staleness_ms", cfg.max_staleness_ms);
  cfg.max_leverage_mbp = get_uint_or(tbl, "max_leverage_mbp", cfg.max_leverage_mbp);
  cfg.option_max_leverage_mbp = get_uint_or(tbl, "option_max_leverage_mbp", cfg.option_max_leverage_mbp);
  cfg.min_size = get_uint_or(tbl, "min_size", cfg.min_size);
  cfg.lot_size = get_uint_or(tbl, "lot_size", cfg.lot_size);
  cfg.maintenance_margin_bp = get_uint_or(tbl, "maintenance_margin_bp", cfg.maintenance_margin_bp);
  cfg.option_maintenance_margin_bp =
      get_uint_or(tbl, "option_maintenance_margin_bp", cfg.option_maintenance_margin_bp);
  cfg.max_long_open_interest = get_uint_or(tbl, "max_long_open_interest", cfg.max_long_open_interest);
  cfg.max_short_open_interest = get_uint_or(tbl, "max_short_open_interest", cfg.max_short_open_interest);

  if (auto* fee_tbl = tbl["trading_fee"].as_table()) {
    cfg.trading_fee.base_fee_mbp = get_uint_or(*fee_tbl, "base_fee_mbp", cfg.trading_fee.base_fee_mbp);
    cfg.trading_fee.max_fee_mbp = get_uint_or(*fee_tbl, "max_fee_mbp", cfg.trading_fee.max_fee_mbp);
    cfg.trading_fee.allocated_exposure_mbp =
        get_uint_or(*fee_tbl, "allocated_exposure_mbp", cfg.trading_fee.allocated_exposure_mbp);
  }

  if (auto* funding_tbl = tbl["funding"].as_table()) {
    cfg.funding.basic_funding_rate = get_uint_or(*funding_tbl, "basic_funding_rate", cfg.funding.basic_funding_rate);
    cfg.funding.funding_interval_ms =
        get_uint_or(*funding_tbl, "funding_interval_ms", cfg.funding.funding_interval_ms);
  }

  return symbol;
}

std::vector<MarketConfig> parse_markets(const toml::table& root) {
  std::vector<MarketConfig> markets;
  if (auto* arr = root["markets"].as_array()) {
    for (const auto& elem : *arr) {
      auto* market_tbl = elem.as_table();
      if (market_tbl == nullptr) {
        continue;
      }
      MarketConfig market;
      market.lp_token = get_str_or(*market_tbl, "lp_token", "");
      market.quote_token = get_str_or(*market_tbl, "quote_token", "");
      market.protocol_fee_share_bp = get_uint_or(*market_tbl, "protocol_fee_share_bp", market.protocol_fee_share_bp);

      if (auto* symbols = (*market_tbl)["symbols"].as_array()) {
        for (const auto& symbol_elem : *symbols) {
          if (auto* symbol_tbl = symbol_elem.as_table()) {
            market.symbols.push_back(parse_symbol(*symbol_tbl));
          }
        }
      }

      markets.push_back(std::move(market));
    }
  }
  return markets;
}

EngineConfig parse_config(const toml::table& root) {
  EngineConfig cfg;
  cfg.journal = parse_journal(root);
  cfg.telemetry = parse_telemetry(root);
  cfg.access = parse_access(root);
  cfg.crank = parse_crank(root);
  cfg.oracles = parse_oracles(root);
  cfg.pools = parse_pools(root);
  cfg.markets = parse_markets(root);
  return cfg;
}

void validate_symbol(const SymbolConfig& symbol, const std::string& prefix, const std::set<common::OracleId>& oracles,
                     std::vector<ValidationError>& errors) {
  const auto& cfg = symbol.market;
  if (symbol.base_token.empty()) {
    errors.push_back({prefix + ".base_token", "base_token cannot be empty"});
  }
  if (oracles.find(cfg.oracle_id) == oracles.end()) {
    errors.push_back({prefix + ".oracle_id", "unknown oracle " + std::to_string(cfg.oracle_id)});
  }
  if (cfg.lot_size == 0) {
    errors.push_back({prefix + ".lot_size", "must be greater than 0"});
  } else if (cfg.min_size % cfg.lot_size != 0) {
    errors.push_back({prefix + ".min_size", "must be a multiple of lot_size"});
  }
  if (cfg.max_leverage_mbp == 0) {
    errors.push_back({prefix + ".max_leverage_mbp", "must be greater than 0"});
  }
  if (cfg.option_max_leverage_mbp == 0) {
    errors.push_back({prefix + ".option_max_leverage_mbp", "must be greater than 0"});
  }
  if (cfg.trading_fee.max_fee_mbp < cfg.trading_fee.base_fee_mbp) {
    errors.push_back({prefix + ".trading_fee", "max_fee_mbp must be >= base_fee_mbp"});
  }
  if (cfg.trading_fee.max_fee_mbp > common::kMbpScale) {
    errors.push_back({prefix + ".trading_fee.max_fee_mbp", "must be at most 10000000"});
  }
  if (cfg.funding.funding_interval_ms == 0) {
    errors.push_back({prefix + ".funding.funding_interval_ms", "must be greater than 0"});
  }
  if (cfg.maintenance_margin_bp > common::kBpScale) {
    errors.push_back({prefix + ".maintenance_margin_bp", "must be at most 10000"});
  }
  if (cfg.option_maintenance_margin_bp > common::kBpScale) {
    errors.push_back({prefix + ".option_maintenance_margin_bp", "must be at most 10000"});
  }
}

}  // namespace

LoadResult ConfigLoader::load(const std::filesystem::path& path) {
  LoadResult result;

  if (!std::filesystem::exists(path)) {
    result.raw_error = "Config file not found: " + path.string();
    return result;
  }

  auto parse_result = toml::parse_file(path.string());
  if (!parse_result) {
    std::ostringstream oss;
    oss << parse_result.error();
    result.raw_error = oss.str();
    return result;
  }

  result.config = parse_config(parse_result.table());
  result.errors = validate(result.config);
  result.success = result.errors.empty();
  return result;
}

LoadResult ConfigLoader::load_from_string(std::string_view toml_content) {
  LoadResult result;

  auto parse_result = toml::parse(toml_content);
  if (!parse_result) {
    std::ostringstream oss;
    oss << parse_result.error();
    result.raw_error = oss.str();
    return result;
  }

  result.config = parse_config(parse_result.table());
  result.errors = validate(result.config);
  result.success = result.errors.empty();
  return result;
}

std::vector<ValidationError> ConfigLoader::validate(const EngineConfig& config) {
  std::vector<ValidationError> errors;

  if (config.journal.enabled && config.journal.path.empty()) {
    errors.push_back({"journal.path", "path cannot be empty"});
  }
  if (config.journal.flush_threshold == 0) {
    errors.push_back({"journal.flush_threshold", "must be greater than 0"});
  }

  if (config.access.admin == 0) {
    errors.push_back({"access.admin", "admin account must be non-zero"});
  }

  if (config.crank.step_ms == 0) {
    errors.push_back({"crank.step_ms", "must be greater than 0"});
  }
  if (config.crank.match_budget == 0 || config.crank.liquidation_budget == 0 || config.crank.settle_budget == 0) {
    errors.push_back({"crank", "budgets must be greater than 0"});
  }

  std::set<common::OracleId> oracle_ids;
  for (std::size_t i = 0; i < config.oracles.size(); ++i) {
    const auto& oracle = config.oracles[i];
    std::string prefix = "oracles[" + std::to_string(i) + "]";
    if (oracle.id == 0) {
      errors.push_back({prefix + ".id", "oracle id must be greater than 0"});
    }
    if (oracle.price == 0) {
      errors.push_back({prefix + ".price", "must be greater than 0"});
    }
    if (!oracle_ids.insert(oracle.id).second) {
      errors.push_back({prefix + ".id", "duplicate oracle id " + std::to_string(oracle.id)});
    }
  }

  std::set<common::TokenType> lp_tokens;
  for (std::size_t i = 0; i < config.pools.size(); ++i) {
    const auto& pool_cfg = config.pools[i];
    std::string prefix = "pools[" + std::to_string(i) + "]";
    if (pool_cfg.lp_token.empty()) {
      errors.push_back({prefix + ".lp_token", "lp_token cannot be empty"});
    } else if (!lp_tokens.insert(pool_cfg.lp_token).second) {
      errors.push_back({prefix + ".lp_token", "duplicate pool " + pool_cfg.lp_token});
    }

    for (std::size_t j = 0; j < pool_cfg.tokens.size(); ++j) {
      const auto& token = pool_cfg.tokens[j].token;
      std::string token_prefix = prefix + ".tokens[" + std::to_string(j) + "]";
      if (token.token.empty()) {
        errors.push_back({token_prefix + ".token", "token cannot be empty"});
      }
      if (oracle_ids.find(token.oracle_id) == oracle_ids.end()) {
        errors.push_back({token_prefix + ".oracle_id", "unknown oracle " + std::to_string(token.oracle_id)});
      }
      if (token.borrow_interval_ms == 0) {
        errors.push_back({token_prefix + ".borrow_interval_ms", "must be greater than 0"});
      }
    }
  }

  for (std::size_t i = 0; i < config.markets.size(); ++i) {
    const auto& market = config.markets[i];
    std::string prefix = "markets[" + std::to_string(i) + "]";

    if (lp_tokens.find(market.lp_token) == lp_tokens.end()) {
      errors.push_back({prefix + ".lp_token", "unknown pool " + market.lp_token});
    }
    if (market.quote_token.empty()) {
      errors.push_back({prefix + ".quote_token", "quote_token cannot be empty"});
    }
    if (market.protocol_fee_share_bp > common::kBpScale) {
      errors.push_back({prefix + ".protocol_fee_share_bp", "must be at most 10000"});
    }

    std::set<common::TokenType> bases;
    for (std::size_t j = 0; j < market.symbols.size(); ++j) {
      const auto& symbol = market.symbols[j];
      std::string symbol_prefix = prefix + ".symbols[" + std::to_string(j) + "]";
      if (!symbol.base_token.empty() && !bases.insert(symbol.base_token).second) {
        errors.push_back({symbol_prefix + ".base_token", "duplicate symbol " + symbol.base_token});
      }
      validate_symbol(symbol, symbol_prefix, oracle_ids, errors);
    }
  }

  return errors;
}

std::string ConfigLoader::generate_default() {
  return R"(# perpcore engine configuration
# Generated default configuration

[journal]
enabled = true
path = "perpcore-events.journal"
flush_threshold = 65536
fsync_on_publish = false

[telemetry]
enabled = true
buffer_size = 1024

[access]
admin = 1
operators = [2]

[crank]
cycles = 10
step_ms = 1000
match_budget = 64
liquidation_budget = 64
settle_budget = 16

[[oracles]]
id = 1
price = 6_500_000_000_000  # BTC $65,000
decimal = 8

[[oracles]]
id = 2
price = 100_000_000  # USDC $1
decimal = 8

[[pools]]
lp_token = "0x2::plp::PLP"

[[pools.tokens]]
token = "0x2::usdc::USDC"
decimal = 6
oracle_id = 2
max_staleness_ms = 60000
basic_borrow_rate = 10_000         # 0.001% per interval
borrow_interval_ms = 3600000
initial_liquidity = 10_000_000_000_000  # 10M USDC

[[markets]]
lp_token = "0x2::plp::PLP"
quote_token = "0x2::usd::USD"
protocol_fee_share_bp = 3000  # 30%

[[markets.symbols]]
base_token = "0x2::btc::BTC"
size_decimal = 8
oracle_id = 1
max_staleness_ms = 60000
max_leverage_mbp = 500_000_000         # 50x
option_max_leverage_mbp = 100_000_000  # 10x
min_size = 100_000                     # 0.001 BTC
lot_size = 1_000
maintenance_margin_bp = 150
option_maintenance_margin_bp = 300
max_long_open_interest = 10_000_000_000   # 100 BTC
max_short_open_interest = 10_000_000_000

[markets.symbols.trading_fee]
base_fee_mbp = 1_000             # 1 bp
max_fee_mbp = 10_000             # 10 bp
allocated_exposure_mbp = 5_000_000  # 50% of TVL

[markets.symbols.funding]
basic_funding_rate = 100_000  # 0.01% per interval at full exposure
funding_interval_ms = 3600000
)";
}

}  // namespace config
}  // namespace perpcore
