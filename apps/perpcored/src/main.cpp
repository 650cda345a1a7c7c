#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <map>
#include <memory>
#include <vector>

#include "perpcore/auth/access_control.hpp"
#include "perpcore/common/error.hpp"
#include "perpcore/common/fixed_point.hpp"
#include "perpcore/common/time_utils.hpp"
#include "perpcore/config/config_loader.hpp"
#include "perpcore/events/event_sink.hpp"
#include "perpcore/market/order.hpp"
#include "perpcore/oracle/price_feed.hpp"
#include "perpcore/registry/market_registry.hpp"
#include "perpcore/telemetry/telemetry_sink.hpp"

namespace {

using namespace perpcore;

void print_usage(const char* program) {
  std::cerr << "Usage: " << program << " [config_file]\n"
            << "  config_file: Path to TOML configuration file\n"
            << "               If not specified, uses ./perpcore.toml or generates defaults\n";
}

std::filesystem::path find_config_path(int argc, char* argv[]) {
  if (argc > 1) {
    return std::filesystem::path{argv[1]};
  }

  const char* home = std::getenv("HOME");
  std::filesystem::path default_paths[] = {
      "./perpcore.toml",
      "/etc/perpcore/perpcore.toml",
      std::filesystem::path{home != nullptr ? home : ""} / ".config/perpcore/perpcore.toml",
  };

  for (const auto& path : default_paths) {
    if (!path.empty() && std::filesystem::exists(path)) {
      return path;
    }
  }

  return {};
}

struct Crank {
  registry::MarketRegistry& engine;
  std::map<common::OracleId, oracle::PriceFeed>& feeds;
  common::AccountId operator_account;
  const config::CrankConfig& budgets;

  std::size_t matched{0};
  std::size_t liquidated{0};
  std::size_t settled{0};
  std::size_t failures{0};
  // Escrow settlement picks up where the previous tick stopped.
  std::uint64_t settle_cursor{0};

  void report(const char* step, const common::EngineError& err) {
    ++failures;
    std::cerr << "  " << step << " failed: " << err.what() << "\n";
  }

  void run_symbol(const registry::Market& owner, const market::SymbolMarket& symbol, common::TimestampMs now_ms) {
    const registry::SymbolKey key{.market = owner.index, .base_token = symbol.base_token};
    const auto& trading = feeds.at(symbol.config.oracle_id);

    try {
      const auto update = engine.update_funding_rate(key, trading, now_ms);
      if (update.updated) {
        std::cout << "  " << symbol.base_token << " funding index " << (update.index.is_negative() ? "-" : "+")
                  << update.index.magnitude() << " after " << update.intervals << " interval(s)\n";
      }
    } catch (const common::EngineError& err) {
      report("funding", err);
    }

    const auto& backing = engine.pool(owner.lp_token);
    for (const auto& token : backing.tokens()) {
      const registry::PriceSources prices{
          .trading = trading,
          .collateral = feeds.at(backing.token_config(token).oracle_id),
      };

      for (const auto bucket : market::kAllBuckets) {
        try {
          for (const auto price : engine.triggered_prices(key, bucket, trading, now_ms)) {
            const auto outcome = engine.match_trading_orders(operator_account, key, bucket, price, token,
                                                             budgets.match_budget, prices, now_ms);
            matched += outcome.value.filled;
          }
        } catch (const common::EngineError& err) {
          report(market::bucket_tag(bucket), err);
        }
      }

      try {
        const auto info = engine.get_liquidation_info(key, token, false, 0, budgets.liquidation_budget, prices, now_ms);
        for (const auto position_id : info.position_ids) {
          const auto result = engine.liquidate(operator_account, key, position_id, prices, now_ms);
          ++liquidated;
          std::cout << "  liquidated position " << result.value.position_id << " seized "
                    << result.value.collateral_seized << "\n";
        }
      } catch (const common::EngineError& err) {
        report("liquidation", err);
      }
    }
  }

  void run(common::TimestampMs now_ms) {
    for (const auto& [index, owner] : engine.markets()) {
      for (const auto& [base, symbol] : owner.symbols) {
        run_symbol(owner, symbol, now_ms);
      }
    }
    try {
      const auto outcome =
          engine.settle_unsettled_receipts(operator_account, settle_cursor, budgets.settle_budget, now_ms);
      settled += outcome.value.settled;
      settle_cursor = outcome.value.next_cursor;
    } catch (const common::EngineError& err) {
      report("escrow settlement", err);
    }
  }
};

}  // namespace

int main(int argc, char* argv[]) {
  using namespace perpcore;

  auto config_path = find_config_path(argc, argv);
  config::EngineConfig cfg;

  if (config_path.empty()) {
    std::cout << "No config file found, using defaults\n";
    auto result = config::ConfigLoader::load_from_string(config::ConfigLoader::generate_default());
    if (!result.success) {
      std::cerr << "Failed to load default config: " << result.raw_error << "\n";
      return 1;
    }
    cfg = std::move(result.config);
  } else {
    std::cout << "Loading config from: " << config_path << "\n";
    auto result = config::ConfigLoader::load(config_path);
    if (!result.success) {
      if (!result.raw_error.empty()) {
        std::cerr << "Parse error: " << result.raw_error << "\n";
      }
      for (const auto& err : result.errors) {
        std::cerr << "Validation error [" << err.field << "]: " << err.message << "\n";
      }
      print_usage(argv[0]);
      return 1;
    }
    cfg = std::move(result.config);
  }

  std::cout << "Config loaded successfully\n";
  std::cout << "  Pools: " << cfg.pools.size() << "\n";
  std::cout << "  Markets: " << cfg.markets.size() << "\n";
  std::cout << "  Journal: " << (cfg.journal.enabled ? cfg.journal.path.string() : "disabled") << "\n";

  std::unique_ptr<events::EventSink> sink;
  events::JournalSink* journal = nullptr;
  if (cfg.journal.enabled) {
    if (cfg.journal.path.has_parent_path()) {
      std::filesystem::create_directories(cfg.journal.path.parent_path());
    }
    auto journal_sink =
        std::make_unique<events::JournalSink>(cfg.journal.path, cfg.journal.flush_threshold, cfg.journal.fsync_on_publish);
    journal = journal_sink.get();
    std::cout << "  Journal resumes at sequence " << journal->next_sequence() << "\n";
    sink = std::move(journal_sink);
  } else {
    sink = std::make_unique<events::NullSink>();
  }

  telemetry::TelemetrySink telemetry;
  registry::MarketRegistry registry{cfg.access.admin, *sink};
  if (cfg.telemetry.enabled) {
    registry.attach_telemetry(&telemetry);
  }

  const auto admin = cfg.access.admin;
  const auto operator_account = cfg.access.operators.empty() ? admin : cfg.access.operators.front();
  common::TimestampMs now_ms = common::now_ms();

  std::map<common::OracleId, oracle::PriceFeed> feeds;
  try {
    for (const auto& oracle_cfg : cfg.oracles) {
      feeds.emplace(oracle_cfg.id, oracle::PriceFeed{oracle_cfg.id, oracle_cfg.price, oracle_cfg.decimal, now_ms});
    }

    registry.grant_role(admin, operator_account, auth::Role::kOperator);
    for (const auto account : cfg.access.operators) {
      registry.grant_role(admin, account, auth::Role::kOperator);
    }

    for (const auto& pool_cfg : cfg.pools) {
      registry.add_pool(admin, pool_cfg.lp_token);
      for (const auto& token : pool_cfg.tokens) {
        registry.add_pool_token(admin, pool_cfg.lp_token, token.token, now_ms);
        if (token.initial_liquidity > 0) {
          registry.deposit_liquidity(admin, pool_cfg.lp_token, token.token.token, token.initial_liquidity);
        }
        registry.update_pool_value(pool_cfg.lp_token, token.token.token, feeds.at(token.token.oracle_id), now_ms);
      }
      std::cout << "  Pool " << pool_cfg.lp_token << " TVL " << registry.pool(pool_cfg.lp_token).tvl_usd()
                << " (usd, 9 decimals)\n";
    }

    for (const auto& market_cfg : cfg.markets) {
      const auto index =
          registry.create_market(admin, market_cfg.lp_token, market_cfg.quote_token, market_cfg.protocol_fee_share_bp);
      std::cout << "  Configuring market " << index << " (" << market_cfg.lp_token << " / " << market_cfg.quote_token
                << ")\n";
      for (const auto& symbol : market_cfg.symbols) {
        registry.add_symbol(admin, index, symbol.base_token, symbol.size_decimal, symbol.market, now_ms);
        std::cout << "    Symbol " << symbol.base_token << "\n";
      }
    }
  } catch (const common::EngineError& err) {
    std::cerr << "Bootstrap failed: " << err.what() << "\n";
    return 1;
  }

  std::cout << "perpcored bootstrapped successfully\n";

  Crank crank{.engine = registry, .feeds = feeds, .operator_account = operator_account, .budgets = cfg.crank};
  for (std::size_t cycle = 0; cycle < cfg.crank.cycles; ++cycle) {
    now_ms += cfg.crank.step_ms;
    for (auto& [id, feed] : feeds) {
      const auto quote = feed.price(now_ms, common::kU64Max);
      feed.update(quote.price, quote.decimal, now_ms);
    }
    crank.run(now_ms);
  }

  std::cout << "Crank finished: " << crank.matched << " fills, " << crank.liquidated << " liquidations, "
            << crank.settled << " escrow settlements, " << crank.failures << " failures\n";

  if (cfg.telemetry.enabled) {
    for (std::size_t idx = 0; idx < static_cast<std::size_t>(telemetry::Metric::kCount); ++idx) {
      const auto metric = static_cast<telemetry::Metric>(idx);
      std::cout << "  " << telemetry::to_string(metric) << " = " << telemetry.total(metric) << "\n";
    }
    for (const auto& summary : telemetry.drain_latency()) {
      std::cout << "  " << telemetry::to_string(summary.operation) << ": " << summary.count << " calls, mean "
                << summary.mean_ns << "ns, p99 " << summary.p99_ns << "ns\n";
    }
  }

  if (journal != nullptr) {
    journal->flush();
    std::cout << "Journal flushed at sequence " << journal->next_sequence() << "\n";
  }
  return 0;
}
