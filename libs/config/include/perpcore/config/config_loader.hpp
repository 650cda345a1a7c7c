#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

#include "perpcore/common/types.hpp"
#include "perpcore/market/market_state.hpp"
#include "perpcore/pool/liquidity_pool.hpp"

namespace perpcore {
namespace config {

struct JournalConfig {
  bool enabled{true};
  std::filesystem::path path{"/var/lib/perpcore/events.journal"};
  std::size_t flush_threshold{1 << 16};
  bool fsync_on_publish{false};
};

struct TelemetryConfig {
  bool enabled{true};
  std::size_t buffer_size{1024};
};

struct AccessConfig {
  common::AccountId admin{1};
  std::vector<common::AccountId> operators{};
};

struct CrankConfig {
  std::size_t cycles{10};
  std::uint64_t step_ms{1'000};
  std::size_t match_budget{64};
  std::size_t liquidation_budget{64};
  std::size_t settle_budget{16};
};

struct OracleConfig {
  common::OracleId id{0};
  std::uint64_t price{0};
  std::uint64_t decimal{0};
};

struct PoolTokenConfig {
  pool::TokenConfig token{};
  std::uint64_t initial_liquidity{0};
};

struct PoolConfig {
  common::TokenType lp_token;
  std::vector<PoolTokenConfig> tokens{};
};

struct SymbolConfig {
  common::TokenType base_token;
  std::uint64_t size_decimal{0};
  market::MarketConfig market{};
};

struct MarketConfig {
  common::TokenType lp_token;
  common::TokenType quote_token;
  std::uint64_t protocol_fee_share_bp{0};
  std::vector<SymbolConfig> symbols{};
};

struct EngineConfig {
  JournalConfig journal;
  TelemetryConfig telemetry;
  AccessConfig access;
  CrankConfig crank;
  std::vector<OracleConfig> oracles;
  std::vector<PoolConfig> pools;
  std::vector<MarketConfig> markets;
};

struct ValidationError {
  std::string field;
  std::string message;
};

struct LoadResult {
  bool success{false};
  EngineConfig config;
  std::vector<ValidationError> errors;
  std::string raw_error;
};

class ConfigLoader {
 public:
  static LoadResult load(const std::filesystem::path& path);
  static LoadResult load_from_string(std::string_view toml_content);
  static std::vector<ValidationError> validate(const EngineConfig& config);
  static std::string generate_default();
};

}  // namespace config
}  // namespace perpcore
