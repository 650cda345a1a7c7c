#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <vector>

#include "perpcore/common/types.hpp"
#include "perpcore/events/events.hpp"
#include "perpcore/market/position_ledger.hpp"
#include "perpcore/market/symbol_market.hpp"
#include "perpcore/market/trading_context.hpp"
#include "perpcore/pool/liquidity_pool.hpp"
#include "perpcore/vault/option_vault.hpp"
#include "perpcore/vault/receipt_escrow.hpp"

namespace perpcore {
namespace liquidation {

inline constexpr std::uint64_t kLiquidatorFeeBp = 100;

struct LiquidationResult {
  common::PositionId position_id{0};
  std::uint64_t collateral_seized{0};
  std::uint64_t liquidator_fee{0};
  std::uint64_t pool_share{0};
  std::optional<std::uint64_t> escrow_id{};
};

struct LiquidationInfo {
  std::vector<common::PositionId> position_ids{};
  std::size_t next_cursor{0};
  bool done{true};
};

class LiquidationEngine {
 public:
  LiquidationEngine(market::SymbolMarket& market, market::TradingContext& ctx) noexcept
      : market_(market), ctx_(ctx), ledger_(market, ctx) {}

  [[nodiscard]] bool is_liquidatable(const market::Position& position) const;

  // Closes an undercollateralized position. The liquidator receives a fee out of
  // the collateral; everything else goes to the pool.
  LiquidationResult liquidate(common::PositionId id, common::AccountId liquidator);

  // Scans position slots [cursor, cursor + budget) holding the context's collateral
  // token and reports the liquidatable ones (or all of them).
  [[nodiscard]] LiquidationInfo get_liquidation_info(bool include_all, std::size_t cursor, std::size_t budget) const;

 private:
  market::SymbolMarket& market_;
  market::TradingContext& ctx_;
  market::PositionLedger ledger_;
};

struct SettleResult {
  std::size_t inspected{0};
  std::size_t settled{0};
  // Escrow id the next call should start from.
  std::uint64_t next_cursor{0};
  bool done{false};
};

using PoolResolver = std::function<pool::LiquidityPool&(common::MarketIndex)>;

// Exercises escrowed receipts once all of them have expired and pays out what
// each record owes: liquidator first, then the pool, then the residual.
// Records are visited in escrow id order starting at `cursor`.
SettleResult settle_unsettled_receipts(vault::ReceiptEscrow& escrow, vault::OptionVaults& vaults,
                                       const PoolResolver& pools, events::EventBuffer& events,
                                       std::vector<common::Payout>& payouts, common::TimestampMs now_ms,
                                       std::uint64_t cursor, std::size_t budget);

}  // namespace liquidation
}  // namespace perpcore
