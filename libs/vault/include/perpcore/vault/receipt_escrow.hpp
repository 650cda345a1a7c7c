#pragma once

#include <cstdint>
#include <map>
#include <vector>

#include "perpcore/common/types.hpp"

namespace perpcore {
namespace vault {

// Receipts held back because exercising them could not yet cover what their
// position owed. Settled once every receipt has expired.
struct UnsettledReceipt {
  std::uint64_t id{0};
  common::MarketIndex market{0};
  common::TokenType symbol;
  common::PositionId position_id{0};
  common::AccountId user{0};
  common::TokenType collateral_token;
  std::uint64_t vault_index{0};
  std::vector<common::BidReceipt> receipts{};
  common::AccountId liquidator{0};
  std::uint64_t liquidator_fee_owed{0};
  std::uint64_t pool_owed{0};
  bool residual_to_user{false};
};

class ReceiptEscrow {
 public:
  std::uint64_t add(UnsettledReceipt record);
  [[nodiscard]] const UnsettledReceipt* find(std::uint64_t id) const;
  void remove(std::uint64_t id);

  [[nodiscard]] std::size_t size() const noexcept { return records_.size(); }
  [[nodiscard]] const std::map<std::uint64_t, UnsettledReceipt>& records() const noexcept { return records_; }

 private:
  std::map<std::uint64_t, UnsettledReceipt> records_{};
  std::uint64_t next_id_{1};
};

}  // namespace vault
}  // namespace perpcore
