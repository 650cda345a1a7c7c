#pragma once

#include <cstdint>
#include <map>
#include <set>
#include <span>
#include <vector>

#include "perpcore/common/types.hpp"

namespace perpcore {
namespace vault {

inline constexpr std::uint64_t kShareScale = 1'000'000'000;

struct VaultInfo {
  std::uint64_t index{0};
  common::TokenType bid_token;
  common::TokenType settlement_token;
  common::TimestampMs expiry_ms{0};
  std::uint64_t value_per_share{0};  // settlement token units per kShareScale shares
};

// Option vaults whose bid receipts may be posted as collateral. Pricing of the
// options themselves is external; the vault only publishes an intrinsic value.
class OptionVaults {
 public:
  void add_vault(const VaultInfo& info);
  void update_intrinsic_value(std::uint64_t vault_index, std::uint64_t value_per_share);
  [[nodiscard]] common::BidReceipt issue_receipt(std::uint64_t vault_index, std::uint64_t shares);

  [[nodiscard]] const VaultInfo& vault(std::uint64_t vault_index) const;
  [[nodiscard]] bool has_vault(std::uint64_t vault_index) const;

  [[nodiscard]] std::uint64_t intrinsic_value(const common::BidReceipt& receipt) const;
  [[nodiscard]] std::uint64_t intrinsic_value(std::span<const common::BidReceipt> receipts) const;
  [[nodiscard]] bool is_expired(const common::BidReceipt& receipt, common::TimestampMs now_ms) const;

  // Every receipt must be live, distinct and come from `vault_index`, and that
  // vault must issue `bid_token`.
  void validate(std::span<const common::BidReceipt> receipts,
                std::uint64_t vault_index,
                const common::TokenType& bid_token) const;

  // Burns expired receipts for settlement tokens.
  [[nodiscard]] std::uint64_t exercise(std::span<const common::BidReceipt> receipts, common::TimestampMs now_ms);

 private:
  std::map<std::uint64_t, VaultInfo> vaults_{};
  std::map<common::ReceiptId, common::BidReceipt> issued_{};
  std::set<common::ReceiptId> exercised_{};
  common::ReceiptId next_receipt_id_{1};

  void ensure_live(const common::BidReceipt& receipt) const;
};

}  // namespace vault
}  // namespace perpcore
