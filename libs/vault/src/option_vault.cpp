#include "perpcore/vault/option_vault.hpp"

#include "perpcore/common/error.hpp"
#include "perpcore/common/fixed_point.hpp"

namespace perpcore {
namespace vault {

using common::EngineError;
using common::ErrorCode;

void OptionVaults::add_vault(const VaultInfo& info) {
  auto [_, inserted] = vaults_.try_emplace(info.index, info);
  if (!inserted) {
    throw EngineError(ErrorCode::kInvalidConfig, "vault index already registered");
  }
}

void OptionVaults::update_intrinsic_value(std::uint64_t vault_index, std::uint64_t value_per_share) {
  auto it = vaults_.find(vault_index);
  if (it == vaults_.end()) {
    throw EngineError(ErrorCode::kVaultNotFound);
  }
  it->second.value_per_share = value_per_share;
}

common::BidReceipt OptionVaults::issue_receipt(std::uint64_t vault_index, std::uint64_t shares) {
  common::ensure(has_vault(vault_index), ErrorCode::kVaultNotFound);
  common::BidReceipt receipt{.id = next_receipt_id_++, .vault_index = vault_index, .shares = shares};
  issued_.emplace(receipt.id, receipt);
  return receipt;
}

const VaultInfo& OptionVaults::vault(std::uint64_t vault_index) const {
  auto it = vaults_.find(vault_index);
  if (it == vaults_.end()) {
    throw EngineError(ErrorCode::kVaultNotFound);
  }
  return it->second;
}

bool OptionVaults::has_vault(std::uint64_t vault_index) const {
  return vaults_.find(vault_index) != vaults_.end();
}

std::uint64_t OptionVaults::intrinsic_value(const common::BidReceipt& receipt) const {
  ensure_live(receipt);
  return common::mul_div(receipt.shares, vault(receipt.vault_index).value_per_share, kShareScale);
}

std::uint64_t OptionVaults::intrinsic_value(std::span<const common::BidReceipt> receipts) const {
  std::uint64_t total = 0;
  for (const auto& receipt : receipts) {
    total = common::saturating_add(total, intrinsic_value(receipt));
  }
  return total;
}

bool OptionVaults::is_expired(const common::BidReceipt& receipt, common::TimestampMs now_ms) const {
  return now_ms >= vault(receipt.vault_index).expiry_ms;
}

void OptionVaults::validate(std::span<const common::BidReceipt> receipts,
                            std::uint64_t vault_index,
                            const common::TokenType& bid_token) const {
  common::ensure(vault(vault_index).bid_token == bid_token, ErrorCode::kBidTokenMismatch);
  std::set<common::ReceiptId> seen;
  for (const auto& receipt : receipts) {
    common::ensure(receipt.vault_index == vault_index, ErrorCode::kBidTokenMismatch);
    common::ensure(seen.insert(receipt.id).second, ErrorCode::kBidTokenMismatch);
    ensure_live(receipt);
  }
}

std::uint64_t OptionVaults::exercise(std::span<const common::BidReceipt> receipts, common::TimestampMs now_ms) {
  for (const auto& receipt : receipts) {
    ensure_live(receipt);
    common::ensure(is_expired(receipt, now_ms), ErrorCode::kReceiptNotExpired);
  }
  const std::uint64_t proceeds = intrinsic_value(receipts);
  for (const auto& receipt : receipts) {
    exercised_.insert(receipt.id);
  }
  return proceeds;
}

void OptionVaults::ensure_live(const common::BidReceipt& receipt) const {
  auto it = issued_.find(receipt.id);
  common::ensure(it != issued_.end() && it->second.vault_index == receipt.vault_index &&
                     it->second.shares == receipt.shares,
                 ErrorCode::kBidTokenMismatch);
  common::ensure(exercised_.find(receipt.id) == exercised_.end(), ErrorCode::kReceiptAlreadyExercised);
}

}  // namespace vault
}  // namespace perpcore
