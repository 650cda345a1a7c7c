#pragma once

#include <cstdint>
#include <map>
#include <unordered_map>
#include <vector>

#include "perpcore/common/types.hpp"

namespace perpcore {
namespace ledger {

// Optional per-user custody accounts. Users without an account receive released
// funds directly from the operation that released them.
class CustodyLedger {
 public:
  void open_account(common::AccountId user);
  [[nodiscard]] bool has_account(common::AccountId user) const;

  void deposit(common::AccountId user, const common::TokenType& token, std::uint64_t amount);
  void withdraw(common::AccountId user, const common::TokenType& token, std::uint64_t amount);
  [[nodiscard]] std::uint64_t balance(common::AccountId user, const common::TokenType& token) const;

  // Deposits token payouts of account holders; returns what must go back to the caller.
  [[nodiscard]] std::vector<common::Payout> route(std::vector<common::Payout> payouts);

 private:
  std::unordered_map<common::AccountId, std::map<common::TokenType, std::uint64_t>> accounts_{};
};

}  // namespace ledger
}  // namespace perpcore
