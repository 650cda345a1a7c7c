#include "perpcore/ledger/custody_ledger.hpp"

#include <utility>

#include "perpcore/common/error.hpp"
#include "perpcore/common/fixed_point.hpp"

namespace perpcore {
namespace ledger {

void CustodyLedger::open_account(common::AccountId user) {
  accounts_.try_emplace(user);
}

bool CustodyLedger::has_account(common::AccountId user) const {
  return accounts_.find(user) != accounts_.end();
}

void CustodyLedger::deposit(common::AccountId user, const common::TokenType& token, std::uint64_t amount) {
  auto it = accounts_.find(user);
  if (it == accounts_.end()) {
    throw common::EngineError(common::ErrorCode::kUnauthorized, "no custody account");
  }
  auto& balance = it->second[token];
  common::ensure(amount <= common::kU64Max - balance, common::ErrorCode::kArithmeticOverflow);
  balance += amount;
}

void CustodyLedger::withdraw(common::AccountId user, const common::TokenType& token, std::uint64_t amount) {
  auto it = accounts_.find(user);
  if (it == accounts_.end()) {
    throw common::EngineError(common::ErrorCode::kUnauthorized, "no custody account");
  }
  auto balance_it = it->second.find(token);
  common::ensure(balance_it != it->second.end() && balance_it->second >= amount,
                 common::ErrorCode::kInsufficientBalance);
  balance_it->second -= amount;
}

std::uint64_t CustodyLedger::balance(common::AccountId user, const common::TokenType& token) const {
  if (auto it = accounts_.find(user); it != accounts_.end()) {
    if (auto balance_it = it->second.find(token); balance_it != it->second.end()) {
      return balance_it->second;
    }
  }
  return 0;
}

std::vector<common::Payout> CustodyLedger::route(std::vector<common::Payout> payouts) {
  // Validate every deposit before applying any so routing is all-or-nothing.
  std::map<std::pair<common::AccountId, common::TokenType>, std::uint64_t> credited;
  for (const auto& payout : payouts) {
    if (payout.amount == 0 || !has_account(payout.user)) {
      continue;
    }
    auto& total = credited[{payout.user, payout.token}];
    common::ensure(payout.amount <= common::kU64Max - total, common::ErrorCode::kArithmeticOverflow);
    total += payout.amount;
    common::ensure(total <= common::kU64Max - balance(payout.user, payout.token),
                   common::ErrorCode::kArithmeticOverflow);
  }

  std::vector<common::Payout> direct;
  for (auto& payout : payouts) {
    if (!has_account(payout.user)) {
      direct.push_back(std::move(payout));
      continue;
    }
    if (payout.amount > 0) {
      deposit(payout.user, payout.token, payout.amount);
      payout.amount = 0;
    }
    if (!payout.receipts.empty()) {
      direct.push_back(std::move(payout));
    }
  }
  return direct;
}

}  // namespace ledger
}  // namespace perpcore
