#pragma once

#include <cstdint>
#include <unordered_map>

#include "perpcore/common/types.hpp"

namespace perpcore {
namespace auth {

enum class Role : std::uint8_t {
  kAdmin = 1 << 0,     // market creation, configuration, protocol fee withdrawal
  kOperator = 1 << 1,  // order matching, escrow settlement, open-interest cleanup
};

// Role table consulted at every privileged registry entry point.
class AccessControl {
 public:
  explicit AccessControl(common::AccountId admin);

  void grant(common::AccountId account, Role role);
  void revoke(common::AccountId account, Role role);
  [[nodiscard]] bool has_role(common::AccountId account, Role role) const;

  // Throws kUnauthorized when `account` lacks `role`.
  void require(common::AccountId account, Role role) const;

  [[nodiscard]] std::size_t account_count() const noexcept { return roles_.size(); }

 private:
  std::unordered_map<common::AccountId, std::uint8_t> roles_;
};

}  // namespace auth
}  // namespace perpcore
