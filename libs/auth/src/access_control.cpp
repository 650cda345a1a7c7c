#include "perpcore/auth/access_control.hpp"

#include "perpcore/common/error.hpp"

namespace perpcore {
namespace auth {

AccessControl::AccessControl(common::AccountId admin) {
  grant(admin, Role::kAdmin);
  grant(admin, Role::kOperator);
}

void AccessControl::grant(common::AccountId account, Role role) {
  roles_[account] |= static_cast<std::uint8_t>(role);
}

void AccessControl::revoke(common::AccountId account, Role role) {
  auto it = roles_.find(account);
  if (it == roles_.end()) {
    return;
  }
  it->second &= static_cast<std::uint8_t>(~static_cast<std::uint8_t>(role));
  if (it->second == 0) {
    roles_.erase(it);
  }
}

bool AccessControl::has_role(common::AccountId account, Role role) const {
  auto it = roles_.find(account);
  return it != roles_.end() && (it->second & static_cast<std::uint8_t>(role)) != 0;
}

void AccessControl::require(common::AccountId account, Role role) const {
  if (!has_role(account, role)) {
    throw common::EngineError(common::ErrorCode::kUnauthorized);
  }
}

}  // namespace auth
}  // namespace perpcore
