#pragma once

#include <functional>
#include <type_traits>
#include <utility>
#include <vector>

namespace perpcore {
namespace registry {

// Snapshots state before an operation mutates it and restores every snapshot,
// newest first, unless commit() is reached.
class Transaction {
 public:
  Transaction() = default;
  Transaction(const Transaction&) = delete;
  Transaction& operator=(const Transaction&) = delete;

  ~Transaction() noexcept {
    if (committed_) {
      return;
    }
    for (auto it = undo_.rbegin(); it != undo_.rend(); ++it) {
      (*it)();
    }
  }

  // The copy is taken here, so restoring is a move that cannot throw from the destructor.
  template <typename T>
  void track(T& target) {
    static_assert(std::is_nothrow_move_assignable_v<T>, "tracked state must restore without throwing");
    undo_.emplace_back([&target, snapshot = target]() mutable noexcept { target = std::move(snapshot); });
  }

  void commit() noexcept { committed_ = true; }
  [[nodiscard]] bool committed() const noexcept { return committed_; }

 private:
  std::vector<std::function<void()>> undo_{};
  bool committed_{false};
};

}  // namespace registry
}  // namespace perpcore
