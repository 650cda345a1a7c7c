#pragma once

#include <cstddef>
#include <optional>
#include <unordered_map>
#include <vector>

#include "perpcore/common/types.hpp"
#include "perpcore/market/position.hpp"

namespace perpcore {
namespace market {

// Dense arena of open positions with O(1) lookup by id. Removal swaps the last
// slot into the hole, so iteration order is not stable across removals.
class PositionStore {
 public:
  void insert(Position position);
  [[nodiscard]] Position remove(common::PositionId id);

  [[nodiscard]] Position* find(common::PositionId id) noexcept;
  [[nodiscard]] const Position* find(common::PositionId id) const noexcept;
  [[nodiscard]] Position& at(common::PositionId id);
  [[nodiscard]] const Position& at(common::PositionId id) const;
  [[nodiscard]] bool contains(common::PositionId id) const noexcept { return index_.contains(id); }

  [[nodiscard]] std::size_t size() const noexcept { return positions_.size(); }
  [[nodiscard]] bool empty() const noexcept { return positions_.empty(); }
  [[nodiscard]] const Position& slot(std::size_t index) const { return positions_.at(index); }
  [[nodiscard]] const std::vector<Position>& positions() const noexcept { return positions_; }

  [[nodiscard]] std::uint64_t total_size(common::Side side) const noexcept;

 private:
  std::vector<Position> positions_{};
  std::unordered_map<common::PositionId, std::size_t> index_{};
};

}  // namespace market
}  // namespace perpcore
