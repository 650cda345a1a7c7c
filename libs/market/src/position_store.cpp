#include "perpcore/market/position_store.hpp"

#include <stdexcept>
#include <string>
#include <utility>

#include "perpcore/common/error.hpp"

namespace perpcore {
namespace market {

void PositionStore::insert(Position position) {
  const auto id = position.id;
  if (index_.contains(id)) {
    throw std::logic_error("duplicate position id " + std::to_string(id));
  }
  positions_.push_back(std::move(position));
  index_.emplace(id, positions_.size() - 1);
}

Position PositionStore::remove(common::PositionId id) {
  auto it = index_.find(id);
  if (it == index_.end()) {
    throw common::EngineError(common::ErrorCode::kPositionNotFound, std::to_string(id));
  }
  const auto slot = it->second;
  index_.erase(it);

  Position removed = std::move(positions_[slot]);
  if (slot + 1 != positions_.size()) {
    positions_[slot] = std::move(positions_.back());
    index_[positions_[slot].id] = slot;
  }
  positions_.pop_back();
  return removed;
}

Position* PositionStore::find(common::PositionId id) noexcept {
  auto it = index_.find(id);
  return it == index_.end() ? nullptr : &positions_[it->second];
}

const Position* PositionStore::find(common::PositionId id) const noexcept {
  auto it = index_.find(id);
  return it == index_.end() ? nullptr : &positions_[it->second];
}

Position& PositionStore::at(common::PositionId id) {
  auto* position = find(id);
  if (position == nullptr) {
    throw common::EngineError(common::ErrorCode::kPositionNotFound, std::to_string(id));
  }
  return *position;
}

const Position& PositionStore::at(common::PositionId id) const {
  const auto* position = find(id);
  if (position == nullptr) {
    throw common::EngineError(common::ErrorCode::kPositionNotFound, std::to_string(id));
  }
  return *position;
}

std::uint64_t PositionStore::total_size(common::Side side) const noexcept {
  std::uint64_t total = 0;
  for (const auto& position : positions_) {
    if (position.side == side) {
      total += position.size;
    }
  }
  return total;
}

}  // namespace market
}  // namespace perpcore
