#include "perpcore/vault/receipt_escrow.hpp"

#include <utility>

#include "perpcore/common/error.hpp"

namespace perpcore {
namespace vault {

std::uint64_t ReceiptEscrow::add(UnsettledReceipt record) {
  record.id = next_id_++;
  const auto id = record.id;
  records_.emplace(id, std::move(record));
  return id;
}

const UnsettledReceipt* ReceiptEscrow::find(std::uint64_t id) const {
  auto it = records_.find(id);
  if (it == records_.end()) {
    return nullptr;
  }
  return &it->second;
}

void ReceiptEscrow::remove(std::uint64_t id) {
  if (records_.erase(id) == 0) {
    throw common::EngineError(common::ErrorCode::kEscrowNotFound);
  }
}

}  // namespace vault
}  // namespace perpcore
