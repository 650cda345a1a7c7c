#include "perpcore/events/event_codec.hpp"

#include <algorithm>
#include <array>
#include <bit>
#include <limits>
#include <stdexcept>
#include <string>

namespace perpcore {
namespace events {

namespace detail {

template <typename T>
inline void append_primitive(std::vector<std::byte>& buffer, T value) {
  auto raw = std::bit_cast<std::array<std::byte, sizeof(T)>>(value);
  buffer.insert(buffer.end(), raw.begin(), raw.end());
}

template <typename T>
inline T read_primitive(std::span<const std::byte> data, std::size_t& offset) {
  if (offset + sizeof(T) > data.size()) {
    throw std::runtime_error("event decode out of bounds");
  }
  std::array<std::byte, sizeof(T)> storage{};
  std::copy_n(data.begin() + static_cast<std::ptrdiff_t>(offset), sizeof(T), storage.begin());
  offset += sizeof(T);
  return std::bit_cast<T>(storage);
}

}  // namespace detail

namespace {

class Encoder {
 public:
  void u8(std::uint8_t value) { detail::append_primitive(buffer_, value); }
  void u32(std::uint32_t value) { detail::append_primitive(buffer_, value); }
  void u64(std::uint64_t value) { detail::append_primitive(buffer_, value); }
  void flag(bool value) { u8(value ? 1 : 0); }
  void side(common::Side value) { u8(static_cast<std::uint8_t>(value)); }
  void amount(const common::SignedAmount& value) {
    flag(value.is_negative());
    u64(value.magnitude());
  }
  void text(const std::string& value) {
    if (value.size() > std::numeric_limits<std::uint16_t>::max()) {
      throw std::runtime_error("event string too long");
    }
    detail::append_primitive(buffer_, static_cast<std::uint16_t>(value.size()));
    const auto bytes = std::as_bytes(std::span(value.data(), value.size()));
    buffer_.insert(buffer_.end(), bytes.begin(), bytes.end());
  }

  std::vector<std::byte> take() { return std::move(buffer_); }

 private:
  std::vector<std::byte> buffer_{};
};

class Decoder {
 public:
  explicit Decoder(std::span<const std::byte> data) : data_(data) {}

  std::uint8_t u8() { return detail::read_primitive<std::uint8_t>(data_, offset_); }
  std::uint32_t u32() { return detail::read_primitive<std::uint32_t>(data_, offset_); }
  std::uint64_t u64() { return detail::read_primitive<std::uint64_t>(data_, offset_); }
  bool flag() { return u8() != 0; }
  common::Side side() {
    const auto raw = u8();
    if (raw > 1) {
      throw std::runtime_error("invalid side in event payload");
    }
    return static_cast<common::Side>(raw);
  }
  common::SignedAmount amount() {
    const bool negative = flag();
    return common::SignedAmount(u64(), negative);
  }
  std::string text() {
    const auto size = detail::read_primitive<std::uint16_t>(data_, offset_);
    if (offset_ + size > data_.size()) {
      throw std::runtime_error("event decode out of bounds");
    }
    std::string value(reinterpret_cast<const char*>(data_.data() + offset_), size);
    offset_ += size;
    return value;
  }

  void finish() const {
    if (offset_ != data_.size()) {
      throw std::runtime_error("trailing bytes in event payload");
    }
  }

 private:
  std::span<const std::byte> data_;
  std::size_t offset_{0};
};

void write(Encoder& out, const OrderCreated& e) {
  out.u64(e.market);
  out.text(e.symbol);
  out.u64(e.order_id);
  out.u64(e.user);
  out.side(e.side);
  out.flag(e.is_stop);
  out.flag(e.reduce_only);
  out.u64(e.size);
  out.u64(e.trigger_price);
  out.text(e.collateral_token);
  out.u64(e.collateral_amount);
  out.u64(e.linked_position_id);
  out.flag(e.filled);
}

void write(Encoder& out, const OrderCanceled& e) {
  out.u64(e.market);
  out.text(e.symbol);
  out.u64(e.order_id);
  out.u64(e.user);
  out.u8(static_cast<std::uint8_t>(e.reason));
  out.u64(e.size);
  out.u64(e.refunded_amount);
  out.u32(e.refunded_receipts);
}

void write(Encoder& out, const OrderFilled& e) {
  out.u64(e.market);
  out.text(e.symbol);
  out.u64(e.order_id);
  out.u64(e.user);
  out.u64(e.position_id);
  out.side(e.side);
  out.u64(e.size);
  out.u64(e.fill_price);
  out.u64(e.fee_mbp);
  out.u64(e.trading_fee);
  out.u64(e.borrow_fee);
  out.amount(e.funding_paid);
  out.amount(e.realized_pnl);
  out.u64(e.position_size);
  out.flag(e.position_closed);
}

void write(Encoder& out, const CollateralChanged& e) {
  out.u64(e.market);
  out.text(e.symbol);
  out.u64(e.position_id);
  out.u64(e.user);
  out.amount(e.delta);
  out.u64(e.collateral_after);
  out.u64(e.borrow_fee);
  out.amount(e.funding_paid);
}

void write(Encoder& out, const PositionLiquidated& e) {
  out.u64(e.market);
  out.text(e.symbol);
  out.u64(e.position_id);
  out.u64(e.user);
  out.u64(e.liquidator);
  out.side(e.side);
  out.u64(e.size);
  out.u64(e.price);
  out.u64(e.collateral_seized);
  out.u64(e.liquidator_fee);
  out.u64(e.pool_share);
  out.u64(e.escrow_id);
}

void write(Encoder& out, const FundingUpdated& e) {
  out.u64(e.market);
  out.text(e.symbol);
  out.amount(e.previous_index);
  out.amount(e.index);
  out.u64(e.intervals);
  out.u64(e.funding_ts);
}

void write(Encoder& out, const ReceiptsEscrowed& e) {
  out.u64(e.escrow_id);
  out.u64(e.market);
  out.text(e.symbol);
  out.u64(e.position_id);
  out.u64(e.user);
  out.u32(e.receipt_count);
  out.u64(e.liquidator_fee_owed);
  out.u64(e.pool_owed);
}

void write(Encoder& out, const ReceiptsSettled& e) {
  out.u64(e.escrow_id);
  out.u64(e.market);
  out.text(e.symbol);
  out.u64(e.position_id);
  out.u64(e.proceeds);
  out.u64(e.to_liquidator);
  out.u64(e.to_pool);
  out.u64(e.to_user);
}

void write(Encoder& out, const AdminAction& e) {
  out.u64(e.caller);
  out.text(e.action);
  out.u64(e.market);
  out.text(e.symbol);
}

OrderCreated read_order_created(Decoder& in) {
  OrderCreated e;
  e.market = in.u64();
  e.symbol = in.text();
  e.order_id = in.u64();
  e.user = in.u64();
  e.side = in.side();
  e.is_stop = in.flag();
  e.reduce_only = in.flag();
  e.size = in.u64();
  e.trigger_price = in.u64();
  e.collateral_token = in.text();
  e.collateral_amount = in.u64();
  e.linked_position_id = in.u64();
  e.filled = in.flag();
  return e;
}

OrderCanceled read_order_canceled(Decoder& in) {
  OrderCanceled e;
  e.market = in.u64();
  e.symbol = in.text();
  e.order_id = in.u64();
  e.user = in.u64();
  const auto reason = in.u8();
  if (reason > static_cast<std::uint8_t>(CancelReason::kOpenInterest)) {
    throw std::runtime_error("invalid cancel reason in event payload");
  }
  e.reason = static_cast<CancelReason>(reason);
  e.size = in.u64();
  e.refunded_amount = in.u64();
  e.refunded_receipts = in.u32();
  return e;
}

OrderFilled read_order_filled(Decoder& in) {
  OrderFilled e;
  e.market = in.u64();
  e.symbol = in.text();
  e.order_id = in.u64();
  e.user = in.u64();
  e.position_id = in.u64();
  e.side = in.side();
  e.size = in.u64();
  e.fill_price = in.u64();
  e.fee_mbp = in.u64();
  e.trading_fee = in.u64();
  e.borrow_fee = in.u64();
  e.funding_paid = in.amount();
  e.realized_pnl = in.amount();
  e.position_size = in.u64();
  e.position_closed = in.flag();
  return e;
}

CollateralChanged read_collateral_changed(Decoder& in) {
  CollateralChanged e;
  e.market = in.u64();
  e.symbol = in.text();
  e.position_id = in.u64();
  e.user = in.u64();
  e.delta = in.amount();
  e.collateral_after = in.u64();
  e.borrow_fee = in.u64();
  e.funding_paid = in.amount();
  return e;
}

PositionLiquidated read_position_liquidated(Decoder& in) {
  PositionLiquidated e;
  e.market = in.u64();
  e.symbol = in.text();
  e.position_id = in.u64();
  e.user = in.u64();
  e.liquidator = in.u64();
  e.side = in.side();
  e.size = in.u64();
  e.price = in.u64();
  e.collateral_seized = in.u64();
  e.liquidator_fee = in.u64();
  e.pool_share = in.u64();
  e.escrow_id = in.u64();
  return e;
}

FundingUpdated read_funding_updated(Decoder& in) {
  FundingUpdated e;
  e.market = in.u64();
  e.symbol = in.text();
  e.previous_index = in.amount();
  e.index = in.amount();
  e.intervals = in.u64();
  e.funding_ts = in.u64();
  return e;
}

ReceiptsEscrowed read_receipts_escrowed(Decoder& in) {
  ReceiptsEscrowed e;
  e.escrow_id = in.u64();
  e.market = in.u64();
  e.symbol = in.text();
  e.position_id = in.u64();
  e.user = in.u64();
  e.receipt_count = in.u32();
  e.liquidator_fee_owed = in.u64();
  e.pool_owed = in.u64();
  return e;
}

ReceiptsSettled read_receipts_settled(Decoder& in) {
  ReceiptsSettled e;
  e.escrow_id = in.u64();
  e.market = in.u64();
  e.symbol = in.text();
  e.position_id = in.u64();
  e.proceeds = in.u64();
  e.to_liquidator = in.u64();
  e.to_pool = in.u64();
  e.to_user = in.u64();
  return e;
}

AdminAction read_admin_action(Decoder& in) {
  AdminAction e;
  e.caller = in.u64();
  e.action = in.text();
  e.market = in.u64();
  e.symbol = in.text();
  return e;
}

}  // namespace

const char* to_string(EventKind kind) noexcept {
  switch (kind) {
    case EventKind::kOrderCreated: return "order_created";
    case EventKind::kOrderCanceled: return "order_canceled";
    case EventKind::kOrderFilled: return "order_filled";
    case EventKind::kCollateralChanged: return "collateral_changed";
    case EventKind::kPositionLiquidated: return "position_liquidated";
    case EventKind::kFundingUpdated: return "funding_updated";
    case EventKind::kReceiptsEscrowed: return "receipts_escrowed";
    case EventKind::kReceiptsSettled: return "receipts_settled";
    case EventKind::kAdminAction: return "admin_action";
  }
  return "unknown";
}

std::vector<std::byte> encode(const Event& event) {
  Encoder out;
  std::visit([&out](const auto& e) { write(out, e); }, event);
  return out.take();
}

Event decode(EventKind kind, std::span<const std::byte> payload) {
  Decoder in(payload);
  Event event;
  switch (kind) {
    case EventKind::kOrderCreated:
      event = read_order_created(in);
      break;
    case EventKind::kOrderCanceled:
      event = read_order_canceled(in);
      break;
    case EventKind::kOrderFilled:
      event = read_order_filled(in);
      break;
    case EventKind::kCollateralChanged:
      event = read_collateral_changed(in);
      break;
    case EventKind::kPositionLiquidated:
      event = read_position_liquidated(in);
      break;
    case EventKind::kFundingUpdated:
      event = read_funding_updated(in);
      break;
    case EventKind::kReceiptsEscrowed:
      event = read_receipts_escrowed(in);
      break;
    case EventKind::kReceiptsSettled:
      event = read_receipts_settled(in);
      break;
    case EventKind::kAdminAction:
      event = read_admin_action(in);
      break;
    default:
      throw std::runtime_error("unknown event kind " + std::to_string(static_cast<unsigned>(kind)));
  }
  in.finish();
  return event;
}

}  // namespace events
}  // namespace perpcore
