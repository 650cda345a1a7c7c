#pragma once

#include <cstdint>

#include "perpcore/common/types.hpp"

namespace perpcore {
namespace oracle {

// Price source consumed by the engine. Aggregation happens outside this component.
class Oracle {
 public:
  virtual ~Oracle() = default;

  [[nodiscard]] virtual common::OracleId id() const noexcept = 0;

  // Latest price; throws kOracleStale when older than max_staleness_ms and
  // kInvalidPrice when no usable price has been published.
  [[nodiscard]] virtual common::PriceQuote price(common::TimestampMs now_ms,
                                                 std::uint64_t max_staleness_ms) const = 0;
};

class PriceFeed final : public Oracle {
 public:
  explicit PriceFeed(common::OracleId id) noexcept : id_(id) {}
  PriceFeed(common::OracleId id, std::uint64_t price, std::uint64_t decimal, common::TimestampMs updated_ms) noexcept;

  void update(std::uint64_t price, std::uint64_t decimal, common::TimestampMs updated_ms) noexcept;

  [[nodiscard]] common::OracleId id() const noexcept override { return id_; }
  [[nodiscard]] common::PriceQuote price(common::TimestampMs now_ms, std::uint64_t max_staleness_ms) const override;
  [[nodiscard]] common::TimestampMs updated_ms() const noexcept { return updated_ms_; }

 private:
  common::OracleId id_;
  common::PriceQuote quote_{};
  common::TimestampMs updated_ms_{0};
};

// Verifies `oracle` is the feed bound to a symbol or token, then reads it.
[[nodiscard]] common::PriceQuote checked_price(const Oracle& oracle,
                                               common::OracleId expected,
                                               common::TimestampMs now_ms,
                                               std::uint64_t max_staleness_ms);

}  // namespace oracle
}  // namespace perpcore
