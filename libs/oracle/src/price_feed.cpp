#include "perpcore/oracle/price_feed.hpp"

#include "perpcore/common/error.hpp"

namespace perpcore {
namespace oracle {

PriceFeed::PriceFeed(common::OracleId id, std::uint64_t price, std::uint64_t decimal,
                     common::TimestampMs updated_ms) noexcept
    : id_(id), quote_{.price = price, .decimal = decimal}, updated_ms_(updated_ms) {}

void PriceFeed::update(std::uint64_t price, std::uint64_t decimal, common::TimestampMs updated_ms) noexcept {
  quote_ = common::PriceQuote{.price = price, .decimal = decimal};
  updated_ms_ = updated_ms;
}

common::PriceQuote PriceFeed::price(common::TimestampMs now_ms, std::uint64_t max_staleness_ms) const {
  common::ensure(quote_.price != 0, common::ErrorCode::kInvalidPrice);
  // A price published "in the future" relative to the caller's clock is treated as fresh.
  if (now_ms > updated_ms_ && now_ms - updated_ms_ > max_staleness_ms) {
    throw common::EngineError(common::ErrorCode::kOracleStale);
  }
  return quote_;
}

common::PriceQuote checked_price(const Oracle& oracle,
                                 common::OracleId expected,
                                 common::TimestampMs now_ms,
                                 std::uint64_t max_staleness_ms) {
  common::ensure(oracle.id() == expected, common::ErrorCode::kOracleMismatch);
  return oracle.price(now_ms, max_staleness_ms);
}

}  // namespace oracle
}  // namespace perpcore
