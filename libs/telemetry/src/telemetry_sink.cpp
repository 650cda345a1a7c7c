#include "perpcore/telemetry/telemetry_sink.hpp"

#include <algorithm>
#include <bit>

namespace perpcore {
namespace telemetry {

const char* to_string(Metric metric) noexcept {
  switch (metric) {
    case Metric::kOrdersCreated: return "orders_created";
    case Metric::kOrdersFilled: return "orders_filled";
    case Metric::kOrdersCanceled: return "orders_canceled";
    case Metric::kPositionsLiquidated: return "positions_liquidated";
    case Metric::kFundingUpdates: return "funding_updates";
    case Metric::kReceiptsSettled: return "receipts_settled";
    case Metric::kOperationsReverted: return "operations_reverted";
    case Metric::kCount: break;
  }
  return "unknown";
}

const char* to_string(Operation operation) noexcept {
  switch (operation) {
    case Operation::kCreateOrder: return "create_order";
    case Operation::kCancelOrder: return "cancel_order";
    case Operation::kMatchOrders: return "match_orders";
    case Operation::kCollateral: return "collateral";
    case Operation::kFunding: return "funding";
    case Operation::kLiquidate: return "liquidate";
    case Operation::kSettleReceipts: return "settle_receipts";
    case Operation::kAdmin: return "admin";
    case Operation::kCount: break;
  }
  return "unknown";
}

// StreamingHistogram implementation

std::size_t StreamingHistogram::bucket_index(std::int64_t value_ns) noexcept {
  if (value_ns <= 0) {
    return 0;
  }
  // bucket[i] covers [2^(i-1), 2^i)
  const auto bits = std::bit_width(static_cast<std::uint64_t>(value_ns));
  return std::min(static_cast<std::size_t>(bits), kNumBuckets - 1);
}

std::int64_t StreamingHistogram::bucket_midpoint(std::size_t idx) noexcept {
  if (idx <= 1) {
    return 1;
  }
  return static_cast<std::int64_t>(3) << (idx - 2);  // 1.5 * 2^(idx-1)
}

void StreamingHistogram::record(std::int64_t value_ns) noexcept {
  const auto idx = bucket_index(value_ns);
  ++buckets_[idx];
  ++count_;
  sum_ += value_ns;
  min_ = std::min(min_, value_ns);
  max_ = std::max(max_, value_ns);
}

void StreamingHistogram::reset() noexcept {
  buckets_.fill(0);
  count_ = 0;
  sum_ = 0;
  min_ = std::numeric_limits<std::int64_t>::max();
  max_ = 0;
}

double StreamingHistogram::mean() const noexcept {
  if (count_ == 0) {
    return 0.0;
  }
  return static_cast<double>(sum_) / static_cast<double>(count_);
}

double StreamingHistogram::percentile(double p) const noexcept {
  if (count_ == 0) {
    return 0.0;
  }

  const auto target = static_cast<std::uint64_t>(static_cast<double>(count_) * p);
  std::uint64_t cumulative = 0;

  for (std::size_t idx = 0; idx < kNumBuckets; ++idx) {
    cumulative += buckets_[idx];
    if (cumulative >= target) {
      return static_cast<double>(bucket_midpoint(idx));
    }
  }

  return static_cast<double>(max_);
}

// TelemetrySink implementation

void TelemetrySink::increment(Metric metric, std::int64_t delta) {
  if (metric == Metric::kCount) {
    return;
  }
  std::scoped_lock lock(mutex_);
  buffer_.push_back(Sample{.metric = metric, .value = delta});
  totals_[static_cast<std::size_t>(metric)] += delta;
}

void TelemetrySink::record_latency(Operation operation, std::chrono::nanoseconds latency) {
  if (operation == Operation::kCount) {
    return;
  }
  std::scoped_lock lock(mutex_);
  histograms_[static_cast<std::size_t>(operation)].record(latency.count());
}

std::int64_t TelemetrySink::total(Metric metric) const {
  if (metric == Metric::kCount) {
    return 0;
  }
  std::scoped_lock lock(mutex_);
  return totals_[static_cast<std::size_t>(metric)];
}

std::vector<Sample> TelemetrySink::drain() {
  std::scoped_lock lock(mutex_);
  auto copy = std::move(buffer_);
  buffer_.clear();
  return copy;
}

std::vector<TelemetrySink::Summary> TelemetrySink::drain_latency() {
  std::scoped_lock lock(mutex_);
  std::vector<Summary> summaries;

  for (std::size_t idx = 0; idx < kOperationCount; ++idx) {
    auto& hist = histograms_[idx];
    if (hist.count() == 0) {
      continue;
    }

    summaries.push_back(Summary{
        .operation = static_cast<Operation>(idx),
        .count = hist.count(),
        .mean_ns = hist.mean(),
        .p99_ns = hist.percentile(0.99),
    });

    hist.reset();
  }

  return summaries;
}

}  // namespace telemetry
}  // namespace perpcore
