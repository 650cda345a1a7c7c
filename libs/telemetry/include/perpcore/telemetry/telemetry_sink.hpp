#pragma once

#include <array>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <mutex>
#include <vector>

namespace perpcore {
namespace telemetry {

enum class Metric : std::uint16_t {
  kOrdersCreated,
  kOrdersFilled,
  kOrdersCanceled,
  kPositionsLiquidated,
  kFundingUpdates,
  kReceiptsSettled,
  kOperationsReverted,
  kCount,
};

enum class Operation : std::uint16_t {
  kCreateOrder,
  kCancelOrder,
  kMatchOrders,
  kCollateral,
  kFunding,
  kLiquidate,
  kSettleReceipts,
  kAdmin,
  kCount,
};

[[nodiscard]] const char* to_string(Metric metric) noexcept;
[[nodiscard]] const char* to_string(Operation operation) noexcept;

struct Sample {
  Metric metric{Metric::kOrdersCreated};
  std::int64_t value{};
};

// Streaming histogram with O(1) recording and O(bucket_count) percentile computation.
// Uses log2-scale buckets from 1ns to ~1s (30 buckets).
class StreamingHistogram {
 public:
  static constexpr std::size_t kNumBuckets = 30;

  void record(std::int64_t value_ns) noexcept;
  void reset() noexcept;

  [[nodiscard]] std::uint64_t count() const noexcept { return count_; }
  [[nodiscard]] double mean() const noexcept;
  [[nodiscard]] double percentile(double p) const noexcept;

 private:
  std::array<std::uint64_t, kNumBuckets> buckets_{};
  std::uint64_t count_{0};
  std::int64_t sum_{0};
  std::int64_t min_{std::numeric_limits<std::int64_t>::max()};
  std::int64_t max_{0};

  static std::size_t bucket_index(std::int64_t value_ns) noexcept;
  static std::int64_t bucket_midpoint(std::size_t idx) noexcept;
};

class TelemetrySink {
 public:
  void increment(Metric metric, std::int64_t delta = 1);
  void record_latency(Operation operation, std::chrono::nanoseconds latency);

  // Running total since construction; drain() does not reset it.
  [[nodiscard]] std::int64_t total(Metric metric) const;
  [[nodiscard]] std::vector<Sample> drain();

  struct Summary {
    Operation operation{Operation::kCreateOrder};
    std::uint64_t count{0};
    double mean_ns{0.0};
    double p99_ns{0.0};
  };

  [[nodiscard]] std::vector<Summary> drain_latency();

 private:
  static constexpr std::size_t kMetricCount = static_cast<std::size_t>(Metric::kCount);
  static constexpr std::size_t kOperationCount = static_cast<std::size_t>(Operation::kCount);

  mutable std::mutex mutex_;
  std::vector<Sample> buffer_{};
  std::array<std::int64_t, kMetricCount> totals_{};
  std::array<StreamingHistogram, kOperationCount> histograms_{};
};

}  // namespace telemetry
}  // namespace perpcore
