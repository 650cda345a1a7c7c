#include "test_telemetry.hpp"

#include <cassert>
#include <chrono>

#include "perpcore/telemetry/telemetry_sink.hpp"
#include "test_desk.hpp"

namespace perpcore::tests {

void test_telemetry_sink() {
  telemetry::TelemetrySink sink;
  sink.increment(telemetry::Metric::kOrdersCreated);
  sink.increment(telemetry::Metric::kOrdersFilled, 2);
  sink.record_latency(telemetry::Operation::kCreateOrder, std::chrono::nanoseconds{100});
  sink.record_latency(telemetry::Operation::kCreateOrder, std::chrono::nanoseconds{200});

  auto samples = sink.drain();
  assert(samples.size() == 2);
  assert(samples[1].metric == telemetry::Metric::kOrdersFilled);
  assert(samples[1].value == 2);
  assert(sink.drain().empty());
  assert(sink.total(telemetry::Metric::kOrdersFilled) == 2);

  auto latency = sink.drain_latency();
  assert(latency.size() == 1);
  assert(latency.front().operation == telemetry::Operation::kCreateOrder);
  assert(latency.front().count == 2);
  assert(latency.front().mean_ns == 150.0);
  assert(sink.drain_latency().empty());
}

void test_registry_telemetry() {
  TestDesk desk;
  telemetry::TelemetrySink telemetry;
  desk.engine.attach_telemetry(&telemetry);

  const auto id = *desk.open(kAlice, common::Side::kLong, 10, 200 * kUsdcUnit).value.position_id;
  assert(thrown([&] {
           desk.engine.release_collateral(kAlice, desk.key, id, 100 * kUsdcUnit, desk.prices(), desk.now);
         }) == common::ErrorCode::kLeverageExceeded);
  desk.engine.close_position(kAlice, desk.key, id, desk.prices(), desk.now);

  assert(telemetry.total(telemetry::Metric::kOrdersCreated) == 2);
  assert(telemetry.total(telemetry::Metric::kOrdersFilled) == 2);
  assert(telemetry.total(telemetry::Metric::kOperationsReverted) == 1);

  // Failed operations record no latency.
  const auto latency = telemetry.drain_latency();
  assert(latency.size() == 1);
  assert(latency.front().operation == telemetry::Operation::kCreateOrder);
  assert(latency.front().count == 2);
}

}  // namespace perpcore::tests
