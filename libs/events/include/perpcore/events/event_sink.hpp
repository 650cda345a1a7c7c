#pragma once

#include <cstdint>
#include <filesystem>
#include <functional>
#include <mutex>
#include <vector>

#include "perpcore/common/types.hpp"
#include "perpcore/events/events.hpp"
#include "perpcore/journal/journal.hpp"

namespace perpcore {
namespace events {

struct PublishedEvent {
  std::uint64_t sequence{0};
  common::TimestampMs timestamp_ms{0};
  Event event;
};

class EventSink {
 public:
  virtual ~EventSink() = default;
  virtual void publish(common::TimestampMs timestamp_ms, const EventBuffer& events) = 0;
};

// Drops everything.
class NullSink final : public EventSink {
 public:
  void publish(common::TimestampMs, const EventBuffer&) override {}
};

class MemorySink final : public EventSink {
 public:
  void publish(common::TimestampMs timestamp_ms, const EventBuffer& events) override;
  [[nodiscard]] std::vector<PublishedEvent> snapshot() const;
  [[nodiscard]] std::vector<PublishedEvent> drain();
  [[nodiscard]] std::size_t size() const;

 private:
  mutable std::mutex mutex_;
  std::vector<PublishedEvent> events_{};
  std::uint64_t next_sequence_{1};
};

class JournalSink final : public EventSink {
 public:
  JournalSink(const std::filesystem::path& path, std::size_t flush_threshold_bytes, bool fsync_on_publish);

  void publish(common::TimestampMs timestamp_ms, const EventBuffer& events) override;
  void flush();
  [[nodiscard]] std::uint64_t next_sequence() const noexcept { return writer_.next_sequence(); }
  [[nodiscard]] std::uint64_t recorded(EventKind kind) const { return writer_.count(static_cast<std::uint16_t>(kind)); }

 private:
  journal::Writer writer_;
  bool fsync_on_publish_;
};

using ReplayHandler = std::function<void(const PublishedEvent&)>;

// Decodes every journal record with sequence >= from_sequence. Returns the count.
std::size_t replay_journal(const std::filesystem::path& path, std::uint64_t from_sequence, const ReplayHandler& handler);

}  // namespace events
}  // namespace perpcore
