#include "perpcore/events/event_sink.hpp"

#include <stdexcept>

#include "perpcore/events/event_codec.hpp"

namespace perpcore {
namespace events {

void MemorySink::publish(common::TimestampMs timestamp_ms, const EventBuffer& events) {
  std::scoped_lock lock(mutex_);
  for (const auto& event : events.events()) {
    events_.push_back(PublishedEvent{.sequence = next_sequence_++, .timestamp_ms = timestamp_ms, .event = event});
  }
}

std::vector<PublishedEvent> MemorySink::snapshot() const {
  std::scoped_lock lock(mutex_);
  return events_;
}

std::vector<PublishedEvent> MemorySink::drain() {
  std::scoped_lock lock(mutex_);
  auto copy = std::move(events_);
  events_.clear();
  return copy;
}

std::size_t MemorySink::size() const {
  std::scoped_lock lock(mutex_);
  return events_.size();
}

JournalSink::JournalSink(const std::filesystem::path& path, std::size_t flush_threshold_bytes, bool fsync_on_publish)
    : writer_(path, flush_threshold_bytes), fsync_on_publish_(fsync_on_publish) {}

void JournalSink::publish(common::TimestampMs timestamp_ms, const EventBuffer& events) {
  if (events.empty()) {
    return;
  }
  // Encode everything first so a bad event never leaves half an operation buffered.
  std::vector<std::vector<std::byte>> payloads;
  payloads.reserve(events.size());
  for (const auto& event : events.events()) {
    payloads.push_back(encode(event));
  }
  for (std::size_t i = 0; i < payloads.size(); ++i) {
    writer_.append(static_cast<std::uint16_t>(kind_of(events.events()[i])), timestamp_ms, payloads[i]);
  }
  if (fsync_on_publish_) {
    writer_.sync();
  }
}

void JournalSink::flush() { writer_.flush(); }

std::size_t replay_journal(const std::filesystem::path& path, std::uint64_t from_sequence, const ReplayHandler& handler) {
  if (!handler) {
    throw std::runtime_error("event handler not set for replay");
  }
  if (!std::filesystem::exists(path)) {
    return 0;
  }

  journal::Reader reader(path);
  journal::Record record;
  std::size_t replayed = 0;
  while (reader.next(record)) {
    if (record.header.sequence < from_sequence) {
      continue;
    }
    handler(PublishedEvent{
        .sequence = record.header.sequence,
        .timestamp_ms = record.header.timestamp_ms,
        .event = decode(static_cast<EventKind>(record.header.kind), record.payload),
    });
    ++replayed;
  }
  return replayed;
}

}  // namespace events
}  // namespace perpcore
