#pragma once

#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <filesystem>
#include <map>
#include <span>
#include <vector>

namespace perpcore {
namespace journal {

// Bytes a header takes on disk, little endian:
// magic u32 | version u16 | kind u16 | sequence u64 | timestamp u64 | size u32 | checksum u32
inline constexpr std::size_t kHeaderSize = 32;

struct RecordHeader {
  std::uint16_t kind{0};
  std::uint64_t sequence{0};
  std::uint64_t timestamp_ms{0};
  std::uint32_t payload_size{0};
  std::uint32_t checksum{0};
};

struct Record {
  RecordHeader header{};
  std::vector<std::byte> payload{};
};

using KindCounts = std::map<std::uint16_t, std::uint64_t>;

// What a scan of an existing journal found.
struct Recovery {
  std::uint64_t next_sequence{1};
  std::uint64_t intact_bytes{0};
  bool torn_tail{false};
  KindCounts kind_counts{};
};

// Reads every intact record of `path`. A record cut short at the end of the file
// (a crash mid-write) ends the scan; damage anywhere before it throws.
Recovery recover(const std::filesystem::path& path);

// Append-only journal of event records, one per event, tagged with the event kind.
// Reopening an existing file drops a torn last record and resumes the sequence
// after the last intact one.
class Writer {
 public:
  explicit Writer(const std::filesystem::path& path,
                  std::size_t flush_threshold_bytes = 1 << 16);
  Writer(const Writer&) = delete;
  Writer& operator=(const Writer&) = delete;
  Writer(Writer&&) = delete;
  Writer& operator=(Writer&&) = delete;
  ~Writer();

  // Kind 0 is reserved. Returns the sequence assigned to the record.
  std::uint64_t append(std::uint16_t kind, std::uint64_t timestamp_ms, std::span<const std::byte> payload);
  void flush();
  void sync();

  [[nodiscard]] std::uint64_t next_sequence() const noexcept { return next_sequence_; }
  // Records of `kind` in the journal, buffered ones included.
  [[nodiscard]] std::uint64_t count(std::uint16_t kind) const;

 private:
  std::FILE* file_{nullptr};
  std::vector<std::byte> buffer_{};
  std::size_t flush_threshold_;
  std::uint64_t next_sequence_{1};
  KindCounts kind_counts_{};

  void open(const std::filesystem::path& path);
};

class Reader {
 public:
  // With `stop_at_torn_tail` a record cut short ends the read instead of throwing.
  explicit Reader(const std::filesystem::path& path, bool stop_at_torn_tail = false);
  Reader(const Reader&) = delete;
  Reader& operator=(const Reader&) = delete;
  Reader(Reader&&) = delete;
  Reader& operator=(Reader&&) = delete;
  ~Reader();

  bool next(Record& out_record);

  // Offset just past the last record returned.
  [[nodiscard]] std::uint64_t offset() const noexcept { return offset_; }
  [[nodiscard]] bool torn() const noexcept { return torn_; }

 private:
  std::FILE* file_{nullptr};
  bool stop_at_torn_tail_;
  bool torn_{false};
  std::uint64_t offset_{0};

  bool cut_short();
};

}  // namespace journal
}  // namespace perpcore
