#include "perpcore/journal/journal.hpp"

#include <array>
#include <cerrno>
#include <stdexcept>
#include <string>
#include <system_error>

#include <unistd.h>

namespace perpcore {
namespace journal {

namespace {

constexpr std::uint32_t kMagic = 0x5043454a;  // 'PCEJ'
constexpr std::uint16_t kVersion = 2;

using HeaderBytes = std::array<std::byte, kHeaderSize>;

template <typename T>
void put(std::byte*& out, T value) noexcept {
  for (std::size_t i = 0; i < sizeof(T); ++i) {
    *out++ = static_cast<std::byte>((static_cast<std::uint64_t>(value) >> (8 * i)) & 0xff);
  }
}

template <typename T>
T get(const std::byte*& in) noexcept {
  std::uint64_t value = 0;
  for (std::size_t i = 0; i < sizeof(T); ++i) {
    value |= static_cast<std::uint64_t>(std::to_integer<std::uint8_t>(*in++)) << (8 * i);
  }
  return static_cast<T>(value);
}

// FNV-1a over the kind and the payload, so a record cannot be re-tagged unnoticed.
std::uint32_t checksum32(std::uint16_t kind, std::span<const std::byte> payload) noexcept {
  constexpr std::uint32_t kFnvPrime = 16777619u;
  std::uint32_t hash = 2166136261u;
  auto mix = [&](std::uint8_t octet) {
    hash ^= octet;
    hash *= kFnvPrime;
  };
  mix(static_cast<std::uint8_t>(kind & 0xff));
  mix(static_cast<std::uint8_t>(kind >> 8));
  for (const auto b : payload) {
    mix(std::to_integer<std::uint8_t>(b));
  }
  return hash;
}

HeaderBytes encode_header(const RecordHeader& header) noexcept {
  HeaderBytes raw{};
  auto* out = raw.data();
  put(out, kMagic);
  put(out, kVersion);
  put(out, header.kind);
  put(out, header.sequence);
  put(out, header.timestamp_ms);
  put(out, header.payload_size);
  put(out, header.checksum);
  return raw;
}

RecordHeader decode_header(const HeaderBytes& raw) {
  const auto* in = raw.data();
  if (get<std::uint32_t>(in) != kMagic) {
    throw std::runtime_error("invalid journal magic");
  }
  const auto version = get<std::uint16_t>(in);
  if (version != kVersion) {
    throw std::runtime_error("unsupported journal version " + std::to_string(version));
  }
  RecordHeader header;
  header.kind = get<std::uint16_t>(in);
  header.sequence = get<std::uint64_t>(in);
  header.timestamp_ms = get<std::uint64_t>(in);
  header.payload_size = get<std::uint32_t>(in);
  header.checksum = get<std::uint32_t>(in);
  return header;
}

void fsync_file(std::FILE* file) {
  if (::fsync(::fileno(file)) != 0) {
    throw std::system_error(errno, std::system_category(), "fsync failed");
  }
}

}  // namespace

Recovery recover(const std::filesystem::path& path) {
  Recovery found;
  Reader reader(path, true);
  Record record;
  while (reader.next(record)) {
    found.next_sequence = record.header.sequence + 1;
    ++found.kind_counts[record.header.kind];
  }
  found.intact_bytes = reader.offset();
  found.torn_tail = reader.torn();
  return found;
}

Writer::Writer(const std::filesystem::path& path, std::size_t flush_threshold_bytes)
    : buffer_(), flush_threshold_(flush_threshold_bytes) {
  buffer_.reserve(flush_threshold_bytes);
  open(path);
}

Writer::~Writer() {
  if (file_) {
    if (!buffer_.empty()) {
      // Best effort: a destructor cannot report a short write.
      const auto wrote = std::fwrite(buffer_.data(), 1, buffer_.size(), file_);
      if (wrote != buffer_.size()) {
        std::fputs("perpcore: journal tail lost on close\n", stderr);
      }
    }
    std::fclose(file_);
    file_ = nullptr;
  }
}

void Writer::open(const std::filesystem::path& path) {
  if (std::filesystem::exists(path)) {
    const auto found = recover(path);
    if (found.torn_tail) {
      std::filesystem::resize_file(path, found.intact_bytes);
    }
    next_sequence_ = found.next_sequence;
    kind_counts_ = found.kind_counts;
  }
  file_ = std::fopen(path.c_str(), "ab");
  if (!file_) {
    throw std::runtime_error("failed to open journal file: " + path.string());
  }
}

std::uint64_t Writer::append(std::uint16_t kind, std::uint64_t timestamp_ms, std::span<const std::byte> payload) {
  if (!file_) {
    throw std::runtime_error("journal writer not open");
  }
  if (kind == 0) {
    throw std::invalid_argument("journal record without an event kind");
  }

  const RecordHeader header{
      .kind = kind,
      .sequence = next_sequence_,
      .timestamp_ms = timestamp_ms,
      .payload_size = static_cast<std::uint32_t>(payload.size()),
      .checksum = checksum32(kind, payload),
  };
  const auto raw = encode_header(header);
  buffer_.insert(buffer_.end(), raw.begin(), raw.end());
  buffer_.insert(buffer_.end(), payload.begin(), payload.end());
  ++next_sequence_;
  ++kind_counts_[kind];

  if (buffer_.size() >= flush_threshold_) {
    flush();
  }
  return header.sequence;
}

std::uint64_t Writer::count(std::uint16_t kind) const {
  auto it = kind_counts_.find(kind);
  return it == kind_counts_.end() ? 0 : it->second;
}

void Writer::flush() {
  if (!file_ || buffer_.empty()) {
    return;
  }

  const auto wrote = std::fwrite(buffer_.data(), 1, buffer_.size(), file_);
  if (wrote != buffer_.size()) {
    throw std::runtime_error("failed to write journal buffer");
  }
  buffer_.clear();
  if (std::fflush(file_) != 0) {
    throw std::system_error(errno, std::system_category(), "journal fflush failed");
  }
}

void Writer::sync() {
  flush();
  if (file_) {
    fsync_file(file_);
  }
}

Reader::Reader(const std::filesystem::path& path, bool stop_at_torn_tail) : stop_at_torn_tail_(stop_at_torn_tail) {
  file_ = std::fopen(path.c_str(), "rb");
  if (!file_) {
    throw std::runtime_error("failed to open journal for read: " + path.string());
  }
}

Reader::~Reader() {
  if (file_) {
    std::fclose(file_);
    file_ = nullptr;
  }
}

bool Reader::next(Record& out_record) {
  if (!file_ || torn_) {
    return false;
  }

  HeaderBytes raw{};
  const auto got = std::fread(raw.data(), 1, raw.size(), file_);
  if (got == 0 && std::feof(file_)) {
    return false;
  }
  if (got != raw.size()) {
    if (std::ferror(file_)) {
      throw std::runtime_error("failed to read journal");
    }
    return cut_short();
  }

  const auto header = decode_header(raw);
  out_record.header = header;
  out_record.payload.resize(header.payload_size);
  if (header.payload_size > 0 &&
      std::fread(out_record.payload.data(), 1, header.payload_size, file_) != header.payload_size) {
    return cut_short();
  }
  if (header.checksum != checksum32(header.kind, out_record.payload)) {
    throw std::runtime_error("journal checksum mismatch at sequence " + std::to_string(header.sequence));
  }

  offset_ += kHeaderSize + header.payload_size;
  return true;
}

bool Reader::cut_short() {
  if (!stop_at_torn_tail_) {
    throw std::runtime_error("truncated journal record at offset " + std::to_string(offset_));
  }
  torn_ = true;
  return false;
}

}  // namespace journal
}  // namespace perpcore
