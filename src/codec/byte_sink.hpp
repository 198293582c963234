#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <ostream>
#include <span>
#include <string_view>
#include <vector>

#include "codec/error.hpp"

namespace vc::codec {

/// Default size of internal write buffers.
inline constexpr std::size_t kDefaultBufferSize = 64;

/// Destination for bulk writes. Returns the number of bytes accepted.
class Writer {
public:
  virtual ~Writer() = default;

  virtual auto write(std::span<const std::uint8_t> bytes) -> Expected<std::size_t> = 0;
  virtual auto flush() -> Status { return {}; }
};

/// Writer with efficient single-byte and string writes.
class ByteWriter : public Writer {
public:
  virtual auto write_byte(std::uint8_t byte) -> Status = 0;
  virtual auto write_string(std::string_view text) -> Expected<std::size_t> = 0;
};

/// Fixed-size buffering layer over a plain Writer.
class BufferedWriter final : public ByteWriter {
public:
  explicit BufferedWriter(Writer &out, std::size_t size = kDefaultBufferSize);

  auto write(std::span<const std::uint8_t> bytes) -> Expected<std::size_t> override;
  auto write_byte(std::uint8_t byte) -> Status override;
  auto write_string(std::string_view text) -> Expected<std::size_t> override;
  /// Drains the buffer, then flushes the underlying writer.
  auto flush() -> Status override;

  auto buffered() const -> std::size_t { return used_; }

private:
  auto drain() -> Status;

  Writer &out_;
  std::vector<std::uint8_t> buffer_;
  std::size_t used_ = 0;
};

/// Adapts a std::ostream. Stream failures are reported as Io errors.
class OstreamWriter final : public ByteWriter {
public:
  explicit OstreamWriter(std::ostream &os) : os_(os) {}

  auto write(std::span<const std::uint8_t> bytes) -> Expected<std::size_t> override;
  auto write_byte(std::uint8_t byte) -> Status override;
  auto write_string(std::string_view text) -> Expected<std::size_t> override;
  auto flush() -> Status override;

private:
  std::ostream &os_;
};

/// Low-level byte output used by wire formats. Integers are big-endian.
class ByteSink {
public:
  virtual ~ByteSink() = default;

  virtual auto write_u16(std::uint16_t value) -> Status = 0;
  virtual auto write_u32(std::uint32_t value) -> Status = 0;
  virtual auto write_u64(std::uint64_t value) -> Status = 0;
  virtual auto write_bytes(std::span<const std::uint8_t> bytes) -> Status = 0;
  virtual auto write_string(std::string_view text) -> Status = 0;
  virtual auto write_byte(std::uint8_t byte) -> Status = 0;
  virtual auto write2(std::uint8_t b1, std::uint8_t b2) -> Status = 0;
  virtual auto write3(std::uint8_t b1, std::uint8_t b2, std::uint8_t b3) -> Status = 0;
  virtual auto write4(std::uint8_t b1, std::uint8_t b2, std::uint8_t b3, std::uint8_t b4)
      -> Status = 0;
  virtual auto flush() -> Status = 0;
};

/// Sink over an output stream. Plain Writers are wrapped in a BufferedWriter.
class StreamSink final : public ByteSink {
public:
  explicit StreamSink(Writer &writer);

  auto write_u16(std::uint16_t value) -> Status override;
  auto write_u32(std::uint32_t value) -> Status override;
  auto write_u64(std::uint64_t value) -> Status override;
  auto write_bytes(std::span<const std::uint8_t> bytes) -> Status override;
  auto write_string(std::string_view text) -> Status override;
  auto write_byte(std::uint8_t byte) -> Status override;
  auto write2(std::uint8_t b1, std::uint8_t b2) -> Status override;
  auto write3(std::uint8_t b1, std::uint8_t b2, std::uint8_t b3) -> Status override;
  auto write4(std::uint8_t b1, std::uint8_t b2, std::uint8_t b3, std::uint8_t b4)
      -> Status override;
  auto flush() -> Status override;

  auto buffered() const -> bool { return buffered_ != nullptr; }

private:
  std::unique_ptr<BufferedWriter> buffered_;
  ByteWriter *writer_ = nullptr;
  std::array<std::uint8_t, 8> scratch_{};
};

/// Sink over a caller-owned byte vector.
///
/// The vector is adopted on construction and handed back by flush(),
/// truncated to the encoded length; capacity is kept so the same vector can
/// be reused across many encode calls without reallocating. Writes after a
/// flush append to the previous output.
class BufferSink final : public ByteSink {
public:
  explicit BufferSink(std::vector<std::uint8_t> &out);

  auto write_u16(std::uint16_t value) -> Status override;
  auto write_u32(std::uint32_t value) -> Status override;
  auto write_u64(std::uint64_t value) -> Status override;
  auto write_bytes(std::span<const std::uint8_t> bytes) -> Status override;
  auto write_string(std::string_view text) -> Status override;
  auto write_byte(std::uint8_t byte) -> Status override;
  auto write2(std::uint8_t b1, std::uint8_t b2) -> Status override;
  auto write3(std::uint8_t b1, std::uint8_t b2, std::uint8_t b3) -> Status override;
  auto write4(std::uint8_t b1, std::uint8_t b2, std::uint8_t b3, std::uint8_t b4)
      -> Status override;
  auto flush() -> Status override;

  /// Logical number of bytes written.
  auto length() const -> std::size_t;
  /// Physical size of the working buffer.
  auto capacity() const -> std::size_t;

private:
  auto adopt() -> void;
  /// Reserve n bytes past the cursor and return the offset to write at.
  auto grow(std::size_t n) -> std::size_t;

  std::vector<std::uint8_t> *out_;
  std::vector<std::uint8_t> buffer_;
  std::size_t cursor_ = 0;
  bool adopted_ = false;
  bool started_ = false;
};

}  // namespace vc::codec
