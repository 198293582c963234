#include "codec/byte_sink.hpp"

#include <algorithm>
#include <cstring>
#include <format>

namespace vc::codec {
namespace {

auto as_bytes(std::string_view text) -> std::span<const std::uint8_t> {
  return {reinterpret_cast<const std::uint8_t *>(text.data()), text.size()};
}

auto short_write(std::size_t expected, std::size_t written) -> EncodeError {
  return make_error(ErrorCode::ShortWrite,
                    std::format("write: incorrect number of bytes written, expected {}, wrote {}",
                                expected, written));
}

auto put_u16(std::uint8_t *out, std::uint16_t value) -> void {
  out[0] = static_cast<std::uint8_t>(value >> 8);
  out[1] = static_cast<std::uint8_t>(value);
}

auto put_u32(std::uint8_t *out, std::uint32_t value) -> void {
  out[0] = static_cast<std::uint8_t>(value >> 24);
  out[1] = static_cast<std::uint8_t>(value >> 16);
  out[2] = static_cast<std::uint8_t>(value >> 8);
  out[3] = static_cast<std::uint8_t>(value);
}

auto put_u64(std::uint8_t *out, std::uint64_t value) -> void {
  put_u32(out, static_cast<std::uint32_t>(value >> 32));
  put_u32(out + 4, static_cast<std::uint32_t>(value));
}

}  // namespace

// BufferedWriter

BufferedWriter::BufferedWriter(Writer &out, std::size_t size)
    : out_(out), buffer_(std::max<std::size_t>(size, 1)) {}

auto BufferedWriter::drain() -> Status {
  if (used_ == 0) {
    return {};
  }
  auto written = out_.write(std::span<const std::uint8_t>(buffer_.data(), used_));
  if (!written) {
    return tl::unexpected(written.error());
  }
  if (*written != used_) {
    // Keep the unwritten tail so the error leaves the buffer consistent.
    auto done = std::min(*written, used_);
    std::memmove(buffer_.data(), buffer_.data() + done, used_ - done);
    auto expected = used_;
    used_ -= done;
    return tl::unexpected(short_write(expected, done));
  }
  used_ = 0;
  return {};
}

auto BufferedWriter::write(std::span<const std::uint8_t> bytes) -> Expected<std::size_t> {
  if (bytes.size() > buffer_.size() - used_) {
    if (auto status = drain(); !status) {
      return tl::unexpected(status.error());
    }
  }
  if (bytes.size() >= buffer_.size()) {
    return out_.write(bytes);
  }
  std::copy(bytes.begin(), bytes.end(), buffer_.begin() + static_cast<std::ptrdiff_t>(used_));
  used_ += bytes.size();
  return bytes.size();
}

auto BufferedWriter::write_byte(std::uint8_t byte) -> Status {
  if (used_ == buffer_.size()) {
    if (auto status = drain(); !status) {
      return status;
    }
  }
  buffer_[used_++] = byte;
  return {};
}

auto BufferedWriter::write_string(std::string_view text) -> Expected<std::size_t> {
  return write(as_bytes(text));
}

auto BufferedWriter::flush() -> Status {
  if (auto status = drain(); !status) {
    return status;
  }
  return out_.flush();
}

// OstreamWriter

auto OstreamWriter::write(std::span<const std::uint8_t> bytes) -> Expected<std::size_t> {
  os_.write(reinterpret_cast<const char *>(bytes.data()),
            static_cast<std::streamsize>(bytes.size()));
  if (!os_) {
    return tl::unexpected(make_error(ErrorCode::Io, "output stream write failed"));
  }
  return bytes.size();
}

auto OstreamWriter::write_byte(std::uint8_t byte) -> Status {
  os_.put(static_cast<char>(byte));
  if (!os_) {
    return tl::unexpected(make_error(ErrorCode::Io, "output stream write failed"));
  }
  return {};
}

auto OstreamWriter::write_string(std::string_view text) -> Expected<std::size_t> {
  return write(as_bytes(text));
}

auto OstreamWriter::flush() -> Status {
  os_.flush();
  if (!os_) {
    return tl::unexpected(make_error(ErrorCode::Io, "output stream flush failed"));
  }
  return {};
}

// StreamSink

StreamSink::StreamSink(Writer &writer) {
  if (auto *byte_writer = dynamic_cast<ByteWriter *>(&writer)) {
    writer_ = byte_writer;
  } else {
    buffered_ = std::make_unique<BufferedWriter>(writer, kDefaultBufferSize);
    writer_ = buffered_.get();
  }
}

auto StreamSink::write_u16(std::uint16_t value) -> Status {
  put_u16(scratch_.data(), value);
  return write_bytes(std::span<const std::uint8_t>(scratch_.data(), 2));
}

auto StreamSink::write_u32(std::uint32_t value) -> Status {
  put_u32(scratch_.data(), value);
  return write_bytes(std::span<const std::uint8_t>(scratch_.data(), 4));
}

auto StreamSink::write_u64(std::uint64_t value) -> Status {
  put_u64(scratch_.data(), value);
  return write_bytes(std::span<const std::uint8_t>(scratch_.data(), 8));
}

auto StreamSink::write_bytes(std::span<const std::uint8_t> bytes) -> Status {
  auto written = writer_->write(bytes);
  if (!written) {
    return tl::unexpected(written.error());
  }
  if (*written != bytes.size()) {
    return tl::unexpected(short_write(bytes.size(), *written));
  }
  return {};
}

auto StreamSink::write_string(std::string_view text) -> Status {
  auto written = writer_->write_string(text);
  if (!written) {
    return tl::unexpected(written.error());
  }
  if (*written != text.size()) {
    return tl::unexpected(short_write(text.size(), *written));
  }
  return {};
}

auto StreamSink::write_byte(std::uint8_t byte) -> Status { return writer_->write_byte(byte); }

auto StreamSink::write2(std::uint8_t b1, std::uint8_t b2) -> Status {
  if (auto status = write_byte(b1); !status) {
    return status;
  }
  return write_byte(b2);
}

auto StreamSink::write3(std::uint8_t b1, std::uint8_t b2, std::uint8_t b3) -> Status {
  if (auto status = write2(b1, b2); !status) {
    return status;
  }
  return write_byte(b3);
}

auto StreamSink::write4(std::uint8_t b1, std::uint8_t b2, std::uint8_t b3, std::uint8_t b4)
    -> Status {
  if (auto status = write3(b1, b2, b3); !status) {
    return status;
  }
  return write_byte(b4);
}

auto StreamSink::flush() -> Status { return writer_->flush(); }

// BufferSink

BufferSink::BufferSink(std::vector<std::uint8_t> &out) : out_(&out) { adopt(); }

auto BufferSink::adopt() -> void {
  if (adopted_) {
    return;
  }
  buffer_ = std::move(*out_);
  out_->clear();
  // A fresh session overwrites the caller's bytes; later ones append.
  cursor_ = started_ ? buffer_.size() : 0;
  started_ = true;
  const auto physical = buffer_.capacity();
  buffer_.resize(physical == 0 ? kDefaultBufferSize : physical);
  adopted_ = true;
}

auto BufferSink::grow(std::size_t n) -> std::size_t {
  adopt();
  const auto offset = cursor_;
  cursor_ = offset + n;
  if (cursor_ > buffer_.size()) {
    // Grows to exactly 2 * capacity + n.
    std::vector<std::uint8_t> next(2 * buffer_.size() + n);
    std::copy_n(buffer_.begin(), offset, next.begin());
    buffer_.swap(next);
  }
  return offset;
}

auto BufferSink::write_u16(std::uint16_t value) -> Status {
  auto offset = grow(2);
  put_u16(buffer_.data() + offset, value);
  return {};
}

auto BufferSink::write_u32(std::uint32_t value) -> Status {
  auto offset = grow(4);
  put_u32(buffer_.data() + offset, value);
  return {};
}

auto BufferSink::write_u64(std::uint64_t value) -> Status {
  auto offset = grow(8);
  put_u64(buffer_.data() + offset, value);
  return {};
}

auto BufferSink::write_bytes(std::span<const std::uint8_t> bytes) -> Status {
  if (bytes.empty()) {
    return {};
  }
  auto offset = grow(bytes.size());
  std::copy(bytes.begin(), bytes.end(), buffer_.begin() + static_cast<std::ptrdiff_t>(offset));
  return {};
}

auto BufferSink::write_string(std::string_view text) -> Status {
  return write_bytes(as_bytes(text));
}

auto BufferSink::write_byte(std::uint8_t byte) -> Status {
  auto offset = grow(1);
  buffer_[offset] = byte;
  return {};
}

auto BufferSink::write2(std::uint8_t b1, std::uint8_t b2) -> Status {
  auto offset = grow(2);
  buffer_[offset] = b1;
  buffer_[offset + 1] = b2;
  return {};
}

auto BufferSink::write3(std::uint8_t b1, std::uint8_t b2, std::uint8_t b3) -> Status {
  auto offset = grow(3);
  buffer_[offset] = b1;
  buffer_[offset + 1] = b2;
  buffer_[offset + 2] = b3;
  return {};
}

auto BufferSink::write4(std::uint8_t b1, std::uint8_t b2, std::uint8_t b3, std::uint8_t b4)
    -> Status {
  auto offset = grow(4);
  buffer_[offset] = b1;
  buffer_[offset + 1] = b2;
  buffer_[offset + 2] = b3;
  buffer_[offset + 3] = b4;
  return {};
}

auto BufferSink::flush() -> Status {
  if (!adopted_) {
    return {};
  }
  buffer_.resize(cursor_);
  *out_ = std::move(buffer_);
  buffer_ = {};
  adopted_ = false;
  return {};
}

auto BufferSink::length() const -> std::size_t { return adopted_ ? cursor_ : out_->size(); }

auto BufferSink::capacity() const -> std::size_t {
  return adopted_ ? buffer_.size() : out_->capacity();
}

}  // namespace vc::codec
