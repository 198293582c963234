#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <span>
#include <string_view>

#include "codec/byte_sink.hpp"
#include "codec/error.hpp"
#include "codec/handle.hpp"
#include "codec/primitive_encoder.hpp"
#include "codec/value.hpp"

namespace vc::codec {

namespace msgpack {

inline constexpr std::uint8_t kNil = 0xc0;
inline constexpr std::uint8_t kFalse = 0xc2;
inline constexpr std::uint8_t kTrue = 0xc3;
inline constexpr std::uint8_t kBin8 = 0xc4;
inline constexpr std::uint8_t kBin16 = 0xc5;
inline constexpr std::uint8_t kBin32 = 0xc6;
inline constexpr std::uint8_t kExt8 = 0xc7;
inline constexpr std::uint8_t kExt16 = 0xc8;
inline constexpr std::uint8_t kExt32 = 0xc9;
inline constexpr std::uint8_t kFloat32 = 0xca;
inline constexpr std::uint8_t kFloat64 = 0xcb;
inline constexpr std::uint8_t kUint8 = 0xcc;
inline constexpr std::uint8_t kUint16 = 0xcd;
inline constexpr std::uint8_t kUint32 = 0xce;
inline constexpr std::uint8_t kUint64 = 0xcf;
inline constexpr std::uint8_t kInt8 = 0xd0;
inline constexpr std::uint8_t kInt16 = 0xd1;
inline constexpr std::uint8_t kInt32 = 0xd2;
inline constexpr std::uint8_t kInt64 = 0xd3;
inline constexpr std::uint8_t kFixExt1 = 0xd4;
inline constexpr std::uint8_t kFixExt2 = 0xd5;
inline constexpr std::uint8_t kFixExt4 = 0xd6;
inline constexpr std::uint8_t kFixExt8 = 0xd7;
inline constexpr std::uint8_t kFixExt16 = 0xd8;
inline constexpr std::uint8_t kStr8 = 0xd9;
inline constexpr std::uint8_t kStr16 = 0xda;
inline constexpr std::uint8_t kStr32 = 0xdb;
inline constexpr std::uint8_t kArray16 = 0xdc;
inline constexpr std::uint8_t kArray32 = 0xdd;
inline constexpr std::uint8_t kMap16 = 0xde;
inline constexpr std::uint8_t kMap32 = 0xdf;

inline constexpr std::uint8_t kFixMap = 0x80;
inline constexpr std::uint8_t kFixArray = 0x90;
inline constexpr std::uint8_t kFixStr = 0xa0;

}  // namespace msgpack

struct MsgpackOptions {
  /// Write raw byte strings with the str family instead of bin, for peers
  /// that predate the bin types.
  bool raw_as_string = false;
};

/// Parse msgpack options from a JSON object, e.g. {"raw_as_string": true}.
auto parse_msgpack_options(const Json &json) -> Expected<MsgpackOptions>;

/// Msgpack wire format.
class MsgpackEncoder final : public PrimitiveEncoder {
public:
  MsgpackEncoder(ByteSink &sink, MsgpackOptions options) : sink_(sink), options_(options) {}

  auto encode_nil() -> Status override;
  auto encode_int(std::int64_t value) -> Status override;
  auto encode_uint(std::uint64_t value) -> Status override;
  auto encode_bool(bool value) -> Status override;
  auto encode_float32(float value) -> Status override;
  auto encode_float64(double value) -> Status override;
  auto encode_ext_preamble(std::uint8_t tag, std::size_t length) -> Status override;
  auto encode_array_preamble(std::size_t length) -> Status override;
  auto encode_map_preamble(std::size_t length) -> Status override;
  auto encode_string(CharEncoding encoding, std::string_view value) -> Status override;
  auto encode_symbol(std::string_view value) -> Status override;
  auto encode_string_bytes(CharEncoding encoding, std::span<const std::uint8_t> value)
      -> Status override;

private:
  auto write_container_len(std::uint8_t fix, std::size_t fix_limit, std::uint8_t code8,
                           std::uint8_t code16, std::uint8_t code32, std::size_t length)
      -> Status;
  auto write_string_header(CharEncoding encoding, std::size_t length) -> Status;

  ByteSink &sink_;
  MsgpackOptions options_;
};

auto make_msgpack_factory(MsgpackOptions options = {}) -> EncoderFactory;

auto make_msgpack_handle(MsgpackOptions options = {}, HandleOptions handle_options = {})
    -> std::unique_ptr<Handle>;

}  // namespace vc::codec
