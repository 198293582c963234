#include "codec/msgpack.hpp"

#include <bit>
#include <format>
#include <limits>

namespace vc::codec {

namespace {

auto too_long(std::string_view what, std::size_t length) -> Status {
  return tl::unexpected(make_error(ErrorCode::UnsupportedShape,
                                   std::format("msgpack: {} length {} exceeds 32 bits", what,
                                               length)));
}

constexpr std::size_t kMaxLen32 = std::numeric_limits<std::uint32_t>::max();

}  // namespace

auto parse_msgpack_options(const Json &json) -> Expected<MsgpackOptions> {
  if (!json.is_object()) {
    return tl::unexpected(
        make_error(ErrorCode::InvalidConfig, "msgpack options must be an object"));
  }
  MsgpackOptions options;
  if (auto it = json.find("raw_as_string"); it != json.end()) {
    if (!it->is_boolean()) {
      return tl::unexpected(
          make_error(ErrorCode::InvalidConfig, "raw_as_string must be a boolean"));
    }
    options.raw_as_string = it->get<bool>();
  }
  return options;
}

auto MsgpackEncoder::encode_nil() -> Status { return sink_.write_byte(msgpack::kNil); }

auto MsgpackEncoder::encode_bool(bool value) -> Status {
  return sink_.write_byte(value ? msgpack::kTrue : msgpack::kFalse);
}

auto MsgpackEncoder::encode_uint(std::uint64_t value) -> Status {
  if (value <= 0x7f) {
    return sink_.write_byte(static_cast<std::uint8_t>(value));
  }
  if (value <= std::numeric_limits<std::uint8_t>::max()) {
    return sink_.write2(msgpack::kUint8, static_cast<std::uint8_t>(value));
  }
  if (value <= std::numeric_limits<std::uint16_t>::max()) {
    if (auto status = sink_.write_byte(msgpack::kUint16); !status) {
      return status;
    }
    return sink_.write_u16(static_cast<std::uint16_t>(value));
  }
  if (value <= std::numeric_limits<std::uint32_t>::max()) {
    if (auto status = sink_.write_byte(msgpack::kUint32); !status) {
      return status;
    }
    return sink_.write_u32(static_cast<std::uint32_t>(value));
  }
  if (auto status = sink_.write_byte(msgpack::kUint64); !status) {
    return status;
  }
  return sink_.write_u64(value);
}

auto MsgpackEncoder::encode_int(std::int64_t value) -> Status {
  if (value >= 0) {
    return encode_uint(static_cast<std::uint64_t>(value));
  }
  if (value >= -32) {
    return sink_.write_byte(static_cast<std::uint8_t>(static_cast<std::int8_t>(value)));
  }
  if (value >= std::numeric_limits<std::int8_t>::min()) {
    return sink_.write2(msgpack::kInt8, static_cast<std::uint8_t>(static_cast<std::int8_t>(value)));
  }
  if (value >= std::numeric_limits<std::int16_t>::min()) {
    if (auto status = sink_.write_byte(msgpack::kInt16); !status) {
      return status;
    }
    return sink_.write_u16(static_cast<std::uint16_t>(static_cast<std::int16_t>(value)));
  }
  if (value >= std::numeric_limits<std::int32_t>::min()) {
    if (auto status = sink_.write_byte(msgpack::kInt32); !status) {
      return status;
    }
    return sink_.write_u32(static_cast<std::uint32_t>(static_cast<std::int32_t>(value)));
  }
  if (auto status = sink_.write_byte(msgpack::kInt64); !status) {
    return status;
  }
  return sink_.write_u64(static_cast<std::uint64_t>(value));
}

auto MsgpackEncoder::encode_float32(float value) -> Status {
  if (auto status = sink_.write_byte(msgpack::kFloat32); !status) {
    return status;
  }
  return sink_.write_u32(std::bit_cast<std::uint32_t>(value));
}

auto MsgpackEncoder::encode_float64(double value) -> Status {
  if (auto status = sink_.write_byte(msgpack::kFloat64); !status) {
    return status;
  }
  return sink_.write_u64(std::bit_cast<std::uint64_t>(value));
}

auto MsgpackEncoder::encode_ext_preamble(std::uint8_t tag, std::size_t length) -> Status {
  switch (length) {
  case 1:
    return sink_.write2(msgpack::kFixExt1, tag);
  case 2:
    return sink_.write2(msgpack::kFixExt2, tag);
  case 4:
    return sink_.write2(msgpack::kFixExt4, tag);
  case 8:
    return sink_.write2(msgpack::kFixExt8, tag);
  case 16:
    return sink_.write2(msgpack::kFixExt16, tag);
  default:
    break;
  }
  if (length <= std::numeric_limits<std::uint8_t>::max()) {
    return sink_.write3(msgpack::kExt8, static_cast<std::uint8_t>(length), tag);
  }
  if (length <= std::numeric_limits<std::uint16_t>::max()) {
    if (auto status = sink_.write_byte(msgpack::kExt16); !status) {
      return status;
    }
    if (auto status = sink_.write_u16(static_cast<std::uint16_t>(length)); !status) {
      return status;
    }
    return sink_.write_byte(tag);
  }
  if (length > kMaxLen32) {
    return too_long("ext", length);
  }
  if (auto status = sink_.write_byte(msgpack::kExt32); !status) {
    return status;
  }
  if (auto status = sink_.write_u32(static_cast<std::uint32_t>(length)); !status) {
    return status;
  }
  return sink_.write_byte(tag);
}

auto MsgpackEncoder::encode_array_preamble(std::size_t length) -> Status {
  if (length > kMaxLen32) {
    return too_long("array", length);
  }
  return write_container_len(msgpack::kFixArray, 16, 0, msgpack::kArray16, msgpack::kArray32,
                             length);
}

auto MsgpackEncoder::encode_map_preamble(std::size_t length) -> Status {
  if (length > kMaxLen32) {
    return too_long("map", length);
  }
  return write_container_len(msgpack::kFixMap, 16, 0, msgpack::kMap16, msgpack::kMap32, length);
}

auto MsgpackEncoder::encode_string(CharEncoding encoding, std::string_view value) -> Status {
  if (auto status = write_string_header(encoding, value.size()); !status) {
    return status;
  }
  return sink_.write_string(value);
}

auto MsgpackEncoder::encode_symbol(std::string_view value) -> Status {
  return encode_string(CharEncoding::Utf8, value);
}

auto MsgpackEncoder::encode_string_bytes(CharEncoding encoding,
                                         std::span<const std::uint8_t> value) -> Status {
  if (auto status = write_string_header(encoding, value.size()); !status) {
    return status;
  }
  return sink_.write_bytes(value);
}

auto MsgpackEncoder::write_string_header(CharEncoding encoding, std::size_t length) -> Status {
  if (length > kMaxLen32) {
    return too_long("string", length);
  }
  if (encoding == CharEncoding::Raw && !options_.raw_as_string) {
    return write_container_len(0, 0, msgpack::kBin8, msgpack::kBin16, msgpack::kBin32, length);
  }
  return write_container_len(msgpack::kFixStr, 32, msgpack::kStr8, msgpack::kStr16,
                             msgpack::kStr32, length);
}

/// Writes the shortest length header. A zero code8 means the family has no
/// 8-bit form; a zero fix_limit means it has no fixed form.
auto MsgpackEncoder::write_container_len(std::uint8_t fix, std::size_t fix_limit,
                                         std::uint8_t code8, std::uint8_t code16,
                                         std::uint8_t code32, std::size_t length) -> Status {
  if (length < fix_limit) {
    return sink_.write_byte(static_cast<std::uint8_t>(fix | length));
  }
  if (code8 != 0 && length <= std::numeric_limits<std::uint8_t>::max()) {
    return sink_.write2(code8, static_cast<std::uint8_t>(length));
  }
  if (length <= std::numeric_limits<std::uint16_t>::max()) {
    if (auto status = sink_.write_byte(code16); !status) {
      return status;
    }
    return sink_.write_u16(static_cast<std::uint16_t>(length));
  }
  if (auto status = sink_.write_byte(code32); !status) {
    return status;
  }
  return sink_.write_u32(static_cast<std::uint32_t>(length));
}

auto make_msgpack_factory(MsgpackOptions options) -> EncoderFactory {
  return [options](ByteSink &sink) -> std::unique_ptr<PrimitiveEncoder> {
    return std::make_unique<MsgpackEncoder>(sink, options);
  };
}

auto make_msgpack_handle(MsgpackOptions options, HandleOptions handle_options)
    -> std::unique_ptr<Handle> {
  return std::make_unique<Handle>(make_msgpack_factory(options), handle_options);
}

}  // namespace vc::codec
