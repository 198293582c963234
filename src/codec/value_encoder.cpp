#include "codec/value_encoder.hpp"

#include <format>
#include <utility>
#include <vector>

#include "codec/struct_info.hpp"

namespace vc::codec {
namespace {

auto unsupported(const Value &value) -> EncodeError {
  return make_error(ErrorCode::UnsupportedShape,
                    std::format("unsupported kind: {}, for type: {}", kind_name(value.kind()),
                                value.type()->name()));
}

}  // namespace

auto ValueEncoder::encode_value(const Value &value) -> Status {
  if (!value.valid()) {
    return primitives_.encode_nil();
  }

  auto handled = primitives_.encode_builtin(value);
  if (!handled) {
    return tl::unexpected(handled.error());
  }
  if (*handled) {
    return {};
  }

  if (const auto *entry = handle_.extensions().find(value.type()->info())) {
    return encode_extension(*entry, value);
  }

  const auto kind = value.kind();
  switch (kind) {
  case Kind::Bool:
    return primitives_.encode_bool(value.bool_value());
  case Kind::String:
    return primitives_.encode_string(CharEncoding::Utf8, value.string_value());
  case Kind::Float64:
    return primitives_.encode_float64(value.float_value());
  case Kind::Float32:
    return primitives_.encode_float32(static_cast<float>(value.float_value()));
  case Kind::Slice:
  case Kind::Array:
    return encode_slice(value);
  case Kind::Map:
    return encode_map(value);
  case Kind::Struct:
    return encode_struct(value);
  case Kind::Pointer:
  case Kind::Interface:
    if (value.is_nil()) {
      return primitives_.encode_nil();
    }
    return encode_value(value.elem());
  case Kind::Int8:
  case Kind::Int16:
  case Kind::Int32:
  case Kind::Int64:
    return primitives_.encode_int(value.int_value());
  case Kind::Uint8:
  case Kind::Uint16:
  case Kind::Uint32:
  case Kind::Uint64:
    return primitives_.encode_uint(value.uint_value());
  case Kind::Invalid:
    return primitives_.encode_nil();
  case Kind::Unsupported:
    break;
  }
  return tl::unexpected(unsupported(value));
}

auto ValueEncoder::encode_extension(const ExtensionEntry &entry, const Value &value) -> Status {
  auto payload = entry.fn(value);
  if (!payload) {
    return tl::unexpected(payload.error());
  }
  if (!payload->has_value()) {
    return primitives_.encode_nil();
  }
  const auto &bytes = **payload;
  if (handle_.write_ext()) {
    if (auto status = primitives_.encode_ext_preamble(entry.tag, bytes.size()); !status) {
      return status;
    }
    return sink_.write_bytes(bytes);
  }
  return primitives_.encode_string_bytes(CharEncoding::Raw, bytes);
}

auto ValueEncoder::encode_slice(const Value &value) -> Status {
  if (value.is_nil()) {
    return primitives_.encode_nil();
  }
  if (value.type()->is_byte_slice()) {
    return primitives_.encode_string_bytes(CharEncoding::Raw, value.bytes_value());
  }
  const auto length = value.len();
  if (auto status = primitives_.encode_array_preamble(length); !status) {
    return status;
  }
  for (std::size_t i = 0; i < length; ++i) {
    if (auto status = encode_value(value.index(i)); !status) {
      return status;
    }
  }
  return {};
}

auto ValueEncoder::encode_map(const Value &value) -> Status {
  if (value.is_nil()) {
    return primitives_.encode_nil();
  }
  const auto length = value.len();
  if (auto status = primitives_.encode_map_preamble(length); !status) {
    return status;
  }
  if (length == 0) {
    return {};
  }
  const bool string_keys = value.type()->key()->kind() == Kind::String;
  return value.for_each_entry([this, string_keys](const Value &key, const Value &mapped) -> Status {
    auto status = string_keys ? primitives_.encode_symbol(key.string_value()) : encode_value(key);
    if (!status) {
      return status;
    }
    return encode_value(mapped);
  });
}

auto ValueEncoder::encode_struct(const Value &value) -> Status {
  const auto *info = value.type()->struct_info();
  if (!info) {
    return tl::unexpected(make_error(
        ErrorCode::UnsupportedShape,
        std::format("unsupported kind: struct, no schema registered for type: {}",
                    value.type()->name())));
  }

  std::vector<std::pair<const FieldDescriptor *, Value>> kept;
  kept.reserve(info->fields.size());
  for (const auto &field : info->fields) {
    auto field_value = field.index >= 0 ? value.field(static_cast<std::size_t>(field.index))
                                        : value.field_by_path(field.path);
    if (field.omit_empty && is_empty(field_value)) {
      continue;
    }
    kept.emplace_back(&field, field_value);
  }

  if (auto status = primitives_.encode_map_preamble(kept.size()); !status) {
    return status;
  }
  for (const auto &[field, field_value] : kept) {
    if (auto status = primitives_.encode_symbol(field->name); !status) {
      return status;
    }
    if (auto status = encode_value(field_value); !status) {
      return status;
    }
  }
  return {};
}

}  // namespace vc::codec
