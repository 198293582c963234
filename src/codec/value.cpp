#include "codec/value.hpp"

#include "codec/struct_info.hpp"

namespace vc::codec {

auto kind_name(Kind kind) -> std::string_view {
  switch (kind) {
  case Kind::Invalid: return "invalid";
  case Kind::Bool: return "bool";
  case Kind::Int8: return "int8";
  case Kind::Int16: return "int16";
  case Kind::Int32: return "int32";
  case Kind::Int64: return "int64";
  case Kind::Uint8: return "uint8";
  case Kind::Uint16: return "uint16";
  case Kind::Uint32: return "uint32";
  case Kind::Uint64: return "uint64";
  case Kind::Float32: return "float32";
  case Kind::Float64: return "float64";
  case Kind::String: return "string";
  case Kind::Slice: return "slice";
  case Kind::Array: return "array";
  case Kind::Map: return "map";
  case Kind::Struct: return "struct";
  case Kind::Pointer: return "pointer";
  case Kind::Interface: return "interface";
  case Kind::Unsupported: return "unsupported";
  }
  return "unknown";
}

auto is_int_kind(Kind kind) -> bool {
  return kind == Kind::Int8 || kind == Kind::Int16 || kind == Kind::Int32 || kind == Kind::Int64;
}

auto is_uint_kind(Kind kind) -> bool {
  return kind == Kind::Uint8 || kind == Kind::Uint16 || kind == Kind::Uint32 ||
         kind == Kind::Uint64;
}

auto Type::is_byte_slice() const -> bool {
  return (kind_ == Kind::Slice || kind_ == Kind::Array) && elem_ != nullptr &&
         elem_->info() == entt::type_id<std::uint8_t>();
}

auto Type::is_nil(const void *) const -> bool { return false; }

auto Type::length(const void *) const -> std::size_t { return 0; }

auto Type::index(const void *, std::size_t) const -> Value { return {}; }

auto Type::elem_value(const void *) const -> Value { return {}; }

auto Type::for_each_entry(const void *, const EntryVisitor &) const -> Status { return {}; }

auto Type::bool_value(const void *) const -> bool { return false; }

auto Type::int_value(const void *) const -> std::int64_t { return 0; }

auto Type::uint_value(const void *) const -> std::uint64_t { return 0; }

auto Type::float_value(const void *) const -> double { return 0.0; }

auto Type::string_value(const void *) const -> std::string_view { return {}; }

auto Type::bytes_value(const void *) const -> std::span<const std::uint8_t> { return {}; }

auto Value::field(std::size_t i) const -> Value {
  const auto *info = type_ ? type_->struct_info() : nullptr;
  if (!info || i >= info->members.size()) {
    return {};
  }
  return info->members[i].get(data_);
}

auto Value::field_by_path(std::span<const std::size_t> path) const -> Value {
  auto current = *this;
  for (auto i : path) {
    current = current.field(i);
    if (!current.valid()) {
      break;
    }
  }
  return current;
}

auto is_empty(const Value &value) -> bool {
  const auto kind = value.kind();
  switch (kind) {
  case Kind::Invalid:
    return true;
  case Kind::Bool:
    return !value.bool_value();
  case Kind::Float32:
  case Kind::Float64:
    return value.float_value() == 0.0;
  case Kind::String:
  case Kind::Slice:
  case Kind::Array:
  case Kind::Map:
    return value.len() == 0;
  case Kind::Pointer:
  case Kind::Interface:
    return value.is_nil();
  default:
    break;
  }
  if (is_int_kind(kind)) {
    return value.int_value() == 0;
  }
  if (is_uint_kind(kind)) {
    return value.uint_value() == 0;
  }
  return false;
}

namespace detail {

auto JsonType::is_nil(const void *data) const -> bool {
  const auto &json = load<Json>(data);
  return json.is_null() || json.is_discarded();
}

auto JsonType::elem_value(const void *data) const -> Value {
  const auto &json = load<Json>(data);
  switch (json.type()) {
  case Json::value_t::boolean:
    return Value::of(json.get_ref<const Json::boolean_t &>());
  case Json::value_t::number_integer:
    return Value::of(json.get_ref<const Json::number_integer_t &>());
  case Json::value_t::number_unsigned:
    return Value::of(json.get_ref<const Json::number_unsigned_t &>());
  case Json::value_t::number_float:
    return Value::of(json.get_ref<const Json::number_float_t &>());
  case Json::value_t::string:
    return Value::of(json.get_ref<const Json::string_t &>());
  case Json::value_t::array:
    return Value::of(json.get_ref<const Json::array_t &>());
  case Json::value_t::object:
    return Value::of(json.get_ref<const Json::object_t &>());
  case Json::value_t::binary:
    return Value::of(
        static_cast<const Json::binary_t::container_type &>(json.get_binary()));
  default:
    return {};
  }
}

}  // namespace detail

}  // namespace vc::codec
