#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <type_traits>

#include "codec/byte_sink.hpp"
#include "codec/error.hpp"
#include "codec/ext_registry.hpp"
#include "codec/handle.hpp"
#include "codec/primitive_encoder.hpp"
#include "codec/value.hpp"

namespace vc::codec {

namespace detail {

template <typename T>
inline constexpr bool is_fast_scalar_v =
    std::is_same_v<T, bool> || (std::is_integral_v<T> && sizeof(T) <= 8) ||
    std::is_same_v<T, float> || std::is_same_v<T, double> || std::is_same_v<T, std::string> ||
    std::is_same_v<T, std::string_view>;

template <typename T> struct fast_pointee : std::false_type {};
template <typename T>
struct fast_pointee<T *> : std::bool_constant<is_fast_scalar_v<std::remove_cv_t<T>>> {};

}  // namespace detail

/// Walks a value's shape and drives a PrimitiveEncoder.
///
/// Order of precedence: static scalar fast path, then the format's builtin
/// hook, then a registered extension, then the value's kind.
class ValueEncoder {
public:
  ValueEncoder(PrimitiveEncoder &primitives, ByteSink &sink, const Handle &handle)
      : primitives_(primitives), sink_(sink), handle_(handle) {}

  template <typename T> auto encode(const T &value) -> Status {
    using U = std::remove_cvref_t<T>;
    if constexpr (std::is_same_v<U, Value>) {
      return encode_value(value);
    } else if constexpr (std::is_same_v<U, std::nullptr_t>) {
      return primitives_.encode_nil();
    } else if constexpr (detail::is_fast_scalar_v<U> || detail::is_c_string_v<U> ||
                         detail::is_char_array_v<U>) {
      return encode_scalar(value);
    } else if constexpr (detail::fast_pointee<U>::value) {
      if (value != nullptr) {
        return encode_scalar(*value);
      }
      return encode_value(Value::of(value));
    } else {
      return encode_value(Value::of(value));
    }
  }

  /// Generic path, driven by the runtime shape of value.
  auto encode_value(const Value &value) -> Status;

private:
  template <typename U> auto encode_scalar(const U &value) -> Status {
    if constexpr (std::is_same_v<U, bool>) {
      return primitives_.encode_bool(value);
    } else if constexpr (std::is_integral_v<U> && std::is_signed_v<U>) {
      return primitives_.encode_int(static_cast<std::int64_t>(value));
    } else if constexpr (std::is_integral_v<U>) {
      return primitives_.encode_uint(static_cast<std::uint64_t>(value));
    } else if constexpr (std::is_same_v<U, float>) {
      return primitives_.encode_float32(value);
    } else if constexpr (std::is_same_v<U, double>) {
      return primitives_.encode_float64(value);
    } else if constexpr (std::is_same_v<U, std::string> || std::is_same_v<U, std::string_view>) {
      return primitives_.encode_string(CharEncoding::Utf8, std::string_view(value));
    } else {
      return primitives_.encode_string(CharEncoding::Utf8, Value::of(value).string_value());
    }
  }

  auto encode_extension(const ExtensionEntry &entry, const Value &value) -> Status;
  auto encode_slice(const Value &value) -> Status;
  auto encode_map(const Value &value) -> Status;
  auto encode_struct(const Value &value) -> Status;

  PrimitiveEncoder &primitives_;
  ByteSink &sink_;
  const Handle &handle_;
};

}  // namespace vc::codec
