#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <string_view>

#include "codec/error.hpp"
#include "codec/value.hpp"

namespace vc::codec {

/// Character encoding hint passed with strings and byte strings.
enum class CharEncoding : std::uint8_t {
  Raw,
  Utf8,
};

/// Operations a wire format provides to the value encoder. One instance is
/// bound to one ByteSink for its whole lifetime.
///
/// Preambles only announce a count; they do not reserve space.
class PrimitiveEncoder {
public:
  virtual ~PrimitiveEncoder() = default;

  /// Lets a format take over values it has an optimized representation for.
  /// Returns true when the value was fully written.
  virtual auto encode_builtin(const Value &) -> Expected<bool> { return false; }

  virtual auto encode_nil() -> Status = 0;
  virtual auto encode_int(std::int64_t value) -> Status = 0;
  virtual auto encode_uint(std::uint64_t value) -> Status = 0;
  virtual auto encode_bool(bool value) -> Status = 0;
  virtual auto encode_float32(float value) -> Status = 0;
  virtual auto encode_float64(double value) -> Status = 0;
  virtual auto encode_ext_preamble(std::uint8_t tag, std::size_t length) -> Status = 0;
  virtual auto encode_array_preamble(std::size_t length) -> Status = 0;
  virtual auto encode_map_preamble(std::size_t length) -> Status = 0;
  virtual auto encode_string(CharEncoding encoding, std::string_view value) -> Status = 0;
  /// String the format may intern; formats without symbols write a string.
  virtual auto encode_symbol(std::string_view value) -> Status = 0;
  virtual auto encode_string_bytes(CharEncoding encoding, std::span<const std::uint8_t> value)
      -> Status = 0;
};

}  // namespace vc::codec
