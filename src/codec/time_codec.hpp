#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <vector>

#include "codec/error.hpp"
#include "codec/handle.hpp"

namespace vc::codec {

/// An instant plus the zone offset it was observed in.
struct Timestamp {
  std::chrono::sys_time<std::chrono::nanoseconds> time{};
  /// Offset east of UTC; std::nullopt means UTC. A zero offset for a named
  /// non-UTC zone is still written.
  std::optional<std::chrono::seconds> zone_offset;
};

/// Compact big-endian timestamp encoding, 4 to 14 bytes:
///   seconds   4 bytes when strictly inside the int32 range, else 8
///   nanos     4 bytes, only when non-zero
///   zone      2 bytes, only when not UTC: offset minutes, sign in bit 15
///   pad       1 zero byte when seconds took 8 bytes and nanos were omitted
auto encode_time(const Timestamp &timestamp) -> std::vector<std::uint8_t>;

/// Installs encode_time as the extension for Timestamp under tag.
auto register_time_ext(Handle &handle, std::uint8_t tag) -> Status;

}  // namespace vc::codec
